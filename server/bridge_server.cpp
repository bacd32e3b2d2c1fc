#include "../bridge.h"
#include "bridge_server.h"
#include "../http_client.h"

using json = nlohmann::json;

BridgeServer::BridgeServer(const Config& config)
    : Server(config.host, config.port, "harmony-bridge"),
      upstream_url(config.upstream_url),
      timeout(config.timeout),
      connect_timeout(config.connect_timeout) {
    while (!upstream_url.empty() && upstream_url.back() == '/') {
        upstream_url.pop_back();
    }

    options.format = Harmony::parse_output_format(config.format);
    options.session.markers = config.markers;
    options.session.max_block_bytes = config.max_block_bytes;
    options.session.strip_namespace = config.strip_namespace;
    options.session.log_analysis = config.log_analysis;
}

void BridgeServer::register_endpoints() {
    auto chat = [this](const httplib::Request& req, httplib::Response& res) {
        handle_chat_completions(req, res);
    };
    auto models = [this](const httplib::Request& req, httplib::Response& res) {
        handle_models(req, res);
    };

    tcp_server.Post("/v1/chat/completions", chat);
    tcp_server.Post("/api/v0/chat/completions", chat);
    tcp_server.Get("/v1/models", models);
    tcp_server.Get("/api/v0/models", models);
}

void BridgeServer::add_status_info(json& status) {
    status["upstream_url"] = upstream_url;
    status["format"] = Harmony::output_format_name(options.format);
    status["active_streams"] = active_streams.load();
}

std::map<std::string, std::string> BridgeServer::upstream_headers(const httplib::Request& req) const {
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    if (req.has_header("Authorization")) {
        headers["Authorization"] = req.get_header_value("Authorization");
    }
    return headers;
}

void BridgeServer::handle_chat_completions(const httplib::Request& req, httplib::Response& res) {
    uint64_t rid = ++next_request_id;
    requests_processed++;
    std::string prefix = "[#" + std::to_string(rid) + "] ";

    json request;
    try {
        request = json::parse(req.body);
    } catch (const json::exception&) {
        LOG_WARN(prefix + "Rejecting request with invalid JSON body");
        res.status = 400;
        res.set_content(make_error_body("Invalid JSON", "bad_request").dump(), "application/json");
        return;
    }
    if (!request.is_object()) {
        res.status = 400;
        res.set_content(make_error_body("Invalid JSON", "bad_request").dump(), "application/json");
        return;
    }

    bool stream = request.contains("stream") && request["stream"].is_boolean() && request["stream"].get<bool>();
    std::string model = (request.contains("model") && request["model"].is_string()) ?
                        request["model"].get<std::string>() : "unknown";

    LOG_INFO(prefix + "Request: model=" + model + ", stream=" + (stream ? "true" : "false") +
             ", mode=" + Harmony::output_format_name(options.format));

    std::string url = upstream_url + "/v1/chat/completions";
    std::map<std::string, std::string> headers = upstream_headers(req);

    if (!stream) {
        HttpClient client;
        client.set_timeout(timeout);
        client.set_connect_timeout(connect_timeout);
        HttpResponse upstream = client.post(url, req.body, headers);

        if (upstream.status_code == 0) {
            LOG_ERROR(prefix + "Upstream unreachable: " + upstream.error_message);
            res.status = 502;
            res.set_content(make_error_body(upstream.error_message, "proxy_error").dump(), "application/json");
            return;
        }

        std::string content_type = upstream.header("Content-Type");
        if (content_type.empty()) {
            content_type = "application/json";
        }

        if (!upstream.is_success()) {
            LOG_WARN_FMT("{}Upstream returned {}", prefix, upstream.status_code);
            res.status = static_cast<int>(upstream.status_code);
            res.set_content(upstream.body, content_type);
            return;
        }

        try {
            std::optional<std::string> transformed = transform_completion(upstream.body, options, prefix);
            if (!transformed) {
                // Not JSON, hand it back as received
                res.set_content(upstream.body, content_type);
                return;
            }
            res.set_content(*transformed, "application/json");
        } catch (const std::exception& e) {
            LOG_ERROR(prefix + "Non-stream transform error: " + std::string(e.what()));
            res.status = 500;
            res.set_content(make_error_body(e.what(), "proxy_error").dump(), "application/json");
        }
        return;
    }

    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");

    std::string body = req.body;
    res.set_chunked_content_provider(
        "text/event-stream",
        [this, url, body, headers, prefix](size_t, httplib::DataSink& sink) {
            active_streams++;

            // Blocking writes: a slow client stalls the upstream transfer
            StreamRelay relay(options, [&sink](const std::string& frame) {
                return sink.write(frame.data(), frame.size());
            }, prefix);

            HttpClient client;
            client.set_connect_timeout(connect_timeout);
            HttpResponse upstream = client.post_stream(url, body, headers,
                [this, &relay](const std::string& chunk) {
                    if (!running) {
                        return false;
                    }
                    return relay.on_upstream_bytes(chunk);
                });

            std::string transport_error;
            if (upstream.status_code == 0 && !upstream.aborted) {
                transport_error = upstream.error_message.empty() ? "Upstream unreachable" : upstream.error_message;
            } else if (!upstream.is_success() && upstream.status_code != 0) {
                LOG_WARN_FMT("{}Upstream returned {}", prefix, upstream.status_code);
            }

            relay.finish(transport_error);
            active_streams--;

            if (relay.client_connected()) {
                sink.done();
                return true;
            }
            return false;
        });
}

void BridgeServer::handle_models(const httplib::Request& req, httplib::Response& res) {
    requests_processed++;

    HttpClient client;
    client.set_timeout(timeout);
    client.set_connect_timeout(connect_timeout);
    HttpResponse upstream = client.get(upstream_url + "/v1/models", upstream_headers(req));

    if (upstream.status_code == 0) {
        LOG_ERROR("Models fetch error: " + upstream.error_message);
        res.status = 502;
        res.set_content(make_error_body(upstream.error_message, "proxy_error").dump(), "application/json");
        return;
    }

    res.status = static_cast<int>(upstream.status_code);
    res.set_content(upstream.body, "application/json");
}
