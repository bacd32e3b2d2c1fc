#pragma once

#include "server.h"
#include "relay.h"
#include "../config.h"
#include <map>

/// @brief OpenAI-compatible proxy in front of a Harmony-emitting model server
/// Relays chat completions through the channel pipeline and proxies the
/// model list untouched.
class BridgeServer : public Server {
public:
    explicit BridgeServer(const Config& config);

protected:
    void register_endpoints() override;
    void add_status_info(nlohmann::json& status) override;

private:
    void handle_chat_completions(const httplib::Request& req, httplib::Response& res);
    void handle_models(const httplib::Request& req, httplib::Response& res);

    // Headers for the upstream request (content type, forwarded auth)
    std::map<std::string, std::string> upstream_headers(const httplib::Request& req) const;

    std::string upstream_url;
    long timeout;
    long connect_timeout;
    RelayOptions options;

    std::atomic<uint64_t> next_request_id{0};
    std::atomic<int> active_streams{0};
};
