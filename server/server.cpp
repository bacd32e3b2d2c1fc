#include "../bridge.h"
#include "server.h"
#include <unistd.h>

using json = nlohmann::json;

Server::Server(const std::string& host, int port, const std::string& server_type)
    : host(host), port(port), server_type(server_type) {
}

Server::~Server() {
    shutdown();
}

void Server::shutdown() {
    if (!running.exchange(false)) {
        return;  // Already shutting down
    }
    LOG_INFO("Server shutdown requested");
    tcp_server.stop();
}

void Server::register_common_endpoints() {
    // GET /health - Health check
    tcp_server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        json response = {
            {"status", "ok"},
            {"server_type", server_type}
        };
        res.set_content(response.dump(), "application/json");
    });

    // GET /status - Server status
    tcp_server.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time).count();

        json status = {
            {"status", "ok"},
            {"server_type", server_type},
            {"version", BRIDGE_VERSION},
            {"uptime_seconds", uptime},
            {"requests_processed", requests_processed.load()},
            {"pid", getpid()},
            {"host", host},
            {"port", port}
        };

        // Let subclass add additional info
        add_status_info(status);

        res.set_content(status.dump(), "application/json");
    });
}

int Server::run() {
    start_time = std::chrono::steady_clock::now();

    register_common_endpoints();
    register_endpoints();

    tcp_server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        dout(1) << req.method << " " << req.path << " -> " << res.status << std::endl;
    });

    on_server_start();

    LOG_INFO_FMT("{} server ready on {}:{}", server_type, host, port);

    // Blocks until stopped
    bool success = tcp_server.listen(host.c_str(), port);

    running = false;
    on_server_stop();

    if (!success) {
        LOG_ERROR_FMT("Failed to start {} server on {}:{}", server_type, host, port);
        return 1;
    }

    LOG_INFO(server_type + " server stopped");
    return 0;
}
