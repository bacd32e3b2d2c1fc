#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>
#include <atomic>
#include <chrono>

/// @brief Base class for HTTP server frontends
/// Manages server lifecycle and the common endpoints (/health, /status)
class Server {
public:
    Server(const std::string& host, int port, const std::string& server_type);
    virtual ~Server();

    /// @brief Register endpoints and listen (blocks until shutdown)
    /// @return 0 on success, non-zero on error
    int run();

    /// @brief Initiate graceful shutdown
    void shutdown();

    bool is_running() const { return running; }

protected:
    /// @brief Register server-specific endpoints on the TCP server
    virtual void register_endpoints() = 0;

    /// @brief Add subclass-specific info to status response
    virtual void add_status_info(nlohmann::json& status) {}

    /// @brief Called before server starts listening (after endpoints registered)
    virtual void on_server_start() {}

    /// @brief Called after server stops listening
    virtual void on_server_stop() {}

    httplib::Server tcp_server;

    // Server state
    std::atomic<bool> running{true};
    std::chrono::steady_clock::time_point start_time;
    std::atomic<uint64_t> requests_processed{0};

    // Configuration
    std::string host;
    int port;
    std::string server_type;

private:
    /// @brief Register common endpoints (/health, /status)
    void register_common_endpoints();
};
