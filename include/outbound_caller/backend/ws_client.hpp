#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace outbound_caller {

class BackendWsClient {
public:
    using MessageHandler = std::function<void(const nlohmann::json&)>;
    using EventHandler = std::function<void()>;

    BackendWsClient(std::string base_url, std::optional<std::string> authorization_token);
    ~BackendWsClient();

    void connect(const std::string& session_id,
                 MessageHandler on_message,
                 EventHandler on_close);
    // Returns false when there is no open connection.
    bool send_json(const nlohmann::json& payload);
    bool connected() const;
    bool wait_connected(std::chrono::milliseconds timeout) const;
    void stop();

    // False when the build has no TLS support, so wss:// endpoints cannot be reached.
    static bool secure_transport_available();

private:
    void run_loop();
    // Runs one connection until it closes. Returns false when the client is stopping.
    template <typename Client>
    bool run_connection(const std::string& url);
    std::string make_ws_url(const std::string& session_id) const;

    std::string base_url_;
    std::optional<std::string> authorization_token_;
    std::string session_id_;
    MessageHandler on_message_;
    EventHandler on_close_;
    std::atomic<bool> running_{false};
    std::atomic<bool> open_{false};
    std::thread worker_;
    mutable std::mutex ws_mutex_;
    mutable std::condition_variable open_cv_;
    struct WsState;
    std::unique_ptr<WsState> ws_state_;
};

}
