#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "outbound_caller/config.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace outbound_caller {

// Health, metrics and call status endpoints for the job's lifetime.
class RestServer {
public:
    using StatusHandler = std::function<nlohmann::json()>;

    RestServer(const Config& config, StatusHandler on_status);
    ~RestServer();

    void start();
    void stop();

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;

    const Config& config_;
    StatusHandler on_status_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
