#include "outbound_caller/server/rest_server.hpp"

#include <httplib.h>

#include <utility>

#include "outbound_caller/logging.hpp"
#include "outbound_caller/metrics.hpp"

namespace outbound_caller {

RestServer::RestServer(const Config& config, StatusHandler on_status)
    : config_(config),
      on_status_(std::move(on_status)) {}

RestServer::~RestServer() {
    stop();
}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Get("/status", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        try {
            res.set_content(on_status_().dump(), "application/json");
        } catch (const std::exception& ex) {
            logging::error("Failed to render call status", {kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"status unavailable"})", "application/json");
        }
    });

    server_thread_ = std::thread([this]() {
        logging::info("REST server listening", {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::warn("REST server stopped listening", {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

}
