#include "outbound_caller/backend/client.hpp"

#include <httplib.h>

#include <utility>

#include "outbound_caller/utils/http.hpp"

namespace outbound_caller {

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {
    utils::parse_url(base_url_, scheme_, host_, port_, base_path_);
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https") {
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }
#endif
    client_ = std::make_unique<httplib::Client>(utils::build_url(scheme_, host_, port_, ""));
    client_->set_connection_timeout(options_.connect_timeout.count(), 0);
    client_->set_read_timeout(options_.sock_read_timeout.count(), 0);
    client_->set_write_timeout(options_.request_timeout.count(), 0);
}

BackendClient::~BackendClient() = default;

nlohmann::json BackendClient::post_json(const std::string& path, const nlohmann::json& body) {
    auto headers = httplib::Headers{{"Accept", "application/json"}};
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    auto response = client_->Post(utils::join_path(base_path_, path).c_str(), headers,
                                  body.dump(), "application/json");
    if (!response) {
        throw BackendError("Backend request failed: " + httplib::to_string(response.error()));
    }
    return parse_response(response->status, response->body);
}

nlohmann::json BackendClient::delete_json(const std::string& path) {
    auto headers = httplib::Headers{{"Accept", "application/json"}};
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    auto response = client_->Delete(utils::join_path(base_path_, path).c_str(), headers);
    if (!response) {
        throw BackendError("Backend request failed: " + httplib::to_string(response.error()));
    }
    return parse_response(response->status, response->body);
}

const std::string& BackendClient::base_url() const {
    return base_url_;
}

nlohmann::json BackendClient::parse_response(int status, const std::string& body) const {
    if (status == 403) {
        throw BackendPermissionError(body);
    }
    if (status < 200 || status >= 300) {
        throw BackendError(body.empty() ? "backend status " + std::to_string(status) : body);
    }
    if (body.empty()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(body);
}

}
