#include "outbound_caller/backend/ws_client.hpp"

#include <chrono>
#include <memory>
#include <thread>
#include <utility>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
#include <websocketpp/config/asio_client.hpp>
#endif

#include "outbound_caller/logging.hpp"
#include "outbound_caller/utils/http.hpp"

namespace outbound_caller {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
using WssClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = websocketpp::lib::asio::ssl::context;
using TlsSocket = websocketpp::lib::asio::ssl::stream<websocketpp::lib::asio::ip::tcp::socket>;
#endif

constexpr auto kReconnectDelay = std::chrono::seconds(2);

template <typename Client>
void prepare_transport(Client&, const std::string&) {}

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
void prepare_transport(WssClient& client, const std::string& host) {
    client.set_tls_init_handler([](websocketpp::connection_hdl) {
        auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tls_client);
        context->set_default_verify_paths();
        context->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
        return context;
    });
    client.set_socket_init_handler(
        [host](websocketpp::connection_hdl, TlsSocket& stream) {
            SSL_set_tlsext_host_name(stream.native_handle(), host.c_str());
        });
}
#endif

}

// Type-erased handle on the live endpoint so send/stop work for ws and wss alike.
struct BackendWsClient::WsState {
    std::function<void(const std::string&, websocketpp::lib::error_code&)> send;
    std::function<void()> shutdown;
};

BackendWsClient::BackendWsClient(std::string base_url,
                                 std::optional<std::string> authorization_token)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)) {}

BackendWsClient::~BackendWsClient() {
    stop();
}

void BackendWsClient::connect(const std::string& session_id,
                              MessageHandler on_message,
                              EventHandler on_close) {
    if (running_) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    session_id_ = session_id;
    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);
    running_ = true;
    worker_ = std::thread([this]() { run_loop(); });
}

bool BackendWsClient::send_json(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!open_ || !ws_state_) {
        return false;
    }
    websocketpp::lib::error_code ec;
    ws_state_->send(payload.dump(), ec);
    if (ec) {
        logging::warn("WebSocket send failed", {kv("error", ec.message())});
        return false;
    }
    return true;
}

bool BackendWsClient::connected() const {
    return open_;
}

bool BackendWsClient::wait_connected(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(ws_mutex_);
    return open_cv_.wait_for(lock, timeout, [this]() { return open_.load() || !running_; }) &&
           open_;
}

void BackendWsClient::stop() {
    if (running_.exchange(false)) {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_) {
            ws_state_->shutdown();
        }
    }
    open_cv_.notify_all();
    // The worker may already have given up on its own; it still has to be joined.
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

bool BackendWsClient::secure_transport_available() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    return true;
#else
    return false;
#endif
}

void BackendWsClient::run_loop() {
    const auto url = make_ws_url(session_id_);
    const bool secure = url.rfind("wss://", 0) == 0;
    if (secure && !secure_transport_available()) {
        logging::error(
            "WebSocket TLS requires OpenSSL support",
            {kv("url", url), kv("session_id", session_id_)});
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            running_ = false;
        }
        open_cv_.notify_all();
        return;
    }
    while (running_) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        const bool keep_going =
            secure ? run_connection<WssClient>(url) : run_connection<WsClient>(url);
#else
        const bool keep_going = run_connection<WsClient>(url);
#endif
        if (!keep_going) {
            break;
        }
        if (running_) {
            std::this_thread::sleep_for(kReconnectDelay);
        }
    }
}

template <typename Client>
bool BackendWsClient::run_connection(const std::string& url) {
    auto client = std::make_shared<Client>();
    client->clear_access_channels(websocketpp::log::alevel::all);
    client->clear_error_channels(websocketpp::log::elevel::all);
    client->init_asio();

    std::string scheme;
    std::string host;
    std::string path;
    int port = 0;
    utils::parse_url(url, scheme, host, port, path);
    prepare_transport(*client, host);

    client->set_open_handler([this](websocketpp::connection_hdl) {
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            open_ = true;
        }
        open_cv_.notify_all();
        logging::debug("WebSocket connected", {kv("session_id", session_id_)});
    });
    client->set_message_handler([this](websocketpp::connection_hdl,
                                       typename Client::message_ptr msg) {
        nlohmann::json payload;
        try {
            payload = nlohmann::json::parse(msg->get_payload());
        } catch (const nlohmann::json::exception& ex) {
            logging::warn(
                "WebSocket message is not JSON",
                {kv("error", ex.what()), kv("session_id", session_id_)});
            return;
        }
        if (on_message_) {
            on_message_(payload);
        }
    });
    client->set_close_handler([this](websocketpp::connection_hdl) {
        open_ = false;
        if (on_close_) {
            on_close_();
        }
    });
    client->set_fail_handler([this](websocketpp::connection_hdl) {
        open_ = false;
        logging::warn("WebSocket connection failed", {kv("session_id", session_id_)});
    });

    websocketpp::lib::error_code ec;
    auto conn = client->get_connection(url, ec);
    if (ec) {
        logging::error(
            "WebSocket connection setup failed",
            {kv("error", ec.message()), kv("session_id", session_id_)});
        return true;
    }
    if (authorization_token_) {
        conn->append_header("Authorization", "Bearer " + *authorization_token_);
    }
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (!running_) {
            return false;
        }
        auto state = std::make_unique<WsState>();
        const websocketpp::connection_hdl handle = conn->get_handle();
        state->send = [client, handle](const std::string& text,
                                       websocketpp::lib::error_code& error) {
            client->send(handle, text, websocketpp::frame::opcode::text, error);
        };
        state->shutdown = [client, handle]() {
            websocketpp::lib::error_code close_ec;
            if (!handle.expired()) {
                client->close(handle, websocketpp::close::status::going_away, "shutdown",
                              close_ec);
            }
            client->stop();
        };
        ws_state_ = std::move(state);
    }
    client->connect(conn);
    client->run();

    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        ws_state_.reset();
        open_ = false;
    }
    return true;
}

std::string BackendWsClient::make_ws_url(const std::string& session_id) const {
    return utils::join_path(utils::to_ws_url(base_url_), "/ws/" + session_id);
}

}
