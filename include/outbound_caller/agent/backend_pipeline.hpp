#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "outbound_caller/agent/pipeline.hpp"
#include "outbound_caller/backend/client.hpp"
#include "outbound_caller/backend/ws_client.hpp"

namespace outbound_caller {

// Conversation pipeline hosted by the agent backend. The session is created over HTTP;
// speech events and tool calls flow over the session WebSocket.
class BackendPipeline : public ConversationPipeline {
public:
    BackendPipeline(std::string backend_url,
                    std::optional<std::string> authorization_token,
                    BackendRequestOptions options);
    ~BackendPipeline() override;

    void start(const std::string& instructions,
               const std::string& room,
               const SessionOptions& options) override;
    void set_participant(const std::string& identity) override;
    std::shared_ptr<Utterance> generate_reply(const std::string& instructions) override;
    std::shared_ptr<Utterance> current_utterance() const override;
    void stop() override;

    // Entry point for socket events; public so the protocol can be exercised directly.
    void handle_message(const nlohmann::json& message);
    // Installed by start(); tool calls arriving without a handler are answered as failed.
    void set_tool_handler(ToolHandler handler);

private:
    void handle_tool_call(const nlohmann::json& message);
    void interrupt_pending();
    void reap_tool_tasks();

    BackendClient backend_client_;
    BackendWsClient ws_client_;
    std::chrono::milliseconds connect_timeout_;
    ToolHandler on_tool_call_;
    std::optional<std::string> session_id_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Utterance>> pending_;
    std::shared_ptr<Utterance> current_;
    std::vector<std::future<void>> tool_tasks_;
    std::atomic<bool> stopping_{false};
    int next_reply_id_ = 0;
};

}
