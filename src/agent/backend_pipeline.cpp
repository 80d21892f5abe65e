#include "outbound_caller/agent/backend_pipeline.hpp"

#include <chrono>
#include <utility>

#include "outbound_caller/logging.hpp"
#include "outbound_caller/utils/async.hpp"

namespace outbound_caller {

BackendPipeline::BackendPipeline(std::string backend_url,
                                 std::optional<std::string> authorization_token,
                                 BackendRequestOptions options)
    : backend_client_(backend_url, authorization_token, options),
      ws_client_(std::move(backend_url), std::move(authorization_token)),
      connect_timeout_(options.connect_timeout) {}

BackendPipeline::~BackendPipeline() {
    stop();
}

void BackendPipeline::start(const std::string& instructions,
                            const std::string& room,
                            const SessionOptions& options) {
    set_tool_handler(options.on_tool_call);

    nlohmann::json payload;
    payload["room"] = room;
    payload["instructions"] = instructions;
    payload["participant_identity"] = options.participant_identity;
    payload["tools"] = options.tools;
    const auto response = backend_client_.post_json("/session", payload);
    const auto session_id = response.at("session_id").get<std::string>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_id_ = session_id;
    }
    logging::info(
        "Agent backend session created",
        {kv("session_id", session_id), kv("room", room)});

    ws_client_.connect(
        session_id,
        [this](const nlohmann::json& message) { handle_message(message); },
        [this, session_id]() {
            logging::info("Agent backend stream closed", {kv("session_id", session_id)});
            interrupt_pending();
        });
    if (!ws_client_.wait_connected(connect_timeout_)) {
        throw BackendError("agent backend stream did not open for session " + session_id);
    }
}

void BackendPipeline::set_tool_handler(ToolHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_tool_call_ = std::move(handler);
}

void BackendPipeline::set_participant(const std::string& identity) {
    const bool sent = ws_client_.send_json({{"type", "set_participant"}, {"identity", identity}});
    if (!sent) {
        throw BackendError("agent backend stream is not connected");
    }
}

std::shared_ptr<Utterance> BackendPipeline::generate_reply(const std::string& instructions) {
    std::shared_ptr<Utterance> utterance;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        utterance = std::make_shared<Utterance>("reply-" + std::to_string(++next_reply_id_),
                                                instructions);
        if (!stopping_) {
            pending_[utterance->id()] = utterance;
            current_ = utterance;
        }
    }
    if (stopping_) {
        utterance->finish(true);
        return utterance;
    }
    const bool sent = ws_client_.send_json({{"type", "generate_reply"},
                                            {"id", utterance->id()},
                                            {"instructions", instructions}});
    if (!sent) {
        logging::warn(
            "Reply dropped, agent backend stream is not connected",
            {kv("utterance_id", utterance->id())});
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(utterance->id());
        if (current_ == utterance) {
            current_.reset();
        }
        utterance->finish(true);
    }
    return utterance;
}

std::shared_ptr<Utterance> BackendPipeline::current_utterance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void BackendPipeline::stop() {
    {
        // Taken together with the task push in handle_tool_call, so no task can be
        // queued after the swap below.
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.exchange(true)) {
            return;
        }
    }
    interrupt_pending();

    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tool_tasks_);
    }
    for (auto& task : tasks) {
        task.wait();
    }
    ws_client_.stop();

    std::optional<std::string> session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_id = session_id_;
    }
    if (!session_id) {
        return;
    }
    try {
        backend_client_.delete_json("/session/" + *session_id);
    } catch (const std::exception& ex) {
        logging::warn(
            "Agent backend session delete failed",
            {kv("session_id", *session_id), kv("error", ex.what())});
    }
}

void BackendPipeline::handle_message(const nlohmann::json& message) {
    const auto type = message.value("type", "");
    if (type == "utterance_started") {
        const auto id = message.value("id", "");
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            it = pending_.emplace(id, std::make_shared<Utterance>(id, message.value("text", "")))
                     .first;
        }
        current_ = it->second;
        return;
    }
    if (type == "utterance_finished") {
        const auto id = message.value("id", "");
        std::shared_ptr<Utterance> utterance;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = pending_.find(id);
            if (it == pending_.end()) {
                return;
            }
            utterance = it->second;
            pending_.erase(it);
            if (current_ == utterance) {
                current_.reset();
            }
        }
        utterance->finish(message.value("interrupted", false));
        return;
    }
    if (type == "tool_call") {
        handle_tool_call(message);
        return;
    }
    if (type == "transcript") {
        logging::debug(
            "Transcript",
            {kv("role", message.value("role", "")), kv("text", message.value("text", ""))});
        return;
    }
    if (type == "error") {
        logging::warn("Agent backend error", {kv("message", message.value("message", ""))});
        return;
    }
    logging::debug("Agent backend event ignored", {kv("type", type)});
}

// Tool handlers may wait on utterances finished by later socket events, so they must
// not run on the socket thread.
void BackendPipeline::handle_tool_call(const nlohmann::json& message) {
    ToolCall call;
    call.call_id = message.value("call_id", "");
    call.name = message.value("name", "");
    if (message.contains("arguments") && message["arguments"].is_object()) {
        call.arguments = message["arguments"];
    }
    reap_tool_tasks();
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || !on_tool_call_) {
        ws_client_.send_json({{"type", "tool_result"},
                              {"call_id", call.call_id},
                              {"ok", false},
                              {"message", "call has ended"}});
        return;
    }
    tool_tasks_.push_back(utils::run_async([this, handler = on_tool_call_, call]() {
        ToolOutput output;
        try {
            output = handler(call);
        } catch (const std::exception& ex) {
            logging::error(
                "Tool call failed",
                {kv("tool", call.name), kv("call_id", call.call_id), kv("error", ex.what())});
            output = {false, "the action could not be completed"};
        }
        ws_client_.send_json({{"type", "tool_result"},
                              {"call_id", call.call_id},
                              {"ok", output.ok},
                              {"message", output.message}});
    }));
}

void BackendPipeline::interrupt_pending() {
    std::map<std::string, std::shared_ptr<Utterance>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
        current_.reset();
    }
    for (auto& entry : pending) {
        entry.second->finish(true);
    }
}

void BackendPipeline::reap_tool_tasks() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tool_tasks_.begin();
    while (it != tool_tasks_.end()) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = tool_tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

}
