#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace outbound_caller {

// One unit of synthesized speech played by the agent.
class Utterance {
public:
    Utterance(std::string id, std::string text);

    const std::string& id() const;
    const std::string& text() const;

    // Blocks until playout finished or was interrupted.
    void wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;
    bool done() const;
    bool interrupted() const;

    // Idempotent; the first call decides whether the utterance counts as interrupted.
    void finish(bool interrupted = false);

private:
    const std::string id_;
    const std::string text_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool done_ = false;
    bool interrupted_ = false;
};

struct ToolCall {
    std::string call_id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ToolOutput {
    bool ok = true;
    std::string message;
};

using ToolHandler = std::function<ToolOutput(const ToolCall&)>;

struct SessionOptions {
    // The remote participant whose audio the agent listens to once bound.
    std::string participant_identity;
    nlohmann::json tools = nlohmann::json::array();
    ToolHandler on_tool_call;
};

// Speech pipeline bound to a room: VAD, turn detection, STT, LLM and TTS live behind it.
class ConversationPipeline {
public:
    virtual ~ConversationPipeline() = default;

    // Audio arriving after this call returns is captured and transcribed.
    virtual void start(const std::string& instructions,
                       const std::string& room,
                       const SessionOptions& options) = 0;
    // Turn-taking begins only once a participant is bound.
    virtual void set_participant(const std::string& identity) = 0;
    virtual std::shared_ptr<Utterance> generate_reply(const std::string& instructions) = 0;
    // Null while the agent is silent.
    virtual std::shared_ptr<Utterance> current_utterance() const = 0;
    virtual void stop() = 0;
};

}
