#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "outbound_caller/agent/pipeline.hpp"

namespace outbound_caller {

// Owns the conversation pipeline for one call and guards its lifecycle.
class SessionController {
public:
    explicit SessionController(std::shared_ptr<ConversationPipeline> pipeline);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Returns immediately; the future is ready once the pipeline is listening and
    // rethrows its start failure.
    std::shared_future<void> start(const std::string& instructions,
                                   const std::string& room,
                                   SessionOptions options);

    void set_participant(const std::string& identity);
    bool has_participant() const;
    // Throws std::logic_error before set_participant.
    std::string participant() const;

    std::shared_ptr<Utterance> current_utterance() const;
    std::shared_ptr<Utterance> generate_reply(const std::string& instructions);
    // Waits for the in-flight utterance, if any.
    void drain() const;

    void close();
    bool closed() const;

private:
    std::shared_ptr<ConversationPipeline> pipeline_;
    mutable std::mutex mutex_;
    std::shared_future<void> started_;
    std::optional<std::string> participant_;
    std::atomic<bool> closed_{false};
};

}
