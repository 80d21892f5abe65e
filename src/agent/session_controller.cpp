#include "outbound_caller/agent/session_controller.hpp"

#include <stdexcept>
#include <utility>

#include "outbound_caller/logging.hpp"
#include "outbound_caller/utils/async.hpp"

namespace outbound_caller {

SessionController::SessionController(std::shared_ptr<ConversationPipeline> pipeline)
    : pipeline_(std::move(pipeline)) {
    if (!pipeline_) {
        throw std::invalid_argument("conversation pipeline is required");
    }
}

SessionController::~SessionController() {
    close();
}

std::shared_future<void> SessionController::start(const std::string& instructions,
                                                  const std::string& room,
                                                  SessionOptions options) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_.valid()) {
        throw std::logic_error("conversation session already started");
    }
    if (closed_) {
        throw std::logic_error("conversation session is closed");
    }
    logging::info("Starting conversation session", {kv("room", room)});
    auto pipeline = pipeline_;
    started_ = utils::run_async([pipeline, instructions, room, options = std::move(options)]() {
                   pipeline->start(instructions, room, options);
                   logging::debug("Conversation session listening", {kv("room", room)});
               }).share();
    return started_;
}

void SessionController::set_participant(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw std::logic_error("conversation session is closed");
    }
    if (!started_.valid()) {
        throw std::logic_error("conversation session not started");
    }
    if (participant_) {
        throw std::logic_error("participant already bound: " + *participant_);
    }
    pipeline_->set_participant(identity);
    participant_ = identity;
    logging::info("Agent bound to participant", {kv("identity", identity)});
}

bool SessionController::has_participant() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return participant_.has_value();
}

std::string SessionController::participant() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!participant_) {
        throw std::logic_error("no participant bound to the conversation session");
    }
    return *participant_;
}

std::shared_ptr<Utterance> SessionController::current_utterance() const {
    return pipeline_->current_utterance();
}

std::shared_ptr<Utterance> SessionController::generate_reply(const std::string& instructions) {
    if (closed_) {
        throw std::logic_error("conversation session is closed");
    }
    return pipeline_->generate_reply(instructions);
}

void SessionController::drain() const {
    if (auto utterance = current_utterance()) {
        logging::debug("Waiting for utterance playout", {kv("utterance_id", utterance->id())});
        utterance->wait();
    }
}

void SessionController::close() {
    if (closed_.exchange(true)) {
        return;
    }
    std::shared_future<void> started;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        started = started_;
    }
    if (started.valid()) {
        try {
            started.get();
        } catch (const std::exception& ex) {
            logging::warn("Conversation session never started", {kv("error", ex.what())});
        }
    }
    pipeline_->stop();
    logging::debug("Conversation session closed");
}

bool SessionController::closed() const {
    return closed_;
}

}
