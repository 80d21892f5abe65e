#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "outbound_caller/agent/pipeline.hpp"
#include "outbound_caller/telephony/client.hpp"

namespace outbound_caller::testing {

inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

// Ordered record of calls made against the fakes.
class EventLog {
public:
    void add(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    // -1 when absent.
    int index_of(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < events_.size(); ++i) {
            if (events_[i] == event) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

enum class TransferBehavior {
    Joins,
    Busy,
    NeverJoins
};

// In-memory room server. The callee's sip.callStatus is set by the test; an
// answered dial returns once a status poll has observed "active".
class FakeRoomServer : public TelephonyClient, public RoomService {
public:
    explicit FakeRoomServer(std::shared_ptr<EventLog> log = std::make_shared<EventLog>())
        : log_(std::move(log)) {}

    std::string callee_identity = "phone_user";
    std::string transfer_identity = "transfer_target";
    std::optional<DialError> dial_error;
    TransferBehavior transfer_behavior = TransferBehavior::Joins;
    bool remove_participant_fails = false;
    // Runs before the callee dial blocks; may throw to simulate a broken gateway.
    std::function<void(const CreateCallRequest&)> on_callee_dial;

    // nullopt removes the callee from the room.
    void set_callee_status(std::optional<std::string> status) {
        std::lock_guard<std::mutex> lock(mutex_);
        callee_status_ = std::move(status);
    }

    Participant create_call(const CreateCallRequest& request) override {
        log_->add("create_call:" + request.identity);
        std::unique_lock<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (request.identity == transfer_identity) {
            if (transfer_behavior == TransferBehavior::Busy) {
                throw DialError("transfer target busy", 486, "Busy Here");
            }
            if (transfer_behavior == TransferBehavior::Joins) {
                transfer_joined_ = true;
            }
            return {request.identity, "PA_transfer", {}};
        }
        if (dial_error) {
            throw *dial_error;
        }
        if (on_callee_dial) {
            on_callee_dial(request);
        }
        cv_.wait(lock, [this]() { return answered_ || deleted_; });
        if (!answered_) {
            throw TelephonyError("room deleted while dialing", "not_found");
        }
        return {request.identity, "PA_callee", {}};
    }

    bool remove_participant(const std::string& room, const std::string& identity) override {
        log_->add("remove_participant:" + identity);
        if (remove_participant_fails) {
            throw TelephonyError("remove participant failed", "internal");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        removed_.push_back(identity);
        return room_exists_locked();
    }

    bool delete_room(const std::string&) override {
        log_->add("delete_room");
        std::lock_guard<std::mutex> lock(mutex_);
        ++delete_count_;
        const bool existed = !deleted_;
        deleted_ = true;
        cv_.notify_all();
        return existed;
    }

    std::optional<Participant> get_participant(const std::string&,
                                               const std::string& identity) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (deleted_) {
            return std::nullopt;
        }
        if (identity == transfer_identity) {
            if (!transfer_joined_) {
                return std::nullopt;
            }
            return Participant{identity, "PA_transfer", {}};
        }
        ++callee_polls_;
        if (!callee_status_) {
            return std::nullopt;
        }
        if (*callee_status_ == "active") {
            answered_ = true;
            cv_.notify_all();
        }
        return Participant{identity, "PA_callee", {{"sip.callStatus", *callee_status_}}};
    }

    std::vector<CreateCallRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<std::string> removed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed_;
    }

    int delete_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delete_count_;
    }

    int callee_polls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return callee_polls_;
    }

private:
    bool room_exists_locked() const { return !deleted_; }

    std::shared_ptr<EventLog> log_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<std::string> callee_status_ = std::string("ringing");
    std::vector<CreateCallRequest> requests_;
    std::vector<std::string> removed_;
    bool answered_ = false;
    bool deleted_ = false;
    bool transfer_joined_ = false;
    int delete_count_ = 0;
    int callee_polls_ = 0;
};

// Records what the call asked of the agent. Replies finish immediately unless
// hold_replies is set.
class FakePipeline : public ConversationPipeline {
public:
    explicit FakePipeline(std::shared_ptr<EventLog> log = std::make_shared<EventLog>())
        : log_(std::move(log)) {}

    bool hold_replies = false;
    std::optional<std::string> start_error;

    void start(const std::string& instructions,
               const std::string& room,
               const SessionOptions& options) override {
        log_->add("session_start");
        {
            std::unique_lock<std::mutex> lock(mutex_);
            start_cv_.wait(lock, [this]() { return !start_held_; });
        }
        if (start_error) {
            throw std::runtime_error(*start_error);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        instructions_ = instructions;
        room_ = room;
        options_ = options;
        started_ = true;
        log_->add("session_ready");
    }

    // While held, start() blocks after logging "session_start".
    void hold_start() {
        std::lock_guard<std::mutex> lock(mutex_);
        start_held_ = true;
    }

    void release_start() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            start_held_ = false;
        }
        start_cv_.notify_all();
    }

    void set_participant(const std::string& identity) override {
        log_->add("set_participant:" + identity);
        std::lock_guard<std::mutex> lock(mutex_);
        participant_ = identity;
    }

    std::shared_ptr<Utterance> generate_reply(const std::string& instructions) override {
        log_->add("generate_reply");
        std::shared_ptr<Utterance> utterance;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            replies_.push_back(instructions);
            utterance = std::make_shared<Utterance>(
                "reply-" + std::to_string(replies_.size()), instructions);
            if (hold_replies) {
                current_ = utterance;
            }
        }
        if (!hold_replies) {
            utterance->finish();
        }
        return utterance;
    }

    std::shared_ptr<Utterance> current_utterance() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    void stop() override {
        log_->add("session_stop");
        stopped_ = true;
    }

    void set_current_utterance(std::shared_ptr<Utterance> utterance) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(utterance);
    }

    ToolOutput invoke_tool(const std::string& name,
                           nlohmann::json arguments = nlohmann::json::object()) {
        ToolHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = options_.on_tool_call;
        }
        if (!handler) {
            throw std::logic_error("no tool handler registered");
        }
        return handler({"call-" + name, name, std::move(arguments)});
    }

    bool started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    std::optional<std::string> participant() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return participant_;
    }

    std::vector<std::string> replies() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return replies_;
    }

    std::string instructions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return instructions_;
    }

    SessionOptions options() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return options_;
    }

    bool stopped() const { return stopped_; }

private:
    std::shared_ptr<EventLog> log_;
    mutable std::mutex mutex_;
    std::condition_variable start_cv_;
    bool start_held_ = false;
    std::string instructions_;
    std::string room_;
    SessionOptions options_;
    bool started_ = false;
    std::optional<std::string> participant_;
    std::vector<std::string> replies_;
    std::shared_ptr<Utterance> current_;
    std::atomic<bool> stopped_{false};
};

}
