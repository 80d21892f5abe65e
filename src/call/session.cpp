#include "outbound_caller/call/session.hpp"

#include <stdexcept>
#include <utility>

namespace outbound_caller {

namespace {

int status_rank(CallStatus status) {
    switch (status) {
        case CallStatus::Pending:
            return 0;
        case CallStatus::Ringing:
            return 1;
        case CallStatus::Automation:
        case CallStatus::Active:
            return 2;
        case CallStatus::Hangup:
        case CallStatus::Failed:
            return 3;
    }
    return 0;
}

}

const char* to_string(CallStatus status) {
    switch (status) {
        case CallStatus::Pending:
            return "pending";
        case CallStatus::Ringing:
            return "ringing";
        case CallStatus::Automation:
            return "automation";
        case CallStatus::Active:
            return "active";
        case CallStatus::Hangup:
            return "hangup";
        case CallStatus::Failed:
            return "failed";
    }
    return "unknown";
}

bool is_terminal(CallStatus status) {
    return status == CallStatus::Hangup || status == CallStatus::Failed;
}

const char* to_string(CloseReason reason) {
    switch (reason) {
        case CloseReason::Completed:
            return "completed";
        case CloseReason::Voicemail:
            return "voicemail";
        case CloseReason::Transferred:
            return "transferred";
        case CloseReason::TransferFailed:
            return "transfer_failed";
        case CloseReason::CalleeHangup:
            return "callee_hangup";
        case CloseReason::DialFailed:
            return "dial_failed";
        case CloseReason::TimedOut:
            return "timed_out";
        case CloseReason::Failed:
            return "failed";
    }
    return "unknown";
}

CallSession::CallSession(std::string room, DialInfo dial_info)
    : room_(std::move(room)),
      dial_info_(std::move(dial_info)),
      started_at_(std::chrono::steady_clock::now()) {}

const std::string& CallSession::room() const {
    return room_;
}

const DialInfo& CallSession::dial_info() const {
    return dial_info_;
}

std::chrono::steady_clock::time_point CallSession::started_at() const {
    return started_at_;
}

std::optional<std::string> CallSession::callee_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callee_identity_;
}

void CallSession::set_callee_identity(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (callee_identity_) {
        throw std::logic_error("callee identity already set to " + *callee_identity_);
    }
    callee_identity_ = identity;
}

CallStatus CallSession::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool CallSession::update_status(CallStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status == status_ || is_terminal(status_)) {
        return false;
    }
    if (status_rank(status) < status_rank(status_)) {
        return false;
    }
    status_ = status;
    return true;
}

void CallSession::attach_session(std::shared_ptr<SessionController> handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_handle_) {
        throw std::logic_error("conversation session already attached");
    }
    session_handle_ = std::move(handle);
}

std::shared_ptr<SessionController> CallSession::session_handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_handle_;
}

bool CallSession::close(CloseReason reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_reason_) {
            return false;
        }
        close_reason_ = reason;
    }
    closed_cv_.notify_all();
    return true;
}

bool CallSession::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_.has_value();
}

std::optional<CloseReason> CallSession::close_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
}

bool CallSession::wait_closed(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return closed_cv_.wait_for(lock, timeout, [this]() { return close_reason_.has_value(); });
}

}
