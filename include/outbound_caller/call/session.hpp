#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "outbound_caller/job.hpp"

namespace outbound_caller {

class SessionController;
class StatusMonitor;

enum class CallStatus {
    Pending,
    Ringing,
    Automation,
    Active,
    Hangup,
    Failed
};

const char* to_string(CallStatus status);
bool is_terminal(CallStatus status);

enum class CloseReason {
    Completed,
    Voicemail,
    Transferred,
    TransferFailed,
    CalleeHangup,
    DialFailed,
    TimedOut,
    Failed
};

const char* to_string(CloseReason reason);

// State of one outbound call attempt. Status is advanced only by the StatusMonitor;
// closing happens exactly once.
class CallSession {
public:
    CallSession(std::string room, DialInfo dial_info);

    CallSession(const CallSession&) = delete;
    CallSession& operator=(const CallSession&) = delete;

    const std::string& room() const;
    const DialInfo& dial_info() const;
    std::chrono::steady_clock::time_point started_at() const;

    std::optional<std::string> callee_identity() const;
    void set_callee_identity(const std::string& identity);

    CallStatus status() const;

    void attach_session(std::shared_ptr<SessionController> handle);
    std::shared_ptr<SessionController> session_handle() const;

    // Returns true for the first caller only.
    bool close(CloseReason reason);
    bool is_closed() const;
    std::optional<CloseReason> close_reason() const;
    bool wait_closed(std::chrono::milliseconds timeout) const;

private:
    friend class StatusMonitor;

    // Lower-ranked updates and updates after a terminal status are ignored.
    bool update_status(CallStatus status);

    const std::string room_;
    const DialInfo dial_info_;
    const std::chrono::steady_clock::time_point started_at_;

    mutable std::mutex mutex_;
    mutable std::condition_variable closed_cv_;
    std::optional<std::string> callee_identity_;
    CallStatus status_ = CallStatus::Pending;
    std::shared_ptr<SessionController> session_handle_;
    std::optional<CloseReason> close_reason_;
};

}
