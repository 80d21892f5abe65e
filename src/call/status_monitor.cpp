#include "outbound_caller/call/status_monitor.hpp"

#include <utility>

#include "outbound_caller/logging.hpp"

namespace outbound_caller {

CallStatus classify(const Attributes& attributes) {
    const auto it = attributes.find(kCallStatusAttribute);
    if (it == attributes.end()) {
        return CallStatus::Pending;
    }
    const auto& value = it->second;
    if (value == "dialing" || value == "ringing") {
        return CallStatus::Ringing;
    }
    if (value == "automation") {
        return CallStatus::Automation;
    }
    if (value == "active") {
        return CallStatus::Active;
    }
    if (value == "hangup") {
        return CallStatus::Hangup;
    }
    if (value == "failed" || value == "error") {
        return CallStatus::Failed;
    }
    return CallStatus::Pending;
}

StatusMonitor::StatusMonitor(RoomService& rooms,
                             std::shared_ptr<CallSession> session,
                             std::string identity,
                             std::chrono::milliseconds poll_interval)
    : rooms_(rooms),
      session_(std::move(session)),
      identity_(std::move(identity)),
      poll_interval_(poll_interval) {}

StatusMonitor::~StatusMonitor() {
    disarm();
}

bool StatusMonitor::ends_phase(MonitorPhase phase, CallStatus status) {
    if (is_terminal(status)) {
        return true;
    }
    return phase == MonitorPhase::Answer && status == CallStatus::Active;
}

void StatusMonitor::arm(MonitorPhase phase,
                        std::optional<std::chrono::milliseconds> budget,
                        StatusHandler on_phase_end,
                        TimeoutHandler on_timeout) {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (budget) {
        deadline = std::chrono::steady_clock::now() + *budget;
    }
    logging::debug(
        "Status monitor armed",
        {kv("room", session_->room()),
         kv("identity", identity_),
         kv("phase", phase == MonitorPhase::Answer ? "answer" : "connected")});

    task_.start(poll_interval_, [this, phase, deadline,
                                 on_phase_end = std::move(on_phase_end),
                                 on_timeout = std::move(on_timeout)]() {
        if (session_->is_closed()) {
            return false;
        }
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            logging::info(
                "Status wait budget elapsed",
                {kv("room", session_->room()),
                 kv("status", to_string(session_->status()))});
            if (on_timeout) {
                on_timeout();
            }
            return false;
        }
        CallStatus status = CallStatus::Pending;
        try {
            status = poll_once();
        } catch (const TelephonyError& ex) {
            logging::warn(
                "Call status poll failed",
                {kv("room", session_->room()), kv("error", ex.what())});
            return true;
        }
        if (!ends_phase(phase, status)) {
            return true;
        }
        if (on_phase_end) {
            on_phase_end(status);
        }
        return false;
    });
}

void StatusMonitor::disarm() {
    task_.stop();
}

bool StatusMonitor::armed() const {
    return task_.running();
}

CallStatus StatusMonitor::poll_once() {
    ++poll_count_;
    const auto participant = rooms_.get_participant(session_->room(), identity_);
    CallStatus status = CallStatus::Pending;
    if (participant) {
        participant_seen_ = true;
        status = classify(participant->attributes);
    } else if (participant_seen_) {
        // The SIP leg left the room.
        status = CallStatus::Hangup;
    }
    record(status);
    return status;
}

void StatusMonitor::record(CallStatus status) {
    const auto previous = session_->status();
    if (!session_->update_status(status)) {
        return;
    }
    if (status == CallStatus::Automation) {
        logging::info(
            "Callee line in automation (DTMF dialing)",
            {kv("room", session_->room()), kv("identity", identity_)});
        return;
    }
    logging::info(
        "Call status changed",
        {kv("room", session_->room()),
         kv("identity", identity_),
         kv("from", to_string(previous)),
         kv("to", to_string(status))});
}

std::size_t StatusMonitor::poll_count() const {
    return poll_count_;
}

}
