#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "outbound_caller/call/session.hpp"
#include "outbound_caller/telephony/client.hpp"
#include "outbound_caller/utils/async.hpp"

namespace outbound_caller {

inline constexpr const char* kCallStatusAttribute = "sip.callStatus";

// Maps the participant's reported sip.callStatus attribute onto a CallStatus.
CallStatus classify(const Attributes& attributes);

enum class MonitorPhase {
    // Waiting for the callee to pick up: active, hangup and failed end the phase.
    Answer,
    // Callee is on the line: only hangup and failed end the phase.
    Connected
};

class StatusMonitor {
public:
    using StatusHandler = std::function<void(CallStatus)>;
    using TimeoutHandler = std::function<void()>;

    StatusMonitor(RoomService& rooms,
                  std::shared_ptr<CallSession> session,
                  std::string identity,
                  std::chrono::milliseconds poll_interval);
    ~StatusMonitor();

    StatusMonitor(const StatusMonitor&) = delete;
    StatusMonitor& operator=(const StatusMonitor&) = delete;

    static bool ends_phase(MonitorPhase phase, CallStatus status);

    // Starts polling. Exactly one of the handlers fires, on the poller thread, unless
    // the monitor is disarmed or the session closes first.
    void arm(MonitorPhase phase,
             std::optional<std::chrono::milliseconds> budget,
             StatusHandler on_phase_end,
             TimeoutHandler on_timeout = {});
    void disarm();
    bool armed() const;

    CallStatus poll_once();
    void record(CallStatus status);
    std::size_t poll_count() const;

private:
    RoomService& rooms_;
    std::shared_ptr<CallSession> session_;
    std::string identity_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> participant_seen_{false};
    std::atomic<std::size_t> poll_count_{0};
    utils::PeriodicTask task_;
};

}
