#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "outbound_caller/actions/action.hpp"
#include "outbound_caller/call/session.hpp"
#include "outbound_caller/telephony/client.hpp"

namespace outbound_caller {

class SessionController;

// What an action may do to the call it runs against.
class CallControl {
public:
    virtual ~CallControl() = default;

    virtual std::shared_ptr<CallSession> session() const = 0;
    // Idempotent: only the first hangup deletes the room.
    virtual void hangup(CloseReason reason) = 0;
    // Ends the job without deleting the room the callee now shares with the transfer target.
    virtual void complete_transfer() = 0;
};

struct DispatcherOptions {
    std::string trunk_id;
    std::string agent_identity = "agent";
    std::string transfer_identity = "transfer_target";
    std::chrono::seconds transfer_answer_timeout{30};
    std::chrono::milliseconds participant_wait_timeout{10000};
    std::chrono::milliseconds poll_interval{100};
    std::vector<std::string> appointment_slots;
};

struct AppointmentConfirmation {
    std::string date;
    std::string time;
};

class ActionDispatcher {
public:
    ActionDispatcher(CallControl& control,
                     TelephonyClient& telephony,
                     RoomService& rooms,
                     DispatcherOptions options);

    // Actions touching the callee throw std::logic_error when no participant is bound.
    ActionResult dispatch(const Action& action);
    // Parses first; unknown or malformed calls come back as a failed result.
    ActionResult dispatch(const std::string& name, const nlohmann::json& arguments);

    std::vector<AppointmentConfirmation> confirmations() const;

private:
    ActionResult end_call(const EndCall& action);
    ActionResult transfer_call(const TransferCall& action);
    ActionResult look_up_availability(const LookUpAvailability& action);
    ActionResult confirm_appointment(const ConfirmAppointment& action);
    ActionResult detected_answering_machine(const DetectedAnsweringMachine& action);

    std::shared_ptr<SessionController> bound_controller(const CallSession& session) const;
    void apologize_and_hang_up(SessionController& controller);

    CallControl& control_;
    TelephonyClient& telephony_;
    RoomService& rooms_;
    DispatcherOptions options_;
    std::atomic<bool> transfer_in_progress_{false};
    mutable std::mutex mutex_;
    std::vector<AppointmentConfirmation> confirmations_;
};

}
