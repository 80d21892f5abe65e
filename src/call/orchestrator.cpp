#include "outbound_caller/call/orchestrator.hpp"

#include <stdexcept>
#include <utility>

#include "outbound_caller/agent/session_controller.hpp"
#include "outbound_caller/logging.hpp"
#include "outbound_caller/metrics.hpp"

namespace outbound_caller {

namespace {

DispatcherOptions make_dispatcher_options(const OrchestratorOptions& options) {
    DispatcherOptions result;
    result.trunk_id = options.trunk_id;
    result.agent_identity = options.agent_identity;
    result.transfer_identity = options.transfer_identity;
    result.transfer_answer_timeout = options.transfer_answer_timeout;
    result.participant_wait_timeout = options.participant_wait_timeout;
    result.poll_interval = options.poll_interval;
    result.appointment_slots = options.appointment_slots;
    return result;
}

std::chrono::seconds ceil_seconds(std::chrono::milliseconds value) {
    return std::chrono::duration_cast<std::chrono::seconds>(value + std::chrono::milliseconds(999));
}

}

OrchestratorOptions OrchestratorOptions::from_config(const Config& config) {
    OrchestratorOptions options;
    options.trunk_id = config.sip_trunk_id;
    options.callee_identity = config.callee_identity;
    options.agent_identity = config.agent_identity;
    options.transfer_identity = config.transfer_identity;
    options.instructions = config.agent_instructions;
    options.answer_timeout = std::chrono::seconds(config.answer_timeout_sec);
    options.transfer_answer_timeout = std::chrono::seconds(config.transfer_answer_timeout_sec);
    options.participant_wait_timeout = std::chrono::seconds(config.participant_wait_timeout_sec);
    options.poll_interval = std::chrono::milliseconds(config.status_poll_interval_ms);
    options.max_call_duration = std::chrono::seconds(config.max_call_duration_sec);
    options.appointment_slots = config.appointment_slots;
    return options;
}

CallOrchestrator::CallOrchestrator(OrchestratorOptions options,
                                   TelephonyClient& telephony,
                                   RoomService& rooms,
                                   std::shared_ptr<ConversationPipeline> pipeline)
    : options_(std::move(options)),
      telephony_(telephony),
      rooms_(rooms),
      pipeline_(std::move(pipeline)),
      dispatcher_(*this, telephony, rooms, make_dispatcher_options(options_)) {}

CallOrchestrator::~CallOrchestrator() {
    std::unique_ptr<StatusMonitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = std::move(monitor_);
    }
    if (monitor) {
        monitor->disarm();
    }
}

CallOutcome CallOrchestrator::place_call(const DialInfo& dial_info) {
    std::shared_ptr<CallSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_) {
            throw std::logic_error("place_call may only run once per orchestrator");
        }
        session_ = std::make_shared<CallSession>(make_room_name(dial_info), dial_info);
        session = session_;
        monitor_ = std::make_unique<StatusMonitor>(rooms_, session, options_.callee_identity,
                                                   options_.poll_interval);
    }
    const auto& room = session->room();
    logging::CallScope log_scope(room);
    logging::info(
        "Placing outbound call",
        {kv("identity", options_.callee_identity),
         kv("transfer_configured", dial_info.transfer_to.has_value())});

    auto controller = std::make_shared<SessionController>(pipeline_);
    session->attach_session(controller);

    // The agent must already be listening when the callee picks up, so the session
    // starts alongside the dial rather than after it.
    SessionOptions session_options;
    session_options.participant_identity = options_.callee_identity;
    session_options.tools = tool_definitions();
    session_options.on_tool_call = [this](const ToolCall& call) { return handle_tool_call(call); };
    auto started = controller->start(build_instructions(options_.instructions, dial_info), room,
                                     std::move(session_options));

    monitor_->arm(
        MonitorPhase::Answer, options_.answer_timeout,
        [this](CallStatus status) {
            if (status == CallStatus::Hangup) {
                logging::info("Callee hung up before answering");
                hangup(CloseReason::CalleeHangup);
            } else if (status == CallStatus::Failed) {
                hangup(CloseReason::DialFailed);
            }
        },
        [this]() { hangup(CloseReason::TimedOut); });

    CallOutcome outcome;
    const auto dial_started = std::chrono::steady_clock::now();
    try {
        CreateCallRequest request;
        request.room = room;
        request.trunk_id = options_.trunk_id;
        request.call_to = dial_info.phone_number;
        request.identity = options_.callee_identity;
        request.wait_until_answered = true;
        request.ringing_timeout = ceil_seconds(options_.answer_timeout);
        telephony_.create_call(request);
    } catch (const DialError& ex) {
        monitor_->disarm();
        logging::error(
            "Dial failed",
            {kv("sip_status_code", ex.sip_status_code()),
             kv("sip_status", ex.sip_status()),
             kv("error", ex.what())});
        if (!session->is_closed()) {
            monitor_->record(CallStatus::Failed);
            hangup(CloseReason::DialFailed);
        }
        outcome.sip_status_code = ex.sip_status_code();
        outcome.sip_status = ex.sip_status();
        outcome.message = ex.what();
        return finish(session, controller, std::move(outcome));
    } catch (const TelephonyError& ex) {
        monitor_->disarm();
        if (!session->is_closed()) {
            logging::error("Dial request failed", {kv("error", ex.what())});
            monitor_->record(CallStatus::Failed);
            hangup(CloseReason::DialFailed);
        }
        outcome.message = ex.what();
        return finish(session, controller, std::move(outcome));
    } catch (const std::exception& ex) {
        monitor_->disarm();
        if (!session->is_closed()) {
            logging::error("Dial raised an unexpected error", {kv("error", ex.what())});
            monitor_->record(CallStatus::Failed);
            hangup(CloseReason::DialFailed);
        }
        outcome.message = ex.what();
        return finish(session, controller, std::move(outcome));
    }
    monitor_->disarm();
    if (session->is_closed()) {
        // The answer budget ran out or the callee hung up as the dial returned.
        return finish(session, controller, std::move(outcome));
    }
    monitor_->record(CallStatus::Active);
    const auto answered_after =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - dial_started).count();
    Metrics::instance().observe_answer_time(answered_after);
    logging::info("Callee picked up", {kv("after_sec", answered_after)});

    // A half-established call cannot be resumed: any failure here ends the job.
    try {
        started.get();
        const auto participant = rooms_.wait_for_participant(
            room, options_.callee_identity, options_.participant_wait_timeout,
            options_.poll_interval, [session]() { return session->is_closed(); });
        controller->set_participant(participant.identity);
        session->set_callee_identity(participant.identity);
    } catch (const std::exception& ex) {
        logging::error("Failed to bind agent to callee", {kv("error", ex.what())});
        outcome.message = ex.what();
        hangup(CloseReason::Failed);
        return finish(session, controller, std::move(outcome));
    }

    monitor_->arm(MonitorPhase::Connected, std::nullopt, [this](CallStatus status) {
        hangup(status == CallStatus::Hangup ? CloseReason::CalleeHangup : CloseReason::Failed);
    });
    if (!session->wait_closed(options_.max_call_duration)) {
        logging::warn("Call reached maximum duration");
        hangup(CloseReason::TimedOut);
    }
    return finish(session, controller, std::move(outcome));
}

std::shared_ptr<CallSession> CallOrchestrator::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void CallOrchestrator::hangup(CloseReason reason) {
    auto call_session = session();
    if (!call_session) {
        return;
    }
    if (!call_session->close(reason)) {
        logging::debug(
            "Hangup skipped, call already closed",
            {kv("room", call_session->room()), kv("reason", to_string(reason))});
        return;
    }
    logging::info(
        "Hanging up",
        {kv("room", call_session->room()), kv("reason", to_string(reason))});
    try {
        if (!telephony_.delete_room(call_session->room())) {
            logging::debug("Room already deleted", {kv("room", call_session->room())});
        }
    } catch (const std::exception& ex) {
        logging::warn(
            "Room delete failed",
            {kv("room", call_session->room()), kv("error", ex.what())});
    }
}

void CallOrchestrator::complete_transfer() {
    auto call_session = session();
    if (!call_session) {
        return;
    }
    if (call_session->close(CloseReason::Transferred)) {
        logging::info("Agent left the transferred call", {kv("room", call_session->room())});
    }
}

ActionDispatcher& CallOrchestrator::dispatcher() {
    return dispatcher_;
}

nlohmann::json CallOrchestrator::describe() const {
    auto call_session = session();
    if (!call_session) {
        return {{"state", "idle"}};
    }
    nlohmann::json payload{
        {"state", call_session->is_closed() ? "closed" : "open"},
        {"room", call_session->room()},
        {"status", to_string(call_session->status())},
    };
    if (const auto identity = call_session->callee_identity()) {
        payload["callee_identity"] = *identity;
    }
    if (const auto reason = call_session->close_reason()) {
        payload["close_reason"] = to_string(*reason);
    }
    return payload;
}

ToolOutput CallOrchestrator::handle_tool_call(const ToolCall& call) {
    try {
        const auto result = dispatcher_.dispatch(call.name, call.arguments);
        return {result.ok, result.message};
    } catch (const std::logic_error& ex) {
        logging::error(
            "Action rejected before the callee was bound",
            {kv("action", call.name), kv("error", ex.what())});
        return {false, "the call is not connected yet"};
    }
}

CallOutcome CallOrchestrator::finish(const std::shared_ptr<CallSession>& session,
                                     const std::shared_ptr<SessionController>& controller,
                                     CallOutcome outcome) {
    monitor_->disarm();
    if (!session->is_closed()) {
        hangup(CloseReason::Failed);
    }
    controller->close();

    outcome.result = session->close_reason().value_or(CloseReason::Failed);
    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session->started_at());
    Metrics::instance().increment_call(to_string(outcome.result));
    logging::info(
        "Call finished",
        {kv("room", session->room()),
         kv("result", to_string(outcome.result)),
         kv("status", to_string(session->status())),
         kv("duration_ms", outcome.duration.count())});
    return outcome;
}

}
