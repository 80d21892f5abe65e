#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "outbound_caller/actions/dispatcher.hpp"
#include "outbound_caller/agent/pipeline.hpp"
#include "outbound_caller/call/session.hpp"
#include "outbound_caller/call/status_monitor.hpp"
#include "outbound_caller/config.hpp"
#include "outbound_caller/job.hpp"
#include "outbound_caller/telephony/client.hpp"

namespace outbound_caller {

class SessionController;

struct OrchestratorOptions {
    std::string trunk_id;
    std::string callee_identity = "phone_user";
    std::string agent_identity = "agent";
    std::string transfer_identity = "transfer_target";
    std::string instructions;
    std::chrono::milliseconds answer_timeout{15000};
    std::chrono::seconds transfer_answer_timeout{30};
    std::chrono::milliseconds participant_wait_timeout{10000};
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds max_call_duration{900000};
    std::vector<std::string> appointment_slots;

    static OrchestratorOptions from_config(const Config& config);
};

struct CallOutcome {
    CloseReason result = CloseReason::Failed;
    std::optional<int> sip_status_code;
    std::optional<std::string> sip_status;
    std::string message;
    std::chrono::milliseconds duration{0};
};

// Drives one outbound call from dial to hangup or transfer.
class CallOrchestrator : public CallControl {
public:
    CallOrchestrator(OrchestratorOptions options,
                     TelephonyClient& telephony,
                     RoomService& rooms,
                     std::shared_ptr<ConversationPipeline> pipeline);
    ~CallOrchestrator() override;

    CallOrchestrator(const CallOrchestrator&) = delete;
    CallOrchestrator& operator=(const CallOrchestrator&) = delete;

    // Blocks until the call is over. May run once per orchestrator.
    CallOutcome place_call(const DialInfo& dial_info);

    std::shared_ptr<CallSession> session() const override;
    void hangup(CloseReason reason) override;
    void complete_transfer() override;

    ActionDispatcher& dispatcher();
    nlohmann::json describe() const;

private:
    ToolOutput handle_tool_call(const ToolCall& call);
    CallOutcome finish(const std::shared_ptr<CallSession>& session,
                       const std::shared_ptr<SessionController>& controller,
                       CallOutcome outcome);

    OrchestratorOptions options_;
    TelephonyClient& telephony_;
    RoomService& rooms_;
    std::shared_ptr<ConversationPipeline> pipeline_;
    ActionDispatcher dispatcher_;

    mutable std::mutex mutex_;
    std::shared_ptr<CallSession> session_;
    std::unique_ptr<StatusMonitor> monitor_;
};

}
