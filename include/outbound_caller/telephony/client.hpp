#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace outbound_caller {

class TelephonyError : public std::runtime_error {
public:
    explicit TelephonyError(const std::string& message, std::string code = "")
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

// Dial attempt rejected by the gateway (busy, no answer, invalid number, ...).
class DialError : public TelephonyError {
public:
    DialError(const std::string& message, int sip_status_code, std::string sip_status)
        : TelephonyError(message, "dial_failed"),
          sip_status_code_(sip_status_code),
          sip_status_(std::move(sip_status)) {}

    int sip_status_code() const { return sip_status_code_; }
    const std::string& sip_status() const { return sip_status_; }

private:
    int sip_status_code_;
    std::string sip_status_;
};

using Attributes = std::map<std::string, std::string>;

struct Participant {
    std::string identity;
    std::string sid;
    Attributes attributes;
};

struct CreateCallRequest {
    std::string room;
    std::string trunk_id;
    std::string call_to;
    std::string identity;
    bool wait_until_answered = true;
    std::chrono::seconds ringing_timeout{15};
};

class TelephonyClient {
public:
    virtual ~TelephonyClient() = default;

    // With wait_until_answered the call returns only once the callee picks up;
    // throws DialError when the attempt fails.
    virtual Participant create_call(const CreateCallRequest& request) = 0;
    // Both return false when the target no longer exists.
    virtual bool remove_participant(const std::string& room, const std::string& identity) = 0;
    virtual bool delete_room(const std::string& room) = 0;
};

class RoomService {
public:
    using CancelCheck = std::function<bool()>;

    virtual ~RoomService() = default;

    virtual std::optional<Participant> get_participant(const std::string& room,
                                                       const std::string& identity) = 0;

    // Polls until the participant is present. Throws TelephonyError on timeout or when
    // the cancel check fires first.
    Participant wait_for_participant(const std::string& room,
                                     const std::string& identity,
                                     std::chrono::milliseconds timeout,
                                     std::chrono::milliseconds poll_interval,
                                     const CancelCheck& cancelled = {});
};

}
