#include "outbound_caller/telephony/client.hpp"

#include <thread>

#include "outbound_caller/logging.hpp"

namespace outbound_caller {

Participant RoomService::wait_for_participant(const std::string& room,
                                              const std::string& identity,
                                              std::chrono::milliseconds timeout,
                                              std::chrono::milliseconds poll_interval,
                                              const CancelCheck& cancelled) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (cancelled && cancelled()) {
            throw TelephonyError("wait for participant cancelled: " + identity, "cancelled");
        }
        if (auto participant = get_participant(room, identity)) {
            logging::debug(
                "Participant joined",
                {kv("room", room), kv("identity", identity), kv("sid", participant->sid)});
            return *participant;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw TelephonyError("timed out waiting for participant: " + identity,
                                 "deadline_exceeded");
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

}
