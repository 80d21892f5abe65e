#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "outbound_caller/telephony/client.hpp"

namespace httplib {
class Client;
}

namespace outbound_caller {

// Twirp/JSON client for the room server's SIP and room services.
class RoomApiClient : public TelephonyClient, public RoomService {
public:
    RoomApiClient(std::string base_url,
                  std::optional<std::string> api_token,
                  std::chrono::seconds request_timeout);

    Participant create_call(const CreateCallRequest& request) override;
    bool remove_participant(const std::string& room, const std::string& identity) override;
    bool delete_room(const std::string& room) override;
    std::optional<Participant> get_participant(const std::string& room,
                                               const std::string& identity) override;

    static Participant parse_participant(const nlohmann::json& info);
    // Converts a twirp error response into DialError (SIP metadata present) or
    // TelephonyError and throws it.
    static void raise_error(int http_status, const std::string& body);

private:
    nlohmann::json call(const std::string& service,
                        const std::string& method,
                        const nlohmann::json& body,
                        std::chrono::seconds read_timeout);
    std::unique_ptr<httplib::Client> make_client(std::chrono::seconds read_timeout) const;

    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::optional<std::string> api_token_;
    std::chrono::seconds request_timeout_;
};

}
