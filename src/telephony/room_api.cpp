#include "outbound_caller/telephony/room_api.hpp"

#include <httplib.h>

#include <utility>

#include "outbound_caller/logging.hpp"
#include "outbound_caller/utils/http.hpp"

namespace outbound_caller {

namespace {

constexpr const char* kSipService = "livekit.SIP";
constexpr const char* kRoomService = "livekit.RoomService";

int parse_status_code(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

std::string string_field(const nlohmann::json& object,
                         const char* key,
                         const std::string& fallback) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

}

RoomApiClient::RoomApiClient(std::string base_url,
                             std::optional<std::string> api_token,
                             std::chrono::seconds request_timeout)
    : api_token_(std::move(api_token)),
      request_timeout_(request_timeout) {
    utils::parse_url(base_url, scheme_, host_, port_, base_path_);
    if (host_.empty()) {
        throw TelephonyError("invalid room api url: " + base_url);
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https") {
        throw TelephonyError("HTTPS room api requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }
#endif
}

Participant RoomApiClient::create_call(const CreateCallRequest& request) {
    nlohmann::json body{
        {"room_name", request.room},
        {"sip_trunk_id", request.trunk_id},
        {"sip_call_to", request.call_to},
        {"participant_identity", request.identity},
        {"wait_until_answered", request.wait_until_answered},
        {"ringing_timeout", std::to_string(request.ringing_timeout.count()) + "s"},
    };
    logging::info(
        "Creating SIP participant",
        {kv("room", request.room),
         kv("identity", request.identity),
         kv("wait_until_answered", request.wait_until_answered)});

    // The server holds the request open while the callee's phone rings.
    const auto read_timeout = request.wait_until_answered
                                  ? request.ringing_timeout + request_timeout_
                                  : request_timeout_;
    const auto response = call(kSipService, "CreateSIPParticipant", body, read_timeout);

    Participant participant;
    participant.identity = string_field(response, "participant_identity", request.identity);
    participant.sid = string_field(response, "participant_id", "");
    return participant;
}

bool RoomApiClient::remove_participant(const std::string& room, const std::string& identity) {
    try {
        call(kRoomService, "RemoveParticipant", {{"room", room}, {"identity", identity}},
             request_timeout_);
    } catch (const TelephonyError& ex) {
        if (ex.code() == "not_found") {
            return false;
        }
        throw;
    }
    return true;
}

bool RoomApiClient::delete_room(const std::string& room) {
    try {
        call(kRoomService, "DeleteRoom", {{"room", room}}, request_timeout_);
    } catch (const TelephonyError& ex) {
        if (ex.code() == "not_found") {
            return false;
        }
        throw;
    }
    return true;
}

std::optional<Participant> RoomApiClient::get_participant(const std::string& room,
                                                          const std::string& identity) {
    try {
        const auto response = call(kRoomService, "GetParticipant",
                                   {{"room", room}, {"identity", identity}}, request_timeout_);
        return parse_participant(response);
    } catch (const TelephonyError& ex) {
        if (ex.code() == "not_found") {
            return std::nullopt;
        }
        throw;
    }
}

Participant RoomApiClient::parse_participant(const nlohmann::json& info) {
    Participant participant;
    participant.identity = string_field(info, "identity", "");
    participant.sid = string_field(info, "sid", "");
    if (info.contains("attributes") && info["attributes"].is_object()) {
        for (auto it = info["attributes"].begin(); it != info["attributes"].end(); ++it) {
            if (it.value().is_string()) {
                participant.attributes[it.key()] = it.value().get<std::string>();
            }
        }
    }
    return participant;
}

void RoomApiClient::raise_error(int http_status, const std::string& body) {
    std::string code = "unknown";
    std::string message = "room api request failed with status " + std::to_string(http_status);
    nlohmann::json payload = nlohmann::json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        throw TelephonyError(message, http_status == 404 ? "not_found" : code);
    }
    code = string_field(payload, "code", code);
    message = string_field(payload, "msg", message);
    if (payload.contains("meta") && payload["meta"].is_object()) {
        const auto& meta = payload["meta"];
        if (meta.contains("sip_status_code")) {
            throw DialError(message,
                            parse_status_code(meta["sip_status_code"]),
                            string_field(meta, "sip_status", ""));
        }
    }
    throw TelephonyError(message, code);
}

nlohmann::json RoomApiClient::call(const std::string& service,
                                   const std::string& method,
                                   const nlohmann::json& body,
                                   std::chrono::seconds read_timeout) {
    auto headers = httplib::Headers{{"Accept", "application/json"}};
    if (api_token_) {
        headers.emplace("Authorization", "Bearer " + *api_token_);
    }
    const auto path = utils::join_path(base_path_, "/twirp/" + service + "/" + method);
    auto client = make_client(read_timeout);
    auto response = client->Post(path.c_str(), headers, body.dump(), "application/json");
    if (!response) {
        throw TelephonyError("room api request failed: " + httplib::to_string(response.error()),
                             "unavailable");
    }
    if (response->status < 200 || response->status >= 300) {
        raise_error(response->status, response->body);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json payload = nlohmann::json::parse(response->body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        throw TelephonyError(service + "/" + method + " returned a malformed body",
                             "malformed_response");
    }
    return payload;
}

// One client per request: long-held dial requests must not serialize status polls.
std::unique_ptr<httplib::Client> RoomApiClient::make_client(std::chrono::seconds read_timeout) const {
    auto client = std::make_unique<httplib::Client>(utils::build_url(scheme_, host_, port_, ""));
    client->set_connection_timeout(request_timeout_.count(), 0);
    client->set_read_timeout(read_timeout.count(), 0);
    client->set_write_timeout(request_timeout_.count(), 0);
    return client;
}

}
