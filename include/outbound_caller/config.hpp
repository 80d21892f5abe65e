#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace outbound_caller {

struct Config {
    std::string room_api_url;
    std::optional<std::string> room_api_token;
    std::string sip_trunk_id;
    std::string callee_identity = "phone_user";
    std::string agent_identity = "agent";
    std::string transfer_identity = "transfer_target";
    int answer_timeout_sec = 15;
    int transfer_answer_timeout_sec = 30;
    int participant_wait_timeout_sec = 10;
    int status_poll_interval_ms = 100;
    int max_call_duration_sec = 900;
    double room_api_request_timeout = 10.0;
    std::string backend_url;
    std::optional<std::string> authorization_token;
    double backend_request_timeout = 60.0;
    double backend_connect_timeout = 60.0;
    double backend_sock_read_timeout = 60.0;
    std::string agent_instructions;
    std::vector<std::string> appointment_slots;
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "outbound_caller";
    int rest_api_port = 8000;

    static Config load();
    void validate() const;
};

}
