#include "outbound_caller/config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "outbound_caller/utils/text.hpp"

namespace outbound_caller {

namespace {

constexpr const char* kDefaultInstructions =
    "You are a scheduling assistant for a dental practice. Your interface with the user will "
    "be voice. You will be on a call with a patient who has an upcoming appointment. Your goal "
    "is to confirm the appointment details. As a customer service representative, you will be "
    "polite and professional at all times. Allow the user to end the conversation.";

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 0);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Variables already present in the environment win over the file.
void load_dotenv(const std::filesystem::path& dotenv_path) {
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = utils::trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = utils::trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = utils::trim(line.substr(0, eq_pos));
        std::string value = utils::trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        set_env_value(key, strip_quotes(value));
    }
}

}

Config Config::load() {
    const auto cwd = std::filesystem::current_path();
    load_dotenv(cwd / ".env.local");
    load_dotenv(cwd / ".env");

    Config config;
    config.room_api_url = get_env_required("ROOM_API_URL");
    config.room_api_token = get_env_optional("ROOM_API_TOKEN");
    config.sip_trunk_id = get_env_required("SIP_TRUNK_ID");
    config.callee_identity = get_env_str("CALLEE_IDENTITY", "phone_user");
    config.agent_identity = get_env_str("AGENT_IDENTITY", "agent");
    config.transfer_identity = get_env_str("TRANSFER_IDENTITY", "transfer_target");

    config.answer_timeout_sec = get_env_int("ANSWER_TIMEOUT_SEC", 15);
    config.transfer_answer_timeout_sec = get_env_int("TRANSFER_ANSWER_TIMEOUT_SEC", 30);
    config.participant_wait_timeout_sec = get_env_int("PARTICIPANT_WAIT_TIMEOUT_SEC", 10);
    config.status_poll_interval_ms = get_env_int("STATUS_POLL_INTERVAL_MS", 100);
    config.max_call_duration_sec = get_env_int("MAX_CALL_DURATION_SEC", 900);
    config.room_api_request_timeout = get_env_double("ROOM_API_REQUEST_TIMEOUT", 10.0);

    config.backend_url = get_env_required("BACKEND_URL");
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 60.0);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 60.0);
    config.backend_sock_read_timeout = get_env_double("BACKEND_SOCK_READ_TIMEOUT", 60.0);

    config.agent_instructions = get_env_str("AGENT_INSTRUCTIONS", kDefaultInstructions);
    config.appointment_slots =
        split_csv(get_env_str("APPOINTMENT_SLOTS", "9:00 AM,11:00 AM,2:00 PM,4:30 PM"));

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "outbound_caller");
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);

    return config;
}

void Config::validate() const {
    if (room_api_url.empty()) {
        throw std::runtime_error("ROOM_API_URL is required");
    }
    if (sip_trunk_id.empty()) {
        throw std::runtime_error("SIP_TRUNK_ID is required");
    }
    if (backend_url.empty()) {
        throw std::runtime_error("BACKEND_URL is required");
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (backend_url.rfind("https://", 0) == 0 || backend_url.rfind("wss://", 0) == 0) {
        throw std::runtime_error("BACKEND_URL uses TLS but the build has no OpenSSL support");
    }
#endif
    if (callee_identity.empty() || agent_identity.empty() || transfer_identity.empty()) {
        throw std::runtime_error("participant identities must not be empty");
    }
    if (callee_identity == agent_identity || transfer_identity == agent_identity ||
        transfer_identity == callee_identity) {
        throw std::runtime_error("participant identities must be distinct");
    }
    if (answer_timeout_sec <= 0) {
        throw std::runtime_error("ANSWER_TIMEOUT_SEC must be positive");
    }
    if (transfer_answer_timeout_sec <= 0) {
        throw std::runtime_error("TRANSFER_ANSWER_TIMEOUT_SEC must be positive");
    }
    if (participant_wait_timeout_sec <= 0) {
        throw std::runtime_error("PARTICIPANT_WAIT_TIMEOUT_SEC must be positive");
    }
    if (status_poll_interval_ms <= 0 || status_poll_interval_ms >= 1000) {
        throw std::runtime_error("STATUS_POLL_INTERVAL_MS must be between 1 and 999");
    }
    if (max_call_duration_sec <= 0) {
        throw std::runtime_error("MAX_CALL_DURATION_SEC must be positive");
    }
    if (rest_api_port < 0) {
        throw std::runtime_error("REST_API_PORT must be zero or positive");
    }
}

}
