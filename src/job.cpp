#include "outbound_caller/job.hpp"

#include <chrono>
#include <cctype>
#include <initializer_list>
#include <string>

#include <nlohmann/json.hpp>

#include "outbound_caller/utils/text.hpp"

namespace outbound_caller {

namespace {

std::optional<std::string> string_field(const nlohmann::json& payload,
                                        const char* snake_key,
                                        const char* camel_key) {
    for (const char* key : {snake_key, camel_key}) {
        if (!payload.contains(key) || payload[key].is_null()) {
            continue;
        }
        if (!payload[key].is_string()) {
            throw JobError(std::string(key) + " must be a string");
        }
        auto value = utils::trim(payload[key].get<std::string>());
        if (!value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::string require_number(const std::string& raw, const char* field) {
    auto number = utils::normalize_phone_number(raw);
    if (number.empty()) {
        throw JobError(std::string(field) + " is not a dialable number: " + raw);
    }
    return number;
}

}

DialInfo parse_job_metadata(const std::string& metadata) {
    const auto trimmed = utils::trim(metadata);
    if (trimmed.empty()) {
        throw JobError("job metadata is empty");
    }

    DialInfo dial_info;
    if (trimmed.front() != '{') {
        dial_info.phone_number = require_number(trimmed, "phone_number");
        return dial_info;
    }

    nlohmann::json payload = nlohmann::json::parse(trimmed, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        throw JobError("job metadata is not a JSON object");
    }
    const auto phone_number = string_field(payload, "phone_number", "phoneNumber");
    if (!phone_number) {
        throw JobError("phone_number is required");
    }
    dial_info.phone_number = require_number(*phone_number, "phone_number");
    if (const auto transfer_to = string_field(payload, "transfer_to", "transferTo")) {
        dial_info.transfer_to = require_number(*transfer_to, "transfer_to");
    }
    dial_info.customer_name = string_field(payload, "customer_name", "customerName");
    dial_info.appointment_time = string_field(payload, "appointment_time", "appointmentTime");
    dial_info.room_name = string_field(payload, "room_name", "roomName");
    return dial_info;
}

std::string build_instructions(const std::string& base_instructions, const DialInfo& dial_info) {
    std::string instructions = utils::trim(base_instructions);
    auto append = [&instructions](const std::string& sentence) {
        if (!instructions.empty()) {
            instructions += ' ';
        }
        instructions += sentence;
    };
    if (dial_info.customer_name) {
        append("The customer's name is " + *dial_info.customer_name + ".");
    }
    if (dial_info.appointment_time) {
        append("Their appointment is " + *dial_info.appointment_time + ".");
    }
    if (!dial_info.transfer_to) {
        append("Transferring to a human agent is not available on this call.");
    }
    return instructions;
}

std::string make_room_name(const DialInfo& dial_info) {
    if (dial_info.room_name) {
        return *dial_info.room_name;
    }
    std::string digits;
    for (unsigned char ch : dial_info.phone_number) {
        if (std::isdigit(ch)) {
            digits.push_back(static_cast<char>(ch));
        }
    }
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    return "outbound-" + digits + "-" + std::to_string(millis);
}

}
