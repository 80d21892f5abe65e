#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace outbound_caller {

class JobError : public std::runtime_error {
public:
    explicit JobError(const std::string& message) : std::runtime_error(message) {}
};

struct DialInfo {
    std::string phone_number;
    std::optional<std::string> transfer_to;
    std::optional<std::string> customer_name;
    std::optional<std::string> appointment_time;
    std::optional<std::string> room_name;
};

// Accepts a JSON object or a bare phone number. Throws JobError when no dialable
// phone number can be extracted.
DialInfo parse_job_metadata(const std::string& metadata);

std::string build_instructions(const std::string& base_instructions, const DialInfo& dial_info);

std::string make_room_name(const DialInfo& dial_info);

}
