#pragma once

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace outbound_caller {

class ActionError : public std::runtime_error {
public:
    explicit ActionError(const std::string& message) : std::runtime_error(message) {}
};

struct EndCall {};

struct TransferCall {};

struct LookUpAvailability {
    std::string date;
};

struct ConfirmAppointment {
    std::string date;
    std::string time;
};

struct DetectedAnsweringMachine {};

using Action = std::variant<EndCall,
                            TransferCall,
                            LookUpAvailability,
                            ConfirmAppointment,
                            DetectedAnsweringMachine>;

struct ActionResult {
    bool ok = true;
    std::string message;
};

struct ActionSpec {
    const char* name;
    const char* description;
    // JSON schema of the arguments object.
    const char* parameters;
    Action (*parse)(const nlohmann::json& arguments);
};

const std::vector<ActionSpec>& action_table();

// Throws ActionError for unknown names or malformed arguments.
Action parse_action(const std::string& name, const nlohmann::json& arguments);

std::string action_name(const Action& action);

// Function-calling definitions handed to the language model.
nlohmann::json tool_definitions();

}
