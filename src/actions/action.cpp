#include "outbound_caller/actions/action.hpp"

#include "outbound_caller/utils/text.hpp"

namespace outbound_caller {

namespace {

constexpr const char* kNoParameters = R"({"type":"object","properties":{}})";

std::string required_string(const nlohmann::json& arguments, const char* key) {
    if (!arguments.is_object() || !arguments.contains(key) || !arguments[key].is_string()) {
        throw ActionError(std::string("missing string argument: ") + key);
    }
    auto value = utils::trim(arguments[key].get<std::string>());
    if (value.empty()) {
        throw ActionError(std::string("empty argument: ") + key);
    }
    return value;
}

Action parse_end_call(const nlohmann::json&) {
    return EndCall{};
}

Action parse_transfer_call(const nlohmann::json&) {
    return TransferCall{};
}

Action parse_look_up_availability(const nlohmann::json& arguments) {
    return LookUpAvailability{required_string(arguments, "date")};
}

Action parse_confirm_appointment(const nlohmann::json& arguments) {
    return ConfirmAppointment{required_string(arguments, "date"),
                              required_string(arguments, "time")};
}

Action parse_detected_answering_machine(const nlohmann::json&) {
    return DetectedAnsweringMachine{};
}

// Order matches the Action variant alternatives.
const std::vector<ActionSpec> kActionTable = {
    {"end_call",
     "Called when the user wants to end the call.",
     kNoParameters,
     &parse_end_call},
    {"transfer_call",
     "Transfer the call to a human agent, called after confirming with the user.",
     kNoParameters,
     &parse_transfer_call},
    {"look_up_availability",
     "Called when the user asks about alternative appointment availability.",
     R"({"type":"object","properties":{"date":{"type":"string","description":"The date of the appointment to check availability for"}},"required":["date"]})",
     &parse_look_up_availability},
    {"confirm_appointment",
     "Called when the user confirms their appointment on a specific date.",
     R"({"type":"object","properties":{"date":{"type":"string","description":"The date of the appointment"},"time":{"type":"string","description":"The time of the appointment"}},"required":["date","time"]})",
     &parse_confirm_appointment},
    {"detected_answering_machine",
     "Called when the call reaches voicemail. Use this tool AFTER you hear the voicemail "
     "greeting.",
     kNoParameters,
     &parse_detected_answering_machine},
};

}

const std::vector<ActionSpec>& action_table() {
    return kActionTable;
}

Action parse_action(const std::string& name, const nlohmann::json& arguments) {
    const auto normalized = utils::normalize_text(name);
    for (const auto& spec : kActionTable) {
        if (normalized == spec.name) {
            return spec.parse(arguments);
        }
    }
    throw ActionError("unknown action: " + name);
}

std::string action_name(const Action& action) {
    return kActionTable.at(action.index()).name;
}

nlohmann::json tool_definitions() {
    auto tools = nlohmann::json::array();
    for (const auto& spec : kActionTable) {
        tools.push_back({{"type", "function"},
                         {"name", spec.name},
                         {"description", spec.description},
                         {"parameters", nlohmann::json::parse(spec.parameters)}});
    }
    return tools;
}

}
