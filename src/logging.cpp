#include "outbound_caller/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"


namespace outbound_caller::logging {

namespace {

std::mutex name_mutex;
std::string logger_name = "outbound_caller";

std::mutex room_mutex;
std::optional<std::string> current_room;

spdlog::level::level_enum parse_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(),
                                                                            true));
    }

    {
        std::lock_guard<std::mutex> lock(name_mutex);
        logger_name = config.log_name;
    }
    spdlog::drop(config.log_name);
    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_level(config.log_level));
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::string name;
    {
        std::lock_guard<std::mutex> lock(name_mutex);
        name = logger_name;
    }
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    return spdlog::default_logger();
}

void set_call_room(std::optional<std::string> room) {
    std::lock_guard<std::mutex> lock(room_mutex);
    current_room = std::move(room);
}

std::optional<std::string> call_room() {
    std::lock_guard<std::mutex> lock(room_mutex);
    return current_room;
}

std::string format_line(const std::string& message,
                        std::initializer_list<KeyValue> items) {
    auto line = with_kv(message, items);
    const auto room = call_room();
    if (!room) {
        return line;
    }
    const bool named = std::any_of(items.begin(), items.end(),
                                   [](const KeyValue& item) { return item.key == "room"; });
    if (named) {
        return line;
    }
    const auto context = format_kv({KeyValue{"room", *room}});
    if (items.size() == 0) {
        return line + " [" + context + "]";
    }
    line.insert(line.size() - 1, ", " + context);
    return line;
}

}
