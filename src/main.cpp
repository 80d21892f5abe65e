#include "outbound_caller/call/orchestrator.hpp"
#include "outbound_caller/agent/backend_pipeline.hpp"
#include "outbound_caller/config.hpp"
#include "outbound_caller/job.hpp"
#include "outbound_caller/logging.hpp"
#include "outbound_caller/server/rest_server.hpp"
#include "outbound_caller/telephony/room_api.hpp"

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

namespace {

std::string read_job_metadata(int argc, char** argv) {
    if (argc > 1) {
        return argv[1];
    }
    if (const char* value = std::getenv("JOB_METADATA")) {
        return value;
    }
    throw outbound_caller::JobError("job metadata missing: pass it as the first argument or JOB_METADATA");
}

std::chrono::seconds to_seconds(double value) {
    return std::chrono::seconds(static_cast<long long>(value));
}

}

int main(int argc, char** argv) {
    using namespace outbound_caller;
    try {
        const auto config = Config::load();
        config.validate();
        logging::init(config);

        const auto dial_info = parse_job_metadata(read_job_metadata(argc, argv));
        info(
            "Starting outbound caller",
            {kv("room_api_url", config.room_api_url),
             kv("backend_url", config.backend_url),
             kv("rest_port", config.rest_api_port),
             kv("transfer_configured", dial_info.transfer_to.has_value())});

        RoomApiClient room_api(config.room_api_url, config.room_api_token,
                               to_seconds(config.room_api_request_timeout));
        BackendRequestOptions backend_options;
        backend_options.request_timeout = to_seconds(config.backend_request_timeout);
        backend_options.connect_timeout = to_seconds(config.backend_connect_timeout);
        backend_options.sock_read_timeout = to_seconds(config.backend_sock_read_timeout);
        auto pipeline = std::make_shared<BackendPipeline>(config.backend_url,
                                                          config.authorization_token,
                                                          backend_options);

        CallOrchestrator orchestrator(OrchestratorOptions::from_config(config), room_api,
                                      room_api, pipeline);
        std::unique_ptr<RestServer> rest_server;
        if (config.rest_api_port > 0) {
            rest_server = std::make_unique<RestServer>(
                config, [&orchestrator]() { return orchestrator.describe(); });
            rest_server->start();
        }

        const auto outcome = orchestrator.place_call(dial_info);
        info(
            "Outbound call job finished",
            {kv("result", to_string(outcome.result)),
             kv("duration_ms", outcome.duration.count()),
             kv("message", outcome.message)});
        if (rest_server) {
            rest_server->stop();
        }
    } catch (const std::exception& ex) {
        error("Outbound call job failed", {kv("error", ex.what())});
        return 1;
    }
    return 0;
}
