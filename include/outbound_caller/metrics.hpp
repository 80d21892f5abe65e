#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace outbound_caller {

class Metrics {
public:
    static Metrics& instance();

    void increment_call(const std::string& outcome);
    void increment_action(const std::string& action, bool ok);
    void observe_answer_time(double seconds);
    std::string render_prometheus() const;

    void reset();

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> calls_total_;
    std::map<std::pair<std::string, bool>, uint64_t> actions_total_;
    HistogramSeries answer_time_;
    std::vector<double> histogram_bounds_;
};

}
