#include "outbound_caller/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace outbound_caller {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {1.0, 2.5, 5.0, 7.5, 10.0, 15.0, 20.0, 30.0, 45.0, 60.0};
    answer_time_.buckets.assign(histogram_bounds_.size() + 1, 0);
}

void Metrics::increment_call(const std::string& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_total_[outcome];
}

void Metrics::increment_action(const std::string& action, bool ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++actions_total_[{action, ok}];
}

void Metrics::observe_answer_time(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    answer_time_.count += 1;
    answer_time_.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            answer_time_.buckets[i] += 1;
        }
    }
    answer_time_.buckets.back() += 1;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_total_.clear();
    actions_total_.clear();
    answer_time_ = HistogramSeries{};
    answer_time_.buckets.assign(histogram_bounds_.size() + 1, 0);
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP outbound_calls_total Outbound calls by outcome\n";
    out << "# TYPE outbound_calls_total counter\n";
    for (const auto& item : calls_total_) {
        out << "outbound_calls_total{outcome=\"" << item.first << "\"} " << item.second << "\n";
    }

    out << "# HELP agent_actions_total Agent actions by name and result\n";
    out << "# TYPE agent_actions_total counter\n";
    for (const auto& item : actions_total_) {
        out << "agent_actions_total{action=\"" << item.first.first << "\",ok=\""
            << (item.first.second ? "true" : "false") << "\"} " << item.second << "\n";
    }

    out << "# HELP call_answer_seconds Time from dial to answer\n";
    out << "# TYPE call_answer_seconds histogram\n";
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        out << "call_answer_seconds_bucket{le=\"" << histogram_bounds_[i] << "\"} "
            << answer_time_.buckets[i] << "\n";
    }
    out << "call_answer_seconds_bucket{le=\"+Inf\"} " << answer_time_.buckets.back() << "\n";
    out << "call_answer_seconds_count " << answer_time_.count << "\n";
    out << "call_answer_seconds_sum " << answer_time_.sum << "\n";

    return out.str();
}

}
