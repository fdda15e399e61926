#include "voice_orchestrator/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace voice_orchestrator {

namespace {

std::string format_number(double value) {
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6) << value;
    return out.str();
}

}

ServiceMetrics& ServiceMetrics::instance() {
    static ServiceMetrics metrics;
    return metrics;
}

ServiceMetrics::ServiceMetrics() {
    histogram_bounds_ = {0.005, 0.01, 0.025, 0.05, 0.075, 0.1, 0.25, 0.5,
                         0.75, 1.0, 2.5, 5.0, 7.5, 10.0};
    barge_in_cutoff_.buckets.assign(histogram_bounds_.size() + 1, 0);
    first_response_.buckets.assign(histogram_bounds_.size() + 1, 0);
}

void ServiceMetrics::increment_calls_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_started_total_;
}

void ServiceMetrics::increment_calls_ended(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_ended_total_[status];
}

void ServiceMetrics::increment_turn_failures() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++turn_failures_total_;
}

void ServiceMetrics::increment_reminders_sent() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++reminders_sent_total_;
}

void ServiceMetrics::increment_barge_ins() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++barge_ins_total_;
}

void ServiceMetrics::increment_circuit_open(const std::string& invoker) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++circuit_open_total_[invoker];
}

void ServiceMetrics::increment_persist_failures() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++persist_failures_total_;
}

void ServiceMetrics::observe_barge_in_cutoff(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    observe(barge_in_cutoff_, seconds);
}

void ServiceMetrics::observe_first_response(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    observe(first_response_, seconds);
}

void ServiceMetrics::observe_outbound_call(const std::string& operation, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = outbound_calls_[operation];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    observe(series, seconds);
}

void ServiceMetrics::observe(HistogramSeries& series, double seconds) {
    series.count += 1;
    series.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            series.buckets[i] += 1;
        }
    }
    series.buckets.back() += 1;
}

void ServiceMetrics::render_histogram(std::string& out,
                                      const std::string& name,
                                      const std::string& labels,
                                      const HistogramSeries& series) const {
    const std::string prefix = labels.empty() ? "" : labels + ",";
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        out += name + "_bucket{" + prefix + "le=\"" + format_number(histogram_bounds_[i]) +
               "\"} " + std::to_string(series.buckets[i]) + "\n";
    }
    out += name + "_bucket{" + prefix + "le=\"+Inf\"} " +
           std::to_string(series.buckets.back()) + "\n";
    const std::string suffix = labels.empty() ? "" : "{" + labels + "}";
    out += name + "_count" + suffix + " " + std::to_string(series.count) + "\n";
    out += name + "_sum" + suffix + " " + format_number(series.sum) + "\n";
}

std::string ServiceMetrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;

    out += "# HELP calls_started_total Calls accepted by the orchestrator\n";
    out += "# TYPE calls_started_total counter\n";
    out += "calls_started_total " + std::to_string(calls_started_total_) + "\n";

    out += "# HELP calls_ended_total Calls ended, by final status\n";
    out += "# TYPE calls_ended_total counter\n";
    for (const auto& item : calls_ended_total_) {
        out += "calls_ended_total{status=\"" + item.first + "\"} " +
               std::to_string(item.second) + "\n";
    }

    out += "# HELP turn_failures_total Turns answered with a fallback utterance\n";
    out += "# TYPE turn_failures_total counter\n";
    out += "turn_failures_total " + std::to_string(turn_failures_total_) + "\n";

    out += "# HELP reminders_sent_total Inactivity reminders spoken\n";
    out += "# TYPE reminders_sent_total counter\n";
    out += "reminders_sent_total " + std::to_string(reminders_sent_total_) + "\n";

    out += "# HELP barge_ins_total Agent playback interrupted by the user\n";
    out += "# TYPE barge_ins_total counter\n";
    out += "barge_ins_total " + std::to_string(barge_ins_total_) + "\n";

    out += "# HELP persist_failures_total Call summaries the store did not accept\n";
    out += "# TYPE persist_failures_total counter\n";
    out += "persist_failures_total " + std::to_string(persist_failures_total_) + "\n";

    out += "# HELP circuit_open_total Circuit breaker openings, by invoker\n";
    out += "# TYPE circuit_open_total counter\n";
    for (const auto& item : circuit_open_total_) {
        out += "circuit_open_total{invoker=\"" + item.first + "\"} " +
               std::to_string(item.second) + "\n";
    }

    out += "# HELP barge_in_cutoff_seconds Time from stop request to playback halt\n";
    out += "# TYPE barge_in_cutoff_seconds histogram\n";
    render_histogram(out, "barge_in_cutoff_seconds", "", barge_in_cutoff_);

    out += "# HELP first_response_seconds Time from end of user turn to agent reply\n";
    out += "# TYPE first_response_seconds histogram\n";
    render_histogram(out, "first_response_seconds", "", first_response_);

    out += "# HELP outbound_call_seconds Latency of outbound service calls\n";
    out += "# TYPE outbound_call_seconds histogram\n";
    for (const auto& item : outbound_calls_) {
        render_histogram(out, "outbound_call_seconds",
                         "operation=\"" + item.first + "\"", item.second);
    }

    return out;
}

}
