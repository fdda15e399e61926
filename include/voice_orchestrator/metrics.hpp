#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voice_orchestrator {

// Process-wide Prometheus counters and histograms, aggregated across calls.
class ServiceMetrics {
public:
    static ServiceMetrics& instance();

    void increment_calls_started();
    void increment_calls_ended(const std::string& status);
    void increment_turn_failures();
    void increment_reminders_sent();
    void increment_barge_ins();
    void increment_circuit_open(const std::string& invoker);
    void increment_persist_failures();
    void observe_barge_in_cutoff(double seconds);
    void observe_first_response(double seconds);
    void observe_outbound_call(const std::string& operation, double seconds);
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    ServiceMetrics();

    void observe(HistogramSeries& series, double seconds);
    void render_histogram(std::string& out,
                          const std::string& name,
                          const std::string& labels,
                          const HistogramSeries& series) const;

    mutable std::mutex mutex_;
    uint64_t calls_started_total_ = 0;
    uint64_t turn_failures_total_ = 0;
    uint64_t reminders_sent_total_ = 0;
    uint64_t barge_ins_total_ = 0;
    uint64_t persist_failures_total_ = 0;
    std::map<std::string, uint64_t> calls_ended_total_;
    std::map<std::string, uint64_t> circuit_open_total_;
    HistogramSeries barge_in_cutoff_;
    HistogramSeries first_response_;
    std::map<std::string, HistogramSeries> outbound_calls_;
    std::vector<double> histogram_bounds_;
};

}
