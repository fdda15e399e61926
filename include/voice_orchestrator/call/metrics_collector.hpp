#pragma once

#include <cstddef>
#include <vector>

#include <nlohmann/json.hpp>

namespace voice_orchestrator {

struct MetricsSummary {
    double barge_in_avg_ms = 0.0;
    double barge_in_p95_ms = 0.0;
    std::size_t barge_in_samples = 0;
    double first_response_avg_ms = 0.0;
    double first_response_p95_ms = 0.0;
    std::size_t first_response_samples = 0;
    int reminders_during_tts = 0;
    int reminders_during_speech = 0;
    int reminders_sent = 0;
    int turn_failures = 0;
    std::size_t kb_chunks_used = 0;

    nlohmann::json to_json() const;
};

// Per-call latency samples and counters. Owned by the call actor; sealed
// when the call ends, after which every record call is ignored.
class MetricsCollector {
public:
    void record_barge_in_cutoff(double ms);
    void record_first_response(double ms);
    void increment_reminders_during_tts();
    void increment_reminders_during_speech();
    void increment_reminders_sent();
    void increment_turn_failures();
    void add_kb_chunks(std::size_t count);

    void seal();
    bool sealed() const { return sealed_; }

    const std::vector<double>& barge_in_cutoff_ms() const { return barge_in_cutoff_ms_; }
    const std::vector<double>& first_response_ms() const { return first_response_ms_; }
    int reminders_during_tts() const { return reminders_during_tts_; }
    int reminders_during_speech() const { return reminders_during_speech_; }
    int reminders_sent() const { return reminders_sent_; }
    int turn_failures() const { return turn_failures_; }

    MetricsSummary summarize() const;

    static double average(const std::vector<double>& samples);
    // Nearest rank: index floor(0.95 * (n - 1)) of the ascending samples.
    static double p95(const std::vector<double>& samples);

private:
    std::vector<double> barge_in_cutoff_ms_;
    std::vector<double> first_response_ms_;
    int reminders_during_tts_ = 0;
    int reminders_during_speech_ = 0;
    int reminders_sent_ = 0;
    int turn_failures_ = 0;
    std::size_t kb_chunks_used_ = 0;
    bool sealed_ = false;
};

}
