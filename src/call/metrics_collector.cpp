#include "voice_orchestrator/call/metrics_collector.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace voice_orchestrator {

nlohmann::json MetricsSummary::to_json() const {
    return {
        {"bargeIn_avg_ms", barge_in_avg_ms},
        {"bargeIn_p95_ms", barge_in_p95_ms},
        {"bargeIn_samples", barge_in_samples},
        {"firstResp_avg_ms", first_response_avg_ms},
        {"firstResp_p95_ms", first_response_p95_ms},
        {"firstResp_samples", first_response_samples},
        {"remindersDuringTTS", reminders_during_tts},
        {"remindersDuringSpeech", reminders_during_speech},
        {"remindersSent", reminders_sent},
        {"turnFailures", turn_failures},
        {"kbChunksUsed", kb_chunks_used}};
}

void MetricsCollector::record_barge_in_cutoff(double ms) {
    if (sealed_) {
        return;
    }
    barge_in_cutoff_ms_.push_back(std::max(0.0, ms));
}

void MetricsCollector::record_first_response(double ms) {
    if (sealed_) {
        return;
    }
    first_response_ms_.push_back(std::max(0.0, ms));
}

void MetricsCollector::increment_reminders_during_tts() {
    if (!sealed_) {
        ++reminders_during_tts_;
    }
}

void MetricsCollector::increment_reminders_during_speech() {
    if (!sealed_) {
        ++reminders_during_speech_;
    }
}

void MetricsCollector::increment_reminders_sent() {
    if (!sealed_) {
        ++reminders_sent_;
    }
}

void MetricsCollector::increment_turn_failures() {
    if (!sealed_) {
        ++turn_failures_;
    }
}

void MetricsCollector::add_kb_chunks(std::size_t count) {
    if (!sealed_) {
        kb_chunks_used_ += count;
    }
}

void MetricsCollector::seal() {
    sealed_ = true;
}

MetricsSummary MetricsCollector::summarize() const {
    MetricsSummary summary;
    summary.barge_in_avg_ms = average(barge_in_cutoff_ms_);
    summary.barge_in_p95_ms = p95(barge_in_cutoff_ms_);
    summary.barge_in_samples = barge_in_cutoff_ms_.size();
    summary.first_response_avg_ms = average(first_response_ms_);
    summary.first_response_p95_ms = p95(first_response_ms_);
    summary.first_response_samples = first_response_ms_.size();
    summary.reminders_during_tts = reminders_during_tts_;
    summary.reminders_during_speech = reminders_during_speech_;
    summary.reminders_sent = reminders_sent_;
    summary.turn_failures = turn_failures_;
    summary.kb_chunks_used = kb_chunks_used_;
    return summary;
}

double MetricsCollector::average(const std::vector<double>& samples) {
    if (samples.empty()) {
        return 0.0;
    }
    const double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    return sum / static_cast<double>(samples.size());
}

double MetricsCollector::p95(const std::vector<double>& samples) {
    if (samples.empty()) {
        return 0.0;
    }
    std::vector<double> sorted = samples;
    std::sort(sorted.begin(), sorted.end());
    const auto index = static_cast<std::size_t>(
        std::floor(0.95 * static_cast<double>(sorted.size() - 1)));
    return sorted[index];
}

}
