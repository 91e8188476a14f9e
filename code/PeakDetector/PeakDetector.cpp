#include "PeakDetector.hpp"
#include "EcgErrors.hpp"
#include <cmath>

const size_t PeakDetector::DEFAULT_MAX_PEAKS;
constexpr double PeakDetector::DEFAULT_MAX_PEAK_AGE_S;

// Tolerance on the refractory comparison so that intervals built from
// i / fs timestamps are not rejected by rounding.
static const double REFRACTORY_EPSILON_S = 1e-9;

PeakLog::PeakLog(size_t max_peaks, double max_age_s)
    : max_peaks_(max_peaks), max_age_s_(max_age_s)
{
    if (max_peaks_ == 0) {
        throw ConfigError("Peak log must retain at least one peak");
    }
    if (!(max_age_s_ > 0.0)) {
        throw ConfigError("Peak log age limit must be positive");
    }
}

void PeakLog::add(const PeakEvent& peak) {
    peaks_.push_back(peak);
    while (peaks_.size() > max_peaks_)
        peaks_.pop_front();
    const double cutoff = peak.timestamp - max_age_s_;
    while (!peaks_.empty() && peaks_.front().timestamp < cutoff)
        peaks_.pop_front();
}

std::vector<PeakEvent> PeakLog::all() const {
    return std::vector<PeakEvent>(peaks_.begin(), peaks_.end());
}

std::vector<PeakEvent> PeakLog::since(double since) const {
    std::vector<PeakEvent> out;
    for (const auto& p : peaks_) {
        if (p.timestamp >= since)
            out.push_back(p);
    }
    return out;
}

PeakDetector::PeakDetector(const DetectionConfig& config, size_t max_peaks, double max_peak_age_s)
    : config_(config),
      log_(max_peaks, max_peak_age_s),
      threshold_(0.0),
      has_pending_(false),
      pending_{0, 0.0, 0, 0.0},
      has_left_(false),
      left_voltage_(0.0),
      has_last_peak_(false),
      last_peak_ts_(0.0)
{
    validate(config_);
}

void PeakDetector::validate(const DetectionConfig& config) {
    if (!(config.threshold_ratio > 0.0 && config.threshold_ratio <= 1.0)) {
        throw ConfigError("Threshold ratio must be in (0, 1]");
    }
    if (config.min_r_interval_ms == 0) {
        throw ConfigError("Minimum R-R interval must be greater than 0 ms");
    }
    if (!(config.amplitude_window_s > 0.0) || !std::isfinite(config.amplitude_window_s)) {
        throw ConfigError("Amplitude window must be a positive number of seconds");
    }
}

void PeakDetector::configure(const DetectionConfig& config) {
    validate(config);
    config_ = config;
}

void PeakDetector::reset() {
    max_window_.clear();
    min_window_.clear();
    threshold_ = 0.0;
    has_pending_ = false;
    has_left_ = false;
    left_voltage_ = 0.0;
    has_last_peak_ = false;
    last_peak_ts_ = 0.0;
    log_.clear();
}

void PeakDetector::track_amplitude(const Sample& s) {
    while (!max_window_.empty() && max_window_.back().voltage <= s.voltage)
        max_window_.pop_back();
    max_window_.push_back({s.timestamp, s.voltage});

    while (!min_window_.empty() && min_window_.back().voltage >= s.voltage)
        min_window_.pop_back();
    min_window_.push_back({s.timestamp, s.voltage});

    const double cutoff = s.timestamp - config_.amplitude_window_s;
    while (max_window_.size() > 1 && max_window_.front().timestamp < cutoff)
        max_window_.pop_front();
    while (min_window_.size() > 1 && min_window_.front().timestamp < cutoff)
        min_window_.pop_front();

    const double running_max = max_window_.front().voltage;
    const double running_min = min_window_.front().voltage;
    threshold_ = running_min + config_.threshold_ratio * (running_max - running_min);
}

std::vector<PeakEvent> PeakDetector::scan(const std::vector<Sample>& samples) {
    std::vector<PeakEvent> accepted;
    for (const auto& s : samples) {
        // The held-back sample is judged against the window ending at its right neighbour.
        track_amplitude(s);
        if (has_pending_) {
            evaluate(pending_, s.voltage, accepted);
            has_left_ = true;
            left_voltage_ = pending_.voltage;
        }
        pending_ = s;
        has_pending_ = true;
    }
    return accepted;
}

void PeakDetector::evaluate(const Sample& s, double right_voltage, std::vector<PeakEvent>& out) {
    if (s.voltage <= threshold_)
        return;
    if (has_left_ && s.voltage <= left_voltage_)
        return;
    if (s.voltage <= right_voltage)
        return;

    const double min_interval_s = config_.min_r_interval_ms / 1000.0;
    if (has_last_peak_ && (s.timestamp - last_peak_ts_) < min_interval_s - REFRACTORY_EPSILON_S)
        return;  // first found wins

    PeakEvent peak{s.sequence, s.timestamp, s.adc_raw, s.voltage};
    has_last_peak_ = true;
    last_peak_ts_ = s.timestamp;
    log_.add(peak);
    out.push_back(peak);
}
