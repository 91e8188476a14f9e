#include "RateEstimator.hpp"
#include "EcgErrors.hpp"
#include <cmath>

RateEstimator::RateEstimator(const RateConfig& config)
    : config_(config),
      has_last_peak_(false),
      last_peak_ts_(0.0),
      last_interval_valid_(false)
{
    validate(config_);
}

void RateEstimator::validate(const RateConfig& config) {
    if (!(config.min_bpm > 0.0) || !std::isfinite(config.min_bpm)) {
        throw ConfigError("Minimum BPM must be positive");
    }
    if (!(config.max_bpm > config.min_bpm) || !std::isfinite(config.max_bpm)) {
        throw ConfigError("Maximum BPM must be greater than minimum BPM");
    }
    if (config.filter_window == 0) {
        throw ConfigError("BPM filter window must hold at least one interval");
    }
}

void RateEstimator::configure(const RateConfig& config) {
    validate(config);
    config_ = config;
    while (intervals_.size() > config_.filter_window)
        intervals_.pop_front();
    refresh_filtered();
}

RateEstimate RateEstimator::update(const PeakEvent& peak) {
    if (!has_last_peak_) {
        has_last_peak_ = true;
        last_peak_ts_ = peak.timestamp;
        return estimate_;
    }

    const double interval = peak.timestamp - last_peak_ts_;
    // Bookkeeping always advances, so one bad detection costs one interval, not two.
    last_peak_ts_ = peak.timestamp;

    if (!(interval > 0.0)) {
        last_interval_valid_ = false;
        ++estimate_.rejected_intervals;
        refresh_filtered();
        return estimate_;
    }

    const double bpm = 60.0 / interval;
    estimate_.bpm_instant = bpm;
    if (bpm < config_.min_bpm || bpm > config_.max_bpm) {
        last_interval_valid_ = false;
        ++estimate_.rejected_intervals;
    } else {
        last_interval_valid_ = true;
        intervals_.push_back(interval);
        while (intervals_.size() > config_.filter_window)
            intervals_.pop_front();
        ++estimate_.valid_intervals;
    }
    refresh_filtered();
    return estimate_;
}

void RateEstimator::refresh_filtered() {
    if (intervals_.empty()) {
        estimate_.bpm_filtered = 0.0;
        estimate_.mean_period_s = 0.0;
        estimate_.valid = false;
        return;
    }
    double sum = 0.0;
    for (double iv : intervals_)
        sum += iv;
    estimate_.mean_period_s = sum / intervals_.size();
    estimate_.bpm_filtered = 60.0 / estimate_.mean_period_s;
    estimate_.valid = last_interval_valid_ && estimate_.valid_intervals >= 2;
}

void RateEstimator::reset() {
    estimate_ = RateEstimate{};
    intervals_.clear();
    has_last_peak_ = false;
    last_peak_ts_ = 0.0;
    last_interval_valid_ = false;
}
