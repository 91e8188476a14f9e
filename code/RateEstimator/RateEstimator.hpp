#ifndef RATE_ESTIMATOR_HPP
#define RATE_ESTIMATOR_HPP

#include <cstddef>
#include <deque>
#include "EcgTypes.hpp"

// Turns accepted peaks into instantaneous and filtered heart rate.
class RateEstimator {
public:
    explicit RateEstimator(const RateConfig& config = RateConfig{});

    // Throws ConfigError and keeps the previous config. Shrinking the filter
    // window drops the oldest intervals.
    void configure(const RateConfig& config);
    const RateConfig& config() const { return config_; }

    // Feed peaks in timestamp order. Returns the estimate after this peak.
    RateEstimate update(const PeakEvent& peak);

    RateEstimate estimate() const { return estimate_; }

    void reset();

    static void validate(const RateConfig& config);

private:
    void refresh_filtered();

    RateConfig config_;
    RateEstimate estimate_;
    std::deque<double> intervals_;   // last valid R-R intervals, seconds
    bool has_last_peak_;
    double last_peak_ts_;
    bool last_interval_valid_;
};

#endif // RATE_ESTIMATOR_HPP
