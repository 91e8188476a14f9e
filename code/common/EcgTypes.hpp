#ifndef ECG_TYPES_HPP
#define ECG_TYPES_HPP

#include <cstdint>
#include <cstddef>

// One raw reading as delivered by a sample source.
struct RawSample {
    double timestamp;   // seconds, non-decreasing
    int64_t adc_raw;
};

// A sample once it has been accepted into the acquisition buffer.
struct Sample {
    uint64_t sequence;  // assigned at append, never reused
    double timestamp;
    int64_t adc_raw;
    double voltage;     // converted with the configuration active at capture time
};

// Snapshot of the sample identified as an R-wave apex.
struct PeakEvent {
    uint64_t sequence;
    double timestamp;
    int64_t adc_raw;
    double voltage;
};

struct ConversionConfig {
    double sample_rate_hz = 250.0;
    int bit_depth = 12;
    double v_ref = 3.3;
};

struct DetectionConfig {
    double threshold_ratio = 0.6;       // (0, 1]
    uint32_t min_r_interval_ms = 300;   // refractory window
    double amplitude_window_s = 5.0;    // rolling min/max lookback
};

struct RateConfig {
    double min_bpm = 20.0;
    double max_bpm = 300.0;
    size_t filter_window = 5;           // valid intervals averaged for bpm_filtered
};

struct RateEstimate {
    double bpm_instant = 0.0;
    double bpm_filtered = 0.0;
    bool valid = false;
    size_t valid_intervals = 0;
    size_t rejected_intervals = 0;
    double mean_period_s = 0.0;
};

#endif // ECG_TYPES_HPP
