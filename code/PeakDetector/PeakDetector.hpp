#ifndef PEAK_DETECTOR_HPP
#define PEAK_DETECTOR_HPP

#include <cstddef>
#include <deque>
#include <vector>
#include "EcgTypes.hpp"

/**
 * @brief Bounded log of accepted peaks.
 *
 * Kept apart from the sample buffer: the rate estimate needs interval history
 * that may reach further back than the raw samples still resident.
 */
class PeakLog {
public:
    PeakLog(size_t max_peaks, double max_age_s);

    void add(const PeakEvent& peak);
    void clear() { peaks_.clear(); }

    std::vector<PeakEvent> all() const;
    // Peaks with timestamp >= since, oldest first.
    std::vector<PeakEvent> since(double since) const;

    size_t size() const { return peaks_.size(); }

private:
    std::deque<PeakEvent> peaks_;
    size_t max_peaks_;
    double max_age_s_;
};

/**
 * @brief Streaming R-peak detector (rolling threshold + refractory window).
 *
 * scan() only ever looks at the samples passed to it. The newest sample of a
 * batch is held back until the following batch supplies its right neighbour.
 * The rolling min/max advances one sample at a time, so how a stream is split
 * into batches never changes which peaks are found.
 */
class PeakDetector {
public:
    static const size_t DEFAULT_MAX_PEAKS = 1000;
    static constexpr double DEFAULT_MAX_PEAK_AGE_S = 600.0;

    explicit PeakDetector(const DetectionConfig& config = DetectionConfig{},
                          size_t max_peaks = DEFAULT_MAX_PEAKS,
                          double max_peak_age_s = DEFAULT_MAX_PEAK_AGE_S);

    // Applies from the next scan on. Throws ConfigError, keeping the old config.
    void configure(const DetectionConfig& config);
    const DetectionConfig& config() const { return config_; }

    // Newly appended samples in sequence order. Returns the peaks accepted.
    std::vector<PeakEvent> scan(const std::vector<Sample>& samples);

    // Forget amplitude history, refractory clock, held-back sample and peak log.
    void reset();

    const PeakLog& log() const { return log_; }
    double threshold() const { return threshold_; }

    static void validate(const DetectionConfig& config);

private:
    struct Point {
        double timestamp;
        double voltage;
    };

    // Pushes s into the amplitude window and recomputes threshold_.
    void track_amplitude(const Sample& s);
    void evaluate(const Sample& s, double right_voltage, std::vector<PeakEvent>& out);

    DetectionConfig config_;
    PeakLog log_;

    // Monotonic deques over the amplitude window: front holds the extreme.
    std::deque<Point> max_window_;
    std::deque<Point> min_window_;
    double threshold_;

    bool has_pending_;
    Sample pending_;
    bool has_left_;
    double left_voltage_;

    bool has_last_peak_;
    double last_peak_ts_;
};

#endif // PEAK_DETECTOR_HPP
