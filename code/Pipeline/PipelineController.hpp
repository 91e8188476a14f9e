#ifndef PIPELINE_CONTROLLER_HPP
#define PIPELINE_CONTROLLER_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "EcgTypes.hpp"
#include "SampleRingBuffer.hpp"
#include "PeakDetector.hpp"
#include "RateEstimator.hpp"
#include "CsvExporter.hpp"

struct PipelineConfig {
    size_t capacity = SampleRingBuffer::DEFAULT_CAPACITY;
    ConversionConfig conversion;
    DetectionConfig detection;
    RateConfig rate;
    size_t max_peaks = PeakDetector::DEFAULT_MAX_PEAKS;
    double max_peak_age_s = PeakDetector::DEFAULT_MAX_PEAK_AGE_S;
};

struct BufferMeta {
    size_t size = 0;
    size_t capacity = 0;
    uint64_t first_sequence = 0;    // meaningful only when size > 0
    uint64_t last_sequence = 0;
    uint64_t total_ingested = 0;
    uint64_t total_evicted = 0;
};

// Eviction caused by the most recent ingest() call.
struct EvictionInfo {
    size_t count = 0;
    uint64_t first_sequence = 0;
    uint64_t last_sequence = 0;
};

struct PipelineSnapshot {
    BufferMeta buffer;
    EvictionInfo last_eviction;
    std::vector<Sample> recent_samples;
    std::vector<PeakEvent> recent_peaks;
    RateEstimate rate;
    double peak_to_peak_v = 0.0;     // over recent_samples
    double measured_rate_hz = 0.0;   // samples received during the last second of data
    ConversionConfig conversion;
    DetectionConfig detection;
};

/**
 * @brief Owns buffer, detector and estimator behind one mutex.
 *
 * The source thread calls ingest(); display and export paths only ever get
 * copies back, so no reader can see a half-processed batch.
 */
class PipelineController {
public:
    explicit PipelineController(const PipelineConfig& config = PipelineConfig{});

    // Applies one batch in order. Throws OutOfOrderError (nothing applied) if
    // timestamps in the batch go backwards.
    std::vector<PeakEvent> ingest(const std::vector<RawSample>& batch);

    void configure(const ConversionConfig& conversion, const DetectionConfig& detection);
    void configure_detection(const DetectionConfig& detection);
    void configure_rate(const RateConfig& rate);

    // Drops buffered samples and detector/estimator state. Sequence numbers continue.
    void reset();

    PipelineSnapshot snapshot(double window_seconds) const;
    std::vector<PeakEvent> peaks() const;
    RateEstimate rate() const;

    // Point-in-time copy of resident samples in [first, last].
    std::vector<Sample> export_range(uint64_t first, uint64_t last) const;
    std::vector<Sample> export_all() const;

    // Copies under the lock, writes outside it. Throws ExportError.
    size_t export_to_file(const std::string& path, uint64_t first, uint64_t last,
                          const CsvExporter& exporter = CsvExporter()) const;

private:
    mutable std::mutex mutex_;
    SampleRingBuffer buffer_;
    PeakDetector detector_;
    RateEstimator estimator_;
    ConversionConfig conversion_;
    uint64_t next_sequence_;
    uint64_t total_ingested_;
    uint64_t total_evicted_;
    EvictionInfo last_eviction_;
};

#endif // PIPELINE_CONTROLLER_HPP
