#include "PipelineController.hpp"
#include "EcgErrors.hpp"
#include "UnitConverter.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>

PipelineController::PipelineController(const PipelineConfig& config)
    : buffer_(config.capacity),
      detector_(config.detection, config.max_peaks, config.max_peak_age_s),
      estimator_(config.rate),
      conversion_(config.conversion),
      next_sequence_(0),
      total_ingested_(0),
      total_evicted_(0)
{
    UnitConverter::validate(conversion_);
}

std::vector<PeakEvent> PipelineController::ingest(const std::vector<RawSample>& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (batch.empty()) {
        last_eviction_ = EvictionInfo{};
        return {};
    }

    // Check the whole batch first so a bad batch leaves everything untouched.
    double prev_ts = buffer_.empty() ? -std::numeric_limits<double>::infinity() : buffer_.back().timestamp;
    for (size_t i = 0; i < batch.size(); ++i) {
        const double ts = batch[i].timestamp;
        if (std::isnan(ts) || ts < prev_ts) {
            std::ostringstream msg;
            msg << "Batch sample " << i << " has timestamp " << ts
                << "s, earlier than preceding " << prev_ts << "s";
            throw OutOfOrderError(msg.str());
        }
        prev_ts = ts;
    }

    last_eviction_ = EvictionInfo{};
    std::vector<Sample> fresh;
    fresh.reserve(batch.size());
    for (const auto& raw : batch) {
        Sample s;
        s.sequence = next_sequence_++;
        s.timestamp = raw.timestamp;
        s.adc_raw = raw.adc_raw;
        s.voltage = UnitConverter::to_voltage(raw.adc_raw, conversion_.bit_depth, conversion_.v_ref);

        EvictionOutcome outcome = buffer_.append(s);
        for (uint64_t evicted : outcome.evicted_sequences) {
            if (last_eviction_.count == 0)
                last_eviction_.first_sequence = evicted;
            last_eviction_.last_sequence = evicted;
            ++last_eviction_.count;
        }
        fresh.push_back(s);
    }
    total_ingested_ += fresh.size();
    total_evicted_ += last_eviction_.count;

    std::vector<PeakEvent> peaks = detector_.scan(fresh);
    for (const auto& p : peaks)
        estimator_.update(p);
    return peaks;
}

void PipelineController::configure(const ConversionConfig& conversion, const DetectionConfig& detection) {
    // Validate everything before touching anything.
    UnitConverter::validate(conversion);
    PeakDetector::validate(detection);

    std::lock_guard<std::mutex> lock(mutex_);
    conversion_ = conversion;
    detector_.configure(detection);
}

void PipelineController::configure_detection(const DetectionConfig& detection) {
    PeakDetector::validate(detection);
    std::lock_guard<std::mutex> lock(mutex_);
    detector_.configure(detection);
}

void PipelineController::configure_rate(const RateConfig& rate) {
    RateEstimator::validate(rate);
    std::lock_guard<std::mutex> lock(mutex_);
    estimator_.configure(rate);
}

void PipelineController::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
    detector_.reset();
    estimator_.reset();
    last_eviction_ = EvictionInfo{};
    std::cerr << "Pipeline reset (next sequence " << next_sequence_ << ")" << std::endl;
}

PipelineSnapshot PipelineController::snapshot(double window_seconds) const {
    PipelineSnapshot snap;
    std::lock_guard<std::mutex> lock(mutex_);

    snap.buffer.size = buffer_.size();
    snap.buffer.capacity = buffer_.capacity();
    if (!buffer_.empty()) {
        snap.buffer.first_sequence = buffer_.front().sequence;
        snap.buffer.last_sequence = buffer_.back().sequence;
    }
    snap.buffer.total_ingested = total_ingested_;
    snap.buffer.total_evicted = total_evicted_;
    snap.last_eviction = last_eviction_;
    snap.rate = estimator_.estimate();
    snap.conversion = conversion_;
    snap.detection = detector_.config();

    snap.recent_samples = buffer_.latest(window_seconds);
    if (!snap.recent_samples.empty()) {
        const double newest = snap.recent_samples.back().timestamp;
        snap.recent_peaks = detector_.log().since(newest - window_seconds);

        auto mm = std::minmax_element(snap.recent_samples.begin(), snap.recent_samples.end(),
                                      [](const Sample& a, const Sample& b) { return a.voltage < b.voltage; });
        snap.peak_to_peak_v = mm.second->voltage - mm.first->voltage;
    }
    if (!buffer_.empty()) {
        // Samples in the last second of the buffer, whatever window_seconds is.
        snap.measured_rate_hz = static_cast<double>(buffer_.count_newer_than(buffer_.back().timestamp - 1.0));
    }
    return snap;
}

std::vector<PeakEvent> PipelineController::peaks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detector_.log().all();
}

RateEstimate PipelineController::rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return estimator_.estimate();
}

std::vector<Sample> PipelineController::export_range(uint64_t first, uint64_t last) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.get_range(first, last);
}

std::vector<Sample> PipelineController::export_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.all();
}

size_t PipelineController::export_to_file(const std::string& path, uint64_t first, uint64_t last,
                                          const CsvExporter& exporter) const {
    // Snapshot under the lock, serialize without it.
    std::vector<Sample> rows = export_range(first, last);
    exporter.write_file(path, rows, first, last);
    return rows.size();
}
