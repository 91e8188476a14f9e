#include "PipelineController.hpp"
#include "EcgErrors.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK   " : "FAIL ") << what << std::endl;
    if (!ok)
        ++failures;
}

static const double FS = 250.0;
static const double PI = std::acos(-1.0);

// 250 Hz, 1500-code baseline, 3500-code apexes at 0.0, 0.8 and 1.6 s.
static std::vector<RawSample> three_beats(size_t count = 475, double t0 = 0.0) {
    const double apexes[] = {0.0, 0.8, 1.6};
    std::vector<RawSample> out;
    for (size_t i = 0; i < count; ++i) {
        const double t = i / FS;
        double code = 1500.0;
        for (double a : apexes) {
            const double d = std::fabs(t - a);
            if (d < 0.04)
                code = 1500.0 + 2000.0 * 0.5 * (1.0 + std::cos(PI * d / 0.04));
        }
        out.push_back(RawSample{t0 + t, std::lround(code)});
    }
    return out;
}

static std::vector<RawSample> slice(const std::vector<RawSample>& v, size_t from, size_t n) {
    return std::vector<RawSample>(v.begin() + from, v.begin() + std::min(v.size(), from + n));
}

static void test_end_to_end_scenario() {
    PipelineController pipeline;
    std::vector<RawSample> data = three_beats();

    double bpm_after_second = 0.0;
    bool valid_after_second = true;
    for (size_t i = 0; i < data.size(); i += 25) {
        const size_t before = pipeline.peaks().size();
        pipeline.ingest(slice(data, i, 25));
        const size_t after = pipeline.peaks().size();
        if (before < 2 && after == 2) {
            bpm_after_second = pipeline.rate().bpm_instant;
            valid_after_second = pipeline.rate().valid;
        }
    }

    std::vector<PeakEvent> peaks = pipeline.peaks();
    check(peaks.size() == 3, "three R-peaks detected");
    check(peaks.size() == 3 && std::fabs(peaks[1].timestamp - 0.8) < 1e-9 &&
          std::fabs(peaks[2].timestamp - 1.6) < 1e-9, "peaks at 0.8 s spacing");
    check(std::fabs(bpm_after_second - 75.0) < 0.01 && !valid_after_second,
          "75 BPM instant after the second peak, not yet valid");
    RateEstimate r = pipeline.rate();
    check(r.valid && std::fabs(r.bpm_filtered - 75.0) < 0.01, "valid 75 BPM after the third peak");

    PipelineSnapshot snap = pipeline.snapshot(5.0);
    check(snap.buffer.size == 475 && snap.buffer.first_sequence == 0 && snap.buffer.last_sequence == 474,
          "snapshot buffer metadata");
    check(snap.recent_samples.size() == 475 && snap.recent_peaks.size() == 3, "snapshot window contents");
    const double p2p = (3500.0 - 1500.0) / 4095.0 * 3.3;
    check(std::fabs(snap.peak_to_peak_v - p2p) < 1e-9, "peak-to-peak voltage");
    check(snap.measured_rate_hz >= 249.0 && snap.measured_rate_hz <= 251.0, "measured sample rate ~250 Hz");

    PipelineSnapshot narrow = pipeline.snapshot(0.5);
    check(narrow.recent_peaks.size() == 1 && narrow.recent_peaks[0].sequence == 400,
          "narrow window only reports the latest peak");
    check(narrow.measured_rate_hz >= 249.0 && narrow.measured_rate_hz <= 251.0,
          "measured sample rate does not shrink with a window under 1 s");
}

static void test_out_of_order_batch() {
    PipelineConfig cfg;
    cfg.capacity = 2;
    PipelineController pipeline(cfg);
    pipeline.ingest({{-0.008, 98}, {-0.004, 99}, {0.0, 100}, {0.004, 101}});

    bool threw = false;
    try {
        pipeline.ingest({{0.008, 102}, {0.006, 103}});
    } catch (const OutOfOrderError&) {
        threw = true;
    }
    check(threw, "timestamps going backwards inside a batch are rejected");

    threw = false;
    try {
        pipeline.ingest({{0.002, 104}});
    } catch (const OutOfOrderError&) {
        threw = true;
    }
    check(threw, "batch earlier than the buffer is rejected");

    PipelineSnapshot snap = pipeline.snapshot(10.0);
    check(snap.buffer.size == 2 && snap.buffer.total_ingested == 4, "rejected batches are not applied");
    check(snap.last_eviction.count == 2 && snap.last_eviction.first_sequence == 0 &&
          snap.last_eviction.last_sequence == 1, "rejected batches keep the last eviction report");

    pipeline.ingest({{0.008, 105}});
    snap = pipeline.snapshot(10.0);
    check(snap.buffer.last_sequence == 4, "no sequence numbers consumed by rejected batches");
}

static void test_eviction_and_export() {
    PipelineConfig cfg;
    cfg.capacity = 10;
    PipelineController pipeline(cfg);

    std::vector<RawSample> batch;
    for (int i = 0; i < 15; ++i)
        batch.push_back(RawSample{i / FS, 2000 + i});
    pipeline.ingest(batch);

    PipelineSnapshot snap = pipeline.snapshot(10.0);
    check(snap.last_eviction.count == 5 && snap.last_eviction.first_sequence == 0 &&
          snap.last_eviction.last_sequence == 4, "eviction of sequences 0..4 reported");
    check(snap.buffer.total_evicted == 5 && snap.buffer.size == 10, "buffer bounded at capacity");

    std::vector<Sample> rows = pipeline.export_range(0, 14);
    check(rows.size() == 10 && rows.front().sequence == 5, "export covers resident samples only");
    check(pipeline.export_range(0, 4).empty(), "export of an evicted range is empty");

    const std::string path = "pipeline_export_test.csv";
    const size_t written = pipeline.export_to_file(path, 7, 9);
    std::vector<Sample> back = CsvExporter::read_file(path);
    check(written == 3 && back.size() == 3 && back[0].sequence == 7 && back[0].adc_raw == 2007,
          "export_to_file writes the requested range");
    std::remove(path.c_str());

    bool threw = false;
    try {
        pipeline.export_to_file("/nonexistent-dir/out.csv", 5, 14);
    } catch (const ExportError& e) {
        threw = e.first_sequence() == 5 && e.last_sequence() == 14;
    }
    check(threw, "failed export reports its range");
    check(pipeline.snapshot(10.0).buffer.size == 10, "failed export leaves the buffer intact");

    pipeline.ingest({{1.0, 2100}});
    snap = pipeline.snapshot(10.0);
    check(snap.last_eviction.count == 1 && snap.last_eviction.first_sequence == 5,
          "eviction info describes the latest ingest only");
}

static void test_configuration() {
    PipelineController pipeline;
    pipeline.ingest({{0.0, 4095}});

    bool threw = false;
    try {
        ConversionConfig bad_conv;
        bad_conv.bit_depth = 0;
        pipeline.configure(bad_conv, DetectionConfig{});
    } catch (const ConfigError&) {
        threw = true;
    }
    check(threw && pipeline.snapshot(1.0).conversion.bit_depth == 12, "bad bit depth rejected, old kept");

    threw = false;
    try {
        ConversionConfig conv;
        conv.bit_depth = 10;
        DetectionConfig bad_det;
        bad_det.threshold_ratio = 0.0;
        pipeline.configure(conv, bad_det);
    } catch (const ConfigError&) {
        threw = true;
    }
    check(threw && pipeline.snapshot(1.0).conversion.bit_depth == 12,
          "rejected detection config leaves conversion untouched");

    ConversionConfig conv;
    conv.bit_depth = 10;
    conv.v_ref = 1.0;
    DetectionConfig det;
    det.threshold_ratio = 0.5;
    pipeline.configure(conv, det);
    pipeline.ingest({{0.004, 1023}});
    std::vector<Sample> rows = pipeline.export_all();
    check(rows.size() == 2 && std::fabs(rows[0].voltage - 3.3) < 1e-9 && std::fabs(rows[1].voltage - 1.0) < 1e-9,
          "new conversion applies to new samples only");
    check(pipeline.snapshot(1.0).detection.threshold_ratio == 0.5, "detection config applied");

    threw = false;
    try {
        RateConfig bad_rate;
        bad_rate.filter_window = 0;
        pipeline.configure_rate(bad_rate);
    } catch (const ConfigError&) {
        threw = true;
    }
    check(threw, "bad rate config rejected");
}

static void test_reset() {
    PipelineController pipeline;
    std::vector<RawSample> data = three_beats();
    pipeline.ingest(data);
    const uint64_t next = pipeline.snapshot(5.0).buffer.last_sequence + 1;

    pipeline.reset();
    PipelineSnapshot snap = pipeline.snapshot(5.0);
    check(snap.buffer.size == 0 && pipeline.peaks().empty() && !snap.rate.valid, "reset clears state");

    // Timestamps restart after a reconnect.
    pipeline.ingest(data);
    snap = pipeline.snapshot(5.0);
    check(snap.buffer.first_sequence == next, "sequence numbering continues after reset");
    check(pipeline.peaks().size() == 3, "detection works again after reset");
}

static void test_concurrent_readers() {
    PipelineConfig cfg;
    cfg.capacity = 1000;
    PipelineController pipeline(cfg);
    std::atomic<bool> done(false);
    std::atomic<bool> consistent(true);

    std::thread reader([&] {
        while (!done) {
            PipelineSnapshot snap = pipeline.snapshot(2.0);
            if (snap.buffer.size > snap.buffer.capacity)
                consistent = false;
            const std::vector<Sample>& s = snap.recent_samples;
            for (size_t i = 1; i < s.size(); ++i) {
                if (s[i].sequence != s[i - 1].sequence + 1 || s[i].timestamp < s[i - 1].timestamp)
                    consistent = false;
            }
            // Batches are applied whole: the buffer always ends on a batch boundary.
            if (snap.buffer.total_ingested % 25 != 0)
                consistent = false;
            std::vector<Sample> rows = pipeline.export_all();
            if (!rows.empty() && rows.back().sequence - rows.front().sequence + 1 != rows.size())
                consistent = false;
        }
    });

    std::vector<RawSample> data;
    for (int beat = 0; beat < 20; ++beat) {
        std::vector<RawSample> b = three_beats(475, beat * 2.0);
        data.insert(data.end(), b.begin(), b.end());
    }
    for (size_t i = 0; i < data.size(); i += 25)
        pipeline.ingest(slice(data, i, 25));
    done = true;
    reader.join();

    check(consistent, "readers only ever see whole batches");
    check(pipeline.snapshot(2.0).buffer.total_ingested == data.size(), "all samples ingested");
    check(pipeline.peaks().size() == 60, "every beat detected while readers run");
}

int main() {
    try {
        test_end_to_end_scenario();
        test_out_of_order_batch();
        test_eviction_and_export();
        test_configuration();
        test_reset();
        test_concurrent_readers();
    } catch (const std::exception& e) {
        std::cerr << "Pipeline test failed: " << e.what() << std::endl;
        return 1;
    }
    std::cout << (failures == 0 ? "All pipeline tests passed" : "Pipeline tests FAILED") << std::endl;
    return failures == 0 ? 0 : 1;
}
