#include "monitor_config.hpp"
#include "EcgErrors.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK   " : "FAIL ") << what << std::endl;
    if (!ok)
        ++failures;
}

static MonitorConfig parse(std::vector<const char*> args) {
    args.insert(args.begin(), "ecg_monitor");
    return parse_monitor_args(static_cast<int>(args.size()), args.data());
}

static bool rejects(const std::vector<const char*>& args, const std::string& flag) {
    try {
        parse(args);
    } catch (const ConfigError& e) {
        return std::string(e.what()).find(flag) != std::string::npos;
    }
    return false;
}

int main() {
    try {
        MonitorConfig defaults = parse({});
        check(defaults.port == "/dev/ttyUSB0" && defaults.baud == 115200 && defaults.mode == "framed",
              "serial defaults");
        check(defaults.pipeline.conversion.sample_rate_hz == 250.0 && defaults.pipeline.conversion.bit_depth == 12 &&
              defaults.pipeline.detection.threshold_ratio == 0.6 &&
              defaults.pipeline.detection.min_r_interval_ms == 300 &&
              defaults.pipeline.capacity == 200000, "pipeline defaults");
        check(defaults.http_port == 8000 && defaults.export_path.empty() && !defaults.show_help,
              "app defaults");

        MonitorConfig c = parse({"--port", "/dev/ttyACM0", "--baud", "230400", "--mode", "text",
                                 "--column", "2", "--rate", "120", "--bits", "10", "--vref", "5",
                                 "--threshold", "0.7", "--min-rr-ms", "250", "--window", "3",
                                 "--capacity", "5000", "--filter", "8", "--http-port", "0",
                                 "--export", "out.csv"});
        check(c.port == "/dev/ttyACM0" && c.baud == 230400 && c.mode == "text" && c.text_column == 2,
              "serial flags");
        check(c.pipeline.conversion.sample_rate_hz == 120.0 && c.pipeline.conversion.bit_depth == 10 &&
              c.pipeline.conversion.v_ref == 5.0, "conversion flags");
        check(c.pipeline.detection.threshold_ratio == 0.7 && c.pipeline.detection.min_r_interval_ms == 250 &&
              c.pipeline.detection.amplitude_window_s == 3.0, "detection flags");
        check(c.pipeline.capacity == 5000 && c.pipeline.rate.filter_window == 8 && c.http_port == 0 &&
              c.export_path == "out.csv", "buffer, rate and output flags");

        check(parse({"--help"}).show_help, "help flag");
        check(rejects({"--threshold", "1.5"}, "Threshold"), "threshold above 1 rejected");
        check(rejects({"--threshold", "abc"}, "--threshold"), "non-numeric value rejected");
        check(rejects({"--bits", "40"}, "--bits"), "bit depth out of range rejected");
        check(rejects({"--capacity", "0"}, "--capacity"), "zero capacity rejected");
        check(rejects({"--mode", "hex"}, "hex"), "unknown decoder mode rejected");
        check(rejects({"--min-bpm", "200", "--max-bpm", "100"}, "BPM"), "inverted BPM band rejected");
        check(rejects({"--frobnicate", "1"}, "--frobnicate"), "unknown flag rejected");
        check(rejects({"--port"}, "--port"), "missing value rejected");

        check(monitor_usage("ecg_monitor").find("--replay") != std::string::npos, "usage lists replay");
    } catch (const std::exception& e) {
        std::cerr << "Monitor config test failed: " << e.what() << std::endl;
        return 1;
    }
    std::cout << (failures == 0 ? "All monitor config tests passed" : "Monitor config tests FAILED") << std::endl;
    return failures == 0 ? 0 : 1;
}
