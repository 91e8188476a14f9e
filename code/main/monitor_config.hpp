#ifndef MONITOR_CONFIG_HPP
#define MONITOR_CONFIG_HPP

#include <string>
#include "PipelineController.hpp"
#include "frame_decoder.hpp"

struct MonitorConfig {
    std::string port = "/dev/ttyUSB0";
    unsigned int baud = 115200;
    std::string mode = "framed";            // framed | raw8 | text
    int text_column = TextLineDecoder::LAST_COLUMN;
    PipelineConfig pipeline;
    double display_window_s = 5.0;
    unsigned short http_port = 8000;        // 0 disables the status page
    std::string export_path;                // CSV written on exit when set
    std::string replay_path;                // offline run over a recorded CSV
    int led_pin = -1;                       // ecg_beat_led only
    bool show_help = false;
};

// Parses command-line flags on top of the defaults and validates the result.
// Throws ConfigError naming the offending flag.
MonitorConfig parse_monitor_args(int argc, const char* const argv[]);

// Same checks parse_monitor_args() applies after reading the flags.
void validate(const MonitorConfig& config);

std::string monitor_usage(const std::string& program);

#endif // MONITOR_CONFIG_HPP
