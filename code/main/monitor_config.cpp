#include "monitor_config.hpp"
#include "EcgErrors.hpp"
#include "UnitConverter.hpp"
#include <limits>
#include <sstream>

static double parse_double(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used == text.size())
            return value;
    } catch (const std::logic_error&) {
    }
    throw ConfigError(flag + " expects a number, got [" + text + "]");
}

static long long parse_integer(const std::string& flag, const std::string& text,
                               long long min, long long max) {
    long long value = 0;
    try {
        size_t used = 0;
        value = std::stoll(text, &used);
        if (used != text.size())
            throw ConfigError(flag + " expects an integer, got [" + text + "]");
    } catch (const ConfigError&) {
        throw;
    } catch (const std::logic_error&) {
        throw ConfigError(flag + " expects an integer, got [" + text + "]");
    }
    if (value < min || value > max) {
        std::ostringstream msg;
        msg << flag << " must be between " << min << " and " << max << ", got " << value;
        throw ConfigError(msg.str());
    }
    return value;
}

void validate(const MonitorConfig& config) {
    if (config.port.empty() && config.replay_path.empty()) {
        throw ConfigError("--port must not be empty");
    }
    if (config.baud == 0) {
        throw ConfigError("--baud must be positive");
    }
    make_decoder(config.mode, config.text_column);
    if (config.pipeline.capacity == 0) {
        throw ConfigError("--capacity must be greater than zero");
    }
    if (!(config.display_window_s > 0.0)) {
        throw ConfigError("--display-window must be positive");
    }
    UnitConverter::validate(config.pipeline.conversion);
    PeakDetector::validate(config.pipeline.detection);
    RateEstimator::validate(config.pipeline.rate);
}

MonitorConfig parse_monitor_args(int argc, const char* const argv[]) {
    MonitorConfig config;
    const long long int_max = std::numeric_limits<int>::max();

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            config.show_help = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw ConfigError("Missing value for " + a);
        }
        const std::string v = argv[++i];

        if (a == "--port" || a == "-p") config.port = v;
        else if (a == "--baud" || a == "-b") config.baud = static_cast<unsigned int>(parse_integer(a, v, 1, 4000000));
        else if (a == "--mode") config.mode = v;
        else if (a == "--column") config.text_column = static_cast<int>(parse_integer(a, v, -1, 64));
        else if (a == "--rate") config.pipeline.conversion.sample_rate_hz = parse_double(a, v);
        else if (a == "--bits") config.pipeline.conversion.bit_depth = static_cast<int>(parse_integer(a, v, 1, 32));
        else if (a == "--vref") config.pipeline.conversion.v_ref = parse_double(a, v);
        else if (a == "--threshold") config.pipeline.detection.threshold_ratio = parse_double(a, v);
        else if (a == "--min-rr-ms") config.pipeline.detection.min_r_interval_ms = static_cast<uint32_t>(parse_integer(a, v, 1, 60000));
        else if (a == "--window") config.pipeline.detection.amplitude_window_s = parse_double(a, v);
        else if (a == "--capacity") config.pipeline.capacity = static_cast<size_t>(parse_integer(a, v, 1, 100000000));
        else if (a == "--max-peaks") config.pipeline.max_peaks = static_cast<size_t>(parse_integer(a, v, 1, 1000000));
        else if (a == "--min-bpm") config.pipeline.rate.min_bpm = parse_double(a, v);
        else if (a == "--max-bpm") config.pipeline.rate.max_bpm = parse_double(a, v);
        else if (a == "--filter") config.pipeline.rate.filter_window = static_cast<size_t>(parse_integer(a, v, 1, 1000));
        else if (a == "--display-window") config.display_window_s = parse_double(a, v);
        else if (a == "--http-port") config.http_port = static_cast<unsigned short>(parse_integer(a, v, 0, 65535));
        else if (a == "--export") config.export_path = v;
        else if (a == "--replay") config.replay_path = v;
        else if (a == "--led-pin") config.led_pin = static_cast<int>(parse_integer(a, v, 0, int_max));
        else throw ConfigError("Unknown option " + a);
    }

    validate(config);
    return config;
}

std::string monitor_usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [options]\n"
       << "  --port <dev>          serial device (default /dev/ttyUSB0)\n"
       << "  --baud <n>            baud rate (default 115200)\n"
       << "  --mode <m>            framed | raw8 | text (default framed)\n"
       << "  --column <n>          ADC column for text mode, -1 = last\n"
       << "  --rate <hz>           sample rate (default 250)\n"
       << "  --bits <n>            ADC bit depth (default 12)\n"
       << "  --vref <v>            ADC reference voltage (default 3.3)\n"
       << "  --threshold <r>       R-peak threshold ratio in (0,1] (default 0.6)\n"
       << "  --min-rr-ms <ms>      refractory window (default 300)\n"
       << "  --window <s>          amplitude lookback (default 5)\n"
       << "  --capacity <n>        sample buffer capacity (default 200000)\n"
       << "  --max-peaks <n>       peak log length (default 1000)\n"
       << "  --min-bpm / --max-bpm plausible heart-rate band (default 20..300)\n"
       << "  --filter <n>          intervals averaged for filtered BPM (default 5)\n"
       << "  --display-window <s>  window reported on the status page (default 5)\n"
       << "  --http-port <n>       status page port, 0 = off (default 8000)\n"
       << "  --export <file.csv>   write the buffer to CSV on exit\n"
       << "  --replay <file.csv>   analyse a recorded CSV instead of the serial port\n"
       << "  --led-pin <gpio>      beat LED line (ecg_beat_led)\n";
    return os.str();
}
