#include "BeatLed.hpp"
#include "monitor_config.hpp"
#include "PipelineController.hpp"
#include "EcgErrors.hpp"
#include "serial_sample_source.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

volatile std::sig_atomic_t g_running = 1;

void signalHandler(int signum) {
    g_running = 0;
}

// Headless variant of the monitor: blink an LED on every R-peak.
int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);

    MonitorConfig config;
    try {
        config = parse_monitor_args(argc, argv);
        if (config.show_help) {
            std::cout << monitor_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (config.led_pin < 0)
            throw ConfigError("--led-pin is required");
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n\n" << monitor_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        BeatLed led(static_cast<unsigned>(config.led_pin));
        PipelineController pipeline(config.pipeline);
        SerialSampleSource source(
            config.port, config.baud, config.pipeline.conversion.sample_rate_hz,
            make_decoder(config.mode, config.text_column),
            [&pipeline](const std::vector<RawSample>& batch) { pipeline.ingest(batch); },
            [&pipeline](const std::string& reason) {
                std::cerr << "Serial link lost (" << reason << ")" << std::endl;
                pipeline.reset();
            });
        source.start();
        std::cout << "Beat LED on GPIO" << config.led_pin << ". Press Ctrl+C to exit." << std::endl;

        while (g_running && source.running()) {
            std::vector<PeakEvent> peaks = pipeline.peaks();
            if (!peaks.empty())
                led.on_peak(peaks.back().sequence);
            led.tick();
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        source.rethrow_if_failed();
        source.stop();
    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
