#include "monitor_config.hpp"
#include "PipelineController.hpp"
#include "CsvExporter.hpp"
#include "EcgErrors.hpp"
#include "serial_sample_source.hpp"
#include "status_http_server.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

using namespace std::chrono;

volatile std::sig_atomic_t g_running = 1;

void signalHandler(int signum) {
    g_running = 0;
}

static void print_status(const PipelineSnapshot& snap) {
    std::cout << "\rBPM: ";
    if (snap.rate.valid)
        std::cout << std::fixed << std::setprecision(1) << snap.rate.bpm_filtered;
    else
        std::cout << "--";
    std::cout << " | instant " << std::fixed << std::setprecision(1) << snap.rate.bpm_instant
              << " | Pk-Pk " << std::setprecision(2) << snap.peak_to_peak_v << " V"
              << " | " << std::setprecision(0) << snap.measured_rate_hz << " sps"
              << " | buffer " << snap.buffer.size << "/" << snap.buffer.capacity
              << "    " << std::flush;
}

static void export_buffer(const PipelineController& pipeline, const std::string& path) {
    std::vector<Sample> rows = pipeline.export_all();
    if (rows.empty()) {
        std::cerr << "Nothing to export" << std::endl;
        return;
    }
    CsvExporter().write_file(path, rows, rows.front().sequence, rows.back().sequence);
    std::cout << "Exported " << rows.size() << " samples to " << path << std::endl;
}

// Runs a recorded CSV through a fresh pipeline in 100 ms batches.
static int run_replay(const MonitorConfig& config) {
    std::vector<Sample> recorded = CsvExporter::read_file(config.replay_path);
    PipelineController pipeline(config.pipeline);

    const size_t batch_size = std::max<size_t>(1, static_cast<size_t>(config.pipeline.conversion.sample_rate_hz / 10.0));
    std::vector<RawSample> batch;
    for (size_t i = 0; i < recorded.size(); ++i) {
        batch.push_back(RawSample{recorded[i].timestamp, recorded[i].adc_raw});
        if (batch.size() == batch_size || i + 1 == recorded.size()) {
            for (const auto& p : pipeline.ingest(batch)) {
                std::cout << "R-peak seq=" << p.sequence << " t=" << std::fixed << std::setprecision(3)
                          << p.timestamp << "s v=" << p.voltage << "V" << std::endl;
            }
            batch.clear();
        }
    }

    RateEstimate rate = pipeline.rate();
    std::cout << "Samples: " << recorded.size() << ", peaks: " << pipeline.peaks().size() << std::endl;
    if (rate.valid) {
        std::cout << "BPM: " << std::setprecision(1) << rate.bpm_filtered
                  << " (instant " << rate.bpm_instant << ", period " << std::setprecision(3)
                  << rate.mean_period_s << " s)" << std::endl;
    } else {
        std::cout << "BPM: -- (not enough valid intervals)" << std::endl;
    }
    if (!config.export_path.empty())
        export_buffer(pipeline, config.export_path);
    return EXIT_SUCCESS;
}

static int run_live(const MonitorConfig& config) {
    PipelineController pipeline(config.pipeline);

    SerialSampleSource source(
        config.port, config.baud, config.pipeline.conversion.sample_rate_hz,
        make_decoder(config.mode, config.text_column),
        [&pipeline](const std::vector<RawSample>& batch) { pipeline.ingest(batch); },
        [&pipeline](const std::string& reason) {
            std::cerr << "\nSerial link lost (" << reason << "), resetting pipeline" << std::endl;
            pipeline.reset();
        });

    std::unique_ptr<StatusHttpServer> server;
    if (config.http_port != 0) {
        server.reset(new StatusHttpServer(pipeline, config.http_port, config.display_window_s));
        server->start();
    }

    source.start();
    std::cout << "ECG monitor started on " << config.port << ". Press Ctrl+C to exit." << std::endl;

    auto last_display = steady_clock::now();
    auto last_reconnect = steady_clock::now();
    while (g_running) {
        auto now = steady_clock::now();
        if (!source.running()) {
            // Propagates a fatal error from the reader thread.
            source.rethrow_if_failed();
            if (now - last_reconnect >= seconds(2)) {
                last_reconnect = now;
                try {
                    source.start();
                } catch (const boost::system::system_error& e) {
                    std::cerr << "Reconnect to " << config.port << " failed: " << e.what() << std::endl;
                }
            }
        }
        if (now - last_display >= seconds(1)) {
            print_status(pipeline.snapshot(config.display_window_s));
            last_display = now;
        }
        std::this_thread::sleep_for(milliseconds(50));
    }

    std::cout << std::endl;
    source.stop();
    if (server)
        server->stop();
    if (!config.export_path.empty())
        export_buffer(pipeline, config.export_path);
    return EXIT_SUCCESS;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    MonitorConfig config;
    try {
        config = parse_monitor_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n\n" << monitor_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.show_help) {
        std::cout << monitor_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try {
        if (!config.replay_path.empty())
            return run_replay(config);
        return run_live(config);
    } catch (const CsvFormatError& e) {
        std::cerr << "\nMalformed recording: " << e.what() << std::endl;
    } catch (const ExportError& e) {
        std::cerr << "\nExport failed: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << std::endl;
    }
    return EXIT_FAILURE;
}
