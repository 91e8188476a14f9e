// Bench tool: streams framed synthetic ECG samples to a serial port so the
// monitor can be exercised without an acquisition board. Pair it with a
// virtual serial link, e.g. socat -d -d pty,raw,echo=0 pty,raw,echo=0
#include "frame_decoder.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

volatile std::sig_atomic_t g_running = 1;

void signalHandler(int signum) {
    g_running = 0;
}

struct SenderOptions {
    std::string port;
    unsigned int baud = 115200;
    int rate = 250;              // samples per second
    int samples_per_frame = 5;
    int max_adc = 4095;
    double bpm = 72.0;
    std::string wave = "ecg";    // ecg | saw
};

// One heartbeat as a sum of Gaussian bumps (P, Q, R, S, T), 0..1 around a 0.3 baseline.
static double ecg_shape(double phase) {
    struct Wave { double center, width, amplitude; };
    static const Wave waves[] = {
        {0.20, 0.025, 0.10},   // P
        {0.36, 0.010, -0.08},  // Q
        {0.40, 0.012, 0.65},   // R
        {0.44, 0.010, -0.12},  // S
        {0.70, 0.040, 0.18},   // T
    };
    double v = 0.3;
    for (const auto& w : waves) {
        double d = (phase - w.center) / w.width;
        v += w.amplitude * std::exp(-0.5 * d * d);
    }
    return v;
}

static uint16_t next_adc(const SenderOptions& opt, uint32_t index) {
    if (opt.wave == "saw")
        return static_cast<uint16_t>(index % (opt.max_adc + 1));
    double t = static_cast<double>(index) / opt.rate;
    double beats = t * opt.bpm / 60.0;
    double phase = beats - std::floor(beats);
    double v = ecg_shape(phase) * opt.max_adc;
    if (v < 0.0) v = 0.0;
    if (v > opt.max_adc) v = opt.max_adc;
    return static_cast<uint16_t>(std::lround(v));
}

static void usage(const char* program) {
    std::cerr << "Usage: " << program << " <port> <baud> [--rate sps] [--samples-per-frame n]"
              << " [--max-adc n] [--bpm n] [--wave ecg|saw]" << std::endl;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    if (argc < 3) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    SenderOptions opt;
    try {
        opt.port = argv[1];
        opt.baud = static_cast<unsigned int>(std::stoul(argv[2]));
        for (int i = 3; i + 1 < argc; i += 2) {
            std::string a = argv[i];
            if (a == "--rate") opt.rate = std::stoi(argv[i + 1]);
            else if (a == "--samples-per-frame") opt.samples_per_frame = std::stoi(argv[i + 1]);
            else if (a == "--max-adc") opt.max_adc = std::stoi(argv[i + 1]);
            else if (a == "--bpm") opt.bpm = std::stod(argv[i + 1]);
            else if (a == "--wave") opt.wave = argv[i + 1];
            else throw std::invalid_argument("unknown option " + a);
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad arguments: " << e.what() << std::endl;
        usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (opt.rate <= 0 || opt.samples_per_frame <= 0 || opt.samples_per_frame > 63 ||
        opt.max_adc <= 0 || opt.max_adc > 0xFFFF || opt.bpm <= 0.0 ||
        (opt.wave != "ecg" && opt.wave != "saw")) {
        std::cerr << "Option out of range (samples per frame must be 1..63)" << std::endl;
        return EXIT_FAILURE;
    }

    try {
        boost::asio::io_context io;
        boost::asio::serial_port port(io, opt.port);
        port.set_option(boost::asio::serial_port_base::baud_rate(opt.baud));
        port.set_option(boost::asio::serial_port_base::character_size(8));

        std::cout << "Sending to " << opt.port << " @ " << opt.baud << ", " << opt.rate
                  << " sps, " << opt.samples_per_frame << " samples per frame" << std::endl;

        const auto frame_period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(static_cast<double>(opt.samples_per_frame) / opt.rate));
        auto next_send = std::chrono::steady_clock::now();
        uint32_t index = 0;
        uint16_t sample_id = 0;

        while (g_running) {
            std::vector<std::pair<uint16_t, uint16_t>> samples;
            for (int i = 0; i < opt.samples_per_frame; ++i) {
                sample_id = static_cast<uint16_t>(sample_id + 1);
                samples.emplace_back(sample_id, next_adc(opt, index++));
            }
            std::vector<uint8_t> frame = encode_adc_frame(samples);
            boost::asio::write(port, boost::asio::buffer(frame));

            next_send += frame_period;
            std::this_thread::sleep_until(next_send);
        }
        std::cout << "Stopped after " << index << " samples" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Sender error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
