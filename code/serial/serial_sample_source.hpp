#ifndef SERIAL_SAMPLE_SOURCE_HPP
#define SERIAL_SAMPLE_SOURCE_HPP

#include <array>
#include <atomic>
#include <exception>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "EcgTypes.hpp"
#include "frame_decoder.hpp"

/**
 * @brief Reads the acquisition board over a serial port (Boost.Asio).
 *
 * Bytes are decoded on the reader thread and delivered as timestamped
 * batches; the timestamp of the n-th sample since open() is n / sample_rate.
 * A read error or end-of-file closes the port and fires the disconnect
 * callback exactly once per session.
 */
class SerialSampleSource {
public:
    using BatchCallback = std::function<void(const std::vector<RawSample>&)>;
    using DisconnectCallback = std::function<void(const std::string&)>;

    static const unsigned int DEFAULT_BAUD = 115200;
    static const size_t READ_CHUNK = 256;

    SerialSampleSource(const std::string& port, unsigned int baud, double sample_rate_hz,
                       std::unique_ptr<FrameDecoder> decoder,
                       BatchCallback on_batch, DisconnectCallback on_disconnect);
    ~SerialSampleSource();

    // Opens the port and starts the reader thread. Throws boost::system::system_error.
    void start();
    void stop();
    bool running() const { return active_.load(); }

    // Rethrows an exception that escaped the batch callback on the reader thread.
    void rethrow_if_failed();

    uint64_t samples_delivered() const { return sample_counter_.load(); }

private:
    void configure_port();
    void start_read();
    void handle_read(const boost::system::error_code& ec, size_t n);

    std::string port_name_;
    unsigned int baud_;
    double sample_rate_hz_;
    std::unique_ptr<FrameDecoder> decoder_;
    BatchCallback on_batch_;
    DisconnectCallback on_disconnect_;

    boost::asio::io_context io_;
    boost::asio::serial_port port_;
    std::array<uint8_t, READ_CHUNK> read_buffer_;
    std::thread reader_;
    std::atomic<bool> active_;
    std::atomic<uint64_t> sample_counter_;
    std::exception_ptr failure_;
};

#endif // SERIAL_SAMPLE_SOURCE_HPP
