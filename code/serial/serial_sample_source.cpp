#include "serial_sample_source.hpp"
#include <iostream>

const unsigned int SerialSampleSource::DEFAULT_BAUD;
const size_t SerialSampleSource::READ_CHUNK;

SerialSampleSource::SerialSampleSource(const std::string& port, unsigned int baud, double sample_rate_hz,
                                       std::unique_ptr<FrameDecoder> decoder,
                                       BatchCallback on_batch, DisconnectCallback on_disconnect)
    : port_name_(port),
      baud_(baud),
      sample_rate_hz_(sample_rate_hz),
      decoder_(std::move(decoder)),
      on_batch_(std::move(on_batch)),
      on_disconnect_(std::move(on_disconnect)),
      port_(io_),
      active_(false),
      sample_counter_(0)
{
    if (!decoder_) {
        throw std::invalid_argument("SerialSampleSource needs a frame decoder");
    }
    if (!(sample_rate_hz_ > 0.0)) {
        throw std::invalid_argument("SerialSampleSource needs a positive sample rate");
    }
}

SerialSampleSource::~SerialSampleSource() {
    stop();
}

void SerialSampleSource::configure_port() {
    using boost::asio::serial_port_base;
    port_.set_option(serial_port_base::baud_rate(baud_));
    port_.set_option(serial_port_base::character_size(8));
    port_.set_option(serial_port_base::parity(serial_port_base::parity::none));
    port_.set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one));
    port_.set_option(serial_port_base::flow_control(serial_port_base::flow_control::none));
}

void SerialSampleSource::start() {
    if (active_.load())
        return;
    // A previous session may have ended on its own after a disconnect.
    if (reader_.joinable())
        reader_.join();

    port_.open(port_name_);
    try {
        configure_port();
    } catch (...) {
        boost::system::error_code ignored;
        port_.close(ignored);
        throw;
    }

    decoder_->reset();
    failure_ = nullptr;
    sample_counter_.store(0);
    io_.restart();
    active_.store(true);
    start_read();
    reader_ = std::thread([this]() {
        try {
            io_.run();
        } catch (const std::exception& e) {
            // Typically an OutOfOrderError thrown by the batch consumer.
            std::cerr << "Serial reader stopped: " << e.what() << std::endl;
            failure_ = std::current_exception();
            active_.store(false);
            boost::system::error_code ignored;
            port_.close(ignored);
        }
    });
    std::cerr << "Serial port " << port_name_ << " opened @ " << baud_
              << " baud (" << decoder_->name() << " decoder)" << std::endl;
}

void SerialSampleSource::stop() {
    active_.store(false);
    if (reader_.joinable()) {
        // Closing from the io thread cancels the pending read.
        boost::asio::post(io_, [this]() {
            boost::system::error_code ignored;
            port_.close(ignored);
        });
        reader_.join();
        // Drain the close handler if the loop had already finished on its own.
        io_.restart();
        io_.poll();
    }
    if (port_.is_open()) {
        boost::system::error_code ignored;
        port_.close(ignored);
    }
}

void SerialSampleSource::start_read() {
    port_.async_read_some(boost::asio::buffer(read_buffer_),
                          [this](const boost::system::error_code& ec, size_t n) { handle_read(ec, n); });
}

void SerialSampleSource::handle_read(const boost::system::error_code& ec, size_t n) {
    if (ec) {
        if (ec == boost::asio::error::operation_aborted && !active_.load())
            return;  // stop() in progress
        std::cerr << "Serial read error on " << port_name_ << ": " << ec.message() << std::endl;
        active_.store(false);
        boost::system::error_code ignored;
        port_.close(ignored);
        if (on_disconnect_)
            on_disconnect_(ec.message());
        return;
    }

    std::vector<int64_t> codes = decoder_->feed(read_buffer_.data(), n);
    if (!codes.empty()) {
        std::vector<RawSample> batch;
        batch.reserve(codes.size());
        uint64_t index = sample_counter_.load();
        for (int64_t code : codes) {
            batch.push_back(RawSample{index / sample_rate_hz_, code});
            ++index;
        }
        sample_counter_.store(index);
        if (on_batch_)
            on_batch_(batch);
    }

    if (active_.load())
        start_read();
}

void SerialSampleSource::rethrow_if_failed() {
    if (active_.load())
        return;
    if (reader_.joinable())
        reader_.join();
    if (failure_)
        std::rethrow_exception(failure_);
}
