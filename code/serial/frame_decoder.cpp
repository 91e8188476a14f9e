#include "frame_decoder.hpp"
#include "EcgErrors.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

const uint8_t FramedDecoder::HEADER0;
const uint8_t FramedDecoder::HEADER1;
const uint8_t FramedDecoder::TYPE_ADC;
const int TextLineDecoder::LAST_COLUMN;
const size_t TextLineDecoder::MAX_LINE;

// header(2) + LEN(1) + TYPE(1) + CRC(2)
static const size_t FRAME_OVERHEAD = 6;
static const size_t ADC_PAIR_SIZE = 4;

uint16_t crc16_ccitt(const uint8_t* data, size_t len, uint16_t poly, uint16_t init) {
    uint16_t crc = init;
    for (size_t i = 0; i < len; ++i) {
        crc ^= static_cast<uint16_t>(data[i] << 8);
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000)
                crc = static_cast<uint16_t>((crc << 1) ^ poly);
            else
                crc = static_cast<uint16_t>(crc << 1);
        }
    }
    return crc;
}

FramedDecoder::FramedDecoder()
    : crc_errors_(0), unknown_frames_(0), dropped_samples_(0),
      has_last_id_(false), last_id_(0) {}

void FramedDecoder::reset() {
    buffer_.clear();
    has_last_id_ = false;
    last_id_ = 0;
}

std::vector<int64_t> FramedDecoder::feed(const uint8_t* data, size_t len) {
    std::vector<int64_t> out;
    buffer_.insert(buffer_.end(), data, data + len);

    while (buffer_.size() >= FRAME_OVERHEAD) {
        // Resync on the two-byte header.
        size_t idx = 0;
        while (idx + 1 < buffer_.size() &&
               !(buffer_[idx] == HEADER0 && buffer_[idx + 1] == HEADER1))
            ++idx;
        if (idx + 1 >= buffer_.size()) {
            // No header: keep a trailing 0xAA, it may start the next one.
            bool keep_last = buffer_.back() == HEADER0;
            buffer_.clear();
            if (keep_last)
                buffer_.push_back(HEADER0);
            break;
        }
        if (idx > 0)
            buffer_.erase(buffer_.begin(), buffer_.begin() + idx);
        if (buffer_.size() < FRAME_OVERHEAD)
            break;

        const size_t length = buffer_[2];
        const size_t total = FRAME_OVERHEAD + length;
        if (buffer_.size() < total)
            break;  // wait for the rest of the frame

        const uint16_t calc = crc16_ccitt(&buffer_[2], length + 2);
        const uint16_t recv = static_cast<uint16_t>(buffer_[total - 2] | (buffer_[total - 1] << 8));
        if (calc != recv) {
            ++crc_errors_;
            buffer_.erase(buffer_.begin());
            continue;
        }

        const uint8_t type = buffer_[3];
        if (type == TYPE_ADC)
            take_adc_payload(&buffer_[4], length, out);
        else
            ++unknown_frames_;
        buffer_.erase(buffer_.begin(), buffer_.begin() + total);
    }
    return out;
}

void FramedDecoder::take_adc_payload(const uint8_t* payload, size_t len, std::vector<int64_t>& out) {
    const size_t pairs = len / ADC_PAIR_SIZE;
    for (size_t i = 0; i < pairs; ++i) {
        const uint8_t* p = payload + i * ADC_PAIR_SIZE;
        const uint16_t id = static_cast<uint16_t>(p[0] | (p[1] << 8));
        const uint16_t adc = static_cast<uint16_t>(p[2] | (p[3] << 8));
        if (has_last_id_) {
            const uint16_t expected = static_cast<uint16_t>(last_id_ + 1);
            dropped_samples_ += static_cast<uint16_t>(id - expected);
        }
        has_last_id_ = true;
        last_id_ = id;
        out.push_back(adc);
    }
}

std::vector<int64_t> RawByteDecoder::feed(const uint8_t* data, size_t len) {
    return std::vector<int64_t>(data, data + len);
}

TextLineDecoder::TextLineDecoder(int column)
    : column_(column), bad_lines_(0) {}

std::vector<int64_t> TextLineDecoder::feed(const uint8_t* data, size_t len) {
    std::vector<int64_t> out;
    line_buffer_.append(reinterpret_cast<const char*>(data), len);

    size_t pos;
    while ((pos = line_buffer_.find('\n')) != std::string::npos) {
        std::string line = line_buffer_.substr(0, pos);
        line_buffer_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        line.erase(0, std::min(line.size(), line.find_first_not_of(" \t")));
        if (line.empty())
            continue;

        std::istringstream iss(line);
        std::string token;
        std::vector<std::string> tokens;
        while (std::getline(iss, token, ',')) {
            if (!token.empty())
                tokens.push_back(token);
        }
        if (tokens.empty()) {
            ++bad_lines_;
            continue;
        }

        size_t col;
        if (column_ < 0) {
            col = tokens.size() - 1;
        } else if (static_cast<size_t>(column_) < tokens.size()) {
            col = static_cast<size_t>(column_);
        } else {
            ++bad_lines_;
            continue;
        }

        try {
            size_t used = 0;
            long long value = std::stoll(tokens[col], &used);
            if (tokens[col].find_first_not_of(" \t", used) != std::string::npos) {
                ++bad_lines_;
                continue;
            }
            out.push_back(value);
        } catch (const std::logic_error&) {
            ++bad_lines_;
        }
    }

    // A line that never ends is noise, not data.
    if (line_buffer_.size() > MAX_LINE) {
        line_buffer_.clear();
        ++bad_lines_;
    }
    return out;
}

std::vector<uint8_t> encode_adc_frame(const std::vector<std::pair<uint16_t, uint16_t>>& samples) {
    const size_t payload_len = samples.size() * ADC_PAIR_SIZE;
    if (payload_len > 0xFF) {
        throw std::invalid_argument("Too many samples for one frame: " + std::to_string(samples.size()));
    }

    std::vector<uint8_t> frame;
    frame.reserve(FRAME_OVERHEAD + payload_len);
    frame.push_back(FramedDecoder::HEADER0);
    frame.push_back(FramedDecoder::HEADER1);
    frame.push_back(static_cast<uint8_t>(payload_len));
    frame.push_back(FramedDecoder::TYPE_ADC);
    for (const auto& s : samples) {
        frame.push_back(static_cast<uint8_t>(s.first & 0xFF));
        frame.push_back(static_cast<uint8_t>(s.first >> 8));
        frame.push_back(static_cast<uint8_t>(s.second & 0xFF));
        frame.push_back(static_cast<uint8_t>(s.second >> 8));
    }
    const uint16_t crc = crc16_ccitt(&frame[2], frame.size() - 2);
    frame.push_back(static_cast<uint8_t>(crc & 0xFF));
    frame.push_back(static_cast<uint8_t>(crc >> 8));
    return frame;
}

std::unique_ptr<FrameDecoder> make_decoder(const std::string& mode, int text_column) {
    if (mode == "framed")
        return std::unique_ptr<FrameDecoder>(new FramedDecoder());
    if (mode == "raw8")
        return std::unique_ptr<FrameDecoder>(new RawByteDecoder());
    if (mode == "text")
        return std::unique_ptr<FrameDecoder>(new TextLineDecoder(text_column));
    throw ConfigError("Unknown decoder mode [" + mode + "], expected framed, raw8 or text");
}
