#ifndef FRAME_DECODER_HPP
#define FRAME_DECODER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// CRC-16/CCITT-FALSE (poly 0x1021, init 0xFFFF).
uint16_t crc16_ccitt(const uint8_t* data, size_t len, uint16_t poly = 0x1021, uint16_t init = 0xFFFF);

// Turns a byte stream from the serial link into ADC codes. Implementations
// keep partial input between calls.
class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;

    virtual std::vector<int64_t> feed(const uint8_t* data, size_t len) = 0;
    virtual void reset() = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Decoder for the framed acquisition protocol.
 *
 * Frame: [0xAA][0x55][LEN][TYPE][PAYLOAD (LEN bytes)][CRC16 LE]
 * CRC covers LEN..PAYLOAD. TYPE 0x01 carries (sample_id u16 LE, adc u16 LE) pairs.
 */
class FramedDecoder : public FrameDecoder {
public:
    static const uint8_t HEADER0 = 0xAA;
    static const uint8_t HEADER1 = 0x55;
    static const uint8_t TYPE_ADC = 0x01;

    FramedDecoder();

    std::vector<int64_t> feed(const uint8_t* data, size_t len) override;
    void reset() override;
    std::string name() const override { return "framed"; }

    size_t crc_errors() const { return crc_errors_; }
    size_t unknown_frames() const { return unknown_frames_; }
    // Samples missing according to gaps in the 16-bit sample id.
    size_t dropped_samples() const { return dropped_samples_; }

private:
    void take_adc_payload(const uint8_t* payload, size_t len, std::vector<int64_t>& out);

    std::vector<uint8_t> buffer_;
    size_t crc_errors_;
    size_t unknown_frames_;
    size_t dropped_samples_;
    bool has_last_id_;
    uint16_t last_id_;
};

// Every received byte is one 8-bit ADC code.
class RawByteDecoder : public FrameDecoder {
public:
    std::vector<int64_t> feed(const uint8_t* data, size_t len) override;
    void reset() override {}
    std::string name() const override { return "raw8"; }
};

// ASCII lines such as "123,456,789\r\n"; the ADC code is read from one column.
class TextLineDecoder : public FrameDecoder {
public:
    static const int LAST_COLUMN = -1;

    explicit TextLineDecoder(int column = LAST_COLUMN);

    std::vector<int64_t> feed(const uint8_t* data, size_t len) override;
    void reset() override { line_buffer_.clear(); }
    std::string name() const override { return "text"; }

    size_t bad_lines() const { return bad_lines_; }

private:
    static const size_t MAX_LINE = 256;

    int column_;
    std::string line_buffer_;
    size_t bad_lines_;
};

// Builds a TYPE 0x01 frame from (sample_id, adc) pairs.
std::vector<uint8_t> encode_adc_frame(const std::vector<std::pair<uint16_t, uint16_t>>& samples);

// "framed", "raw8" or "text". Throws ConfigError for anything else.
std::unique_ptr<FrameDecoder> make_decoder(const std::string& mode, int text_column = TextLineDecoder::LAST_COLUMN);

#endif // FRAME_DECODER_HPP
