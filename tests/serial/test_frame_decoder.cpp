#include "frame_decoder.hpp"
#include "EcgErrors.hpp"
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK   " : "FAIL ") << what << std::endl;
    if (!ok)
        ++failures;
}

static std::vector<int64_t> feed(FrameDecoder& dec, const std::vector<uint8_t>& bytes) {
    return dec.feed(bytes.data(), bytes.size());
}

static std::vector<int64_t> feed_text(FrameDecoder& dec, const std::string& text) {
    return dec.feed(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

static void test_crc() {
    const char* check_string = "123456789";
    check(crc16_ccitt(reinterpret_cast<const uint8_t*>(check_string), std::strlen(check_string)) == 0x29B1,
          "CRC-16/CCITT-FALSE check value");
}

static void test_framed_decoding() {
    std::vector<uint8_t> frame = encode_adc_frame({{1, 1500}, {2, 3500}, {3, 4095}});
    check(frame.size() == 6 + 12 && frame[0] == 0xAA && frame[1] == 0x55 && frame[2] == 12 && frame[3] == 0x01,
          "frame layout");

    FramedDecoder dec;
    std::vector<int64_t> codes = feed(dec, frame);
    check(codes == std::vector<int64_t>({1500, 3500, 4095}), "whole frame decodes");

    FramedDecoder split;
    std::vector<uint8_t> two = encode_adc_frame({{10, 100}});
    std::vector<uint8_t> three = encode_adc_frame({{11, 200}, {12, 300}});
    two.insert(two.end(), three.begin(), three.end());
    std::vector<int64_t> got;
    for (uint8_t b : two) {
        std::vector<int64_t> part = split.feed(&b, 1);
        got.insert(got.end(), part.begin(), part.end());
    }
    check(got == std::vector<int64_t>({100, 200, 300}), "byte-at-a-time delivery decodes");
    check(split.dropped_samples() == 0, "consecutive ids report no drops");
}

static void test_resync_and_errors() {
    FramedDecoder dec;
    std::vector<uint8_t> stream = {0x00, 0x13, 0xAA, 0x37, 0x55};
    std::vector<uint8_t> bad = encode_adc_frame({{1, 111}});
    bad[6] ^= 0xFF;  // corrupt the ADC low byte
    std::vector<uint8_t> good = encode_adc_frame({{2, 222}});
    stream.insert(stream.end(), bad.begin(), bad.end());
    stream.insert(stream.end(), good.begin(), good.end());

    std::vector<int64_t> codes = feed(dec, stream);
    check(codes == std::vector<int64_t>({222}), "garbage and corrupt frame skipped");
    check(dec.crc_errors() == 1, "CRC error counted");

    std::vector<uint8_t> other = {0xAA, 0x55, 0x02, 0x07, 0x01, 0x02};
    uint16_t crc = crc16_ccitt(&other[2], 4);
    other.push_back(static_cast<uint8_t>(crc & 0xFF));
    other.push_back(static_cast<uint8_t>(crc >> 8));
    check(feed(dec, other).empty() && dec.unknown_frames() == 1, "unknown frame type ignored");

    FramedDecoder gaps;
    feed(gaps, encode_adc_frame({{1, 10}, {2, 20}}));
    feed(gaps, encode_adc_frame({{5, 50}}));
    check(gaps.dropped_samples() == 2, "missing sample ids counted");
    feed(gaps, encode_adc_frame({{0, 60}}));  // 5 -> 0 wraps through 65535
    check(gaps.dropped_samples() == 2 + 65530, "id gap measured modulo 2^16");

    FramedDecoder partial;
    std::vector<uint8_t> frame = encode_adc_frame({{1, 42}});
    feed(partial, std::vector<uint8_t>(frame.begin(), frame.begin() + 5));
    partial.reset();
    check(feed(partial, std::vector<uint8_t>(frame.begin() + 5, frame.end())).empty(),
          "reset drops a partial frame");

    bool threw = false;
    try {
        encode_adc_frame(std::vector<std::pair<uint16_t, uint16_t>>(64, {0, 0}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "payload over 255 bytes rejected");
}

static void test_raw_and_text() {
    RawByteDecoder raw;
    check(feed(raw, {0, 127, 255}) == std::vector<int64_t>({0, 127, 255}), "raw8 bytes are codes");

    TextLineDecoder last;
    std::vector<int64_t> codes = feed_text(last, "1,2,300\r\n4,5,6");
    std::vector<int64_t> more = feed_text(last, "00\n");
    codes.insert(codes.end(), more.begin(), more.end());
    check(codes == std::vector<int64_t>({300, 600}), "text lines use the last column by default");

    TextLineDecoder first(0);
    check(feed_text(first, "7,8,9\n  12 \n") == std::vector<int64_t>({7, 12}), "explicit column and padding");

    TextLineDecoder strict(2);
    check(feed_text(strict, "abc\n1,2\n3,4,x5\n").empty() && strict.bad_lines() == 3, "bad lines counted");

    TextLineDecoder runaway;
    feed_text(runaway, std::string(300, '1'));
    check(runaway.bad_lines() == 1, "overlong unterminated line discarded");

    check(make_decoder("framed")->name() == "framed" && make_decoder("raw8")->name() == "raw8" &&
          make_decoder("text", 1)->name() == "text", "make_decoder modes");
    bool threw = false;
    try {
        make_decoder("hex");
    } catch (const ConfigError&) {
        threw = true;
    }
    check(threw, "unknown mode rejected");
}

int main() {
    try {
        test_crc();
        test_framed_decoding();
        test_resync_and_errors();
        test_raw_and_text();
    } catch (const std::exception& e) {
        std::cerr << "Frame decoder test failed: " << e.what() << std::endl;
        return 1;
    }
    std::cout << (failures == 0 ? "All frame decoder tests passed" : "Frame decoder tests FAILED") << std::endl;
    return failures == 0 ? 0 : 1;
}
