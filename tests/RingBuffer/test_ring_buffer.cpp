#include "SampleRingBuffer.hpp"
#include "EcgErrors.hpp"
#include <iostream>
#include <string>

static int failures = 0;

static void check(bool ok, const std::string& what) {
    std::cout << (ok ? "OK   " : "FAIL ") << what << std::endl;
    if (!ok)
        ++failures;
}

static Sample make_sample(uint64_t seq, double ts) {
    return Sample{seq, ts, static_cast<int64_t>(seq % 4096), 0.0};
}

static void test_capacity_and_fifo_eviction() {
    SampleRingBuffer buf(5);
    bool bounded = true;
    bool evicts_oldest = true;
    for (uint64_t i = 0; i < 12; ++i) {
        EvictionOutcome out = buf.append(make_sample(i, i * 0.004));
        if (buf.size() > buf.capacity())
            bounded = false;
        if (i < 5) {
            if (!out.evicted_sequences.empty())
                evicts_oldest = false;
        } else if (out.evicted_sequences.size() != 1 || out.evicted_sequences[0] != i - 5) {
            evicts_oldest = false;
        }
    }
    check(bounded, "size never exceeds capacity");
    check(evicts_oldest, "each append past capacity evicts exactly the oldest sample");
    check(buf.size() == 5 && buf.front().sequence == 7 && buf.back().sequence == 11,
          "resident samples are the newest five");
}

static void test_full_buffer_scenario() {
    SampleRingBuffer buf(200000);
    for (uint64_t i = 0; i <= 200000; ++i)
        buf.append(make_sample(i, i / 250.0));
    Sample s;
    check(buf.size() == 200000, "200001 appends leave 200000 samples");
    check(!buf.find(0, s), "sequence 0 is gone after one eviction");
    check(buf.get_range(0, 0).empty(), "range over the evicted sequence is empty");
    check(buf.front().sequence == 1 && buf.back().sequence == 200000, "front/back after eviction");
}

static void test_out_of_order_rejected() {
    SampleRingBuffer buf(10);
    buf.append(make_sample(3, 1.0));
    buf.append(make_sample(5, 1.5));

    bool threw = false;
    try {
        buf.append(make_sample(4, 2.0));
    } catch (const OutOfOrderError&) {
        threw = true;
    }
    check(threw, "lower sequence raises OutOfOrderError");

    threw = false;
    try {
        buf.append(make_sample(6, 1.2));
    } catch (const OutOfOrderError&) {
        threw = true;
    }
    check(threw, "earlier timestamp raises OutOfOrderError");

    threw = false;
    try {
        buf.append(make_sample(5, 1.5));
    } catch (const OutOfOrderError&) {
        threw = true;
    }
    check(threw, "repeated sequence raises OutOfOrderError");
    check(buf.size() == 2 && buf.back().sequence == 5, "rejected appends leave the buffer unchanged");

    buf.append(make_sample(6, 1.5));
    check(buf.size() == 3, "equal timestamp is accepted");
}

static void test_range_queries() {
    SampleRingBuffer buf(5);
    for (uint64_t i = 0; i < 10; ++i)
        buf.append(make_sample(i, i * 0.1));

    std::vector<Sample> partial = buf.get_range(3, 6);
    check(partial.size() == 2 && partial[0].sequence == 5 && partial[1].sequence == 6,
          "range overlapping eviction returns only resident samples");
    check(buf.get_range(0, 2).empty(), "fully evicted range is empty");
    std::vector<Sample> tail = buf.get_range(7, 100);
    check(tail.size() == 3 && tail.front().sequence == 7 && tail.back().sequence == 9,
          "range past the newest sample stops at the newest");
    check(buf.get_range(8, 7).empty(), "inverted range is empty");

    Sample s;
    check(buf.find(7, s) && s.sequence == 7, "find resident sequence");
    check(!buf.find(4, s), "find evicted sequence");
    check(!buf.find(42, s), "find future sequence");

    std::vector<Sample> recent = buf.latest(0.25);
    check(recent.size() == 3 && recent.front().sequence == 7, "latest() covers the requested window");
    check(buf.count_newer_than(0.65) == 3 && buf.count_newer_than(10.0) == 0 && buf.count_newer_than(-1.0) == 5,
          "count_newer_than() counts resident samples after a time");
    check(buf.all().size() == 5, "all() returns every resident sample");
}

static void test_clear_and_capacity_zero() {
    SampleRingBuffer buf(3);
    buf.append(make_sample(10, 5.0));
    buf.clear();
    check(buf.empty(), "clear empties the buffer");
    buf.append(make_sample(0, 0.0));
    check(buf.size() == 1, "ordering starts over after clear");

    bool threw = false;
    try {
        SampleRingBuffer bad(0);
    } catch (const ConfigError&) {
        threw = true;
    }
    check(threw, "capacity 0 is rejected");
}

int main() {
    try {
        test_capacity_and_fifo_eviction();
        test_full_buffer_scenario();
        test_out_of_order_rejected();
        test_range_queries();
        test_clear_and_capacity_zero();
    } catch (const std::exception& e) {
        std::cerr << "Ring buffer test failed: " << e.what() << std::endl;
        return 1;
    }
    std::cout << (failures == 0 ? "All ring buffer tests passed" : "Ring buffer tests FAILED") << std::endl;
    return failures == 0 ? 0 : 1;
}
