#ifndef SAMPLE_RING_BUFFER_HPP
#define SAMPLE_RING_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "EcgTypes.hpp"

struct EvictionOutcome {
    std::vector<uint64_t> evicted_sequences;
};

/**
 * @brief Fixed-capacity, append-only sample store with FIFO eviction.
 *
 * Samples are addressed by sequence number, never by slot index, so callers
 * holding a sequence stay correct after eviction: a lookup for an evicted
 * sequence simply finds nothing.
 */
class SampleRingBuffer {
public:
    static const size_t DEFAULT_CAPACITY = 200000;

    explicit SampleRingBuffer(size_t capacity = DEFAULT_CAPACITY);

    // Throws OutOfOrderError (buffer untouched) if sequence does not increase
    // or timestamp goes backwards.
    EvictionOutcome append(const Sample& sample);

    // Resident samples with seq_start <= sequence <= seq_end, oldest first.
    std::vector<Sample> get_range(uint64_t seq_start, uint64_t seq_end) const;

    // Resident samples within window_seconds of the newest sample.
    std::vector<Sample> latest(double window_seconds) const;

    // Number of resident samples with a timestamp strictly after timestamp.
    size_t count_newer_than(double timestamp) const;

    std::vector<Sample> all() const;

    bool find(uint64_t sequence, Sample& out) const;

    void clear();

    size_t size() const { return size_; }
    size_t capacity() const { return slots_.size(); }
    bool empty() const { return size_ == 0; }

    // Valid only when !empty().
    const Sample& front() const { return at(0); }
    const Sample& back() const { return at(size_ - 1); }

private:
    const Sample& at(size_t logical) const;
    // First logical index whose sequence is >= sequence.
    size_t lower_bound(uint64_t sequence) const;

    std::vector<Sample> slots_;
    size_t head_;   // slot of the oldest sample
    size_t size_;
};

#endif // SAMPLE_RING_BUFFER_HPP
