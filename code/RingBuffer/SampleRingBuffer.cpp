#include "SampleRingBuffer.hpp"
#include "EcgErrors.hpp"
#include <sstream>

const size_t SampleRingBuffer::DEFAULT_CAPACITY;

SampleRingBuffer::SampleRingBuffer(size_t capacity)
    : head_(0), size_(0)
{
    if (capacity == 0) {
        throw ConfigError("Ring buffer capacity must be greater than zero");
    }
    slots_.resize(capacity);
}

EvictionOutcome SampleRingBuffer::append(const Sample& sample) {
    if (size_ > 0) {
        const Sample& last = back();
        if (sample.sequence <= last.sequence || sample.timestamp < last.timestamp) {
            std::ostringstream msg;
            msg << "Out-of-order append: sequence " << sample.sequence
                << " @ " << sample.timestamp << "s after sequence " << last.sequence
                << " @ " << last.timestamp << "s";
            throw OutOfOrderError(msg.str());
        }
    }

    EvictionOutcome outcome;
    const size_t cap = slots_.size();
    if (size_ == cap) {
        // Full: the oldest slot is overwritten and head moves forward.
        outcome.evicted_sequences.push_back(slots_[head_].sequence);
        slots_[head_] = sample;
        head_ = (head_ + 1) % cap;
    } else {
        slots_[(head_ + size_) % cap] = sample;
        ++size_;
    }
    return outcome;
}

const Sample& SampleRingBuffer::at(size_t logical) const {
    return slots_[(head_ + logical) % slots_.size()];
}

size_t SampleRingBuffer::lower_bound(uint64_t sequence) const {
    size_t lo = 0;
    size_t hi = size_;
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        if (at(mid).sequence < sequence)
            lo = mid + 1;
        else
            hi = mid;
    }
    return lo;
}

std::vector<Sample> SampleRingBuffer::get_range(uint64_t seq_start, uint64_t seq_end) const {
    std::vector<Sample> out;
    if (size_ == 0 || seq_start > seq_end)
        return out;
    for (size_t i = lower_bound(seq_start); i < size_; ++i) {
        const Sample& s = at(i);
        if (s.sequence > seq_end)
            break;
        out.push_back(s);
    }
    return out;
}

std::vector<Sample> SampleRingBuffer::latest(double window_seconds) const {
    std::vector<Sample> out;
    if (size_ == 0)
        return out;
    const double cutoff = back().timestamp - window_seconds;
    // Timestamps are non-decreasing, so walk back from the newest sample.
    size_t first = size_;
    while (first > 0 && at(first - 1).timestamp >= cutoff)
        --first;
    out.reserve(size_ - first);
    for (size_t i = first; i < size_; ++i)
        out.push_back(at(i));
    return out;
}

size_t SampleRingBuffer::count_newer_than(double timestamp) const {
    size_t first = size_;
    while (first > 0 && at(first - 1).timestamp > timestamp)
        --first;
    return size_ - first;
}

std::vector<Sample> SampleRingBuffer::all() const {
    std::vector<Sample> out;
    out.reserve(size_);
    for (size_t i = 0; i < size_; ++i)
        out.push_back(at(i));
    return out;
}

bool SampleRingBuffer::find(uint64_t sequence, Sample& out) const {
    size_t i = lower_bound(sequence);
    if (i < size_ && at(i).sequence == sequence) {
        out = at(i);
        return true;
    }
    return false;
}

void SampleRingBuffer::clear() {
    head_ = 0;
    size_ = 0;
}
