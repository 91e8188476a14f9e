#ifndef BEAT_LED_HPP
#define BEAT_LED_HPP

#include <gpiod.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>

// Flashes a GPIO LED once per detected beat.
class BeatLed {
public:
    BeatLed(unsigned pin, std::chrono::milliseconds flash = std::chrono::milliseconds(80));
    ~BeatLed();

    // Call periodically with the sequence of the newest peak seen so far.
    // A sequence different from the last one starts a flash.
    void on_peak(uint64_t peak_sequence);
    // Turns the LED off once the flash has lasted long enough.
    void tick();

private:
    void set(bool on);

    gpiod::chip m_chip;
    gpiod::line m_line;
    unsigned m_pin;
    std::chrono::milliseconds m_flash;
    bool m_on;
    bool m_has_peak;
    uint64_t m_last_peak;
    std::chrono::steady_clock::time_point m_on_since;
    std::mutex m_mutex;
};

#endif // BEAT_LED_HPP
