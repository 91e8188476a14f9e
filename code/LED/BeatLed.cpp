#include "BeatLed.hpp"
#include <iostream>

constexpr char GPIO_CHIP[] = "gpiochip0";

BeatLed::BeatLed(unsigned pin, std::chrono::milliseconds flash)
    : m_pin(pin), m_flash(flash), m_on(false), m_has_peak(false), m_last_peak(0)
{
    try {
        m_chip = gpiod::chip(GPIO_CHIP);
        m_line = m_chip.get_line(m_pin);
        gpiod::line_request config = {
            "ecg_beat_led",
            gpiod::line_request::DIRECTION_OUTPUT,
            0
        };
        m_line.request(config, 0);
    } catch (const std::exception& e) {
        std::cerr << "BeatLed initialization failed on GPIO" << m_pin << ": " << e.what() << std::endl;
        throw;
    }
}

BeatLed::~BeatLed() {
    try {
        m_line.set_value(0);
    } catch (const std::exception& e) {
        std::cerr << "BeatLed: failed to switch off GPIO" << m_pin << ": " << e.what() << std::endl;
    }
    m_line.release();
}

void BeatLed::on_peak(uint64_t peak_sequence) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_has_peak && peak_sequence == m_last_peak)
        return;
    m_has_peak = true;
    m_last_peak = peak_sequence;
    m_on_since = std::chrono::steady_clock::now();
    set(true);
}

void BeatLed::tick() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_on && std::chrono::steady_clock::now() - m_on_since >= m_flash)
        set(false);
}

void BeatLed::set(bool on) {
    m_on = on;
    m_line.set_value(on ? 1 : 0);
}
