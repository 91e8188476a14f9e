#include "UnitConverter.hpp"
#include "EcgErrors.hpp"
#include <cmath>
#include <string>

namespace UnitConverter {

int64_t max_code(int bit_depth) {
    if (bit_depth < MIN_BIT_DEPTH || bit_depth > MAX_BIT_DEPTH) {
        throw ConfigError("ADC bit depth must be in [1, 32], got " + std::to_string(bit_depth));
    }
    return (int64_t{1} << bit_depth) - 1;
}

double to_voltage(int64_t adc_raw, int bit_depth, double v_ref) {
    const int64_t full_scale = max_code(bit_depth);
    if (!(v_ref > 0.0) || !std::isfinite(v_ref)) {
        throw ConfigError("Reference voltage must be a positive number");
    }
    return static_cast<double>(adc_raw) / static_cast<double>(full_scale) * v_ref;
}

void validate(const ConversionConfig& config) {
    if (!(config.sample_rate_hz > 0.0) || !std::isfinite(config.sample_rate_hz)) {
        throw ConfigError("Sample rate must be a positive number of Hz");
    }
    max_code(config.bit_depth);
    if (!(config.v_ref > 0.0) || !std::isfinite(config.v_ref)) {
        throw ConfigError("Reference voltage must be a positive number");
    }
}

} // namespace UnitConverter
