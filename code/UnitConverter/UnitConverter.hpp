#ifndef UNIT_CONVERTER_HPP
#define UNIT_CONVERTER_HPP

#include <cstdint>
#include "EcgTypes.hpp"

namespace UnitConverter {

constexpr int MIN_BIT_DEPTH = 1;
constexpr int MAX_BIT_DEPTH = 32;

// Largest code of an ADC with the given resolution (2^bits - 1).
int64_t max_code(int bit_depth);

// adc_raw / (2^bit_depth - 1) * v_ref. Throws ConfigError on bad bit_depth or v_ref.
double to_voltage(int64_t adc_raw, int bit_depth, double v_ref);

// Throws ConfigError describing the first offending field.
void validate(const ConversionConfig& config);

} // namespace UnitConverter

#endif // UNIT_CONVERTER_HPP
