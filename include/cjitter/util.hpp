#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "cjitter/visibility.hpp"

namespace cjitter {

/**
 * Compute a classic 16-bit Internet checksum (RFC 1071).
 *
 * @param data  Pointer to raw buffer
 * @param len   Buffer length in bytes
 * @return      One's-complement 16-bit checksum
 */
CJITTER_API uint16_t checksum16(const void* data, size_t len);

/**
 * Round half away from zero to `precision` decimal places.
 */
CJITTER_API double round_to_precision(double value, int precision);

/**
 * Shortest decimal rendering of a value: 2 -> "2", 0.5 -> "0.5",
 * 1.667 -> "1.667". Used for output and performance data.
 */
CJITTER_API std::string format_number(double value);

CJITTER_API std::string to_lower(const std::string& s);

} // namespace cjitter
