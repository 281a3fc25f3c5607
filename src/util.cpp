#include "cjitter/util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace cjitter {

/**
 * Compute the standard Internet checksum (RFC 1071).
 *
 * Used for ICMPv4 Echo Requests; the kernel computes ICMPv6 checksums
 * itself. Classic 16-bit one's-complement sum:
 *   - sum words
 *   - fold carries
 *   - invert result
 */
uint16_t checksum16(const void* data, size_t len) {
    uint32_t sum = 0;
    const uint8_t* p = static_cast<const uint8_t*>(data);

    // Sum 16-bit chunks in memory order
    while (len > 1) {
        uint16_t word;
        std::memcpy(&word, p, sizeof(word));
        sum += word;
        p += 2;
        len -= 2;
    }

    // Handle remaining odd byte
    if (len) {
        uint16_t last = 0;
        std::memcpy(&last, p, 1);
        sum += last;
    }

    // Fold carries
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}


double round_to_precision(double value, int precision) {
    if (precision < 0)
        precision = 0;
    const double factor = std::pow(10.0, precision);
    return std::round(value * factor) / factor;
}


std::string format_number(double value) {
    if (std::isinf(value))
        return value < 0 ? "-inf" : "inf";

    // 15 significant digits: exact for anything an operator can type,
    // without exposing binary noise such as 0.1 -> 0.10000000000000001
    std::ostringstream os;
    os << std::setprecision(15) << value;
    std::string s = os.str();

    if (s == "-0")
        s = "0";
    return s;
}


std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace cjitter
