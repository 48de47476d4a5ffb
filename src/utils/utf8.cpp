#include "utils/utf8.hpp"

#include <cstddef>

namespace codebox::utils {
namespace {

constexpr const char kReplacement[] = "\xEF\xBF\xBD";

bool IsContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Returns the length of the well-formed sequence starting at pos, or 0.
// On failure, skip receives the length of the maximal invalid subpart.
std::size_t SequenceLength(std::string_view bytes, std::size_t pos, std::size_t& skip) {
    const auto lead = static_cast<unsigned char>(bytes[pos]);
    skip = 1;
    if (lead < 0x80) {
        return 1;
    }
    std::size_t length = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            lower = 0xA0;
        } else if (lead == 0xED) {
            upper = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            lower = 0x90;
        } else if (lead == 0xF4) {
            upper = 0x8F;
        }
    } else {
        return 0;
    }
    for (std::size_t i = 1; i < length; ++i) {
        if (pos + i >= bytes.size()) {
            return 0;
        }
        const auto byte = static_cast<unsigned char>(bytes[pos + i]);
        const bool in_range = i == 1 ? (byte >= lower && byte <= upper) : IsContinuation(byte);
        if (!in_range) {
            return 0;
        }
        skip = i + 1;
    }
    return length;
}

}  // namespace

bool IsValidUtf8(std::string_view bytes) {
    std::size_t pos = 0;
    std::size_t skip = 0;
    while (pos < bytes.size()) {
        const auto length = SequenceLength(bytes, pos, skip);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

std::string SanitizeUtf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    std::size_t skip = 0;
    while (pos < bytes.size()) {
        const auto length = SequenceLength(bytes, pos, skip);
        if (length == 0) {
            out.append(kReplacement);
            pos += skip;
            continue;
        }
        out.append(bytes.substr(pos, length));
        pos += length;
    }
    return out;
}

}  // namespace codebox::utils
