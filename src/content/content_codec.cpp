#include "content/content_codec.hpp"

#include <array>
#include <cstdint>
#include <iterator>

#include <boost/algorithm/hex.hpp>

#include "exec/exec_error.hpp"
#include "utils/utf8.hpp"

namespace codebox::content {
namespace {

constexpr char kBase64Table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr int kInvalid = -1;
constexpr int kPad = -2;

std::array<int, 256> BuildReverseTable() {
    std::array<int, 256> table{};
    table.fill(kInvalid);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kBase64Table[i])] = i;
    }
    table[static_cast<unsigned char>('=')] = kPad;
    return table;
}

exec::Bytes DecodeBase64(const std::string& text) {
    static const auto reverse = BuildReverseTable();
    if (text.size() % 4 != 0) {
        throw exec::ExecError::Internal("Base64 decode error: invalid length " + std::to_string(text.size()));
    }
    exec::Bytes decoded;
    decoded.reserve(text.size() / 4 * 3);
    for (std::size_t offset = 0; offset < text.size(); offset += 4) {
        const bool last_quad = offset + 4 == text.size();
        int values[4];
        int padding = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            const auto c = static_cast<unsigned char>(text[offset + i]);
            values[i] = reverse[c];
            if (values[i] == kInvalid) {
                throw exec::ExecError::Internal(
                    "Base64 decode error: invalid symbol at offset " + std::to_string(offset + i));
            }
            if (values[i] == kPad) {
                if (!last_quad || i < 2) {
                    throw exec::ExecError::Internal(
                        "Base64 decode error: invalid padding at offset " + std::to_string(offset + i));
                }
                ++padding;
                values[i] = 0;
            } else if (padding > 0) {
                throw exec::ExecError::Internal(
                    "Base64 decode error: invalid padding at offset " + std::to_string(offset + i));
            }
        }
        const std::uint32_t triple = (static_cast<std::uint32_t>(values[0]) << 18)
            | (static_cast<std::uint32_t>(values[1]) << 12)
            | (static_cast<std::uint32_t>(values[2]) << 6)
            | static_cast<std::uint32_t>(values[3]);
        // Bits below the last emitted byte must be zero.
        if ((padding == 1 && (triple & 0xFF) != 0) || (padding == 2 && (triple & 0xFFFF) != 0)) {
            throw exec::ExecError::Internal(
                "Base64 decode error: invalid trailing bits at offset " + std::to_string(offset));
        }
        decoded.push_back(static_cast<char>((triple >> 16) & 0xFF));
        if (padding < 2) {
            decoded.push_back(static_cast<char>((triple >> 8) & 0xFF));
        }
        if (padding < 1) {
            decoded.push_back(static_cast<char>(triple & 0xFF));
        }
    }
    return decoded;
}

exec::Bytes DecodeHex(const std::string& text) {
    exec::Bytes decoded;
    try {
        boost::algorithm::unhex(text.begin(), text.end(), std::back_inserter(decoded));
    } catch (const boost::algorithm::non_hex_input&) {
        throw exec::ExecError::Internal("Hex decode error: invalid character in hex string");
    } catch (const boost::algorithm::not_enough_input&) {
        throw exec::ExecError::Internal("Hex decode error: odd number of digits");
    }
    return decoded;
}

}  // namespace

exec::Bytes Decode(const exec::Bytes& content, std::optional<exec::Encoding> encoding) {
    const auto effective = encoding.value_or(exec::Encoding::kUtf8);
    switch (effective) {
        case exec::Encoding::kUtf8:
            return content;
        case exec::Encoding::kBase64:
            if (!utils::IsValidUtf8(content)) {
                throw exec::ExecError::Internal("Invalid UTF-8 in base64 content");
            }
            return DecodeBase64(content);
        case exec::Encoding::kHex:
            if (!utils::IsValidUtf8(content)) {
                throw exec::ExecError::Internal("Invalid UTF-8 in hex content");
            }
            return DecodeHex(content);
    }
    return content;
}

std::string EncodeBase64(const exec::Bytes& data) {
    std::string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);
    std::size_t i = 0;
    while (i < data.size()) {
        const std::size_t start = i;
        const unsigned int octet_a = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;
        const unsigned int octet_b = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;
        const unsigned int octet_c = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;

        const unsigned int triple = (octet_a << 16) + (octet_b << 8) + octet_c;
        encoded.push_back(kBase64Table[(triple >> 18) & 0x3F]);
        encoded.push_back(kBase64Table[(triple >> 12) & 0x3F]);
        encoded.push_back(start + 1 < data.size() ? kBase64Table[(triple >> 6) & 0x3F] : '=');
        encoded.push_back(start + 2 < data.size() ? kBase64Table[triple & 0x3F] : '=');
    }
    return encoded;
}

std::string EncodeHex(const exec::Bytes& data) {
    std::string encoded;
    encoded.reserve(data.size() * 2);
    boost::algorithm::hex_lower(data.begin(), data.end(), std::back_inserter(encoded));
    return encoded;
}

}  // namespace codebox::content
