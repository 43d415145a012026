#include "Codec.hpp"
#include "Logger.hpp"
#include <charconv>
#include <cctype>
#include <string>

namespace toy_ecc {

namespace {
    constexpr char HEX_DIGITS[] = "0123456789abcdef";
    constexpr char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD"; // U+FFFD

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::string_view trim(std::string_view text) {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        return text;
    }

    // Strict unsigned decimal: digits only, whole input consumed
    bool parseDecimal(std::string_view text, uint64_t& value) {
        if (text.empty()) return false;
        const char* first = text.data();
        const char* last = first + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        return ec == std::errc() && ptr == last;
    }

    [[noreturn]] void rejectPoint(std::string_view text) {
        std::string message = "Expected \"x,y\" but got \"" + std::string(text) + "\"";
        Logger::logError(ErrorCode::MalformedPointInput, message);
        throw EccError(ErrorCode::MalformedPointInput, message);
    }

    // Copies well-formed sequences through and emits U+FFFD for each maximal
    // invalid subpart; a byte that breaks a sequence starts the next one
    std::string replaceInvalidUtf8(const uint8_t* bytes, std::size_t n) {
        std::string out;
        out.reserve(n);

        std::size_t i = 0;
        while (i < n) {
            const uint8_t lead = bytes[i];
            if (lead < 0x80) {
                out.push_back(static_cast<char>(lead));
                ++i;
                continue;
            }

            std::size_t needed;
            uint8_t lower = 0x80;
            uint8_t upper = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                needed = 1;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                needed = 2;
                if (lead == 0xE0) lower = 0xA0;      // Overlong
                if (lead == 0xED) upper = 0x9F;      // Surrogates
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                needed = 3;
                if (lead == 0xF0) lower = 0x90;      // Overlong
                if (lead == 0xF4) upper = 0x8F;      // Beyond U+10FFFF
            } else {
                out += REPLACEMENT_CHARACTER;
                ++i;
                continue;
            }

            std::size_t j = i + 1;
            bool valid = true;
            for (std::size_t k = 0; k < needed; ++k, ++j) {
                if (j >= n) {
                    valid = false;
                    break;
                }
                const uint8_t lo = (k == 0) ? lower : 0x80;
                const uint8_t hi = (k == 0) ? upper : 0xBF;
                if (bytes[j] < lo || bytes[j] > hi) {
                    valid = false;
                    break;
                }
            }

            if (valid) {
                out.append(reinterpret_cast<const char*>(bytes + i), j - i);
            } else {
                out += REPLACEMENT_CHARACTER;
            }
            i = j;
        }
        return out;
    }
}

std::vector<uint8_t> Codec::utf8Encode(std::string_view text) {
    std::string wellFormed = replaceInvalidUtf8(
        reinterpret_cast<const uint8_t*>(text.data()), text.size());
    if (wellFormed != text) {
        Logger::logEvent(LogLevel::Debug,
            "Replaced malformed UTF-8 in input text with U+FFFD");
    }
    return std::vector<uint8_t>(wellFormed.begin(), wellFormed.end());
}

std::string Codec::utf8Decode(const std::vector<uint8_t>& bytes) {
    return replaceInvalidUtf8(bytes.data(), bytes.size());
}

std::string Codec::toHex(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> Codec::fromHex(std::string_view text) {
    std::string digits;
    digits.reserve(text.size());
    for (char c : text) {
        if (hexValue(c) >= 0) {
            digits.push_back(c);
        }
    }

    if (digits.size() != text.size()) {
        Logger::logEvent(LogLevel::Debug, "Stripped " +
            std::to_string(text.size() - digits.size()) + " non-hex characters");
    }

    if (digits.size() % 2 != 0) {
        std::string message = "Odd number of hex digits (" +
            std::to_string(digits.size()) + ") after removing non-hex characters";
        Logger::logError(ErrorCode::MalformedHexInput, message);
        throw EccError(ErrorCode::MalformedHexInput, message);
    }

    std::vector<uint8_t> out(digits.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>((hexValue(digits[2 * i]) << 4) |
                                      hexValue(digits[2 * i + 1]));
    }
    return out;
}

std::string Codec::formatPoint(const Point& point) {
    if (const auto* a = std::get_if<Affine>(&point)) {
        return "(" + std::to_string(a->x) + ", " + std::to_string(a->y) + ")";
    }
    return "O";
}

Point Codec::parsePoint(std::string_view text) {
    std::string_view body = trim(text);
    if (!body.empty() && body.front() == '(') {
        if (body.back() != ')') rejectPoint(text);
        body = trim(body.substr(1, body.size() - 2));
    }

    auto comma = body.find(',');
    if (comma == std::string_view::npos) {
        rejectPoint(text);
    }

    uint64_t x = 0;
    uint64_t y = 0;
    if (!parseDecimal(trim(body.substr(0, comma)), x) ||
        !parseDecimal(trim(body.substr(comma + 1)), y)) {
        rejectPoint(text);
    }
    return Affine{x, y};
}

uint64_t Codec::parseScalar(std::string_view text) {
    uint64_t value = 0;
    if (!parseDecimal(trim(text), value)) {
        std::string message = "Expected a non-negative decimal scalar but got \"" +
            std::string(text) + "\"";
        Logger::logError(ErrorCode::MalformedScalarInput, message);
        throw EccError(ErrorCode::MalformedScalarInput, message);
    }
    return value;
}

} // namespace toy_ecc
