#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <string_view>
#include "EccTypes.hpp"

namespace toy_ecc {

class Codec {
public:
    // Text <-> bytes
    // Malformed input is replaced the same way utf8Decode does it, so the
    // returned bytes are always well-formed UTF-8
    static std::vector<uint8_t> utf8Encode(std::string_view text);
    // Malformed sequences become U+FFFD, one per maximal invalid subpart
    static std::string utf8Decode(const std::vector<uint8_t>& bytes);

    // Bytes <-> hex
    static std::string toHex(const std::vector<uint8_t>& bytes);
    // Non-hex characters are dropped before pairing. An odd number of
    // remaining digits throws EccError(MalformedHexInput).
    static std::vector<uint8_t> fromHex(std::string_view text);

    // Points and scalars as typed by a user
    static std::string formatPoint(const Point& point);
    static Point parsePoint(std::string_view text);
    static uint64_t parseScalar(std::string_view text);

private:
    // Prevent instantiation
    Codec() = delete;
    ~Codec() = delete;
    Codec(const Codec&) = delete;
    Codec& operator=(const Codec&) = delete;
};

} // namespace toy_ecc
