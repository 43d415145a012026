#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace toy_ecc {

// LCG keystream + XOR. Deterministic and restartable; not a secure cipher.
class StreamCipher {
public:
    static constexpr uint32_t LCG_MULTIPLIER = 1664525;
    static constexpr uint32_t LCG_INCREMENT = 1013904223;

    static std::vector<uint8_t> generateKeystream(uint32_t seed, std::size_t length);

    // Throws EccError(InvalidParameter) when the lengths differ
    static std::vector<uint8_t> xorBytes(const std::vector<uint8_t>& a,
                                         const std::vector<uint8_t>& b);

private:
    // Prevent instantiation
    StreamCipher() = delete;
    ~StreamCipher() = delete;
    StreamCipher(const StreamCipher&) = delete;
    StreamCipher& operator=(const StreamCipher&) = delete;
};

} // namespace toy_ecc
