#include "StreamCipher.hpp"
#include "EccTypes.hpp"
#include "Logger.hpp"
#include <string>

namespace toy_ecc {

std::vector<uint8_t> StreamCipher::generateKeystream(uint32_t seed, std::size_t length) {
    std::vector<uint8_t> out(length);
    uint32_t state = seed;
    for (std::size_t i = 0; i < length; ++i) {
        // uint32_t arithmetic wraps mod 2^32
        state = state * LCG_MULTIPLIER + LCG_INCREMENT;
        out[i] = static_cast<uint8_t>(state & 0xFF);
    }
    return out;
}

std::vector<uint8_t> StreamCipher::xorBytes(const std::vector<uint8_t>& a,
                                            const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) {
        std::string message = "XOR operands differ in length (" +
            std::to_string(a.size()) + " vs " + std::to_string(b.size()) + ")";
        Logger::logError(ErrorCode::InvalidParameter, message);
        throw EccError(ErrorCode::InvalidParameter, message);
    }

    std::vector<uint8_t> out(a.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        out[i] = a[i] ^ b[i];
    }
    return out;
}

} // namespace toy_ecc
