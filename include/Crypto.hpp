#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "EccTypes.hpp"

namespace toy_ecc {

// C1 and the ciphertext as hex, the form handed to the receiver
struct HexCiphertext {
    Point c1;
    std::string ciphertextHex;
};

class Crypto {
public:
    // ECIES-like encryption: C1 = k*G, keystream seeded from (k*Q).x
    static EncryptedMessage encrypt(
        const CurveParams& params,
        std::string_view plaintext,
        uint64_t ephemeralScalar,
        const Point& recipientPublicKey);
    static HexCiphertext encryptToHex(
        const CurveParams& params,
        std::string_view plaintext,
        uint64_t ephemeralScalar,
        const Point& recipientPublicKey);

    // Keystream seeded from (d*C1).x
    static std::string decrypt(
        const CurveParams& params,
        const std::vector<uint8_t>& ciphertext,
        const Point& c1,
        uint64_t privateScalar);
    static std::string decrypt(
        const CurveParams& params,
        std::string_view ciphertextHex,
        const Point& c1,
        uint64_t privateScalar);

    // Secure memory wiping
    static void secureWipe(std::vector<uint8_t>& data);

private:
    // Prevent instantiation
    Crypto() = delete;
    ~Crypto() = delete;
    Crypto(const Crypto&) = delete;
    Crypto& operator=(const Crypto&) = delete;
};

} // namespace toy_ecc
