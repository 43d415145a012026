#pragma once

#include <string>
#include <string_view>
#include <random>
#include <optional>
#include "Crypto.hpp"
#include "EccTypes.hpp"

namespace toy_ecc {

// One end of the simulated channel. Each participant owns its own key pair;
// two participants in the same process never share scalars.
class Participant {
public:
    Participant(std::string name, const CurveParams& params);
    Participant(std::string name, const CurveParams& params, uint64_t seed);

    // Draws a fresh private scalar; the public key follows
    void regenerate();
    // Rejects scalars outside [1, n-1] with EccError(ScalarOutOfRange)
    void setPrivateScalar(uint64_t d);

    const std::string& name() const { return name_; }
    const CurveParams& params() const { return params_; }
    uint64_t privateScalar() const { return keys_.privateScalar; }
    const Point& publicKey() const { return keys_.publicPoint; }

    // Uses a fresh ephemeral scalar unless one is given
    HexCiphertext encryptFor(const Point& peerPublicKey, std::string_view plaintext,
                             std::optional<uint64_t> ephemeralScalar = std::nullopt);
    std::string decrypt(std::string_view ciphertextHex, const Point& c1) const;

private:
    std::string name_;
    CurveParams params_;
    std::mt19937_64 engine_;
    KeyPair keys_;
};

} // namespace toy_ecc
