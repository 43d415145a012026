#include "Participant.hpp"
#include "KeyAgreement.hpp"
#include "Codec.hpp"
#include "Logger.hpp"
#include <utility>

namespace toy_ecc {

Participant::Participant(std::string name, const CurveParams& params)
    : Participant(std::move(name), params, std::random_device{}()) {}

Participant::Participant(std::string name, const CurveParams& params, uint64_t seed)
    : name_(std::move(name)), params_(params), engine_(seed) {
    regenerate();
}

void Participant::regenerate() {
    keys_ = KeyAgreement::generateKeyPair(params_, engine_);
    Logger::logEvent(LogLevel::Info, name_ + " generated a new key pair, Q = " +
        Codec::formatPoint(keys_.publicPoint));
}

void Participant::setPrivateScalar(uint64_t d) {
    // keyPairFromScalar throws before keys_ is touched
    keys_ = KeyAgreement::keyPairFromScalar(params_, d);
    Logger::logEvent(LogLevel::Info, name_ + " set private scalar, Q = " +
        Codec::formatPoint(keys_.publicPoint));
}

HexCiphertext Participant::encryptFor(const Point& peerPublicKey, std::string_view plaintext,
                                      std::optional<uint64_t> ephemeralScalar) {
    uint64_t k = ephemeralScalar ? *ephemeralScalar
                                 : KeyAgreement::generatePrivateScalar(params_, engine_);
    return Crypto::encryptToHex(params_, plaintext, k, peerPublicKey);
}

std::string Participant::decrypt(std::string_view ciphertextHex, const Point& c1) const {
    return Crypto::decrypt(params_, ciphertextHex, c1, keys_.privateScalar);
}

} // namespace toy_ecc
