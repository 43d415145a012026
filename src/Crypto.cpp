#include "Crypto.hpp"      // Include the header for Crypto declarations
#include "Curve.hpp"
#include "Codec.hpp"
#include "KeyAgreement.hpp"
#include "StreamCipher.hpp"
#include "Logger.hpp"      // For logging
#include <openssl/crypto.h>

namespace toy_ecc { // Begin namespace toy_ecc

EncryptedMessage Crypto::encrypt(
    const CurveParams& params,
    std::string_view plaintext,
    uint64_t ephemeralScalar,
    const Point& recipientPublicKey)
{
    KeyAgreement::requireScalarInRange(params, ephemeralScalar, "Ephemeral scalar");
    Curve::requireOnCurve(params, recipientPublicKey, "Recipient public key");

    Point c1 = Curve::scalarMultiply(params, ephemeralScalar, params.generator());
    Point shared = KeyAgreement::deriveSharedSecret(params, ephemeralScalar, recipientPublicKey);
    uint32_t seed = KeyAgreement::seedFromPoint(shared);

    std::vector<uint8_t> message = Codec::utf8Encode(plaintext);
    std::vector<uint8_t> keystream = StreamCipher::generateKeystream(seed, message.size());

    EncryptedMessage result;
    result.ephemeralPoint = c1;
    result.ciphertext = StreamCipher::xorBytes(message, keystream);

    secureWipe(message);
    secureWipe(keystream);

    Logger::logEvent(LogLevel::Info, "Encrypted " + std::to_string(result.ciphertext.size()) +
        " bytes, C1 = " + Codec::formatPoint(c1));
    return result;
}

HexCiphertext Crypto::encryptToHex(
    const CurveParams& params,
    std::string_view plaintext,
    uint64_t ephemeralScalar,
    const Point& recipientPublicKey)
{
    EncryptedMessage msg = encrypt(params, plaintext, ephemeralScalar, recipientPublicKey);
    return HexCiphertext{msg.ephemeralPoint, Codec::toHex(msg.ciphertext)};
}

std::string Crypto::decrypt(
    const CurveParams& params,
    const std::vector<uint8_t>& ciphertext,
    const Point& c1,
    uint64_t privateScalar)
{
    KeyAgreement::requireScalarInRange(params, privateScalar, "Private scalar");
    Curve::requireOnCurve(params, c1, "C1");

    Point shared = KeyAgreement::deriveSharedSecret(params, privateScalar, c1);
    uint32_t seed = KeyAgreement::seedFromPoint(shared);

    std::vector<uint8_t> keystream = StreamCipher::generateKeystream(seed, ciphertext.size());
    std::vector<uint8_t> plain = StreamCipher::xorBytes(ciphertext, keystream);
    std::string result = Codec::utf8Decode(plain);

    secureWipe(plain);
    secureWipe(keystream);

    Logger::logEvent(LogLevel::Info, "Decrypted " + std::to_string(ciphertext.size()) + " bytes");
    return result;
}

std::string Crypto::decrypt(
    const CurveParams& params,
    std::string_view ciphertextHex,
    const Point& c1,
    uint64_t privateScalar)
{
    try {
        std::vector<uint8_t> ciphertext = Codec::fromHex(ciphertextHex);
        return decrypt(params, ciphertext, c1, privateScalar);
    }
    catch (const EccError& e) {
        Logger::logEvent(LogLevel::Warning,
            std::string("Decryption rejected: ") + e.what());
        throw;
    }
}

void Crypto::secureWipe(std::vector<uint8_t>& data) {
    if (data.empty()) return;

    // Use OpenSSL's secure memory wiping function
    OPENSSL_cleanse(data.data(), data.size());
    data.clear();
    data.shrink_to_fit(); // Release the memory back to the system
}

} // namespace toy_ecc
