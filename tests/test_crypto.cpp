/**
 * @file test_crypto.cpp
 * @brief ECIES-like encrypt/decrypt over the toy curve
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "Crypto.hpp"
#include "Codec.hpp"
#include "Curve.hpp"
#include "KeyAgreement.hpp"
#include "StreamCipher.hpp"

using namespace toy_ecc;

class CryptoTest : public ::testing::Test {
protected:
    CurveParams params_ = CurveParams::toyCurve();
};

// ============================================================================
// Worked example: d = 7, k = 5, "hi"
// ============================================================================

TEST_F(CryptoTest, WorkedExample) {
    const uint64_t d = 7;
    const uint64_t k = 5;
    Point Q = KeyAgreement::derivePublicKey(params_, d);
    ASSERT_EQ(Q, Point(Affine{10, 76}));

    HexCiphertext out = Crypto::encryptToHex(params_, "hi", k, Q);
    EXPECT_EQ(out.c1, Point(Affine{88, 56}));
    EXPECT_EQ(out.ciphertextHex, "7846");

    EXPECT_EQ(Crypto::decrypt(params_, std::string_view(out.ciphertextHex), out.c1, d), "hi");
}

TEST_F(CryptoTest, EncryptedMessageCarriesC1NotK) {
    Point Q = KeyAgreement::derivePublicKey(params_, 7);
    EncryptedMessage msg = Crypto::encrypt(params_, "hi", 5, Q);
    EXPECT_EQ(msg.ephemeralPoint, KeyAgreement::derivePublicKey(params_, 5));
    EXPECT_EQ(msg.ciphertext, (std::vector<uint8_t>{0x78, 0x46}));
    EXPECT_EQ(Crypto::decrypt(params_, msg.ciphertext, msg.ephemeralPoint, 7), "hi");
}

TEST_F(CryptoTest, MultiByteUtf8Message) {
    const std::string text = "Hello ECC \xF0\x9F\x91\x8B";
    Point Q = KeyAgreement::derivePublicKey(params_, 7);
    HexCiphertext out = Crypto::encryptToHex(params_, text, 5, Q);
    EXPECT_EQ(out.ciphertextHex, "584aae552bf3533efb975a9efd50");
    EXPECT_EQ(Crypto::decrypt(params_, std::string_view(out.ciphertextHex), out.c1, 7), text);
}

TEST_F(CryptoTest, MalformedUtf8IsNormalizedBeforeEncryption) {
    const std::string raw = "a\xFF" "b";
    const std::string normalized = "a\xEF\xBF\xBD" "b";
    Point Q = KeyAgreement::derivePublicKey(params_, 7);

    HexCiphertext out = Crypto::encryptToHex(params_, raw, 5, Q);
    EXPECT_EQ(out.ciphertextHex.size(), 10u);
    EXPECT_EQ(out.ciphertextHex, Crypto::encryptToHex(params_, normalized, 5, Q).ciphertextHex);

    std::string decrypted = Crypto::decrypt(params_, std::string_view(out.ciphertextHex), out.c1, 7);
    EXPECT_EQ(decrypted, normalized);
    EXPECT_EQ(Crypto::encryptToHex(params_, decrypted, 5, Q).ciphertextHex, out.ciphertextHex);
}

// ============================================================================
// Round trip
// ============================================================================

TEST_F(CryptoTest, RoundTripForAllScalarPairs) {
    const std::vector<std::string> messages = {"", "a", "hi", "The quick brown fox",
                                               "caf\xC3\xA9 \xE2\x82\xAC"};
    for (uint64_t d = 1; d < params_.n; d += 2) {
        Point Q = KeyAgreement::derivePublicKey(params_, d);
        for (uint64_t k = 1; k < params_.n; k += 3) {
            for (const std::string& m : messages) {
                HexCiphertext out = Crypto::encryptToHex(params_, m, k, Q);
                EXPECT_EQ(Crypto::decrypt(params_, std::string_view(out.ciphertextHex), out.c1, d), m)
                    << "d=" << d << " k=" << k;
            }
        }
    }
}

TEST_F(CryptoTest, DecryptIsIdempotent) {
    Point Q = KeyAgreement::derivePublicKey(params_, 11);
    HexCiphertext out = Crypto::encryptToHex(params_, "repeat me", 17, Q);
    std::string first = Crypto::decrypt(params_, std::string_view(out.ciphertextHex), out.c1, 11);
    std::string second = Crypto::decrypt(params_, std::string_view(out.ciphertextHex), out.c1, 11);
    EXPECT_EQ(first, second);
}

TEST_F(CryptoTest, DecryptToleratesSeparatorsInHex) {
    EXPECT_EQ(Crypto::decrypt(params_, std::string_view("78 46"), Affine{88, 56}, 7), "hi");
}

TEST_F(CryptoTest, WrongPrivateKeyDoesNotRecoverPlaintext) {
    Point Q = KeyAgreement::derivePublicKey(params_, 7);
    HexCiphertext out = Crypto::encryptToHex(params_, "secret text", 5, Q);
    EXPECT_NE(Crypto::decrypt(params_, std::string_view(out.ciphertextHex), out.c1, 8),
              "secret text");
}

TEST_F(CryptoTest, DegenerateSharedPointStillRoundTrips) {
    // k * d = 50 = n: the shared point is the identity and the seed is 0
    Point Q = KeyAgreement::derivePublicKey(params_, 10);
    EncryptedMessage msg = Crypto::encrypt(params_, "weak", 5, Q);
    EXPECT_EQ(msg.ciphertext, StreamCipher::xorBytes(Codec::utf8Encode("weak"),
                                                     StreamCipher::generateKeystream(0, 4)));
    EXPECT_EQ(Crypto::decrypt(params_, msg.ciphertext, msg.ephemeralPoint, 10), "weak");
}

TEST_F(CryptoTest, IdentityRecipientKeyUsesZeroSeed) {
    // The identity is accepted as a public key and the keystream seed is then 0
    EncryptedMessage msg = Crypto::encrypt(params_, "weak", 5, Identity{});
    EXPECT_EQ(msg.ephemeralPoint, KeyAgreement::derivePublicKey(params_, 5));
    const std::vector<uint8_t> zeroSeedKeystream = StreamCipher::generateKeystream(0, 4);
    EXPECT_EQ(msg.ciphertext,
              StreamCipher::xorBytes(Codec::utf8Encode("weak"), zeroSeedKeystream));
    EXPECT_EQ(Codec::utf8Decode(StreamCipher::xorBytes(msg.ciphertext, zeroSeedKeystream)),
              "weak");
}

TEST_F(CryptoTest, IdentityC1DecryptsWithZeroSeed) {
    std::vector<uint8_t> ciphertext = StreamCipher::xorBytes(
        Codec::utf8Encode("weak"), StreamCipher::generateKeystream(0, 4));
    for (uint64_t d : {uint64_t{1}, uint64_t{7}, uint64_t{49}}) {
        EXPECT_EQ(Crypto::decrypt(params_, ciphertext, Identity{}, d), "weak");
    }
}

// ============================================================================
// Errors
// ============================================================================

namespace {
ErrorCode decryptError(const CurveParams& params, std::string_view hex, const Point& c1,
                       uint64_t d) {
    try {
        Crypto::decrypt(params, hex, c1, d);
    } catch (const EccError& e) {
        return e.code();
    }
    return ErrorCode::None;
}
}

TEST_F(CryptoTest, DecryptRejectsOddHex) {
    EXPECT_EQ(decryptError(params_, "784", Affine{88, 56}, 7), ErrorCode::MalformedHexInput);
}

TEST_F(CryptoTest, DecryptRejectsOffCurveC1) {
    EXPECT_EQ(decryptError(params_, "7846", Affine{88, 57}, 7), ErrorCode::PointNotOnCurve);
}

TEST_F(CryptoTest, DecryptRejectsOutOfRangePrivateScalar) {
    EXPECT_EQ(decryptError(params_, "7846", Affine{88, 56}, 0), ErrorCode::ScalarOutOfRange);
    EXPECT_EQ(decryptError(params_, "7846", Affine{88, 56}, 50), ErrorCode::ScalarOutOfRange);
}

TEST_F(CryptoTest, EncryptRejectsBadInputs) {
    Point Q = KeyAgreement::derivePublicKey(params_, 7);
    try {
        Crypto::encrypt(params_, "hi", 0, Q);
        FAIL() << "expected EccError";
    } catch (const EccError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ScalarOutOfRange);
    }
    try {
        Crypto::encrypt(params_, "hi", 5, Affine{1, 1});
        FAIL() << "expected EccError";
    } catch (const EccError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PointNotOnCurve);
    }
}

TEST(SecureWipeTest, ClearsBuffer) {
    std::vector<uint8_t> data = {1, 2, 3, 4};
    Crypto::secureWipe(data);
    EXPECT_TRUE(data.empty());

    std::vector<uint8_t> empty;
    Crypto::secureWipe(empty);
    EXPECT_TRUE(empty.empty());
}
