/**
 * @file test_crypto.cpp
 * @brief Unit tests for base64, UUIDs and ThumbnailCipher
 */

#include <gtest/gtest.h>
#include "crypto_utils.h"
#include "errors.h"
#include "thumbnail_cipher.h"
#include <regex>
#include <set>

using namespace gymface;

namespace {

Bytes bytesOf(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

ErrorKind decryptErrorKind(const ThumbnailCipher& cipher, const Bytes& sealed) {
    try {
        cipher.decrypt(sealed);
    } catch (const FaceError& e) {
        return e.kind();
    }
    return ErrorKind::None;
}

} // namespace

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(base64Encode(bytesOf("")), "");
    EXPECT_EQ(base64Encode(bytesOf("f")), "Zg==");
    EXPECT_EQ(base64Encode(bytesOf("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(bytesOf("foobar")), "Zm9vYmFy");

    EXPECT_EQ(base64Decode("Zg=="), bytesOf("f"));
    EXPECT_EQ(base64Decode("Zm8="), bytesOf("fo"));
    EXPECT_EQ(base64Decode("Zm9v\nYmFy"), bytesOf("foobar"));
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_FALSE(base64Decode("").has_value());
    EXPECT_FALSE(base64Decode("Zm9").has_value());
    EXPECT_FALSE(base64Decode("Z=g=").has_value());
    EXPECT_FALSE(base64Decode("Zm9v!!!!").has_value());
}

TEST(Sha256Test, KnownDigest) {
    Bytes digest = sha256("abc");
    ASSERT_EQ(digest.size(), 32u);
    EXPECT_EQ(digest[0], 0xba);
    EXPECT_EQ(digest[1], 0x78);
    EXPECT_EQ(digest[31], 0xad);
}

TEST(UuidTest, CanonicalVersion4) {
    std::regex pattern("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 100; i++) {
        std::string id = generateUuid();
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(ThumbnailCipherTest, RoundTrip) {
    ThumbnailCipher cipher("gym-secret");
    Bytes plain = bytesOf("jpeg bytes go here");

    Bytes sealed = cipher.encrypt(plain);

    EXPECT_EQ(sealed.size(), plain.size() + ThumbnailCipher::NONCE_SIZE + ThumbnailCipher::TAG_SIZE);
    EXPECT_EQ(cipher.decrypt(sealed), plain);
}

TEST(ThumbnailCipherTest, FreshNoncePerEncryption) {
    ThumbnailCipher cipher("gym-secret");
    Bytes plain = bytesOf("same input");

    EXPECT_NE(cipher.encrypt(plain), cipher.encrypt(plain));
}

TEST(ThumbnailCipherTest, WrongKeyFailsIntegrity) {
    Bytes sealed = ThumbnailCipher("key-a").encrypt(bytesOf("payload"));

    EXPECT_EQ(decryptErrorKind(ThumbnailCipher("key-b"), sealed), ErrorKind::PersistenceFailure);
}

TEST(ThumbnailCipherTest, TamperedCiphertextFailsIntegrity) {
    ThumbnailCipher cipher("gym-secret");
    Bytes sealed = cipher.encrypt(bytesOf("payload"));
    sealed[ThumbnailCipher::NONCE_SIZE] ^= 0x01;

    EXPECT_EQ(decryptErrorKind(cipher, sealed), ErrorKind::PersistenceFailure);
}

TEST(ThumbnailCipherTest, TruncatedBlobIsRejected) {
    ThumbnailCipher cipher("gym-secret");

    EXPECT_EQ(decryptErrorKind(cipher, Bytes(10, 0)), ErrorKind::PersistenceFailure);
}

TEST(ThumbnailCipherTest, EmptySecretIsRejected) {
    try {
        ThumbnailCipher cipher("");
        FAIL() << "expected FaceError";
    } catch (const FaceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InputValidation);
        EXPECT_STREQ(e.what(), "Biometric encryption key is not configured");
    }
}
