#include "thumbnail_cipher.h"
#include "errors.h"
#include "logger.h"
#include <openssl/evp.h>
#include <algorithm>
#include <memory>

namespace gymface {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtxPtr newContext() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw FaceError(ErrorKind::Unexpected, "Failed to allocate cipher context");
    }
    return ctx;
}

} // namespace

ThumbnailCipher::ThumbnailCipher(const std::string& secret) {
    if (secret.empty()) {
        throw FaceError(ErrorKind::InputValidation, "Biometric encryption key is not configured");
    }
    key_ = sha256(secret);
}

Bytes ThumbnailCipher::encrypt(const Bytes& plaintext) const {
    Bytes nonce = randomBytes(NONCE_SIZE);
    CipherCtxPtr ctx = newContext();

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1) {
        throw FaceError(ErrorKind::Unexpected, "Failed to initialize thumbnail encryption");
    }

    Bytes sealed(NONCE_SIZE + plaintext.size() + TAG_SIZE);
    std::copy(nonce.begin(), nonce.end(), sealed.begin());

    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), sealed.data() + NONCE_SIZE, &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            throw FaceError(ErrorKind::Unexpected, "Thumbnail encryption failed");
        }
        total = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + NONCE_SIZE + total, &len) != 1) {
        throw FaceError(ErrorKind::Unexpected, "Thumbnail encryption failed");
    }
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                            sealed.data() + NONCE_SIZE + total) != 1) {
        throw FaceError(ErrorKind::Unexpected, "Failed to read GCM tag");
    }

    return sealed;
}

Bytes ThumbnailCipher::decrypt(const Bytes& sealed) const {
    if (sealed.size() < NONCE_SIZE + TAG_SIZE) {
        throw FaceError(ErrorKind::PersistenceFailure, "Encrypted thumbnail is truncated");
    }

    const size_t cipher_len = sealed.size() - NONCE_SIZE - TAG_SIZE;
    const uint8_t* nonce = sealed.data();
    const uint8_t* ciphertext = sealed.data() + NONCE_SIZE;
    Bytes tag(sealed.end() - TAG_SIZE, sealed.end());

    CipherCtxPtr ctx = newContext();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        throw FaceError(ErrorKind::Unexpected, "Failed to initialize thumbnail decryption");
    }

    Bytes plaintext(cipher_len);
    int len = 0;
    int total = 0;
    if (cipher_len > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext,
                              static_cast<int>(cipher_len)) != 1) {
            throw FaceError(ErrorKind::PersistenceFailure, "Thumbnail decryption failed");
        }
        total = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
        throw FaceError(ErrorKind::Unexpected, "Failed to set GCM tag");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
        Logger::getInstance().warning("Thumbnail authentication tag mismatch (wrong key or tampered data)");
        throw FaceError(ErrorKind::PersistenceFailure, "Thumbnail failed integrity check");
    }
    total += len;
    plaintext.resize(static_cast<size_t>(total));

    return plaintext;
}

} // namespace gymface
