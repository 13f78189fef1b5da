#ifndef GYMFACE_THUMBNAIL_CIPHER_H
#define GYMFACE_THUMBNAIL_CIPHER_H

#include "crypto_utils.h"
#include <string>

namespace gymface {

// AES-256-GCM sealing of thumbnail bytes.
// Sealed layout: nonce (12 bytes) || ciphertext || tag (16 bytes).
// The 256-bit key is the SHA-256 digest of the configured secret.
class ThumbnailCipher {
public:
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;

    // Throws FaceError(InputValidation) for an empty secret
    explicit ThumbnailCipher(const std::string& secret);

    Bytes encrypt(const Bytes& plaintext) const;

    // Throws FaceError(PersistenceFailure) when the blob is truncated or fails authentication
    Bytes decrypt(const Bytes& sealed) const;

private:
    Bytes key_;
};

} // namespace gymface

#endif // GYMFACE_THUMBNAIL_CIPHER_H
