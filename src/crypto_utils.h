#ifndef GYMFACE_CRYPTO_UTILS_H
#define GYMFACE_CRYPTO_UTILS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gymface {

using Bytes = std::vector<uint8_t>;

// Standard base64 (RFC 4648) with '=' padding
std::string base64Encode(const uint8_t* data, size_t size);
inline std::string base64Encode(const Bytes& data) { return base64Encode(data.data(), data.size()); }

// Whitespace is ignored; nullopt on bad characters or bad padding
std::optional<Bytes> base64Decode(const std::string& text);

// SHA-256 digest (32 bytes)
Bytes sha256(const std::string& data);

// Cryptographically secure random bytes; throws FaceError(Unexpected) if the RNG fails
Bytes randomBytes(size_t count);

// Random (version 4) UUID in canonical 8-4-4-4-12 form
std::string generateUuid();

} // namespace gymface

#endif // GYMFACE_CRYPTO_UTILS_H
