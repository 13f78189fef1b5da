#include "crypto_utils.h"
#include "errors.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <cctype>
#include <cstdio>

namespace gymface {

std::string base64Encode(const uint8_t* data, size_t size) {
    if (size == 0) {
        return "";
    }

    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data, static_cast<int>(size));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

std::optional<Bytes> base64Decode(const std::string& text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }

    if (compact.empty() || compact.size() % 4 != 0) {
        return std::nullopt;
    }

    // '=' may only appear as the last one or two characters
    size_t padding = 0;
    if (compact.back() == '=') padding++;
    if (compact[compact.size() - 2] == '=') padding++;
    size_t first_pad = compact.find('=');
    if (first_pad != std::string::npos && first_pad < compact.size() - padding) {
        return std::nullopt;
    }

    Bytes out(compact.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (decoded < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock keeps the zero bytes produced by padding
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

Bytes sha256(const std::string& data) {
    Bytes digest(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data());
    return digest;
}

Bytes randomBytes(size_t count) {
    Bytes out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw FaceError(ErrorKind::Unexpected, "Secure random generator unavailable");
    }
    return out;
}

std::string generateUuid() {
    Bytes b = randomBytes(16);
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf);
}

} // namespace gymface
