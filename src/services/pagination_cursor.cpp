#include "duet/pagination_cursor.hpp"
#include "duet/errors.hpp"
#include <spdlog/spdlog.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace duet {

namespace {

// URL-safe alphabet, no padding
const std::string base64url_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789-_";

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

const char* cursor_kind_name(CursorKind kind) {
    switch (kind) {
        case CursorKind::Messages: return "messages";
        case CursorKind::Conversations: return "conversations";
    }
    return "unknown";
}

std::string CursorCodec::base64url_encode(const uint8_t* data, size_t len) {
    std::string ret;
    ret.reserve((len * 4 + 2) / 3);

    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        ret += base64url_chars[(n >> 18) & 0x3F];
        ret += base64url_chars[(n >> 12) & 0x3F];
        ret += base64url_chars[(n >> 6) & 0x3F];
        ret += base64url_chars[n & 0x3F];
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        ret += base64url_chars[(n >> 18) & 0x3F];
        ret += base64url_chars[(n >> 12) & 0x3F];
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        ret += base64url_chars[(n >> 18) & 0x3F];
        ret += base64url_chars[(n >> 12) & 0x3F];
        ret += base64url_chars[(n >> 6) & 0x3F];
    }
    return ret;
}

bool CursorCodec::base64url_decode(const std::string& encoded, std::vector<uint8_t>& out) {
    out.clear();
    if (encoded.size() % 4 == 1) return false;
    out.reserve(encoded.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : encoded) {
        auto pos = base64url_chars.find(c);
        if (pos == std::string::npos) return false;
        buffer = (buffer << 6) | static_cast<uint32_t>(pos);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return true;
}

CursorCodec::CursorCodec(const CursorConfig& config) {
    if (config.key_hex.empty()) {
        key_.resize(KEY_SIZE);
        if (RAND_bytes(key_.data(), KEY_SIZE) != 1) {
            throw std::runtime_error("Failed to generate cursor key");
        }
        ephemeral_ = true;
        spdlog::warn("DUET_CURSOR_KEY not set - using an ephemeral cursor key, "
                     "cursors will not survive a restart");
        return;
    }

    if (config.key_hex.length() != KEY_SIZE * 2) {
        throw std::invalid_argument("DUET_CURSOR_KEY must be 32 bytes (64 hex characters), got " +
                                    std::to_string(config.key_hex.length()));
    }

    key_.reserve(KEY_SIZE);
    for (size_t i = 0; i < config.key_hex.length(); i += 2) {
        int hi = hex_value(config.key_hex[i]);
        int lo = hex_value(config.key_hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("DUET_CURSOR_KEY contains non-hex characters");
        }
        key_.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    spdlog::debug("Cursor codec initialized (AES-256-GCM)");
}

std::string CursorCodec::encode(CursorKind kind, const std::string& partition,
                                const ClusteringKey& position) const {
    nlohmann::json payload = {
        {"k", cursor_kind_name(kind)},
        {"p", partition},
        {"ts", position.ts},
        {"id", position.id}
    };
    std::string plaintext = payload.dump();

    uint8_t iv[IV_SIZE];
    if (RAND_bytes(iv, IV_SIZE) != 1) {
        throw std::runtime_error("Failed to generate cursor IV");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key_.data(), iv) != 1) {
        throw std::runtime_error("Failed to initialize cursor encryption");
    }

    // iv | tag | ciphertext
    std::vector<uint8_t> sealed(IV_SIZE + TAG_SIZE + plaintext.size() + EVP_CIPHER_block_size(EVP_aes_256_gcm()));
    std::copy(iv, iv + IV_SIZE, sealed.begin());
    uint8_t* ciphertext = sealed.data() + IV_SIZE + TAG_SIZE;

    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(), ciphertext, &len,
                          reinterpret_cast<const uint8_t*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("Failed to encrypt cursor");
    }
    int ciphertext_len = len;

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + len, &len) != 1) {
        throw std::runtime_error("Failed to finalize cursor encryption");
    }
    ciphertext_len += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_SIZE, sealed.data() + IV_SIZE) != 1) {
        throw std::runtime_error("Failed to get cursor authentication tag");
    }

    sealed.resize(IV_SIZE + TAG_SIZE + ciphertext_len);
    return base64url_encode(sealed.data(), sealed.size());
}

ClusteringKey CursorCodec::decode(const std::string& token, CursorKind kind,
                                  const std::string& partition) const {
    std::vector<uint8_t> sealed;
    if (!base64url_decode(token, sealed) || sealed.size() <= IV_SIZE + TAG_SIZE) {
        throw InvalidCursor("Malformed cursor");
    }

    const uint8_t* iv = sealed.data();
    uint8_t* tag = sealed.data() + IV_SIZE;
    const uint8_t* ciphertext = sealed.data() + IV_SIZE + TAG_SIZE;
    int ciphertext_len = static_cast<int>(sealed.size() - IV_SIZE - TAG_SIZE);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create decipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key_.data(), iv) != 1) {
        throw std::runtime_error("Failed to initialize cursor decryption");
    }

    std::vector<uint8_t> plaintext(ciphertext_len + EVP_CIPHER_block_size(EVP_aes_256_gcm()));
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext, ciphertext_len) != 1) {
        throw InvalidCursor("Cursor could not be decrypted");
    }
    int plaintext_len = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_SIZE, tag) != 1) {
        throw std::runtime_error("Failed to set cursor authentication tag");
    }

    // Verifies the tag
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) != 1) {
        throw InvalidCursor("Cursor authentication failed");
    }
    plaintext_len += len;

    nlohmann::json payload = nlohmann::json::parse(
        plaintext.begin(), plaintext.begin() + plaintext_len, nullptr, false);
    if (payload.is_discarded() || !payload.is_object() ||
        !payload.contains("k") || !payload["k"].is_string() ||
        !payload.contains("p") || !payload["p"].is_string() ||
        !payload.contains("ts") || !payload["ts"].is_number_integer() ||
        !payload.contains("id") || !payload["id"].is_string()) {
        throw InvalidCursor("Cursor payload is malformed");
    }

    if (payload["k"].get<std::string>() != cursor_kind_name(kind)) {
        throw InvalidCursor(std::string("Cursor was not issued for a ") + cursor_kind_name(kind) + " list");
    }
    if (payload["p"].get<std::string>() != partition) {
        throw InvalidCursor("Cursor was issued for a different list");
    }

    ClusteringKey position;
    position.ts = payload["ts"].get<TimestampMs>();
    position.id = payload["id"].get<std::string>();
    return position;
}

} // namespace duet
