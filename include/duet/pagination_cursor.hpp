#pragma once

#include "duet/config.hpp"
#include "duet/storage_driver.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace duet {

enum class CursorKind {
    Messages,
    Conversations
};

const char* cursor_kind_name(CursorKind kind);

/**
 * @brief Opaque pagination cursors (AES-256-GCM).
 *
 * A cursor seals `{kind, partition, ts, id}` with the configured key and is
 * rendered as unpadded URL-safe base64 (iv | tag | ciphertext). Decoding
 * checks the tag, the list kind and the partition, so a cursor can neither be
 * forged nor replayed against a different list.
 */
class CursorCodec {
public:
    static constexpr size_t KEY_SIZE = 32;   // 256 bits
    static constexpr size_t IV_SIZE = 12;    // 96 bits for GCM
    static constexpr size_t TAG_SIZE = 16;   // 128 bits

    /**
     * Without a key in `config` an ephemeral random key is generated; cursors
     * then only decode inside this process.
     *
     * @throws std::invalid_argument if the key is not 64 hex characters
     */
    explicit CursorCodec(const CursorConfig& config);

    std::string encode(CursorKind kind, const std::string& partition, const ClusteringKey& position) const;

    /**
     * @throws InvalidCursor on any malformed, tampered or foreign cursor
     */
    ClusteringKey decode(const std::string& token, CursorKind kind, const std::string& partition) const;

    bool has_ephemeral_key() const { return ephemeral_; }

    static std::string base64url_encode(const uint8_t* data, size_t len);
    static bool base64url_decode(const std::string& encoded, std::vector<uint8_t>& out);

private:
    std::vector<uint8_t> key_;
    bool ephemeral_ = false;
};

} // namespace duet
