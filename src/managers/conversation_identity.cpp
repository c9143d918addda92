#include "duet/conversation_identity.hpp"
#include "duet/errors.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

namespace duet {

namespace {

constexpr size_t ID_BYTES = 16;

} // anonymous namespace

ConversationRef ConversationIdentity::resolve(UserId user_a, UserId user_b) {
    if (user_a == user_b) {
        throw InvalidParticipants("A conversation needs two distinct users, got " +
                                  std::to_string(user_a) + " twice");
    }

    ConversationRef ref;
    ref.low_user_id = std::min(user_a, user_b);
    ref.high_user_id = std::max(user_a, user_b);
    ref.id = conversation_id(ref.low_user_id, ref.high_user_id);
    return ref;
}

std::string ConversationIdentity::conversation_id(UserId low_user_id, UserId high_user_id) {
    const std::string material = std::to_string(low_user_id) + ":" + std::to_string(high_user_id);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(material.data(), material.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1 ||
        digest_len < ID_BYTES) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string id;
    id.reserve(ID_BYTES * 2);
    for (size_t i = 0; i < ID_BYTES; ++i) {
        id += hex[digest[i] >> 4];
        id += hex[digest[i] & 0x0F];
    }
    return id;
}

} // namespace duet
