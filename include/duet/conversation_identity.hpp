#pragma once

#include "duet/conversation_types.hpp"
#include <string>

namespace duet {

/**
 * Canonical conversation identity for an unordered pair of users.
 *
 * Pure: resolve(a, b) == resolve(b, a), so concurrent first-contact sends from
 * both directions land on the same conversation row.
 */
class ConversationIdentity {
public:
    /**
     * @throws InvalidParticipants if both ids are the same user
     */
    static ConversationRef resolve(UserId user_a, UserId user_b);

    // First 128 bits of SHA-256("<low>:<high>") as lowercase hex
    static std::string conversation_id(UserId low_user_id, UserId high_user_id);
};

} // namespace duet
