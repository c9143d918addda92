#include "duet/storage_driver.hpp"

namespace duet {

const char* table_name(Table table) {
    switch (table) {
        case Table::Messages: return "messages";
        case Table::ConversationsByUser: return "conversations_by_user";
        case Table::Conversations: return "conversations";
        case Table::DirectoryHeads: return "directory_heads";
    }
    return "unknown";
}

} // namespace duet
