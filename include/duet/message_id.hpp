#pragma once

#include "duet/conversation_types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace duet {

TimestampMs system_clock_ms();

/**
 * UUIDv7 generator for message ids.
 *
 * Layout: 48-bit ms timestamp | version 7 | 12-bit sequence | variant | 62 random bits.
 * The canonical string form sorts lexicographically in (timestamp, sequence)
 * order. Server-assigned timestamps never go backwards for one generator, and
 * a sequence overflow within one millisecond advances the timestamp.
 */
class MessageIdGenerator {
public:
    using Clock = std::function<TimestampMs()>;

    struct Stamp {
        TimestampMs created_at = 0;
        std::string id;
    };

    explicit MessageIdGenerator(Clock clock = system_clock_ms);

    // Client timestamps are taken as-is and never move the server clock state.
    // Ids sharing a timestamp sort in call order either way.
    Stamp next(std::optional<TimestampMs> client_timestamp = std::nullopt);

    static std::string format(TimestampMs ts, uint16_t sequence, uint64_t random_bits);

private:
    Clock clock_;
    std::mutex mutex_;
    TimestampMs last_ms_ = 0;
    uint16_t sequence_ = 0;
    uint64_t client_counter_ = 0;
    std::mt19937_64 gen_;
};

} // namespace duet
