#include "duet/message_id.hpp"
#include <array>
#include <chrono>

namespace duet {

namespace {

constexpr uint16_t MAX_SEQUENCE = 0x0FFF;

// Client-stamped ids: 48-bit counter split over rand_a (12 bits) and the top of
// rand_b (36 bits), followed by 26 random bits
constexpr int CLIENT_COUNTER_LOW_BITS = 36;
constexpr int CLIENT_RANDOM_BITS = 26;
constexpr uint64_t CLIENT_COUNTER_MASK = (uint64_t(1) << 48) - 1;

} // anonymous namespace

TimestampMs system_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

MessageIdGenerator::MessageIdGenerator(Clock clock)
    : clock_(std::move(clock)), gen_(std::random_device{}()) {
}

MessageIdGenerator::Stamp MessageIdGenerator::next(std::optional<TimestampMs> client_timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);

    Stamp stamp;
    uint16_t sequence = 0;

    if (client_timestamp) {
        // Server clock state is left alone. The tie-break comes from a counter shared by
        // every client-stamped id, so equal client timestamps sort in call order.
        stamp.created_at = *client_timestamp;
        uint64_t counter = client_counter_++ & CLIENT_COUNTER_MASK;
        uint16_t high = static_cast<uint16_t>(counter >> CLIENT_COUNTER_LOW_BITS);
        uint64_t low = counter & ((uint64_t(1) << CLIENT_COUNTER_LOW_BITS) - 1);
        uint64_t tail = (low << CLIENT_RANDOM_BITS) | (gen_() & ((uint64_t(1) << CLIENT_RANDOM_BITS) - 1));
        stamp.id = format(stamp.created_at, high, tail);
        return stamp;
    }

    TimestampMs now = clock_();
    if (now <= last_ms_) {
        if (sequence_ >= MAX_SEQUENCE) {
            ++last_ms_;
            sequence_ = 0;
        } else {
            ++sequence_;
        }
    } else {
        last_ms_ = now;
        sequence_ = 0;
    }
    stamp.created_at = last_ms_;
    sequence = sequence_;

    stamp.id = format(stamp.created_at, sequence, gen_());
    return stamp;
}

std::string MessageIdGenerator::format(TimestampMs ts, uint16_t sequence, uint64_t random_bits) {
    uint64_t ms = static_cast<uint64_t>(ts);
    std::array<uint8_t, 16> bytes;

    // 48-bit unix_ts_ms (big-endian)
    bytes[0] = (ms >> 40) & 0xFF;
    bytes[1] = (ms >> 32) & 0xFF;
    bytes[2] = (ms >> 24) & 0xFF;
    bytes[3] = (ms >> 16) & 0xFF;
    bytes[4] = (ms >> 8) & 0xFF;
    bytes[5] = ms & 0xFF;

    // 4-bit version (0111) and 12-bit sequence
    bytes[6] = 0x70 | ((sequence >> 8) & 0x0F);
    bytes[7] = sequence & 0xFF;

    // 2-bit variant (10) and 62 random bits
    bytes[8] = 0x80 | ((random_bits >> 56) & 0x3F);
    for (int i = 9; i < 16; ++i) {
        bytes[i] = (random_bits >> (8 * (15 - i))) & 0xFF;
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += hex[bytes[i] >> 4];
        out += hex[bytes[i] & 0x0F];
    }
    return out;
}

} // namespace duet
