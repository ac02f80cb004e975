#pragma once

#include "../types.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>

namespace mpt {
namespace ipc {

enum class MessageKind : uint8_t {
    Bar = 0,          // producer -> consumer: one minute bar for a symbol
    NewSymbol = 1,    // scanner -> producer: start tracking a symbol
    EndOfSession = 2, // producer -> consumer: no more data this session
};

inline const char* message_kind_to_string(MessageKind kind) {
    switch (kind) {
    case MessageKind::Bar:
        return "bar";
    case MessageKind::NewSymbol:
        return "new_symbol";
    case MessageKind::EndOfSession:
        return "end_of_session";
    }
    return "unknown";
}

/**
 * QueueMessage - fixed-size record carried by every inter-process queue
 *
 * Trivially copyable so it can live in shared memory.
 */
struct alignas(64) QueueMessage {
    MessageKind kind = MessageKind::Bar;
    char symbol[MAX_SYMBOL_LEN + 1] = {};
    Timestamp timestamp = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    uint64_t volume = 0;

    void set_symbol(const std::string& s) {
        size_t len = s.size();
        if (len > MAX_SYMBOL_LEN)
            len = MAX_SYMBOL_LEN;
        std::memcpy(symbol, s.data(), len);
        symbol[len] = '\0';
    }

    std::string symbol_str() const { return std::string(symbol, strnlen(symbol, sizeof(symbol))); }

    Bar bar() const { return Bar{timestamp, open, high, low, close, volume}; }

    static QueueMessage make_bar(const std::string& sym, const Bar& b) {
        QueueMessage m;
        m.kind = MessageKind::Bar;
        m.set_symbol(sym);
        m.timestamp = b.timestamp;
        m.open = b.open;
        m.high = b.high;
        m.low = b.low;
        m.close = b.close;
        m.volume = b.volume;
        return m;
    }

    static QueueMessage make_new_symbol(const std::string& sym, Timestamp ts) {
        QueueMessage m;
        m.kind = MessageKind::NewSymbol;
        m.set_symbol(sym);
        m.timestamp = ts;
        return m;
    }

    static QueueMessage make_end_of_session(Timestamp ts) {
        QueueMessage m;
        m.kind = MessageKind::EndOfSession;
        m.timestamp = ts;
        return m;
    }
};

static_assert(std::is_trivially_copyable<QueueMessage>::value, "QueueMessage must be trivially copyable");
static_assert(sizeof(QueueMessage) == 128, "QueueMessage should be two cache lines");

} // namespace ipc
} // namespace mpt
