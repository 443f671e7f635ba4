#pragma once

#include "protocol/fragment.hpp"
#include "protocol/mesh.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reassembly {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{2000};

enum class ReassemblyState {
    IDLE,
    COLLECTING,
    COMPLETE,
    EXPIRED
};

const char* to_string(ReassemblyState state);

struct ReassemblyStats {
    uint64_t fragments_accepted = 0;
    uint64_t fragments_dropped = 0;   // bad magic, short header, index >= total
    uint64_t messages_completed = 0;
    uint64_t messages_expired = 0;
    uint64_t messages_replaced = 0;   // partial message abandoned on a total mismatch
    uint64_t messages_malformed = 0;  // completed payload failed to deserialize

    ReassemblyStats& operator+=(const ReassemblyStats& other);
};

// Rebuilds payloads from the fragments of ONE sender. The header carries no
// message id, so at most one message is in flight: a fragment whose total
// differs from the current message starts a new one, and a message that sees
// no fragment for longer than the timeout is dropped.
//
// Not thread-safe. Feed it from one receive loop.
class Reassembler {
public:
    explicit Reassembler(Clock::duration timeout = DEFAULT_TIMEOUT);

    // Returns the payload once the last missing fragment arrives
    std::optional<protocol::Payload> collect(const protocol::Fragment& fragment,
                                             Clock::time_point now = Clock::now());
    std::optional<protocol::Payload> collect_datagram(const uint8_t* data, size_t size,
                                                      Clock::time_point now = Clock::now());

    // collect() followed by serializer::deserialize(). A payload that does not
    // decode throws protocol::MalformedPayloadError and leaves the reassembler IDLE.
    std::optional<protocol::MeshMessage> accept(const protocol::Fragment& fragment,
                                                Clock::time_point now = Clock::now());
    std::optional<protocol::MeshMessage> accept_datagram(const uint8_t* data, size_t size,
                                                         Clock::time_point now = Clock::now());

    // Drops the in-flight message if it has been inactive for longer than the
    // timeout and goes back to IDLE. Returns true when something was dropped.
    bool expire(Clock::time_point now = Clock::now());

    ReassemblyState state() const { return state_; }
    bool collecting() const { return state_ == ReassemblyState::COLLECTING; }
    uint16_t expected_total() const { return message_.total; }
    size_t received_count() const { return message_.received; }
    Clock::duration timeout() const { return timeout_; }
    const ReassemblyStats& stats() const { return stats_; }

private:
    struct InFlightMessage {
        uint16_t total = 0;
        size_t received = 0;
        std::vector<std::optional<protocol::Payload>> slots;
        Clock::time_point started_at;
        Clock::time_point last_activity;
    };

    void begin(uint16_t total, Clock::time_point now);
    protocol::Payload assemble();
    bool timed_out(Clock::time_point now) const;
    void discard_expired();

    Clock::duration timeout_;
    ReassemblyState state_ = ReassemblyState::IDLE;
    InFlightMessage message_;
    ReassemblyStats stats_;
};

// One Reassembler per sender identity (e.g. "10.0.0.7:40211")
class SessionTable {
public:
    explicit SessionTable(Clock::duration timeout = DEFAULT_TIMEOUT);

    // Routes a raw datagram to the sender's reassembler. Datagrams without a
    // valid header never create a session. Throws protocol::MalformedPayloadError
    // like Reassembler::accept.
    std::optional<protocol::MeshMessage> accept(const std::string& sender, const uint8_t* data, size_t size,
                                                Clock::time_point now = Clock::now());

    // Expires stale messages and forgets senders with nothing in flight.
    // Returns the number of partial messages dropped.
    size_t sweep(Clock::time_point now = Clock::now());

    size_t size() const { return sessions_.size(); }
    const Reassembler* find(const std::string& sender) const;

    // Counters over live and forgotten sessions
    ReassemblyStats stats() const;

private:
    Clock::duration timeout_;
    std::map<std::string, Reassembler> sessions_;
    ReassemblyStats retired_;
};

} // namespace reassembly
