#include "reassembler.hpp"
#include "protocol/errors.hpp"
#include "serializer.hpp"

namespace reassembly {

const char* to_string(ReassemblyState state) {
    switch (state) {
        case ReassemblyState::IDLE: return "IDLE";
        case ReassemblyState::COLLECTING: return "COLLECTING";
        case ReassemblyState::COMPLETE: return "COMPLETE";
        case ReassemblyState::EXPIRED: return "EXPIRED";
    }
    return "UNKNOWN";
}

ReassemblyStats& ReassemblyStats::operator+=(const ReassemblyStats& other) {
    fragments_accepted += other.fragments_accepted;
    fragments_dropped += other.fragments_dropped;
    messages_completed += other.messages_completed;
    messages_expired += other.messages_expired;
    messages_replaced += other.messages_replaced;
    messages_malformed += other.messages_malformed;
    return *this;
}

// ─── Reassembler ────────────────────────────────────────────────────────────

Reassembler::Reassembler(Clock::duration timeout) : timeout_(timeout) {}

void Reassembler::begin(uint16_t total, Clock::time_point now) {
    message_ = InFlightMessage{};
    message_.total = total;
    message_.slots.resize(total);
    message_.started_at = now;
    message_.last_activity = now;
    state_ = ReassemblyState::COLLECTING;
}

// EXPIRED passes straight through to IDLE; only the counter records it
void Reassembler::discard_expired() {
    message_ = InFlightMessage{};
    stats_.messages_expired++;
    state_ = ReassemblyState::IDLE;
}

bool Reassembler::timed_out(Clock::time_point now) const {
    return now - message_.last_activity > timeout_;
}

protocol::Payload Reassembler::assemble() {
    size_t size = 0;
    for (const auto& slot : message_.slots) {
        size += slot->size();
    }
    protocol::Payload payload;
    payload.reserve(size);
    for (const auto& slot : message_.slots) {
        payload.insert(payload.end(), slot->begin(), slot->end());
    }
    return payload;
}

std::optional<protocol::Payload> Reassembler::collect(const protocol::Fragment& fragment, Clock::time_point now) {
    const auto& header = fragment.header;
    if (header.total == 0 || header.index >= header.total) {
        stats_.fragments_dropped++;
        return std::nullopt;
    }

    if (state_ == ReassemblyState::COLLECTING && timed_out(now)) {
        discard_expired();
    }

    if (state_ != ReassemblyState::COLLECTING) {
        begin(header.total, now);
    } else if (header.total != message_.total) {
        stats_.messages_replaced++;
        begin(header.total, now);
    }

    auto& slot = message_.slots[header.index];
    if (!slot) {
        message_.received++;
    }
    slot = fragment.body;
    message_.last_activity = now;
    stats_.fragments_accepted++;

    if (message_.received < message_.total) {
        return std::nullopt;
    }

    protocol::Payload payload = assemble();
    message_ = InFlightMessage{};
    state_ = ReassemblyState::COMPLETE;
    stats_.messages_completed++;
    return payload;
}

std::optional<protocol::Payload> Reassembler::collect_datagram(const uint8_t* data, size_t size,
                                                               Clock::time_point now) {
    auto fragment = protocol::decode_fragment(data, size);
    if (!fragment) {
        stats_.fragments_dropped++;
        return std::nullopt;
    }
    return collect(*fragment, now);
}

std::optional<protocol::MeshMessage> Reassembler::accept(const protocol::Fragment& fragment, Clock::time_point now) {
    auto payload = collect(fragment, now);
    if (!payload) {
        return std::nullopt;
    }
    try {
        return serializer::deserialize(*payload);
    } catch (const protocol::MalformedPayloadError&) {
        stats_.messages_malformed++;
        state_ = ReassemblyState::IDLE;
        throw;
    }
}

std::optional<protocol::MeshMessage> Reassembler::accept_datagram(const uint8_t* data, size_t size,
                                                                  Clock::time_point now) {
    auto fragment = protocol::decode_fragment(data, size);
    if (!fragment) {
        stats_.fragments_dropped++;
        return std::nullopt;
    }
    return accept(*fragment, now);
}

bool Reassembler::expire(Clock::time_point now) {
    if (state_ != ReassemblyState::COLLECTING || !timed_out(now)) {
        return false;
    }
    discard_expired();
    return true;
}

// ─── SessionTable ───────────────────────────────────────────────────────────

SessionTable::SessionTable(Clock::duration timeout) : timeout_(timeout) {}

std::optional<protocol::MeshMessage> SessionTable::accept(const std::string& sender, const uint8_t* data,
                                                          size_t size, Clock::time_point now) {
    auto fragment = protocol::decode_fragment(data, size);
    if (!fragment || fragment->header.total == 0 || fragment->header.index >= fragment->header.total) {
        retired_.fragments_dropped++;
        return std::nullopt;
    }

    auto it = sessions_.find(sender);
    if (it == sessions_.end()) {
        it = sessions_.emplace(sender, Reassembler(timeout_)).first;
    }
    return it->second.accept(*fragment, now);
}

size_t SessionTable::sweep(Clock::time_point now) {
    size_t dropped = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.expire(now)) {
            dropped++;
        }
        if (!it->second.collecting()) {
            retired_ += it->second.stats();
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return dropped;
}

const Reassembler* SessionTable::find(const std::string& sender) const {
    auto it = sessions_.find(sender);
    return it == sessions_.end() ? nullptr : &it->second;
}

ReassemblyStats SessionTable::stats() const {
    ReassemblyStats total = retired_;
    for (const auto& entry : sessions_) {
        total += entry.second.stats();
    }
    return total;
}

} // namespace reassembly
