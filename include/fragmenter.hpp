#pragma once

#include "protocol/fragment.hpp"
#include "protocol/mesh.hpp"
#include <cstddef>
#include <cstdint>
#include <utility>

namespace fragmenter {

// ceil(payload_size / chunk_size). Throws std::invalid_argument when chunk_size is 0
// and protocol::PayloadTooLargeError when the count does not fit the 16-bit total field.
uint16_t fragment_count(size_t payload_size, size_t chunk_size);

// Single-pass producer of the fragments of one payload, in index order.
// The total is fixed at construction, so every fragment (the first included)
// carries the final count. Not restartable: once next() has handed out the last
// fragment the producer is exhausted.
class Fragmenter {
public:
    Fragmenter(protocol::Payload payload, size_t chunk_size = protocol::DEFAULT_CHUNK_SIZE);

    uint16_t total() const { return total_; }
    size_t chunk_size() const { return chunk_size_; }
    size_t payload_size() const { return payload_.size(); }

    bool has_next() const { return next_index_ < total_; }

    // Throws std::out_of_range when exhausted
    protocol::Fragment next();

private:
    protocol::Payload payload_;
    size_t chunk_size_;
    uint16_t total_;
    size_t next_index_ = 0;
};

inline Fragmenter fragment(protocol::Payload payload, size_t chunk_size = protocol::DEFAULT_CHUNK_SIZE) {
    return Fragmenter(std::move(payload), chunk_size);
}

} // namespace fragmenter
