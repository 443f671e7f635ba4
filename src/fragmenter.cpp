#include "fragmenter.hpp"
#include "protocol/errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace fragmenter {

uint16_t fragment_count(size_t payload_size, size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be at least 1 byte");
    }
    size_t parts = (payload_size + chunk_size - 1) / chunk_size;
    if (parts > protocol::MAX_FRAGMENTS) {
        throw protocol::PayloadTooLargeError(
            "payload of " + std::to_string(payload_size) + " bytes needs " + std::to_string(parts) +
            " fragments at chunk size " + std::to_string(chunk_size) + " (limit " +
            std::to_string(protocol::MAX_FRAGMENTS) + ")");
    }
    return static_cast<uint16_t>(parts);
}

Fragmenter::Fragmenter(protocol::Payload payload, size_t chunk_size)
    : payload_(std::move(payload)),
      chunk_size_(chunk_size),
      total_(fragment_count(payload_.size(), chunk_size)) {}

protocol::Fragment Fragmenter::next() {
    if (!has_next()) {
        throw std::out_of_range("fragmenter exhausted after " + std::to_string(total_) + " fragments");
    }

    size_t offset = next_index_ * chunk_size_;
    size_t length = std::min(chunk_size_, payload_.size() - offset);

    protocol::Fragment fragment;
    fragment.header.index = static_cast<uint16_t>(next_index_);
    fragment.header.total = total_;
    fragment.body.assign(payload_.begin() + offset, payload_.begin() + offset + length);

    ++next_index_;
    return fragment;
}

} // namespace fragmenter
