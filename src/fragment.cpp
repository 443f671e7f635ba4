#include "protocol/fragment.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cstring>

namespace protocol {

std::array<uint8_t, HEADER_SIZE> serialize_header(const FragmentHeader& header) {
    std::array<uint8_t, HEADER_SIZE> buffer;
    uint16_t index = htons(header.index);
    uint16_t total = htons(header.total);

    std::memcpy(buffer.data(), FRAGMENT_MAGIC.data(), FRAGMENT_MAGIC.size());
    std::memcpy(buffer.data() + 4, &index, 2);
    std::memcpy(buffer.data() + 6, &total, 2);

    return buffer;
}

std::optional<FragmentHeader> deserialize_header(const uint8_t* data, size_t size) {
    if (data == nullptr || size < HEADER_SIZE) {
        return std::nullopt;
    }
    if (!std::equal(FRAGMENT_MAGIC.begin(), FRAGMENT_MAGIC.end(), data)) {
        return std::nullopt;
    }

    uint16_t index, total;
    std::memcpy(&index, data + 4, 2);
    std::memcpy(&total, data + 6, 2);

    FragmentHeader header;
    header.index = ntohs(index);
    header.total = ntohs(total);
    return header;
}

std::vector<uint8_t> encode_fragment(const Fragment& fragment) {
    auto header = serialize_header(fragment.header);
    std::vector<uint8_t> datagram;
    datagram.reserve(HEADER_SIZE + fragment.body.size());
    datagram.insert(datagram.end(), header.begin(), header.end());
    datagram.insert(datagram.end(), fragment.body.begin(), fragment.body.end());
    return datagram;
}

std::optional<Fragment> decode_fragment(const uint8_t* data, size_t size) {
    auto header = deserialize_header(data, size);
    if (!header) {
        return std::nullopt;
    }
    Fragment fragment;
    fragment.header = *header;
    fragment.body.assign(data + HEADER_SIZE, data + size);
    return fragment;
}

} // namespace protocol
