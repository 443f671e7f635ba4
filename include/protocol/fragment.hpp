#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace protocol {

// "ARC" followed by the protocol version
constexpr std::array<uint8_t, 4> FRAGMENT_MAGIC = {'A', 'R', 'C', 0x01};
constexpr size_t HEADER_SIZE = 8;
constexpr size_t MAX_FRAGMENTS = 65535;
constexpr size_t DEFAULT_CHUNK_SIZE = 60000;
// Largest UDP payload an IPv4 datagram can carry
constexpr size_t MAX_DATAGRAM_SIZE = 65507;

// Fixed 8-byte header: magic(4) | index(2) | total(2), big-endian
struct FragmentHeader {
    uint16_t index;
    uint16_t total;
};

struct Fragment {
    FragmentHeader header;
    std::vector<uint8_t> body;
};

std::array<uint8_t, HEADER_SIZE> serialize_header(const FragmentHeader& header);

// Returns nullopt for datagrams too short to carry a header or with the wrong magic
std::optional<FragmentHeader> deserialize_header(const uint8_t* data, size_t size);

std::vector<uint8_t> encode_fragment(const Fragment& fragment);

// Header plus body. Callers still have to check index < total.
std::optional<Fragment> decode_fragment(const uint8_t* data, size_t size);

} // namespace protocol
