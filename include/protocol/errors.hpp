#pragma once

#include <stdexcept>
#include <string>

namespace protocol {

// Base for every error raised by the mesh transport
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Mesh data that cannot be encoded (non-finite floats)
class SerializationError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Reassembled bytes that do not decode to a valid mesh
class MalformedPayloadError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Payload needs more fragments than the 16-bit total field can address
class PayloadTooLargeError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Socket failure while sending
class TransportError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

} // namespace protocol
