#pragma once

#include "fragmenter.hpp"
#include "protocol/mesh.hpp"
#include "reassembler.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>

namespace networking {

constexpr unsigned short DEFAULT_PORT = 51234;
constexpr const char* DEFAULT_DESTINATION = "192.168.0.10";

struct Destination {
    std::string ip;
    unsigned short port = DEFAULT_PORT;
};

struct SenderConfig {
    std::string ip = DEFAULT_DESTINATION;
    unsigned short port = DEFAULT_PORT;
    size_t chunk_size = protocol::DEFAULT_CHUNK_SIZE;
};

struct ReceiverConfig {
    std::string bind_address = "0.0.0.0";
    unsigned short port = DEFAULT_PORT; // 0 picks an ephemeral port
    std::chrono::milliseconds timeout = reassembly::DEFAULT_TIMEOUT;
    std::chrono::milliseconds poll_interval{20};
};

// Progress callback: fragments_sent, fragments_total, bytes_sent
using ProgressCallback = std::function<void(uint16_t, uint16_t, uint64_t)>;
using StatusCallback = std::function<void(const std::string&)>;

struct SenderCallbacks {
    StatusCallback on_status;
    ProgressCallback on_progress;
    std::function<void(uint64_t bytes_sent)> on_complete;
    std::function<void(const std::string&)> on_error;
};

struct ReceiverCallbacks {
    std::function<void(const std::string& sender, const protocol::MeshMessage&)> on_mesh;
    StatusCallback on_status;
    std::function<void(const std::string&)> on_error;
};

// "1.5KB"
std::string format_size(uint64_t bytes);

// Throws std::invalid_argument for an empty ip, port 0, or a chunk size that
// cannot fit one UDP datagram together with the header.
void validate(const SenderConfig& config);

// Sends every remaining fragment as one datagram, in index order, with no
// pacing and no acknowledgement. The first socket failure aborts the loop and
// is thrown as protocol::TransportError. Stops early when cancel_flag is set.
// Returns the number of payload bytes sent.
uint64_t transmit(fragmenter::Fragmenter& fragments, const Destination& destination,
                  const std::atomic<bool>* cancel_flag = nullptr,
                  const ProgressCallback& progress = nullptr);

// Serialize with the current time, fragment and transmit. Returns the payload size.
uint64_t send_mesh(const protocol::Mesh& mesh, const SenderConfig& config);

// Runs a transmit on a worker thread so the caller (a UI thread) never blocks
// on the socket. Serialization and fragmentation happen in start(), on the
// calling thread, so those errors are thrown before any datagram leaves.
class TransmitTask {
public:
    ~TransmitTask();

    // Returns false if a transmit is still in progress
    bool start(const protocol::Mesh& mesh, SenderConfig config, SenderCallbacks callbacks);
    void cancel();
    void join();
    bool is_running() const { return running_; }

private:
    std::atomic<bool> running_{false};
    std::atomic<bool> cancel_{false};
    std::thread thread_;
};

// Receive loop on one UDP socket. Datagrams are processed one at a time in
// arrival order and routed to a reassembler per sender address.
class MeshReceiver {
public:
    ~MeshReceiver();

    // Binds synchronously (throws protocol::TransportError on failure), then
    // receives on a background thread until stop().
    void start(ReceiverConfig config, ReceiverCallbacks callbacks);
    void stop();
    bool is_running() const { return running_; }

    // Bound port, useful when the config asked for port 0
    unsigned short port() const { return port_; }

    reassembly::ReassemblyStats stats() const;

private:
    void run(ReceiverConfig config, ReceiverCallbacks callbacks);
    void receive_loop(const ReceiverConfig& config, const ReceiverCallbacks& callbacks);

    std::atomic<bool> running_{false};
    std::atomic<unsigned short> port_{0};
    std::thread thread_;
    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::ip::udp::socket> socket_;
    std::unique_ptr<reassembly::SessionTable> sessions_;
    mutable std::mutex sessions_mutex_;
};

} // namespace networking
