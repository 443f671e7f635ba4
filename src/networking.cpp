#include "networking.hpp"
#include "protocol/errors.hpp"
#include "protocol/fragment.hpp"
#include "serializer.hpp"
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <vector>

using boost::asio::ip::udp;

namespace networking {

namespace {

std::string endpoint_label(const udp::endpoint& endpoint) {
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

udp::endpoint resolve(const std::string& ip, unsigned short port) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(ip, ec);
    if (ec) {
        throw protocol::TransportError("Invalid address '" + ip + "': " + ec.message());
    }
    return udp::endpoint(address, port);
}

} // namespace

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

void validate(const SenderConfig& config) {
    if (config.ip.empty()) {
        throw std::invalid_argument("Destination address is empty");
    }
    if (config.port == 0) {
        throw std::invalid_argument("Destination port must be non-zero");
    }
    const size_t max_chunk = protocol::MAX_DATAGRAM_SIZE - protocol::HEADER_SIZE;
    if (config.chunk_size == 0 || config.chunk_size > max_chunk) {
        throw std::invalid_argument("Chunk size " + std::to_string(config.chunk_size) +
                                    " outside [1, " + std::to_string(max_chunk) + "]");
    }
}

uint64_t transmit(fragmenter::Fragmenter& fragments, const Destination& destination,
                  const std::atomic<bool>* cancel_flag, const ProgressCallback& progress) {
    udp::endpoint endpoint = resolve(destination.ip, destination.port);

    boost::asio::io_context io_context;
    udp::socket socket(io_context);
    boost::system::error_code ec;
    socket.open(endpoint.protocol(), ec);
    if (ec) {
        throw protocol::TransportError("Failed to open UDP socket: " + ec.message());
    }

    uint64_t bytes_sent = 0;
    while (fragments.has_next()) {
        if (cancel_flag && cancel_flag->load()) {
            break;
        }

        protocol::Fragment fragment = fragments.next();
        std::vector<uint8_t> datagram = protocol::encode_fragment(fragment);
        socket.send_to(boost::asio::buffer(datagram), endpoint, 0, ec);
        if (ec) {
            throw protocol::TransportError("Failed to send fragment " + std::to_string(fragment.header.index) +
                                           "/" + std::to_string(fragment.header.total) + " to " +
                                           endpoint_label(endpoint) + ": " + ec.message());
        }
        bytes_sent += fragment.body.size();

        if (progress) {
            progress(static_cast<uint16_t>(fragment.header.index + 1), fragment.header.total, bytes_sent);
        }
    }
    return bytes_sent;
}

uint64_t send_mesh(const protocol::Mesh& mesh, const SenderConfig& config) {
    validate(config);
    fragmenter::Fragmenter fragments(serializer::serialize(mesh, serializer::now_seconds()), config.chunk_size);
    return transmit(fragments, Destination{config.ip, config.port});
}

// ─── TransmitTask ───────────────────────────────────────────────────────────

TransmitTask::~TransmitTask() {
    cancel();
    join();
}

bool TransmitTask::start(const protocol::Mesh& mesh, SenderConfig config, SenderCallbacks callbacks) {
    if (running_) return false;
    join();

    validate(config);
    fragmenter::Fragmenter fragments(serializer::serialize(mesh, serializer::now_seconds()), config.chunk_size);

    cancel_ = false;
    running_ = true;
    thread_ = std::thread([this, fragments = std::move(fragments), config, callbacks]() mutable {
        try {
            const uint16_t total = fragments.total();
            const uint64_t payload_size = fragments.payload_size();
            if (callbacks.on_status) {
                callbacks.on_status("Sending " + format_size(payload_size) + " in " + std::to_string(total) +
                                    " fragments to " + config.ip + ":" + std::to_string(config.port));
            }

            uint64_t sent = transmit(fragments, Destination{config.ip, config.port}, &cancel_, callbacks.on_progress);

            if (sent < payload_size) {
                if (callbacks.on_status) {
                    callbacks.on_status("Transmit cancelled after " + format_size(sent) + ".");
                }
            } else if (callbacks.on_complete) {
                callbacks.on_complete(sent);
            }
        } catch (std::exception& e) {
            if (callbacks.on_error) {
                callbacks.on_error(std::string("Transmit error: ") + e.what());
            } else {
                std::cerr << "TransmitTask Exception: " << e.what() << "\n";
            }
        }
        running_ = false;
    });
    return true;
}

void TransmitTask::cancel() {
    cancel_ = true;
}

void TransmitTask::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

// ─── MeshReceiver ───────────────────────────────────────────────────────────

MeshReceiver::~MeshReceiver() {
    stop();
}

void MeshReceiver::start(ReceiverConfig config, ReceiverCallbacks callbacks) {
    if (running_) return;
    // The loop may have ended on its own; reap it and release the old socket
    stop();

    udp::endpoint local = resolve(config.bind_address, config.port);
    auto socket = std::make_unique<udp::socket>(io_context_);
    boost::system::error_code ec;
    socket->open(local.protocol(), ec);
    if (!ec) socket->set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (!ec) socket->bind(local, ec);
    // Non-blocking so the loop can check running_ between datagrams
    if (!ec) socket->non_blocking(true, ec);
    udp::endpoint bound;
    if (!ec) bound = socket->local_endpoint(ec);
    if (ec) {
        throw protocol::TransportError("Failed to bind " + endpoint_label(local) + ": " + ec.message());
    }

    port_ = bound.port();
    socket_ = std::move(socket);
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_ = std::make_unique<reassembly::SessionTable>(config.timeout);
    }

    running_ = true;
    thread_ = std::thread([this, config, callbacks]() { run(config, callbacks); });
}

void MeshReceiver::run(ReceiverConfig config, ReceiverCallbacks callbacks) {
    try {
        if (callbacks.on_status) {
            callbacks.on_status("Listening on " + config.bind_address + ":" + std::to_string(port_.load()));
        }
        receive_loop(config, callbacks);
    } catch (std::exception& e) {
        std::cerr << "MeshReceiver Exception: " << e.what() << "\n";
        if (callbacks.on_error) callbacks.on_error(std::string("Receiver stopped: ") + e.what());
    }
    running_ = false;
}

void MeshReceiver::receive_loop(const ReceiverConfig& config, const ReceiverCallbacks& callbacks) {
    std::vector<uint8_t> buffer(protocol::MAX_DATAGRAM_SIZE + 1);
    while (running_) {
        udp::endpoint sender_endpoint;
        boost::system::error_code ec;
        size_t len = socket_->receive_from(boost::asio::buffer(buffer), sender_endpoint, 0, ec);

        if (ec == boost::asio::error::would_block) {
            size_t dropped;
            {
                std::lock_guard<std::mutex> lock(sessions_mutex_);
                dropped = sessions_->sweep();
            }
            if (dropped > 0 && callbacks.on_status) {
                callbacks.on_status("Dropped " + std::to_string(dropped) + " incomplete message(s) after timeout");
            }
            std::this_thread::sleep_for(config.poll_interval);
            continue;
        }

        if (ec) {
            if (callbacks.on_error) {
                callbacks.on_error("Receive failed: " + ec.message());
            } else {
                std::cerr << "MeshReceiver: receive failed: " << ec.message() << "\n";
            }
            std::this_thread::sleep_for(config.poll_interval);
            continue;
        }

        std::string sender = endpoint_label(sender_endpoint);
        std::optional<protocol::MeshMessage> message;
        try {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            message = sessions_->accept(sender, buffer.data(), len);
        } catch (const protocol::MalformedPayloadError& e) {
            if (callbacks.on_error) {
                callbacks.on_error("Malformed payload from " + sender + ": " + e.what());
            } else {
                std::cerr << "MeshReceiver: malformed payload from " << sender << ": " << e.what() << "\n";
            }
            continue;
        }

        if (message && callbacks.on_mesh) {
            try {
                callbacks.on_mesh(sender, *message);
            } catch (std::exception& e) {
                std::cerr << "MeshReceiver Exception (on_mesh): " << e.what() << "\n";
            }
        }
    }
}

void MeshReceiver::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (socket_) {
        boost::system::error_code ec;
        socket_->close(ec);
        if (ec) {
            std::cerr << "MeshReceiver: failed to close socket: " << ec.message() << "\n";
        }
        socket_.reset();
    }
}

reassembly::ReassemblyStats MeshReceiver::stats() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_ ? sessions_->stats() : reassembly::ReassemblyStats{};
}

} // namespace networking
