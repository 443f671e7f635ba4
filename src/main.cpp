#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include "networking.hpp"
#include "protocol/mesh.hpp"
#include "serializer.hpp"

namespace {

std::atomic<bool> interrupted{false};

void on_signal(int) {
    interrupted = true;
}

void print_usage() {
    std::cout << "Usage:\n"
              << "  arcstream listen [port] [timeout_ms]\n"
              << "  arcstream send <ip> [port] [chunk_size] [payload.json]\n"
              << "  arcstream demo [chunk_size]\n";
}

protocol::Mesh load_mesh(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open mesh file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return serializer::deserialize(contents.str()).mesh;
}

void print_stats(const reassembly::ReassemblyStats& stats) {
    std::cout << "Fragments accepted: " << stats.fragments_accepted
              << ", dropped: " << stats.fragments_dropped << "\n";
    std::cout << "Messages completed: " << stats.messages_completed
              << ", expired: " << stats.messages_expired
              << ", replaced: " << stats.messages_replaced
              << ", malformed: " << stats.messages_malformed << "\n";
}

int run_listen(unsigned short port, std::chrono::milliseconds timeout) {
    networking::ReceiverConfig config;
    config.port = port;
    config.timeout = timeout;

    networking::ReceiverCallbacks callbacks;
    callbacks.on_status = [](const std::string& status) { std::cout << status << "\n"; };
    callbacks.on_error = [](const std::string& error) { std::cerr << error << "\n"; };
    callbacks.on_mesh = [](const std::string& sender, const protocol::MeshMessage& message) {
        auto analysis = protocol::analyze(message.mesh);
        std::cout << "Mesh from " << protocol::describe(analysis, sender)
                  << " (captured at " << std::fixed << message.captured_at << ")\n";
    };

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    networking::MeshReceiver receiver;
    receiver.start(config, callbacks);
    while (!interrupted && receiver.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    receiver.stop();
    print_stats(receiver.stats());
    return 0;
}

int run_send(const networking::SenderConfig& config, const std::string& mesh_path) {
    protocol::Mesh mesh = mesh_path.empty() ? protocol::make_demo_quad() : load_mesh(mesh_path);
    std::cout << protocol::describe(protocol::analyze(mesh), mesh_path.empty() ? "demo quad" : mesh_path) << "\n";

    uint64_t sent = networking::send_mesh(mesh, config);
    std::cout << "Sent " << networking::format_size(sent) << " to " << config.ip << ":" << config.port
              << " in chunks of " << config.chunk_size << " bytes\n";
    return 0;
}

// Loopback round trip of the demo quad through a live receiver
int run_demo(size_t chunk_size) {
    std::atomic<bool> received{false};
    protocol::Mesh result;

    networking::ReceiverConfig receiver_config;
    receiver_config.bind_address = "127.0.0.1";
    receiver_config.port = 0;

    networking::ReceiverCallbacks callbacks;
    callbacks.on_error = [](const std::string& error) { std::cerr << error << "\n"; };
    callbacks.on_mesh = [&](const std::string& sender, const protocol::MeshMessage& message) {
        std::cout << "Received " << protocol::describe(protocol::analyze(message.mesh), sender) << "\n";
        result = message.mesh;
        received = true;
    };

    networking::MeshReceiver receiver;
    receiver.start(receiver_config, callbacks);

    networking::SenderConfig sender_config;
    sender_config.ip = "127.0.0.1";
    sender_config.port = receiver.port();
    sender_config.chunk_size = chunk_size;

    protocol::Mesh quad = protocol::make_demo_quad();
    uint64_t sent = networking::send_mesh(quad, sender_config);
    std::cout << "Sent " << networking::format_size(sent) << " in chunks of " << chunk_size << " bytes\n";

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!received && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    receiver.stop();
    print_stats(receiver.stats());

    if (!received || result != quad) {
        std::cerr << "Demo failed: mesh did not arrive intact\n";
        return 1;
    }
    std::cout << "Demo mesh arrived intact.\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    try {
        std::string command = argv[1];
        if (command == "listen") {
            unsigned short port = argc >= 3 ? static_cast<unsigned short>(std::stoi(argv[2])) : networking::DEFAULT_PORT;
            std::chrono::milliseconds timeout = argc >= 4 ? std::chrono::milliseconds(std::stol(argv[3]))
                                                          : reassembly::DEFAULT_TIMEOUT;
            return run_listen(port, timeout);
        } else if (command == "send" && argc >= 3) {
            networking::SenderConfig config;
            config.ip = argv[2];
            if (argc >= 4) config.port = static_cast<unsigned short>(std::stoi(argv[3]));
            if (argc >= 5) config.chunk_size = std::stoul(argv[4]);
            std::string mesh_path = argc >= 6 ? argv[5] : "";
            return run_send(config, mesh_path);
        } else if (command == "demo") {
            size_t chunk_size = argc >= 3 ? std::stoul(argv[2]) : 16;
            return run_demo(chunk_size);
        }
        print_usage();
        return 1;
    } catch (std::exception& e) {
        std::cerr << "arcstream: " << e.what() << "\n";
        return 1;
    }
}
