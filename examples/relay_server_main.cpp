/**
 * @file relay_server_main.cpp
 * @brief Standalone envelope relay for RelayTransport clients
 *
 * Usage: retrochat-relay [port] [--public]
 */

#include "retrochat/transport/relay_server.hpp"
#include "retrochat/crypto/sodium_interop.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <chrono>

using namespace retrochat::vault;

namespace {
volatile std::sig_atomic_t g_stop = 0;

void OnSignal(int) {
    g_stop = 1;
}
}

int main(int argc, char** argv) {
    uint16_t port = 7400;
    bool loopback_only = true;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--public") {
            loopback_only = false;
        } else {
            const long value = std::strtol(arg.c_str(), nullptr, 10);
            if (value <= 0 || value > 65535) {
                std::cerr << "Invalid port: " << arg << std::endl;
                return 2;
            }
            port = static_cast<uint16_t>(value);
        }
    }

    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }

    transport::RelayServer server;
    auto started = server.Start(port, loopback_only);
    if (started.IsErr()) {
        std::cerr << "Failed to start relay: " << started.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "Relay listening on port " << started.Unwrap()
              << (loopback_only ? " (loopback)" : "") << std::endl;

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server.Stop();
    std::cout << "Relay stopped" << std::endl;
    return 0;
}
