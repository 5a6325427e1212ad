#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>
#include "cache_node.hpp"
#include "config.hpp"

// Global flag for graceful shutdown
std::atomic<bool> running{true};

void handleSignal(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    NodeConfig config;
    switch (parseNodeConfig(argc, argv, config, std::cerr)) {
        case ParseResult::HELP:
            printUsage(argv[0], std::cout);
            return 0;
        case ParseResult::ERROR:
            printUsage(argv[0], std::cerr);
            return 1;
        case ParseResult::OK:
            break;
    }

    std::cout << "====================================\n";
    std::cout << "      MiniCache Node Starting       \n";
    std::cout << "====================================\n";

    std::unique_ptr<CacheNode> node;
    try {
        node = std::make_unique<CacheNode>(config);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Failed to initialize node: " << e.what() << "\n";
        return 1;
    }

    if (!node->start()) {
        return 1;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::thread waiter([&node]() { node->wait(); });

    while (running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[INFO] Shutdown signal received\n";
    node->stop();
    waiter.join();

    std::cout << "[INFO] Cache node shutdown complete\n";
    return 0;
}
