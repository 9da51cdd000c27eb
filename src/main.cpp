#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <signal.h>
#include <unistd.h>
#include "listening_reactor.hpp"

// Global state for the signal handler
static BasicReactorStatus* g_status = nullptr;
static int g_wakeup_fd = -1;

void signalHandler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_status != nullptr && g_wakeup_fd != -1) {
        g_status->set(ReactorStatus::SHUTTING_DOWN);
        // Write to eventfd to wake the selector (async-signal-safe)
        uint64_t val = 1;
        ssize_t written = write(g_wakeup_fd, &val, sizeof(val));
        (void)written;
    }
}

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--select-interval MS] [--reuse-addr] [--rcvbuf BYTES] [--backlog N] ADDRESS..." << std::endl
              << "  ADDRESS is host:port, [v6]:port or *:port; port 0 picks an ephemeral port" << std::endl;
}

static int parseInt(const std::string& flag, const char* value) {
    if (value == nullptr) {
        throw std::invalid_argument(flag + " requires a value");
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
}

static void listenAndReport(ListeningReactor& reactor, const SocketAddress& address) {
    reactor.listen(address, [address](const ListenCompletion& result) {
        try {
            auto endpoint = result.get();
            std::cout << "Listening on " << endpoint->getAddress().toString() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Failed to listen on " << address.toString() << ": " << e.what() << std::endl;
        }
    });
}

int main(int argc, char** argv) {
    try {
        ReactorConfig config;
        std::vector<SocketAddress> addresses;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--select-interval") {
                config.selectInterval = std::chrono::milliseconds(parseInt(arg, i + 1 < argc ? argv[++i] : nullptr));
            } else if (arg == "--reuse-addr") {
                config.soReuseAddress = true;
            } else if (arg == "--rcvbuf") {
                config.rcvBufSize = parseInt(arg, i + 1 < argc ? argv[++i] : nullptr);
            } else if (arg == "--backlog") {
                config.backlogSize = parseInt(arg, i + 1 < argc ? argv[++i] : nullptr);
            } else if (arg == "-h" || arg == "--help") {
                usage(argv[0]);
                return 0;
            } else {
                addresses.push_back(SocketAddress::parse(arg));
            }
        }
        if (addresses.empty()) {
            addresses.push_back(SocketAddress::any(8080));
        }

        BasicReactorStatus status(ReactorStatus::INACTIVE);
        ListeningReactor reactor(config, [](Socket connection) {
            std::cout << "Accepted connection from " << connection.getPeerAddress().toString()
                      << ", fd: " << connection.getFd() << std::endl;
        }, status);

        // No SA_RESTART: a signal must interrupt the blocking read on stdin
        g_status = &status;
        g_wakeup_fd = reactor.getWakeupFd();
        struct sigaction sa{};
        sa.sa_handler = signalHandler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);

        status.set(ReactorStatus::ACTIVE);
        for (const auto& address : addresses) {
            listenAndReport(reactor, address);
        }

        std::thread worker([&reactor]() {
            try {
                reactor.execute();
            } catch (const std::exception& e) {
                std::cerr << "Reactor loop failed: " << e.what() << std::endl;
            }
        });

        std::cout << "Commands: list | pause | resume | listen ADDRESS | quit" << std::endl;
        std::string line;
        while (status.getStatus() == ReactorStatus::ACTIVE && std::getline(std::cin, line)) {
            std::istringstream in(line);
            std::string cmd;
            in >> cmd;
            try {
                if (cmd == "list") {
                    std::cout << reactor.getEndpointCount() << " registered" << std::endl;
                    for (const auto& endpoint : reactor.getEndpoints()) {
                        std::cout << "  " << endpoint->getAddress().toString() << std::endl;
                    }
                } else if (cmd == "pause") {
                    reactor.pause();
                    std::cout << "Paused" << std::endl;
                } else if (cmd == "resume") {
                    reactor.resume();
                    std::cout << "Resumed" << std::endl;
                } else if (cmd == "listen") {
                    std::string text;
                    in >> text;
                    listenAndReport(reactor, SocketAddress::parse(text));
                } else if (cmd == "quit") {
                    break;
                } else if (!cmd.empty()) {
                    std::cerr << "Unknown command: " << cmd << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << std::endl;
            }
        }

        std::cout << "\nShutdown requested. Stopping listener..." << std::endl;
        status.set(ReactorStatus::SHUTTING_DOWN);
        reactor.wakeup();
        worker.join();
        g_status = nullptr;
        reactor.terminate();
        status.set(ReactorStatus::SHUT_DOWN);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
