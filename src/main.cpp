#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <csignal>
#include <boost/asio.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "networking.hpp"
#include "session.hpp"
#include "transfer.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  peerdrop host <file> [options]          share a file, prints a room code\n"
              << "  peerdrop join <code> [options]          receive a file from a room\n"
              << "  peerdrop connect <ip> <port> [options]  receive from a known address\n"
              << "Options:\n"
              << "  --save-dir <dir>     where received files go (default: .)\n"
              << "  --port <n>           discovery UDP port (default: 45454)\n"
              << "  --timeout-ms <n>     how long to look for the room (default: 10000)\n"
              << "  --grace-ms <n>       delay before the completion marker (default: 500)\n"
              << "  --watchdog-ms <n>    finalize after this long without a marker (default: 1000)\n";
}

void print_room_code(const std::string& token) {
    std::cout << "┌──────────────────────┐\n";
    std::cout << "│  Room code: " << token << " │\n";
    std::cout << "└──────────────────────┘\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    config::Config cfg;
    std::vector<std::string> positional;
    try {
        positional = config::parse_args(std::vector<std::string>(argv + 1, argv + argc), cfg);
    } catch (errors::ValidationError& e) {
        std::cerr << e.what() << "\n";
        print_usage();
        return 1;
    }

    const std::string mode = positional.empty() ? "" : positional[0];
    bool host = mode == "host" && positional.size() == 2;
    bool join = mode == "join" && positional.size() == 2;
    bool direct = mode == "connect" && positional.size() == 3;
    if (!host && !join && !direct) {
        print_usage();
        return 1;
    }

    if (direct) {
        try {
            int port = std::stoi(positional[2]);
            if (port <= 0 || port > 65535) throw std::out_of_range(positional[2]);
            cfg.direct_host = positional[1];
            cfg.direct_port = static_cast<unsigned short>(port);
        } catch (std::logic_error&) {
            std::cerr << "Invalid port: " << positional[2] << "\n";
            return 1;
        }
    }

    boost::asio::io_context io_context;
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    std::unique_ptr<session::SessionController> controller;
    int exit_code = 0;
    bool finished = false;

    // Runs outside of any controller callback
    auto finish = [&](int code) {
        if (finished) return;
        finished = true;
        exit_code = code;
        boost::asio::post(io_context, [&]() {
            signals.cancel();
            controller->close();
        });
    };

    session::SessionCallbacks callbacks;
    callbacks.on_status_change = [&](session::ConnectionStatus status) {
        std::cout << "\nStatus: " << session::status_text(status) << std::endl;
        if (status == session::ConnectionStatus::FAILED) {
            finish(1);
        } else if (status == session::ConnectionStatus::DISCONNECTED) {
            bool done = controller->transfer_state().phase == transfer::Phase::COMPLETED;
            finish(done ? 0 : 1);
        }
    };
    callbacks.on_transfer = [&](const transfer::TransferState& state) {
        if (state.phase == transfer::Phase::IDLE) return;
        std::cout << "\r" << state.progress_percent << "% | " << transfer::phase_text(state) << "    " << std::flush;
        if (state.phase == transfer::Phase::COMPLETED) {
            std::cout << "\n";
            // The receiver keeps the channel until the sender hangs up
            if (host) finish(0);
        } else if (state.phase == transfer::Phase::FAILED) {
            std::cout << "\n";
            finish(1);
        }
    };
    callbacks.on_notice = [](const std::string& text) {
        std::cout << "\n" << text << std::endl;
    };
    callbacks.on_error = [](const std::runtime_error& error) {
        std::cerr << "\nError: " << error.what() << std::endl;
    };

    auto adapter_factory = [&io_context, cfg]() -> std::unique_ptr<channel::Adapter> {
        return std::make_unique<networking::TcpAdapter>(io_context, cfg);
    };

    try {
        controller = std::make_unique<session::SessionController>(
            io_context, cfg, adapter_factory,
            std::make_shared<transfer::DirectorySink>(cfg.save_dir), callbacks);

        if (host) {
            auto source = std::make_shared<transfer::DiskFileSource>(io_context, positional[1]);
            std::cout << "Sharing " << source->metadata().name << " ("
                      << transfer::format_size(source->metadata().size) << ")\n";
            print_room_code(controller->create_session());
            controller->select_file(source);
        } else if (join) {
            controller->join_session(positional[1]);
        } else {
            controller->join_session(cfg.direct_host + ":" + std::to_string(cfg.direct_port));
        }
    } catch (std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        std::cout << "\nInterrupted.\n";
        finish(130);
    });

    io_context.run();
    controller.reset();
    return exit_code;
}
