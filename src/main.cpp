#include <iostream>
#include <string>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <csignal>
#include <filesystem>
#include <vector>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "networking.hpp"
#include "pairing.hpp"
#include "storage.hpp"

namespace fs = std::filesystem;

namespace {

void print_usage() {
    std::cout << "Usage:\n"
              << "  lanbridge serve [--config FILE] [--port N] [--dir DIR]\n"
              << "  lanbridge send [--binary] HOST PORT FILE\n"
              << "  lanbridge decode PAYLOAD\n";
}

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

int run_serve(int argc, char* argv[]) {
    config::ServerConfig cfg;
    std::string config_path;
    std::optional<uint16_t> port;
    std::optional<std::string> dir;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = static_cast<uint16_t>(std::stoul(argv[++i]));
        } else if (arg == "--dir" && i + 1 < argc) {
            dir = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 2;
        }
    }

    if (!config_path.empty()) cfg = config::load_config(config_path);
    if (port) cfg.port = *port;
    if (dir) cfg.storage_dir = *dir;
    config::validate(cfg);

    auto storage = std::make_shared<storage::DirectoryStorage>(cfg.storage_dir, cfg.effective_temp_dir());
    std::cout << "Saving to: " << fs::absolute(cfg.storage_dir) << "\n";

    networking::ServerCallbacks callbacks;
    callbacks.on_state = [](const networking::LanTransferState& state) {
        if (state.file_transfer && state.status == networking::ServerStatus::RECEIVING_FILE) {
            const auto& t = *state.file_transfer;
            std::cout << "\r  " << t.file_name << "  " << format_size(t.bytes_received) << " / "
                      << format_size(t.file_size) << "  (" << t.percentage << "%)   " << std::flush;
            return;
        }
        std::cout << "\n[" << networking::to_string(state.status) << "] "
                  << nlohmann::json(state).dump() << "\n";
    };

    networking::TransferServer server(cfg, storage, callbacks);
    server.start();

    auto state = server.state();
    if (!state.port) {
        std::cerr << "Server failed to start: " << state.last_error.value_or("unknown error") << "\n";
        return 1;
    }

    auto info = networking::make_connection_info(*state.port);
    std::cout << "Listening on port " << *state.port << "\n";
    std::cout << "Advertise as: " << cli::service_banner(*state.port) << "\n";
    for (const auto& c : info.candidates) {
        std::cout << "  " << c.host << " (" << c.interface_name << ")\n";
    }
    std::cout << "┌──────────────────────────────────────────────┐\n";
    std::cout << "  Pairing payload: " << pairing::encode_payload(info) << "\n";
    std::cout << "└──────────────────────────────────────────────┘\n";

    boost::asio::io_context io_context;
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, int signal_number) {
        std::cout << "\nReceived signal " << signal_number << ", shutting down...\n";
    });
    io_context.run();

    server.stop();
    return 0;
}

int run_send(int argc, char* argv[]) {
    auto args = cli::parse_send_args(std::vector<std::string>(argv + 2, argv + argc));
    if (!args) {
        print_usage();
        return 2;
    }

    networking::ClientCallbacks callbacks;
    callbacks.on_status = [](const std::string& text) { std::cout << text << "\n"; };
    callbacks.on_progress = [](const std::string& name, uint64_t sent, uint64_t total, double speed) {
        int percent = total > 0 ? static_cast<int>(sent * 100 / total) : 100;
        std::cout << "\r  " << name << "  " << format_size(sent) << " / " << format_size(total)
                  << "  (" << percent << "%)  " << std::fixed << std::setprecision(1)
                  << speed << " MB/s   " << std::flush;
    };

    networking::Client client("lanbridge", args->binary);
    std::string path = client.send_file(args->host, args->port, args->filepath, callbacks);
    std::cout << "\nStored by receiver at: " << path << "\n";
    return 0;
}

int run_decode(const std::string& payload) {
    auto info = pairing::decode_payload(payload);
    nlohmann::json out = {
        {"type", info.type},
        {"port", info.port},
        {"timestamp", info.timestamp}
    };
    if (info.selected_host) out["selectedHost"] = *info.selected_host;
    out["candidates"] = nlohmann::json::array();
    for (const auto& c : info.candidates) {
        out["candidates"].push_back({{"host", c.host}, {"interface", c.interface_name}, {"priority", c.priority}});
    }
    std::cout << out.dump(2) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    std::string command = argv[1];
    try {
        if (command == "serve") {
            return run_serve(argc, argv);
        } else if (command == "send") {
            return run_send(argc, argv);
        } else if (command == "decode" && argc >= 3) {
            return run_decode(argv[2]);
        }
    } catch (const errors::Error& e) {
        std::cerr << "\nError [" << errors::wire_code(e.code()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nException: " << e.what() << "\n";
        return 1;
    }

    print_usage();
    return 2;
}
