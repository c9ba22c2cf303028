#include "WebSocketServer.hpp"
#include "ControlConsole.hpp"
#include "protocol/KeyGenerator.hpp"
#include "protocol/KeyAgreement.hpp"
#include "cipher/Cipher.hpp"
#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Random.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <unistd.h>

using namespace keystone;

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop = true; }

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help             Show this help message and exit\n"
              << "  -c, --config PATH      Load protocol configuration (JSON); default $KEYSTONE_CONFIG\n"
              << "      --seed N           Override the configured random seed (0 = nondeterministic)\n"
              << "  -g, --generate N       Run one BB84 attempt for a key of at least N bits\n"
              << "      --establish        With --generate: retry until N bits are available\n"
              << "  -e, --encrypt TEXT     Encrypt TEXT with --key\n"
              << "  -d, --decrypt TEXT     Decrypt TEXT with --key\n"
              << "  -k, --key BITS         Binary key for --encrypt/--decrypt\n"
              << "  -s, --serve            Serve the JSON-RPC key service over WebSocket\n"
              << "  -p, --port PORT        Listening TCP port (default 9001)\n"
              << std::flush;
}

struct Options {
    std::string config_path;
    std::optional<uint64_t> seed;
    std::optional<int> generate;
    bool establish = false;
    std::optional<std::string> encrypt_text;
    std::optional<std::string> decrypt_text;
    std::optional<std::string> key;
    bool serve = false;
    int port = 9001;
};

static int run_generate(const KeyGenerator& generator, int n, bool establish) {
    RandomSource rng(generator.config().seed);
    if (establish) {
        KeyAgreement agreement(generator, rng);
        auto outcome = agreement.establish(static_cast<std::size_t>(n));
        if (auto key = std::get_if<FinalKey>(&outcome)) {
            std::cout << key->bits << std::endl;
            return 0;
        }
        const auto& f = std::get<AgreementFailure>(outcome);
        std::cerr << "Error " << f.code << ": " << f.message << " (attempts=" << f.attempts << ")" << std::endl;
        return 3;
    }

    auto run = generator.run(n, rng);
    std::cerr << run.report().dump() << std::endl;
    if (auto key = std::get_if<FinalKey>(&run.outcome)) {
        if (key->empty()) {
            std::cerr << errors::format_E3110_insufficient_sifted_bits(0, static_cast<std::size_t>(n)) << std::endl;
            return 3;
        }
        std::cout << key->bits << std::endl;
        return 0;
    }
    std::cerr << std::get<AbortSignal>(run.outcome).reason << std::endl;
    return 3;
}

static int run_server(const KeyGenerator& generator, int port) {
    WebSocketServer server(port, generator);
    server.start();
    if (!server.is_running()) return 4;

    std::cout << "KeyStone key service running on port " << port << "..." << std::endl;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // Accept JSON control lines on stdin for development, only when stdin is a TTY;
    // detached runs (nohup, systemd) would otherwise block on it.
    bool interactive_stdin = isatty(fileno(stdin));
    std::unique_ptr<ControlConsole> console;
    if (interactive_stdin) {
        console = std::make_unique<ControlConsole>(server, std::cin, std::cout, fileno(stdin));
        console->start();
    } else {
        std::cerr << "stdin not a TTY; skipping stdin control thread (detached/background mode)" << std::endl;
    }

    while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    if (console) console->stop();
    server.stop();
    std::cout << "KeyStone key service stopped" << std::endl;
    return 0;
}

int main(int argc, char** argv) {
    Options opt;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            auto next = [&](const char* flag) -> std::string {
                if (i + 1 >= argc) throw errors::invalid_argument(std::string(flag) + " requires a value");
                return argv[++i];
            };
            if (a == "-h" || a == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            else if (a == "-c" || a == "--config") opt.config_path = next("--config");
            else if (a == "--seed") opt.seed = parse_seed(next("--seed"));
            else if (a == "-g" || a == "--generate") opt.generate = std::stoi(next("--generate"));
            else if (a == "--establish") opt.establish = true;
            else if (a == "-e" || a == "--encrypt") opt.encrypt_text = next("--encrypt");
            else if (a == "-d" || a == "--decrypt") opt.decrypt_text = next("--decrypt");
            else if (a == "-k" || a == "--key") opt.key = next("--key");
            else if (a == "-s" || a == "--serve") opt.serve = true;
            else if (a == "-p" || a == "--port") opt.port = std::stoi(next("--port"));
            else if (a.rfind("--port=", 0) == 0) opt.port = std::stoi(a.substr(7));
            else {
                std::cerr << "Unknown option: " << a << std::endl;
                print_usage(argv[0]);
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << std::endl;
        return 2;
    }

    try {
        ProtocolConfig cfg;
        if (opt.config_path.empty()) opt.config_path = resolve_config_path();
        if (!opt.config_path.empty()) cfg = load_config_file(opt.config_path);
        if (opt.seed) cfg.seed = *opt.seed;

        KeyGenerator generator(cfg);

        if (opt.generate) return run_generate(generator, *opt.generate, opt.establish);

        if (opt.encrypt_text || opt.decrypt_text) {
            if (!opt.key) {
                std::cerr << errors::format_E3210_invalid_key(errors::D3210_EMPTY_KEY) << std::endl;
                return 2;
            }
            if (opt.encrypt_text) std::cout << cipher::encrypt(*opt.encrypt_text, *opt.key) << std::endl;
            else std::cout << cipher::decrypt(*opt.decrypt_text, *opt.key) << std::endl;
            return 0;
        }

        if (opt.serve) return run_server(generator, opt.port);

        print_usage(argv[0]);
        return 2;
    } catch (const errors::CatalogError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "keystone_backend: " << e.what() << std::endl;
        return 1;
    }
}
