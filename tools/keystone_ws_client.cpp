#include "client/RpcClient.hpp"
#include "core/ErrorCatalog.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace keystone;

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " ws://host:port/path <command> [args]\n"
              << "Commands:\n"
              << "  info                       Build info and effective protocol configuration\n"
              << "  generate N [--establish]   Run BB84 for a key of at least N bits\n"
              << "  encrypt TEXT KEY           XOR-encrypt TEXT with a binary KEY\n"
              << "  decrypt TEXT KEY           XOR-decrypt TEXT with a binary KEY\n"
              << "  call METHOD [PARAMS_JSON]  Send any RPC method\n"
              << "Example:\n"
              << "  " << prog << " ws://localhost:9001/ generate 32 --establish\n";
}

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 2;
    }

    client::WsUrl url;
    if (!client::parse_ws_url(argv[1], url)) {
        std::cerr << "Invalid ws url (expected ws://host:port/path): " << argv[1] << "\n";
        return 2;
    }

    client::Call call;
    try {
        call = client::build_call(std::vector<std::string>(argv + 2, argv + argc));
    } catch (const errors::CatalogError& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    try {
        client::RpcClient rpc(url);
        return client::print_reply(call, rpc.call(call), std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
