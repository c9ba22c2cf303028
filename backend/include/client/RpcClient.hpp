#pragma once
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace keystone::client {

struct WsUrl {
    std::string host;
    std::string port;   // "9001" when the url names none
    std::string target; // "/" when the url names none
};

// ws://host[:port][/path]; returns false for anything else
bool parse_ws_url(const std::string& url, WsUrl& out);

// One RPC call as named on the command line.
struct Call {
    std::string command; // info, generate, encrypt, decrypt, call
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

/**
 * @brief Turn command-line words into an RPC call.
 *
 *   info
 *   generate N [--establish]
 *   encrypt TEXT KEY
 *   decrypt TEXT KEY
 *   call METHOD [PARAMS_JSON]
 *
 * Throws errors::CatalogError (E3000) for unknown commands or bad arguments.
 */
Call build_call(const std::vector<std::string>& args);

nlohmann::json make_request(const std::string& id, const Call& call);

// Print the interesting part of an rpc_result for `call`; returns the process exit code.
int print_reply(const Call& call, const nlohmann::json& reply, std::ostream& out, std::ostream& err);

// Blocking WebSocket connection to a key service; one call at a time.
class RpcClient {
public:
    explicit RpcClient(const WsUrl& url);
    ~RpcClient();

    // Sends the request and waits for the rpc_result carrying the same id.
    nlohmann::json call(const Call& call);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
    unsigned counter = 0;
};

} // namespace keystone::client
