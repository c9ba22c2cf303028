#include <iostream>
#include <sstream>
#include "client/RpcClient.hpp"
#include "WebSocketServer.hpp"
#include "protocol/KeyGenerator.hpp"
#include "core/ErrorCatalog.hpp"
#include <nlohmann/json.hpp>

using nlohmann::json;
using namespace keystone;

static bool rejects(const std::vector<std::string>& args) {
    try {
        client::build_call(args);
    } catch (const errors::CatalogError& e) {
        return e.code() == errors::E3000_INVALID_ARGUMENT;
    }
    return false;
}

int main() {
    std::cout << "CI-less client tests starting...\n";
    try {
        client::WsUrl u;
        if (!client::parse_ws_url("ws://localhost:9100/keys", u) || u.host != "localhost" || u.port != "9100" || u.target != "/keys") {
            std::cerr << "full url parsed wrong\n"; return 2;
        }
        if (!client::parse_ws_url("ws://10.0.0.7", u) || u.port != "9001" || u.target != "/") {
            std::cerr << "defaults not applied\n"; return 3;
        }
        if (client::parse_ws_url("http://localhost:9001/", u) || client::parse_ws_url("ws://:9001/", u) ||
            client::parse_ws_url("ws://host:90x1/", u)) {
            std::cerr << "bad url accepted\n"; return 4;
        }

        auto gen_call = client::build_call({"generate", "32", "--establish"});
        if (gen_call.method != "qkd.generate" || gen_call.params["min_key_length"] != 32 || gen_call.params["establish"] != true) {
            std::cerr << "generate call wrong: " << gen_call.params.dump() << "\n"; return 5;
        }
        auto enc_call = client::build_call({"encrypt", "HI", "1010"});
        auto req = client::make_request("r1", enc_call);
        if (req["method"] != "cipher.encrypt" || req["params"]["text"] != "HI" || req["type"] != "rpc") {
            std::cerr << "encrypt request wrong: " << req.dump() << "\n"; return 6;
        }
        if (!rejects({"generate", "ten"}) || !rejects({"encrypt", "HI"}) || !rejects({"teleport"}) ||
            !rejects({"call", "backend.info", "[1,2]"}) || !rejects({})) {
            std::cerr << "bad command line accepted\n"; return 7;
        }

        json failed = { {"type", "rpc_result"}, {"id", "r1"}, {"ok", false},
                        {"error", { {"code", 3210}, {"message", "Error 3210: Invalid key material: key is empty"} }} };
        std::ostringstream out, err;
        if (client::print_reply(enc_call, failed, out, err) != 1 || err.str().find("3210") == std::string::npos) {
            std::cerr << "error reply not reported\n"; return 8;
        }

        // loopback against a real server on an ephemeral port
        ProtocolConfig cfg;
        cfg.seed = 77;
        KeyGenerator generator(cfg);
        WebSocketServer server(0, generator);
        server.start();
        if (!server.is_running() || server.bound_port() <= 0) { std::cerr << "server did not start\n"; return 9; }

        client::WsUrl local;
        client::parse_ws_url("ws://127.0.0.1:" + std::to_string(server.bound_port()) + "/", local);
        {
            client::RpcClient rpc(local);

            auto reply = rpc.call(enc_call);
            std::ostringstream text;
            if (client::print_reply(enc_call, reply, text, err) != 0 || text.str() != "\xC3\xA2\xC3\xA3\n") {
                std::cerr << "encrypt over websocket failed: " << reply.dump() << "\n"; return 10;
            }

            auto key_call = client::build_call({"generate", "16", "--establish"});
            std::ostringstream key;
            if (client::print_reply(key_call, rpc.call(key_call), key, err) != 0 || key.str().size() != 17) {
                std::cerr << "generate over websocket failed: " << key.str() << "\n"; return 11;
            }

            auto bad = rpc.call(client::build_call({"decrypt", "HI", "2"}));
            if (bad.value("ok", true) || bad["error"]["code"] != errors::E3210_INVALID_KEY_MATERIAL) {
                std::cerr << "invalid key not rejected over websocket\n"; return 12;
            }
        }
        server.stop();

        std::cout << "CI-less client tests passed\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "exception: " << e.what() << std::endl;
        return 1;
    }
}
