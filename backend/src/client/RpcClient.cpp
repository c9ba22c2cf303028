#include "client/RpcClient.hpp"
#include "core/ErrorCatalog.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <ostream>
#include <stdexcept>
#include <unistd.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using nlohmann::json;

namespace keystone::client {

bool parse_ws_url(const std::string& url, WsUrl& out) {
    const std::string scheme = "ws://";
    if (url.rfind(scheme, 0) != 0) return false;
    const std::string rest = url.substr(scheme.size());

    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.find(':');
    out.host = authority.substr(0, colon);
    out.port = colon == std::string::npos ? "" : authority.substr(colon + 1);
    if (out.port.empty()) out.port = "9001";

    if (out.host.empty()) return false;
    return out.port.find_first_not_of("0123456789") == std::string::npos;
}

namespace {

void require_args(const std::vector<std::string>& args, std::size_t min, std::size_t max, const char* usage) {
    if (args.size() < min || args.size() > max) throw errors::invalid_argument(std::string("usage: ") + usage);
}

int parse_length(const std::string& text) {
    try {
        std::size_t used = 0;
        int n = std::stoi(text, &used);
        if (used == text.size()) return n;
    } catch (const std::logic_error&) {
        // fall through to the catalogued error
    }
    throw errors::invalid_argument("key length must be an integer: " + text);
}

} // namespace

Call build_call(const std::vector<std::string>& args) {
    if (args.empty()) throw errors::invalid_argument("missing command");
    Call c;
    c.command = args[0];

    if (c.command == "info") {
        require_args(args, 1, 1, "info");
        c.method = "backend.info";
    } else if (c.command == "generate") {
        require_args(args, 2, 3, "generate N [--establish]");
        c.method = "qkd.generate";
        c.params["min_key_length"] = parse_length(args[1]);
        if (args.size() == 3) {
            if (args[2] != "--establish") throw errors::invalid_argument("unknown generate flag: " + args[2]);
            c.params["establish"] = true;
        }
    } else if (c.command == "encrypt" || c.command == "decrypt") {
        require_args(args, 3, 3, "encrypt|decrypt TEXT KEY");
        c.method = "cipher." + c.command;
        c.params["text"] = args[1];
        c.params["key"] = args[2];
    } else if (c.command == "call") {
        require_args(args, 2, 3, "call METHOD [PARAMS_JSON]");
        c.method = args[1];
        if (args.size() == 3) {
            c.params = json::parse(args[2], nullptr, false);
            if (!c.params.is_object()) throw errors::invalid_argument("params must be a JSON object");
        }
    } else {
        throw errors::invalid_argument("unknown command: " + c.command);
    }
    return c;
}

json make_request(const std::string& id, const Call& call) {
    return {
        {"type", "rpc"},
        {"id", id},
        {"method", call.method},
        {"params", call.params},
    };
}

int print_reply(const Call& call, const json& reply, std::ostream& out, std::ostream& err) {
    if (!reply.value("ok", false)) {
        const json error = reply.value("error", json::object());
        err << "Error " << error.value("code", 0) << ": " << error.value("message", std::string("no message")) << "\n";
        return 1;
    }
    const json result = reply.value("result", json::object());

    if (call.command == "generate") {
        if (result.value("outcome", std::string{}) == "key") {
            out << result.value("key", std::string{}) << "\n";
            return 0;
        }
        err << "Error " << result.value("code", 0) << ": " << result.value("reason", std::string{}) << "\n";
        return 3;
    }
    if (call.command == "encrypt" || call.command == "decrypt") {
        out << result.value("text", std::string{}) << "\n";
        return 0;
    }
    out << result.dump(2) << "\n";
    return 0;
}

struct RpcClient::Impl {
    net::io_context ioc;
    websocket::stream<tcp::socket> ws{ioc};
};

RpcClient::RpcClient(const WsUrl& url)
: impl(std::make_unique<Impl>()) {
    tcp::resolver resolver{impl->ioc};
    auto const results = resolver.resolve(url.host, url.port);
    net::connect(impl->ws.next_layer(), results);
    impl->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    impl->ws.handshake(url.host + ":" + url.port, url.target);
}

RpcClient::~RpcClient() {
    beast::error_code ec;
    impl->ws.close(websocket::close_code::normal, ec);
}

json RpcClient::call(const Call& call) {
    const std::string id = "req_" + std::to_string(getpid()) + "_" + std::to_string(++counter);
    impl->ws.write(net::buffer(make_request(id, call).dump()));

    beast::flat_buffer buffer;
    for (;;) {
        buffer.clear();
        impl->ws.read(buffer);
        json msg = json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
        if (!msg.is_object()) continue;
        if (msg.value("type", std::string{}) == "rpc_result" && msg.contains("id") && msg["id"] == id) return msg;
    }
}

} // namespace keystone::client
