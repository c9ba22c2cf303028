#include "WebSocketServer.hpp"
#include "KeyProtocol.hpp"
#include "core/ErrorCatalog.hpp"
#include <iostream>
#include <chrono>
// Boost.Beast / Asio for WebSocket
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <mutex>
#include <set>

namespace beast = boost::beast;         // from <boost/beast.hpp>
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace asio = boost::asio;           // from <boost/asio.hpp>
using tcp = asio::ip::tcp;              // from <boost/asio/ip/tcp.hpp>

namespace keystone {

using WsStream = websocket::stream<tcp::socket>;

// Implementation details hidden behind PIMPL
struct WebSocketServer::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;
    std::mutex sessions_m;
    std::set<std::shared_ptr<WsStream>> sessions;
    bool listening = false;

    Impl(int port): ioc(), acceptor(ioc) {
        boost::system::error_code ec;
        acceptor.open(tcp::v4(), ec);
        if (ec) {
            std::cerr << "WebSocketServer: acceptor.open failed: " << ec.message() << std::endl;
            return;
        }
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) {
            std::cerr << "WebSocketServer: set_option failed: " << ec.message() << std::endl;
        }
        acceptor.bind(tcp::endpoint(tcp::v4(), static_cast<unsigned short>(port)), ec);
        if (ec) {
            std::cerr << "WebSocketServer: bind failed: " << ec.message() << std::endl;
            return;
        }
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            std::cerr << "WebSocketServer: listen failed: " << ec.message() << std::endl;
            return;
        }
        listening = true;
    }

    void add_session(std::shared_ptr<WsStream> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.insert(s);
        std::cerr << "WebSocketServer: client connected (count=" << sessions.size() << ")" << std::endl;
    }
    void remove_session(std::shared_ptr<WsStream> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.erase(s);
        std::cerr << "WebSocketServer: client disconnected (count=" << sessions.size() << ")" << std::endl;
    }
    template<typename Fn>
    void for_each_session(Fn&& fn) {
        std::lock_guard<std::mutex> lk(sessions_m);
        for (auto &s : sessions) fn(s);
    }
};

WebSocketServer::WebSocketServer(int p, const KeyGenerator& gen)
: port(p), running(false), generator(gen), protocol(std::make_unique<KeyProtocol>(gen)) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::start() {
    if (running) return;
    impl = std::make_shared<Impl>(port);
    if (!impl->listening) {
        std::cerr << "WebSocketServer: not listening on port " << port << std::endl;
        impl.reset();
        return;
    }
    boost::system::error_code ec;
    auto local = impl->acceptor.local_endpoint(ec);
    bound = ec ? port : local.port();
    running = true;
    event_thread = std::thread([this](){ run_event_loop(); });
}

void WebSocketServer::stop() {
    running = false;
    if (event_thread.joinable()) event_thread.join();
}

void WebSocketServer::run_event_loop() {
    try {
        auto& ioc = impl->ioc;
        auto& acceptor = impl->acceptor;

        std::function<void()> do_accept;
        do_accept = [&]() {
            auto socket = std::make_shared<tcp::socket>(ioc);
            acceptor.async_accept(*socket, [this, socket, &do_accept](boost::system::error_code ec) {
                if (ec) {
                    if (running) std::cerr << "WebSocketServer: accept error: " << ec.message() << std::endl;
                } else {
                    auto ws = std::make_shared<WsStream>(std::move(*socket));
                    ws->async_accept([this, ws](boost::system::error_code ec) {
                        if (ec) {
                            std::cerr << "WebSocketServer: websocket accept failed: " << ec.message() << std::endl;
                            return;
                        }
                        impl->add_session(ws);
                        // read loop: one reply per request
                        auto buffer = std::make_shared<beast::flat_buffer>();
                        auto do_read = std::make_shared<std::function<void()>>();
                        *do_read = [this, ws, buffer, do_read]() {
                            ws->async_read(*buffer, [this, ws, buffer, do_read](boost::system::error_code ec, std::size_t) {
                                if (ec) {
                                    impl->remove_session(ws);
                                    return;
                                }
                                auto data = beast::buffers_to_string(buffer->data());
                                buffer->consume(buffer->size());

                                nlohmann::json reply;
                                auto j = nlohmann::json::parse(data, nullptr, false);
                                if (j.is_discarded()) {
                                    reply = {
                                        {"type", "rpc_result"}, {"id", nullptr}, {"ok", false},
                                        {"error", { {"code", errors::E2400_CONTROL_REJECTED},
                                                    {"message", errors::format_E2400_control_rejected(errors::D2400_INVALID_REQUEST)} }}
                                    };
                                } else {
                                    reply = handle_control(j);
                                }
                                if (!reply.is_null()) {
                                    auto payload = reply.dump();
                                    asio::post(ws->get_executor(), [ws, payload]() {
                                        boost::system::error_code wec;
                                        ws->write(asio::buffer(payload), wec);
                                        if (wec) {
                                            std::cerr << "WebSocketServer: write failed: " << wec.message() << std::endl;
                                        }
                                    });
                                }
                                (*do_read)();
                            });
                        };
                        (*do_read)();
                    });
                }
                if (running) do_accept();
            });
        };

        do_accept();

        // Run the I/O context until stopped (use non-blocking poll loop)
        while (running) {
            try {
                impl->ioc.poll();
            } catch (const std::exception& e) {
                std::cerr << "WebSocketServer: I/O context error: " << e.what() << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        // cleanly close sessions
        impl->for_each_session([&](std::shared_ptr<WsStream> s){
            boost::system::error_code ec;
            s->close(websocket::close_code::normal, ec);
        });
        boost::system::error_code ec;
        acceptor.close(ec);
    } catch (const std::exception& e) {
        std::cerr << "WebSocketServer: run_event_loop exception: " << e.what() << std::endl;
    }
}

nlohmann::json WebSocketServer::handle_control(const nlohmann::json& msg) {
    if (msg.is_object() && msg.value("cmd", std::string{}) == "ping") {
        return { {"type", "pong"} };
    }
    // everything else goes through the RPC handler, which rejects malformed requests itself
    return protocol->handle_rpc(msg);
}

} // namespace keystone
