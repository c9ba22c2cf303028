#pragma once
#include <thread>
#include <atomic>
#include <functional>
#include <string>
#include <memory>
#include <nlohmann/json.hpp>

namespace keystone {

class KeyProtocol;
class KeyGenerator;

class WebSocketServer {
public:
    WebSocketServer(int port, const KeyGenerator& generator);
    ~WebSocketServer();

    void start();
    void stop();
    bool is_running() const { return running; }
    // Port actually bound by start(); differs from the requested one when that was 0.
    int bound_port() const { return bound; }
    // Handle one control message; returns the reply to send back (null for none)
    nlohmann::json handle_control(const nlohmann::json& msg);

private:
    void run_event_loop();

    struct Impl;

    int port;
    int bound = 0;
    std::atomic<bool> running;
    std::thread event_thread;

    const KeyGenerator& generator;
    std::unique_ptr<KeyProtocol> protocol;
    std::shared_ptr<Impl> impl;
};

} // namespace keystone
