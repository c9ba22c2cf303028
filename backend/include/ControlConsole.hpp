#pragma once
#include <atomic>
#include <iosfwd>
#include <thread>

namespace keystone {

class WebSocketServer;

/**
 * @brief Development console: one JSON control message per input line, reply per output line.
 *
 * The reader thread polls `fd` with a short timeout between lines, so stop() returns
 * promptly even when no input arrives. Pass fd = -1 for a stream with no descriptor.
 * stop() (also run by the destructor) joins the thread, so no line is handled after it.
 */
class ControlConsole {
public:
    ControlConsole(WebSocketServer& server, std::istream& in, std::ostream& out, int fd);
    ~ControlConsole();

    void start();
    void stop();

private:
    void run();

    WebSocketServer& server;
    std::istream& in;
    std::ostream& out;
    int fd;
    std::atomic<bool> stopping{false};
    std::thread reader;
};

} // namespace keystone
