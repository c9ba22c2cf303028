#include "ControlConsole.hpp"
#include "WebSocketServer.hpp"
#include <iostream>
#include <string>
#include <poll.h>
#include <nlohmann/json.hpp>

namespace keystone {

ControlConsole::ControlConsole(WebSocketServer& srv, std::istream& input, std::ostream& output, int input_fd)
: server(srv), in(input), out(output), fd(input_fd) {}

ControlConsole::~ControlConsole() {
    stop();
}

void ControlConsole::start() {
    if (reader.joinable()) return;
    stopping = false;
    reader = std::thread([this](){ run(); });
}

void ControlConsole::stop() {
    stopping = true;
    if (reader.joinable()) reader.join();
}

void ControlConsole::run() {
    std::string line;
    pollfd pfd{fd, POLLIN, 0};
    while (!stopping) {
        // buffered input first, then wait at most 200 ms for more
        if (in.rdbuf()->in_avail() <= 0 && poll(&pfd, 1, 200) <= 0) continue;
        if (!std::getline(in, line)) break;
        if (line.empty()) continue;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded()) {
            std::cerr << "control: failed to parse input" << std::endl;
            continue;
        }
        out << server.handle_control(j).dump() << std::endl;
    }
}

} // namespace keystone
