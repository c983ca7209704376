#include "DebugConsole.hpp"
#include <cctype>
#include <iostream>
#include <poll.h>
#include <unistd.h>

namespace companion {

DebugConsole::DebugConsole(LineCallback on_line) : on_line_(std::move(on_line)) {}

DebugConsole::~DebugConsole() {
    stop();
}

void DebugConsole::print_help() {
    std::cout << "\n============================================================\n"
              << "Debug keys:\n"
              << "   1 - Wake 'hey'\n"
              << "   2 - Command 'sing'\n"
              << "   3 - Command 'spin'\n"
              << "   4 - Command 'friends'\n"
              << "   5 - Command 'back'\n"
              << "   [ / ] - Left wheel trim\n"
              << "   - / = - Right wheel trim\n"
              << "   s - Save trim\n"
              << "   q - Quit\n"
              << "============================================================\n"
              << std::endl;
}

void DebugConsole::start() {
    if (running_) return;
    print_help();
    running_ = true;
    thread_ = std::thread(&DebugConsole::read_loop, this);
}

void DebugConsole::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void DebugConsole::read_loop() {
    std::string line;
    char c = 0;

    while (running_) {
        // Poll so stop() is honoured without waiting for a keypress
        struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, 200);
        if (ready <= 0) continue;
        if (pfd.revents & (POLLHUP | POLLERR)) break;

        ssize_t n = read(STDIN_FILENO, &c, 1);
        if (n <= 0) break;  // EOF

        if (c != '\n') {
            line.push_back(c);
            continue;
        }

        std::string command;
        for (char ch : line) {
            if (!std::isspace(static_cast<unsigned char>(ch))) {
                command.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
            }
        }
        line.clear();

        if (!command.empty() && on_line_) {
            on_line_(command);
        }
    }
    running_ = false;
}

} // namespace companion
