#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace companion {

/**
 * @brief Reads single-key commands from stdin on a background thread
 *
 * Each non-empty line is trimmed, lower-cased and handed to the line
 * callback (which only posts it to the control loop).
 */
class DebugConsole {
public:
    using LineCallback = std::function<void(const std::string&)>;

    explicit DebugConsole(LineCallback on_line);
    ~DebugConsole();

    void start();
    void stop();

    static void print_help();

private:
    void read_loop();

    LineCallback on_line_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace companion
