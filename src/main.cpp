#include "AudioPlayer.hpp"
#include "Config.hpp"
#include "DebugConsole.hpp"
#include "Display.hpp"
#include "FaceRecognizer.hpp"
#include "FrameSource.hpp"
#include "MotorDriver.hpp"
#include "ProximitySensor.hpp"
#include "RobotController.hpp"
#include "Utils.hpp"
#include "VoiceListener.hpp"

#include <iostream>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <execinfo.h>  // For backtrace
#include <fstream>
#include <ctime>
#include <atomic>
#include <exception>   // For std::set_terminate
#include <unistd.h>

std::unique_ptr<companion::RobotController> controller;
std::atomic<bool> shutdown_requested{false};

const char* COMPANION_VERSION = "1.0.0";

// Crash details go next to the log file (or the working directory)
std::string crash_log_path = "companion_crash.log";

void write_crash_header(std::ofstream& crash_log, const char* title) {
    time_t now = time(nullptr);
    char time_buf[64];
    strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", localtime(&now));

    crash_log << "\n========================================\n";
    crash_log << title << " at " << time_buf << "\n";
    crash_log << "========================================\n";
}

void write_backtrace(std::ofstream& crash_log, void* frames[], int frame_count) {
    char** symbols = backtrace_symbols(frames, frame_count);
    if (symbols) {
        crash_log << "Stack trace (" << frame_count << " frames):\n";
        for (int i = 0; i < frame_count; i++) {
            crash_log << "  [" << i << "] " << symbols[i] << "\n";
        }
        free(symbols);
    }
    crash_log << "========================================\n";
}

// Global terminate handler - catches uncaught exceptions from threads
void terminate_handler() {
    std::exception_ptr eptr = std::current_exception();

    std::ofstream crash_log(crash_log_path, std::ios::app);
    write_crash_header(crash_log, "UNCAUGHT EXCEPTION");

    if (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            crash_log << "Exception: " << e.what() << "\n";
            std::cerr << "💥 UNCAUGHT EXCEPTION: " << e.what() << std::endl;
        } catch (...) {
            crash_log << "Exception: Unknown (non-std::exception)\n";
            std::cerr << "💥 UNCAUGHT EXCEPTION: Unknown type" << std::endl;
        }
    } else {
        crash_log << "Exception: std::terminate called without active exception\n";
        std::cerr << "💥 std::terminate called (no active exception)" << std::endl;
    }

    void* frames[64];
    int frame_count = backtrace(frames, 64);
    write_backtrace(crash_log, frames, frame_count);
    crash_log.close();

    std::cerr << "📁 Crash saved to: " << crash_log_path << std::endl;
    std::cerr.flush();
    _exit(1);
}

void signal_handler(int signum) {
    const char* sig_name = "UNKNOWN";
    bool is_crash = false;

    switch (signum) {
        case SIGINT:
            sig_name = "SIGINT (Interrupt)";
            break;
        case SIGTERM:
            sig_name = "SIGTERM (Terminate)";
            break;
        case SIGSEGV:
            sig_name = "SIGSEGV (Segmentation Fault)";
            is_crash = true;
            break;
        case SIGABRT:
            sig_name = "SIGABRT (Abort)";
            is_crash = true;
            break;
        case SIGFPE:
            sig_name = "SIGFPE (Floating Point Exception)";
            is_crash = true;
            break;
        case SIGBUS:
            sig_name = "SIGBUS (Bus Error)";
            is_crash = true;
            break;
    }

    if (!is_crash) {
        // Second Ctrl-C while a maneuver is still sleeping
        if (shutdown_requested.exchange(true)) {
            std::cout << "\n⚠ Shutdown already in progress, forcing exit..." << std::endl;
            _exit(signum);
        }

        std::cout << "\n🛑 Shutdown signal received (" << sig_name << ")" << std::endl;
        if (controller) {
            controller->stop();
        }
        return;
    }

    std::cerr << "\n💥 CRASH DETECTED - signal " << signum << " (" << sig_name << ")" << std::endl;

    void* frames[64];
    int frame_count = backtrace(frames, 64);
    backtrace_symbols_fd(frames, frame_count, STDERR_FILENO);

    std::ofstream crash_log(crash_log_path, std::ios::app);
    if (crash_log.is_open()) {
        write_crash_header(crash_log, "CRASH");
        crash_log << "Signal: " << signum << " (" << sig_name << ")\n";
        write_backtrace(crash_log, frames, frame_count);
    }

    std::cerr << "📁 Crash details saved to: " << crash_log_path << std::endl;
    _exit(signum);
}

// Redirect stdout/stderr to log file
void setup_logging(const std::string& log_file) {
    if (!companion::utils::ensure_parent_directory(log_file)) {
        std::cerr << "Failed to create log directory for " << log_file << std::endl;
    }

    if (!freopen(log_file.c_str(), "a", stdout)) {
        perror("Failed to redirect stdout");
    }
    if (!freopen(log_file.c_str(), "a", stderr)) {
        perror("Failed to redirect stderr");
    }
    // Unbuffered for immediate log writes
    setvbuf(stdout, NULL, _IONBF, 0);
    setvbuf(stderr, NULL, _IONBF, 0);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>] [--headless] [--log <path>]\n"
              << "  --config <path>  JSON configuration (default: config/robot.json)\n"
              << "  --headless       No OpenCV window (framebuffer and touchscreen still used)\n"
              << "  --log <path>     Append stdout/stderr to a log file\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = "config/robot.json";
    std::string log_file;
    bool headless = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--headless") == 0) {
            headless = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    if (!log_file.empty()) {
        setup_logging(log_file);
        crash_log_path = log_file + ".crash";
    }

    std::set_terminate(terminate_handler);

    std::cout << "\n╔════════════════════════════════════════════╗" << std::endl;
    std::cout << "║   Companion Robot v" << COMPANION_VERSION << "                   ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════╝" << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);
    signal(SIGFPE, signal_handler);
    signal(SIGBUS, signal_handler);

    companion::Config config;
    if (!companion::load_config(config_path, config)) {
        std::cerr << "⚠ Continuing with default configuration" << std::endl;
    }
    if (!config.display.show_window) {
        headless = true;
    }

    companion::RobotDevices devices;
    devices.display = std::make_unique<companion::OpenCVDisplay>(config.display, headless);
    devices.audio = std::make_unique<companion::AlsaAudioPlayer>(config.audio);
    devices.motor = companion::create_motor_driver(config.motor);
    devices.proximity = companion::create_proximity_sensor(config.ultrasonic);
    devices.recognizer = companion::create_face_recognizer(config);
    if (devices.recognizer) {
        devices.camera = companion::open_camera(config.camera);
        if (!devices.camera) {
            std::cerr << "❌ Camera initialization failed; face recognition disabled" << std::endl;
            devices.recognizer.reset();
        }
    }

    controller = std::make_unique<companion::RobotController>(config, std::move(devices));
    controller->set_state_callback([](companion::RobotState from, companion::RobotState to) {
        std::cout << "State: " << companion::to_string(from) << " -> " << companion::to_string(to) << std::endl;
    });

    if (config.voice.enabled) {
        companion::RobotController* target = controller.get();
        controller->attach_voice_listener(std::make_unique<companion::VoiceListener>(
            config.voice,
            std::make_unique<companion::FifoSpeechSource>(config.voice.transcript_fifo),
            [target](const std::string& transcript) { target->post_voice_wake(transcript); },
            [target](const std::string& command, const std::string& transcript) {
                target->post_voice_command(command, transcript);
            }));
    }

    if (!controller->initialize()) {
        std::cerr << "System initialization failed!" << std::endl;
        return 1;
    }

    companion::DebugConsole console([](const std::string& line) {
        if (controller) controller->post_debug_command(line);
    });
    companion::DebugConsole::print_help();
    console.start();

    std::cout << "System initialized. Starting main loop..." << std::endl;
    controller->run();

    console.stop();
    std::cout << "Main loop exited." << std::endl;
    controller.reset();
    std::cout << "Cleanup complete." << std::endl;
    return 0;
}
