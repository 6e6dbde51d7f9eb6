// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/cli/commands.hpp>
#include <fetchpoint/core/http_session.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stop_token>
#include <thread>

using namespace fetchpoint::cli;

namespace {

volatile std::sig_atomic_t g_signal = 0;

extern "C" void on_signal(int signum) {
    g_signal = signum;
}

} // namespace

// Terminate handler to catch exceptions in noexcept functions
static void fetchpoint_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    try {
        std::rethrow_exception(std::current_exception());
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "Unknown exception in noexcept context" << std::endl;
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(fetchpoint_terminate_handler);
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    // Handle help
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    // Handle version
    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return EXIT_FATAL;
    }

    setup_logging(args.verbose, args.quiet);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // Turn a signal into a stop request; in-flight downloads finish and
    // progress is flushed before exit
    std::stop_source stop;
    std::jthread watcher([&stop](std::stop_token self) {
        while (!self.stop_requested()) {
            if (g_signal != 0) {
                std::cout << "\nStopping after current downloads..." << std::endl;
                stop.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    fetchpoint::core::HttpSession::global_init();
    auto result = download(args, stop.get_token());
    fetchpoint::core::HttpSession::global_cleanup();

    watcher.request_stop();

    if (!result) {
        return EXIT_FATAL;
    }
    return *result;
}
