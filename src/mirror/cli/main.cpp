// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mirror/cli/commands.hpp>
#include <mirror/core/cancellation.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <unistd.h>

using namespace mirror::cli;

namespace {

std::atomic<bool>* g_cancel_flag = nullptr;
volatile std::sig_atomic_t g_signal_count = 0;

void write_stderr(const char* text, std::size_t size) noexcept {
    auto written = ::write(STDERR_FILENO, text, size);
    (void)written;
}

// First signal requests a graceful stop, the second exits at once
void on_terminate_signal(int) {
    if (g_signal_count > 0) {
        static const char forced[] = "\n\nForced termination. Some files may be incomplete.\n";
        write_stderr(forced, sizeof(forced) - 1);
        ::_exit(1);
    }
    g_signal_count = 1;

    static const char graceful[] = "\n\nTermination requested. Completing current operation...\n";
    write_stderr(graceful, sizeof(graceful) - 1);
    if (g_cancel_flag) {
        g_cancel_flag->store(true, std::memory_order_release);
    }
}

void install_signal_handlers(const mirror::core::CancellationToken& token) {
    g_cancel_flag = token.native_flag();

    struct sigaction action{};
    action.sa_handler = on_terminate_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // No SA_RESTART: a pending prompt read is interrupted
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
}

// Terminate handler to catch exceptions in noexcept functions
void mirror_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

} // namespace

int main(int argc, char* argv[]) {
    std::set_terminate(mirror_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cout << "Use -h for help" << std::endl;
        return static_cast<int>(ExitCode::failure);
    }

    mirror::core::CancellationToken token;
    install_signal_handlers(token);

    return static_cast<int>(run(args, token));
}
