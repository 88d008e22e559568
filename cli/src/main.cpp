#include "cli_app.hpp"

#include <signal.h>

#include <atomic>
#include <iostream>
#include <stdexcept>

namespace {
std::atomic<bool> g_should_run{true};

void handle_signal(int) {
    g_should_run = false;
}

// No SA_RESTART, so a blocked read on stdin returns and the shell can exit.
void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        throw std::runtime_error("Failed to install signal handlers");
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "engine/config/chunkflow.conf";

    try {
        auto config = chunkflow::engine::load_config(config_path);
        chunkflow::cli::CliApp app(std::move(config));
        install_signal_handlers();

        app.run_shell(g_should_run);

        std::cout << "\nStopping..." << std::endl;
        app.shutdown();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
