#include "backend/Config.hpp"
#include "backend/Navigator.hpp"
#include "backend/TreeBuilder.hpp"
#include "config/CommandLine.hpp"
#include "config/KeyMap.hpp"
#include "config/Version.hpp"
#include "ui/Terminal.hpp"
#include "ui/Renderer.hpp"
#include "util/DirectoryWalker.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <iostream>
#include <atomic>
#include <csignal>
#include <cerrno>
#include <exception>
#include <poll.h>
#include <unistd.h>
#include <filesystem>

// Set by SIGINT/SIGTERM; the main loop exits and restores the terminal
static volatile std::sig_atomic_t g_shutdown = 0;

static void shutdown_signal_handler(int) {
    g_shutdown = 1;
}

// Crash path: give the user their terminal back, then die with the same signal
static void fatal_signal_handler(int signum) {
    rdu::ui::Terminal::emergency_restore();
    std::signal(signum, SIG_DFL);
    std::raise(signum);
}

static void terminate_handler() {
    rdu::ui::Terminal::emergency_restore();
    std::signal(SIGABRT, SIG_DFL);
    std::abort();
}

static void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = shutdown_signal_handler;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGINT, &sa, nullptr);   // Ctrl+C
    ::sigaction(SIGTERM, &sa, nullptr);  // kill command

    for (int sig : {SIGSEGV, SIGABRT, SIGBUS, SIGFPE, SIGILL}) {
        std::signal(sig, fatal_signal_handler);
    }
    std::set_terminate(terminate_handler);
}

int main(int argc, char* argv[]) {
    const std::string program_name = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "rdu";

    rdu::config::CommandLine cmd;
    try {
        cmd = rdu::config::CommandLine::parse(argc, argv);
    } catch (const rdu::config::UsageError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << rdu::config::CommandLine::usage(program_name);
        return 2;
    }

    if (cmd.action == rdu::config::CommandLine::Action::ShowHelp) {
        std::cout << rdu::config::CommandLine::usage(program_name);
        return 0;
    }
    if (cmd.action == rdu::config::CommandLine::Action::ShowVersion) {
        std::cout << rdu::config::CommandLine::version_string() << "\n";
        return 0;
    }

    try {
        // Configuration supplies defaults, switches can only turn options on
        auto config = rdu::backend::ConfigLoader::load_config();
        rdu::util::Logger::init(config.log_file, config.log_level);
        rdu::util::Logger::info("rdu " + std::string(rdu::config::VERSION) + " starting...");

        rdu::model::ScanOptions options = config.scan;
        options.one_file_system = options.one_file_system || cmd.one_file_system;
        options.follow_links = options.follow_links || cmd.follow_links;

        auto root = rdu::util::Platform::normalize_root(cmd.path);
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            std::cerr << "error: " << cmd.path.string() << " is not a directory\n";
            rdu::util::Logger::error("Root is not a directory: " + root.string());
            return 1;
        }

        rdu::config::KeyMap keymap;
        keymap.load_from_config(config.keybinds);

        std::cout << "Scanning " << cmd.path.string() << "... This may take a moment." << std::endl;

        rdu::util::DirectoryWalker walker;
        rdu::backend::TreeBuilder builder(walker, options);
        auto tree = builder.build(root);
        rdu::util::Logger::info("Initial scan done: " + std::to_string(tree->size) + " bytes, " +
                                std::to_string(tree->error_count) + " errors");

        rdu::backend::Navigator navigator(tree, builder, config.propagate_refresh);

        install_signal_handlers();

        auto& terminal = rdu::ui::Terminal::instance();
        terminal.init();

        rdu::ui::Renderer renderer(navigator, keymap);
        renderer.render();

        while (!renderer.should_quit() && !g_shutdown) {
            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ret = ::poll(&pfd, 1, 250);

            if (ret < 0) {
                if (errno == EINTR) {
                    // Resize or shutdown signal; handled below and by the loop condition
                } else {
                    rdu::util::Logger::error("Poll failed: " + rdu::util::Platform::error_string(errno));
                    break;
                }
            }

            if (terminal.consume_resize()) {
                renderer.render(true);
            }

            if (ret > 0 && (pfd.revents & POLLIN)) {
                // Drain every pending key so held keys do not lag behind
                bool handled = false;
                while (true) {
                    auto event = terminal.read_input();
                    if (event.empty()) break;
                    renderer.handle_input_event(event);
                    handled = true;
                    if (renderer.should_quit()) break;
                }
                if (handled && !renderer.should_quit()) {
                    renderer.render();
                }
            }
        }

        terminal.shutdown();
        rdu::util::Logger::info(g_shutdown ? "Interrupted, shutting down" : "rdu shutdown");
        return 0;
    } catch (const std::exception& e) {
        // Restore terminal even on exception
        rdu::ui::Terminal::instance().shutdown();
        rdu::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
