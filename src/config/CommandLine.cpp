#include "config/CommandLine.hpp"
#include "config/Version.hpp"
#include <sstream>

namespace rdu::config {

CommandLine CommandLine::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

CommandLine CommandLine::parse(const std::vector<std::string>& args) {
    CommandLine cmd;
    bool have_path = false;
    bool options_done = false;

    auto set_path = [&](const std::string& arg) {
        if (have_path) {
            throw UsageError("unexpected argument '" + arg + "'");
        }
        cmd.path = arg;
        have_path = true;
    };

    for (const auto& arg : args) {
        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            set_path(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
        } else if (arg == "-h" || arg == "--help") {
            cmd.action = Action::ShowHelp;
        } else if (arg == "-V" || arg == "--version") {
            if (cmd.action == Action::Run) cmd.action = Action::ShowVersion;
        } else if (arg == "-x" || arg == "--one-file-system") {
            cmd.one_file_system = true;
        } else if (arg == "-L" || arg == "--follow-links") {
            cmd.follow_links = true;
        } else if (arg.size() > 2 && arg[1] != '-') {
            // Bundled short flags, e.g. -xL
            for (size_t i = 1; i < arg.size(); ++i) {
                switch (arg[i]) {
                    case 'x': cmd.one_file_system = true; break;
                    case 'L': cmd.follow_links = true; break;
                    case 'h': cmd.action = Action::ShowHelp; break;
                    case 'V':
                        if (cmd.action == Action::Run) cmd.action = Action::ShowVersion;
                        break;
                    default:
                        throw UsageError(std::string("unknown option '-") + arg[i] + "'");
                }
            }
        } else {
            throw UsageError("unknown option '" + arg + "'");
        }
    }

    return cmd;
}

std::string CommandLine::usage(const std::string& program_name) {
    std::ostringstream out;
    out << "Interactive disk usage analyzer\n\n";
    out << "Usage: " << program_name << " [OPTIONS] [PATH]\n\n";
    out << "Arguments:\n";
    out << "  [PATH]                 Directory to scan (default: current)\n\n";
    out << "Options:\n";
    out << "  -x, --one-file-system  Do not cross filesystem boundaries\n";
    out << "  -L, --follow-links     Follow symbolic links (loops are detected)\n";
    out << "  -h, --help             Print help\n";
    out << "  -V, --version          Print version\n";
    return out.str();
}

std::string CommandLine::version_string() {
    return std::string("rdu ") + VERSION;
}

}  // namespace rdu::config
