#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace rdu::config {

// Malformed command line; main() prints it with the usage text and exits 2
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CommandLine {
    enum class Action { Run, ShowHelp, ShowVersion };

    Action action = Action::Run;
    std::filesystem::path path = ".";
    bool one_file_system = false;
    bool follow_links = false;

    // Arguments without the program name. Throws UsageError.
    static CommandLine parse(const std::vector<std::string>& args);
    static CommandLine parse(int argc, char* argv[]);

    static std::string usage(const std::string& program_name);
    static std::string version_string();
};

}  // namespace rdu::config
