#include "../framework/SimpleTest.hpp"
#include "../framework/TempTree.hpp"
#include "util/TimSort.hpp"
#include "util/UnicodeUtils.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "ui/Formatting.hpp"
#include "config/KeyMap.hpp"
#include "config/CommandLine.hpp"
#include "backend/Config.hpp"
#include <vector>
#include <algorithm>
#include <random>
#include <limits>

using namespace rdu::util;
using rdu::ui::format_size;
using rdu::ui::render_bar;

TEST_CASE(test_timsort_integers) {
    std::vector<int> v = {5, 1, 9, 3, 7, 4, 8, 2, 6, 0};
    timsort(v, std::less<int>());

    for (size_t i = 0; i < v.size(); ++i) {
        ASSERT_EQ(v[i], (int)i);
    }
}

TEST_CASE(test_timsort_reverse_sorted) {
    std::vector<int> v = {5, 4, 3, 2, 1};
    timsort(v, std::less<int>());

    ASSERT_EQ(v[0], 1);
    ASSERT_EQ(v[4], 5);
}

TEST_CASE(test_timsort_matches_stable_sort) {
    // Few distinct keys and long inputs exercise run merging and stability
    std::mt19937 rng(7);
    for (size_t n : {0u, 1u, 31u, 64u, 1000u, 5000u}) {
        std::vector<std::pair<int, size_t>> v;
        for (size_t i = 0; i < n; ++i) {
            v.emplace_back(static_cast<int>(rng() % 17), i);
        }
        auto expected = v;
        auto by_key = [](const auto& a, const auto& b) { return a.first < b.first; };
        std::stable_sort(expected.begin(), expected.end(), by_key);

        timsort(v, by_key);
        ASSERT_TRUE(v == expected);
    }
}

TEST_CASE(test_timsort_partially_ordered_runs) {
    std::vector<int> v;
    for (int i = 0; i < 300; ++i) v.push_back(i);
    for (int i = 300; i > 0; --i) v.push_back(i);
    for (int i = 0; i < 300; ++i) v.push_back(i % 50);

    auto expected = v;
    std::stable_sort(expected.begin(), expected.end());
    timsort(v, std::less<int>());
    ASSERT_TRUE(v == expected);
}

TEST_CASE(test_format_size_bytes) {
    ASSERT_EQ(format_size(0), std::string("0 B"));
    ASSERT_EQ(format_size(1), std::string("1 B"));
    ASSERT_EQ(format_size(1023), std::string("1023 B"));
}

TEST_CASE(test_format_size_binary_prefixes) {
    ASSERT_EQ(format_size(1024), std::string("1.0 KiB"));
    ASSERT_EQ(format_size(1536), std::string("1.5 KiB"));
    ASSERT_EQ(format_size(3ull * 1024 * 1024), std::string("3.0 MiB"));
    ASSERT_EQ(format_size(5ull * 1024 * 1024 * 1024), std::string("5.0 GiB"));
    ASSERT_EQ(format_size(2ull << 40), std::string("2.0 TiB"));
    ASSERT_EQ(format_size(std::numeric_limits<std::uint64_t>::max()), std::string("16.0 EiB"));
}

TEST_CASE(test_render_bar) {
    ASSERT_EQ(render_bar(0.0, 10), std::string(""));
    ASSERT_EQ(render_bar(5.0, 10), std::string("▌"));
    ASSERT_EQ(render_bar(25.0, 10), std::string("██▌"));
    ASSERT_EQ(render_bar(30.0, 10), std::string("███"));

    std::string full;
    for (int i = 0; i < 10; ++i) full += "█";
    ASSERT_EQ(render_bar(100.0, 10), full);

    // Never wider than requested, even when rounding up the last eighth
    ASSERT_EQ(rdu::ui::display_cols(render_bar(99.9, 10)), 10);
    ASSERT_EQ(rdu::ui::display_cols(render_bar(100.0, 4)), 4);
}

TEST_CASE(test_format_percent) {
    ASSERT_EQ(rdu::ui::format_percent(25.0, 5), std::string(" 25.0"));
    ASSERT_EQ(rdu::ui::format_percent(100.0, 5), std::string("100.0"));
    ASSERT_EQ(rdu::ui::format_percent(0.0, 5), std::string("  0.0"));
}

TEST_CASE(test_display_width) {
    ASSERT_EQ(display_width("abc"), 3);
    ASSERT_EQ(display_width("日本"), 4);
    ASSERT_EQ(display_width("e\xCC\x81"), 1);  // e + combining acute
    ASSERT_EQ(display_width(""), 0);
}

TEST_CASE(test_trunc_pad_and_align) {
    using namespace rdu::ui;
    ASSERT_EQ(trunc_pad("abc", 5), std::string("abc  "));
    ASSERT_EQ(trunc_pad("abcdef", 4), std::string("abc…"));
    ASSERT_EQ(display_cols(trunc_pad("日本語", 4)), 4);
    ASSERT_EQ(rpad_trunc("42", 5), std::string("   42"));
    ASSERT_EQ(lr_align(20, "Sort", "done"), std::string("Sort            done"));
    ASSERT_EQ(display_cols(lr_align(10, "a very long left side", "right")), 10);
}

TEST_CASE(test_keymap_defaults) {
    rdu::config::KeyMap keymap;
    ASSERT_EQ(keymap.lookup_action("j"), std::string("next"));
    ASSERT_EQ(keymap.lookup_action("down"), std::string("next"));
    ASSERT_EQ(keymap.lookup_action("ctrl+u"), std::string("page_up"));
    ASSERT_EQ(keymap.lookup_action("pagedown"), std::string("page_down"));
    ASSERT_EQ(keymap.lookup_action("G"), std::string("go_to_last"));
    ASSERT_EQ(keymap.lookup_action("backspace"), std::string("go_up"));
    ASSERT_EQ(keymap.lookup_action("o"), std::string("enter_dir"));
    ASSERT_EQ(keymap.lookup_action("m"), std::string("sort_mtime"));
    ASSERT_EQ(keymap.lookup_action("escape"), std::string("quit"));
    ASSERT_EQ(keymap.lookup_action("z"), std::string(""));
}

TEST_CASE(test_keymap_config_bindings) {
    rdu::config::KeyMap keymap;
    keymap.load_from_config({{"refresh", "F"}, {"no_such_action", "x"}, {"quit", ""}});

    ASSERT_EQ(keymap.lookup_action("F"), std::string("refresh"));
    ASSERT_EQ(keymap.lookup_action("r"), std::string("refresh"));  // defaults stay
    ASSERT_EQ(keymap.lookup_action("x"), std::string(""));
    ASSERT_TRUE(rdu::config::KeyMap::is_known_action("sort_count"));
    ASSERT_FALSE(rdu::config::KeyMap::is_known_action("play"));
}

TEST_CASE(test_command_line_defaults) {
    auto cmd = rdu::config::CommandLine::parse(std::vector<std::string>{});
    ASSERT_TRUE(cmd.action == rdu::config::CommandLine::Action::Run);
    ASSERT_EQ(cmd.path.string(), std::string("."));
    ASSERT_FALSE(cmd.one_file_system);
    ASSERT_FALSE(cmd.follow_links);
}

TEST_CASE(test_command_line_flags_and_path) {
    using rdu::config::CommandLine;
    auto cmd = CommandLine::parse(std::vector<std::string>{"-x", "/var", "--follow-links"});
    ASSERT_TRUE(cmd.one_file_system);
    ASSERT_TRUE(cmd.follow_links);
    ASSERT_EQ(cmd.path.string(), std::string("/var"));

    auto bundled = CommandLine::parse(std::vector<std::string>{"-xL"});
    ASSERT_TRUE(bundled.one_file_system);
    ASSERT_TRUE(bundled.follow_links);

    auto dashed = CommandLine::parse(std::vector<std::string>{"--", "-odd-name"});
    ASSERT_EQ(dashed.path.string(), std::string("-odd-name"));
}

TEST_CASE(test_command_line_help_version) {
    using rdu::config::CommandLine;
    ASSERT_TRUE(CommandLine::parse(std::vector<std::string>{"-h"}).action == CommandLine::Action::ShowHelp);
    ASSERT_TRUE(CommandLine::parse(std::vector<std::string>{"--version"}).action == CommandLine::Action::ShowVersion);
    ASSERT_TRUE(CommandLine::version_string().rfind("rdu ", 0) == 0);
    ASSERT_TRUE(CommandLine::usage("rdu").find("--one-file-system") != std::string::npos);
}

TEST_CASE(test_command_line_errors) {
    using rdu::config::CommandLine;
    using rdu::config::UsageError;
    ASSERT_THROWS(CommandLine::parse(std::vector<std::string>{"--bogus"}), UsageError);
    ASSERT_THROWS(CommandLine::parse(std::vector<std::string>{"-xq"}), UsageError);
    ASSERT_THROWS(CommandLine::parse(std::vector<std::string>{"a", "b"}), UsageError);
}

TEST_CASE(test_config_parse_file) {
    rdu::test::TempTree tree("config");
    auto path = tree.root() / "config.toml";
    {
        std::ofstream out(path);
        out << "# rdu settings\n";
        out << "[scan]\n";
        out << "follow_links = true\n";
        out << "one_file_system = false\n";
        out << "threads = 3\n";
        out << "propagate_refresh = true\n\n";
        out << "[logging]\n";
        out << "file = \"/tmp/custom.log\"\n";
        out << "level = debug\n\n";
        out << "[keybinds]\n";
        out << "refresh = \"F\"\n";
    }

    auto cfg = rdu::backend::ConfigLoader::load_from_file(path);
    ASSERT_TRUE(cfg.scan.follow_links);
    ASSERT_FALSE(cfg.scan.one_file_system);
    ASSERT_EQ(cfg.scan.threads, 3u);
    ASSERT_TRUE(cfg.propagate_refresh);
    ASSERT_EQ(cfg.log_file.string(), std::string("/tmp/custom.log"));
    ASSERT_TRUE(cfg.log_level == Logger::Level::Debug);
    ASSERT_EQ(cfg.keybinds.at("refresh"), std::string("F"));
}

TEST_CASE(test_config_bad_values_keep_defaults) {
    rdu::test::TempTree tree("config_bad");
    auto path = tree.root() / "config.toml";
    {
        std::ofstream out(path);
        out << "[scan]\n";
        out << "follow_links = maybe\n";
        out << "threads = lots\n";
        out << "this line has no equals sign\n";
    }

    auto cfg = rdu::backend::ConfigLoader::load_from_file(path);
    ASSERT_FALSE(cfg.scan.follow_links);
    ASSERT_EQ(cfg.scan.threads, 0u);
    ASSERT_FALSE(cfg.propagate_refresh);

    auto missing = rdu::backend::ConfigLoader::load_from_file(tree.root() / "nope.toml");
    ASSERT_TRUE(missing.scan == rdu::model::ScanOptions{});
}

TEST_CASE(test_logger_parse_level) {
    ASSERT_TRUE(Logger::parse_level("debug") == Logger::Level::Debug);
    ASSERT_TRUE(Logger::parse_level("WARNING") == Logger::Level::Warn);
    ASSERT_TRUE(Logger::parse_level("error") == Logger::Level::Error);
    ASSERT_TRUE(Logger::parse_level("chatty") == Logger::Level::Info);
}

TEST_CASE(test_normalize_root) {
    ASSERT_EQ(Platform::normalize_root("/usr/lib/../share/").string(), std::string("/usr/share"));
    ASSERT_EQ(Platform::normalize_root("/").string(), std::string("/"));
    ASSERT_TRUE(Platform::normalize_root(".").is_absolute());
}

int main() {
    return rdu::test::TestRunner::instance().run_all("utils");
}
