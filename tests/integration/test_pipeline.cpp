#include "../framework/SimpleTest.hpp"
#include "../framework/TempTree.hpp"
#include "backend/Navigator.hpp"
#include "backend/TreeBuilder.hpp"
#include "config/KeyMap.hpp"
#include "ui/Renderer.hpp"
#include "util/DirectoryWalker.hpp"
#include <filesystem>

using namespace rdu::backend;
using rdu::model::FileNode;
using rdu::model::ScanOptions;
using rdu::test::TempTree;

namespace {

FileNode::Ptr child_named(const FileNode::Ptr& node, const std::string& name) {
    for (const auto& child : node->children) {
        if (child->name == name) return child;
    }
    return nullptr;
}

}  // namespace

TEST_CASE(test_scan_real_tree) {
    TempTree tree("scan");
    tree.file("a.bin", 100);
    tree.file("docs/b.txt", 30);
    tree.file("docs/deep/c.txt", 20);
    tree.file("docs/deep/d.txt", 10);
    tree.dir("empty");

    rdu::util::DirectoryWalker walker;
    TreeBuilder builder(walker, ScanOptions{});
    auto root = builder.build(tree.root());

    ASSERT_EQ(root->size, 160u);
    ASSERT_EQ(root->error_count, 0u);
    ASSERT_EQ(root->children.size(), 3u);
    ASSERT_TRUE(root->modified_time.has_value());

    auto docs = child_named(root, "docs");
    ASSERT_TRUE(docs != nullptr);
    ASSERT_TRUE(docs->is_directory);
    ASSERT_EQ(docs->size, 60u);

    auto deep = child_named(docs, "deep");
    ASSERT_TRUE(deep != nullptr);
    ASSERT_EQ(deep->size, 30u);
    ASSERT_EQ(deep->children.size(), 2u);

    auto empty = child_named(root, "empty");
    ASSERT_TRUE(empty != nullptr);
    ASSERT_EQ(empty->size, 0u);
    ASSERT_TRUE(empty->children.empty());
}

TEST_CASE(test_trailing_slash_root) {
    TempTree tree("slash");
    tree.file("x", 7);

    rdu::util::DirectoryWalker walker;
    TreeBuilder builder(walker, ScanOptions{});
    auto root = builder.build(tree.root().string() + "/");

    ASSERT_EQ(root->size, 7u);
    ASSERT_EQ(root->children.size(), 1u);
    ASSERT_EQ(root->children[0]->name, std::string("x"));
}

TEST_CASE(test_symlink_not_followed) {
    TempTree tree("nolink");
    tree.file("target/big", 500);
    tree.dir("other");
    std::filesystem::create_directory_symlink(tree.root() / "target", tree.root() / "other/link");

    rdu::util::DirectoryWalker walker;
    TreeBuilder builder(walker, ScanOptions{});
    auto root = builder.build(tree.root());

    // The link counts as a zero-size leaf, the target only once
    ASSERT_EQ(root->size, 500u);
    auto link = child_named(child_named(root, "other"), "link");
    ASSERT_TRUE(link != nullptr);
    ASSERT_FALSE(link->is_directory);
    ASSERT_EQ(link->size, 0u);
}

TEST_CASE(test_symlink_loop_is_reported) {
    TempTree tree("loop");
    tree.file("sub/f", 40);
    std::filesystem::create_directory_symlink(tree.root(), tree.root() / "sub/back");

    ScanOptions options;
    options.follow_links = true;

    rdu::util::DirectoryWalker walker;
    TreeBuilder builder(walker, options);
    auto root = builder.build(tree.root());

    ASSERT_EQ(root->error_count, 1u);
    ASSERT_EQ(root->size, 40u);
    auto back = child_named(child_named(root, "sub"), "back");
    ASSERT_TRUE(back != nullptr);
    ASSERT_TRUE(back->children.empty());
}

TEST_CASE(test_unreadable_directory_counts_error) {
    if (::geteuid() == 0) return;  // root reads everything

    TempTree tree("denied");
    tree.file("ok", 5);
    auto locked = tree.dir("locked");
    tree.file("locked/hidden", 50);
    std::filesystem::permissions(locked, std::filesystem::perms::none);

    rdu::util::DirectoryWalker walker;
    TreeBuilder builder(walker, ScanOptions{});
    auto root = builder.build(tree.root());

    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

    ASSERT_EQ(root->error_count, 1u);
    ASSERT_EQ(root->size, 5u);
}

TEST_CASE(test_browse_and_refresh_after_deletion) {
    TempTree tree("refresh");
    tree.file("data/one", 100);
    tree.file("data/two", 100);
    tree.file("data/three", 100);
    tree.file("keep", 50);

    rdu::util::DirectoryWalker walker;
    TreeBuilder builder(walker, ScanOptions{});
    Navigator nav(builder.build(tree.root()), builder);
    rdu::config::KeyMap keymap;
    rdu::ui::Renderer renderer(nav, keymap);

    auto press = [&](const std::string& name) {
        renderer.handle_input_event(rdu::ui::InputEvent{
            rdu::ui::InputEvent::Type::KeyPress, name.size() == 1 ? name[0] : 0, name});
    };

    ASSERT_EQ(nav.current()->children[0]->name, std::string("data"));
    press("enter");
    ASSERT_EQ(nav.current()->name, std::string("data"));
    ASSERT_EQ(nav.current()->children.size(), 3u);

    tree.remove("data/one");
    tree.remove("data/two");
    press("r");

    ASSERT_EQ(nav.current()->children.size(), 1u);
    ASSERT_EQ(nav.current()->size, 100u);
    ASSERT_EQ(nav.status_message(), std::optional<std::string>("Refresh complete!"));
    ASSERT_EQ(nav.selection(), std::optional<std::size_t>(0));

    // Ancestors keep their scanned totals
    press("u");
    ASSERT_EQ(nav.current()->size, 350u);
    ASSERT_FALSE(nav.status_message().has_value());
}

int main() {
    return rdu::test::TestRunner::instance().run_all("pipeline");
}
