#include "backend/SortEngine.hpp"
#include "util/TimSort.hpp"

namespace rdu::backend {

namespace {

// -1, 0, 1 like strcmp
template<typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

int compare_by(const model::FileNode& a, const model::FileNode& b, model::SortMode mode) {
    switch (mode) {
        case model::SortMode::Size:
            return three_way(a.size, b.size);
        case model::SortMode::ModifiedTime:
            // std::optional orders nullopt below every value
            return three_way(a.modified_time, b.modified_time);
        case model::SortMode::ItemCount:
            return three_way(a.child_count(), b.child_count());
    }
    return 0;
}

}  // namespace

bool SortEngine::before(const model::FileNode& a, const model::FileNode& b,
                        model::SortMode mode, bool ascending) {
    int cmp = compare_by(a, b, mode);
    return ascending ? cmp < 0 : cmp > 0;
}

void SortEngine::sort(model::FileNode& node, model::SortMode mode, bool ascending) {
    util::timsort(node.children, [mode, ascending](const model::FileNode::Ptr& a,
                                                   const model::FileNode::Ptr& b) {
        return before(*a, *b, mode, ascending);
    });
}

}  // namespace rdu::backend
