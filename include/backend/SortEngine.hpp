#pragma once

#include "model/FileNode.hpp"
#include "model/SortMode.hpp"

namespace rdu::backend {

class SortEngine {
public:
    /**
     * Reorder node.children in place by mode. Descending reverses the natural
     * comparison; equal keys keep their current relative order (stable).
     * Missing modification times compare as the oldest possible value.
     */
    static void sort(model::FileNode& node, model::SortMode mode, bool ascending);

    // Strict "a before b" for the given mode and direction
    static bool before(const model::FileNode& a, const model::FileNode& b,
                       model::SortMode mode, bool ascending);
};

}  // namespace rdu::backend
