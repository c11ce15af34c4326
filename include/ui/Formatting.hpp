#pragma once

#include <cstdint>
#include <string>

namespace rdu::ui {

/**
 * Human-readable byte count with binary prefixes.
 * Below 1024 the exact count is shown ("512 B"), otherwise one decimal
 * place and the largest fitting prefix ("1.5 KiB", "3.0 MiB", ... "EiB").
 */
std::string format_size(std::uint64_t bytes);

/**
 * Usage bar of at most `width` columns for a percentage in [0, 100].
 * Whole cells are drawn with a full block, the remainder is rounded to
 * the nearest eighth and drawn with one partial block.
 */
std::string render_bar(double percent, int width);

// Percentage with one decimal, right-aligned in `width` columns ("  7.5")
std::string format_percent(double percent, int width);

/**
 * Terminal columns occupied by a plain UTF-8 string.
 * Wide characters count 2, combining marks 0.
 */
int display_cols(const std::string& s);

/**
 * Longest prefix of s that fits in `width` columns.
 */
std::string take_cols(const std::string& s, int width);

/**
 * Truncate string if too long, pad with spaces if too short.
 * Result will be exactly `width` display columns.
 */
std::string trunc_pad(const std::string& s, int width);

/**
 * Right-align (spaces on the left side), truncating if too long.
 */
std::string rpad_trunc(const std::string& s, int width);

/**
 * Align left text and right text with space between.
 * Example: lr_align(20, "Sort", "done") -> "Sort            done"
 */
std::string lr_align(int width, const std::string& left, const std::string& right);

} // namespace rdu::ui
