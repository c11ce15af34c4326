#include "ui/Formatting.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <iomanip>
#include <sstream>

namespace rdu::ui {

namespace {
constexpr const char* FULL_BLOCK = "█";
constexpr const char* PARTIAL_BLOCKS[] = {"▏", "▎", "▍", "▌", "▋", "▊", "▉"};
constexpr const char* BINARY_PREFIXES[] = {"Ki", "Mi", "Gi", "Ti", "Pi", "Ei"};
}

std::string format_size(std::uint64_t bytes) {
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes);
    size_t prefix = 0;
    value /= 1024.0;
    while (value >= 1024.0 && prefix + 1 < std::size(BINARY_PREFIXES)) {
        value /= 1024.0;
        ++prefix;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << " " << BINARY_PREFIXES[prefix] << "B";
    return oss.str();
}

std::string render_bar(double percent, int width) {
    if (width <= 0 || !(percent > 0.0)) return "";

    double fraction = percent / 100.0 * width;
    int full_blocks = static_cast<int>(std::floor(fraction));
    int partial = static_cast<int>(std::lround((fraction - full_blocks) * 8.0));

    std::string bar;
    for (int i = 0; i < std::min(full_blocks, width); ++i) {
        bar += FULL_BLOCK;
    }
    if (full_blocks < width && partial > 0) {
        bar += PARTIAL_BLOCKS[std::min(partial - 1, 6)];
    }
    return bar;
}

std::string format_percent(double percent, int width) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << std::setw(width) << percent;
    return oss.str();
}

int display_cols(const std::string& s) {
    return util::display_width(s);
}

std::string take_cols(const std::string& s, int cols) {
    if (cols <= 0) return "";

    int seen = 0;
    size_t i = 0;
    while (i < s.size()) {
        size_t next = i;
        UChar32 c = util::next_codepoint(s, next);
        int w = (c < 0) ? 1 : util::codepoint_width(c);
        if (seen + w > cols) break;
        seen += w;
        i = next;
    }
    return s.substr(0, i);
}

std::string trunc_pad(const std::string& s, int w) {
    if (w <= 0) return "";

    int cols = display_cols(s);

    if (cols == w) {
        return s;
    }

    if (cols < w) {
        return s + std::string(w - cols, ' ');
    }

    // Truncate with ellipsis; a wide char may leave one column short
    std::string out = (w <= 1) ? take_cols(s, w) : take_cols(s, w - 1) + "…";
    int out_cols = display_cols(out);
    if (out_cols < w) out += std::string(w - out_cols, ' ');
    return out;
}

std::string rpad_trunc(const std::string& s, int w) {
    if (w <= 0) return "";

    int cols = display_cols(s);

    if (cols == w) return s;
    if (cols < w) return std::string(w - cols, ' ') + s;

    return take_cols(s, w);
}

std::string lr_align(int width, const std::string& left, const std::string& right) {
    if (width <= 0) return "";

    std::string r = take_cols(right, width);
    int rvis = display_cols(r);
    int left_max = width - rvis;
    if (!r.empty()) left_max -= 1;  // at least one space between
    if (left_max < 0) left_max = 0;

    std::string l = trunc_pad(left, left_max);
    int lvis = display_cols(l);

    int space = width - lvis - rvis;
    if (space < 0) space = 0;

    return l + std::string(space, ' ') + r;
}

} // namespace rdu::ui
