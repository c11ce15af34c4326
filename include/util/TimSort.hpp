#pragma once

#include <vector>
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace rdu::util {

namespace detail {

/**
 * Minimum run length: n is shifted down until it is below 32, with a
 * rounding bit so that n / min_run is close to a power of two.
 */
constexpr size_t min_run_length(size_t n) {
    size_t r = 0;
    while (n >= 32) {
        r |= (n & 1);
        n >>= 1;
    }
    return n + r;
}

struct Run {
    size_t base;
    size_t length;
};

// Insertion sort of [first, last) where [first, sorted_end) is already ordered.
// Inserts after equal elements, which keeps the sort stable.
template<typename RandomIt, typename Compare>
void binary_insertion_sort(RandomIt first, RandomIt sorted_end, RandomIt last, Compare& comp) {
    for (auto it = sorted_end; it != last; ++it) {
        auto pos = std::upper_bound(first, it, *it, comp);
        if (pos == it) continue;
        auto value = std::move(*it);
        std::move_backward(pos, it, it + 1);
        *pos = std::move(value);
    }
}

// Length of the natural run starting at first. A strictly descending run is
// reversed in place; strictness matters, reversing equal keys would break stability.
template<typename RandomIt, typename Compare>
size_t natural_run(RandomIt first, RandomIt last, Compare& comp) {
    auto end = first + 1;
    if (end == last) return 1;

    if (comp(*end, *first)) {
        while (end != last && comp(*end, *(end - 1))) ++end;
        std::reverse(first, end);
    } else {
        while (end != last && !comp(*end, *(end - 1))) ++end;
    }
    return static_cast<size_t>(std::distance(first, end));
}

// Stable merge of runs[i] and runs[i + 1]. Only the smaller side is buffered.
template<typename RandomIt, typename Compare>
void merge_runs(RandomIt first, std::vector<Run>& runs, size_t i, Compare& comp) {
    using Value = typename std::iterator_traits<RandomIt>::value_type;

    auto left = first + runs[i].base;
    auto mid = left + runs[i].length;
    auto right_end = mid + runs[i + 1].length;

    // Elements of the left run already <= the right run's head stay put,
    // and so do right run elements >= the left run's tail.
    left = std::upper_bound(left, mid, *mid, comp);
    right_end = std::lower_bound(mid, right_end, *(mid - 1), comp);

    if (left != mid && mid != right_end) {
        if (std::distance(left, mid) <= std::distance(mid, right_end)) {
            std::vector<Value> buffer(std::make_move_iterator(left), std::make_move_iterator(mid));
            auto a = buffer.begin();
            auto b = mid;
            auto out = left;
            while (a != buffer.end() && b != right_end) {
                *out++ = comp(*b, *a) ? std::move(*b++) : std::move(*a++);
            }
            std::move(a, buffer.end(), out);
        } else {
            std::vector<Value> buffer(std::make_move_iterator(mid), std::make_move_iterator(right_end));
            auto a = mid;           // one past the remaining left elements
            auto b = buffer.end();  // one past the remaining buffered right elements
            auto out = right_end;
            while (a != left && b != buffer.begin()) {
                if (comp(*(b - 1), *(a - 1))) {
                    *--out = std::move(*--a);
                } else {
                    *--out = std::move(*--b);
                }
            }
            std::move_backward(buffer.begin(), b, out);
        }
    }

    runs[i].length += runs[i + 1].length;
    runs.erase(runs.begin() + static_cast<std::ptrdiff_t>(i) + 1);
}

// Restores the run stack invariants: |Z| > |Y| + |X| and |Y| > |X|.
template<typename RandomIt, typename Compare>
void collapse(RandomIt first, std::vector<Run>& runs, Compare& comp) {
    while (runs.size() > 1) {
        size_t n = runs.size() - 2;
        if ((n > 0 && runs[n - 1].length <= runs[n].length + runs[n + 1].length) ||
            (n > 1 && runs[n - 2].length <= runs[n - 1].length + runs[n].length)) {
            if (runs[n - 1].length < runs[n + 1].length) --n;
        } else if (runs[n].length > runs[n + 1].length) {
            break;
        }
        merge_runs(first, runs, n, comp);
    }
}

}  // namespace detail

/**
 * TimSort: stable, adaptive merge sort.
 * O(n) on presorted input, O(n log n) worst case. Equal elements keep
 * their relative order, which the directory listing relies on when keys tie.
 */
template<typename RandomIt, typename Compare>
void timsort(RandomIt first, RandomIt last, Compare comp) {
    const size_t n = static_cast<size_t>(std::distance(first, last));
    if (n < 2) return;

    const size_t min_run = detail::min_run_length(n);
    std::vector<detail::Run> runs;

    size_t pos = 0;
    while (pos < n) {
        auto run_first = first + static_cast<std::ptrdiff_t>(pos);
        size_t run_len = detail::natural_run(run_first, last, comp);

        if (run_len < min_run) {
            size_t forced = std::min(n - pos, min_run);
            detail::binary_insertion_sort(run_first, run_first + static_cast<std::ptrdiff_t>(run_len),
                                          run_first + static_cast<std::ptrdiff_t>(forced), comp);
            run_len = forced;
        }

        runs.push_back({pos, run_len});
        detail::collapse(first, runs, comp);
        pos += run_len;
    }

    while (runs.size() > 1) {
        size_t i = runs.size() - 2;
        if (i > 0 && runs[i - 1].length < runs[i + 1].length) --i;
        detail::merge_runs(first, runs, i, comp);
    }
}

template<typename Container, typename Compare>
void timsort(Container& c, Compare comp) {
    timsort(c.begin(), c.end(), comp);
}

}  // namespace rdu::util
