/*
 * hybridsort - A hybrid comparison sorting and order-statistics engine
 *
 * Copyright (c) 2025
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * =============================================================================
 *
 * hybridsort: Comparison Sorting for Any Element Type
 *
 * How it works:
 *   n <= 5          -> fixed compare-exchange network
 *   n < threshold   -> insertion sort (stable, adaptive)
 *   unstable        -> iterative median-of-three quicksort (explicit stack)
 *   stable          -> bottom-up merge sort with one O(n) buffer
 *
 *   partition_by_rank() -> quickselect on the same partition primitive
 *
 * Works with any random access iterator and any comparator defining a
 * strict weak ordering. No randomization: the same input, comparator and
 * stability request always produce the same output.
 *
 * The quicksort is NOT an introsort: pivot selection is deterministic and
 * there is no depth-limited fallback, so crafted inputs can drive it to
 * O(n^2). Use stable_sort() when a worst-case O(n log n) bound matters.
 *
 * Usage:
 *   #include "hybridsort.hpp"
 *
 *   std::vector<int> data = {5, 2, 8, 1, 9};
 *   hybrid::sort(data.begin(), data.end());
 *
 *   // Stable, with a comparator:
 *   hybrid::stable_sort(people.begin(), people.end(),
 *                       [](const Person& a, const Person& b) { return a.age < b.age; });
 *
 *   // Median without a full sort:
 *   hybrid::partition_by_rank(data.begin(), data.end(), data.size() / 2);
 *
 * =============================================================================
 */

#ifndef HYBRIDSORT_HPP
#define HYBRIDSORT_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

// Spans shorter than this are insertion sorted. Also the block width of the
// stable merge sort.
#ifndef HYBRIDSORT_INSERTION_SORT_THRESHOLD
#define HYBRIDSORT_INSERTION_SORT_THRESHOLD 32
#endif

namespace hybrid {

constexpr std::size_t insertion_sort_threshold = HYBRIDSORT_INSERTION_SORT_THRESHOLD;
static_assert(insertion_sort_threshold >= 1, "HYBRIDSORT_INSERTION_SORT_THRESHOLD must be at least 1");

// Largest span sorted by a compare-exchange network.
constexpr std::size_t small_sort_max = 5;

namespace detail {

using index_t = std::ptrdiff_t;

constexpr index_t threshold = static_cast<index_t>(insertion_sort_threshold);
constexpr index_t network_max = static_cast<index_t>(small_sort_max);

template<typename RandomIt>
using value_type_t = typename std::iterator_traits<RandomIt>::value_type;

template<typename RandomIt>
constexpr bool is_random_access_v = std::is_base_of_v<
    std::random_access_iterator_tag,
    typename std::iterator_traits<RandomIt>::iterator_category>;

// True when X is the "caller buffer" argument rather than a comparator.
template<typename RandomIt, typename X>
constexpr bool is_buffer_v = std::is_same_v<std::decay_t<X>, value_type_t<RandomIt>*>;

// =============================================================================
// SMALL SPANS: COMPARE-EXCHANGE NETWORKS (n = 2..5)
// =============================================================================

template<typename RandomIt, typename Compare>
inline void compare_exchange(RandomIt a, index_t i, index_t j, Compare& comp) {
    if (comp(a[j], a[i])) std::iter_swap(a + i, a + j);
}

// Sorts a[x], a[y], a[z] given that a[y], a[z] are already in order.
// Always two comparisons.
template<typename RandomIt, typename Compare>
inline void partial_sort3(RandomIt a, index_t x, index_t y, index_t z, Compare& comp) {
    compare_exchange(a, x, z, comp);
    compare_exchange(a, x, y, comp);
}

template<typename RandomIt, typename Compare>
inline void sort3(RandomIt a, index_t x, index_t y, index_t z, Compare& comp) {
    compare_exchange(a, y, z, comp);
    partial_sort3(a, x, y, z, comp);
}

// Comparison counts: 1, 3, 5, 9 for n = 2, 3, 4, 5. Other n are left alone.
template<typename RandomIt, typename Compare>
void small_sort(RandomIt a, index_t n, Compare& comp) {
    switch (n) {
    case 2:
        compare_exchange(a, 0, 1, comp);
        break;
    case 3:
        sort3(a, 0, 1, 2, comp);
        break;
    case 4:
        compare_exchange(a, 0, 2, comp);
        compare_exchange(a, 1, 3, comp);
        compare_exchange(a, 0, 1, comp);
        compare_exchange(a, 2, 3, comp);
        compare_exchange(a, 1, 2, comp);
        break;
    case 5:
        compare_exchange(a, 0, 1, comp);
        compare_exchange(a, 3, 4, comp);
        partial_sort3(a, 2, 3, 4, comp);
        compare_exchange(a, 1, 4, comp);
        partial_sort3(a, 0, 2, 3, comp);
        partial_sort3(a, 1, 2, 3, comp);
        break;
    default:
        break;
    }
}

// =============================================================================
// INSERTION SORT (stable, O(n + inversions))
// =============================================================================

template<typename RandomIt, typename Compare>
void insertion_sort(RandomIt a, index_t n, Compare& comp) {
    for (index_t i = 1; i < n; i++) {
        // Strict test keeps equal elements in input order
        if (!comp(a[i], a[i - 1])) continue;

        value_type_t<RandomIt> tmp = std::move(a[i]);
        index_t j = i;
        do {
            a[j] = std::move(a[j - 1]);
            --j;
        } while (j > 0 && comp(tmp, a[j - 1]));
        a[j] = std::move(tmp);
    }
}

// =============================================================================
// PARTITIONING (median-of-three pivot, two inward cursors)
// =============================================================================

// Moves the median of a[0], a[n/2], a[n-1] into a[0]. For n == 2 the smaller
// element ends up in a[0]. Requires n >= 2.
template<typename RandomIt, typename Compare>
void median_to_front(RandomIt a, index_t n, Compare& comp) {
    if (n < 3) {
        compare_exchange(a, 0, 1, comp);
        return;
    }
    index_t mid = n / 2;
    sort3(a, 0, mid, n - 1, comp);
    std::iter_swap(a, a + mid);
}

// Pivot is a[0]. Afterwards [0, p) is less than the pivot, a[p] is the pivot
// and (p, n) is not less than it. Returns p.
//
// Elements equal to the pivot go right, so a long run of them lands in the
// next span up, where partition_left() can dispose of it in one pass.
template<typename RandomIt, typename Compare>
index_t partition_right(RandomIt a, index_t n, Compare& comp) {
    index_t left = 1;
    index_t right = n - 1;

    for (;;) {
        while (left <= right && comp(a[left], a[0])) ++left;
        while (left <= right && !comp(a[right], a[0])) --right;
        if (left >= right) break;
        std::iter_swap(a + left, a + right);
        ++left;
        --right;
    }

    index_t p = left - 1;
    if (p != 0) std::iter_swap(a, a + p);
    return p;
}

// Pivot is a[0]. Afterwards [0, p] is not greater than the pivot and (p, n)
// is greater. Returns p.
//
// Only called when the element before the span is not less than the pivot.
// That element is a pivot from an earlier pass and bounds the whole span
// from below, so every element of [0, p] is equal to the pivot.
template<typename RandomIt, typename Compare>
index_t partition_left(RandomIt a, index_t n, Compare& comp) {
    index_t left = 1;
    index_t right = n - 1;

    for (;;) {
        while (left <= right && !comp(a[0], a[left])) ++left;
        while (left <= right && comp(a[0], a[right])) --right;
        if (left >= right) break;
        std::iter_swap(a + left, a + right);
        ++left;
        --right;
    }

    index_t p = left - 1;
    if (p != 0) std::iter_swap(a, a + p);
    return p;
}

// =============================================================================
// QUICKSORT (iterative, unstable)
// =============================================================================

struct span {
    index_t start;
    index_t end;
};

// Expected pending-stack height under median-of-three pivoting:
// max(2, ceil(1.3 * log2(n))). Only a reservation; the stack grows past it.
inline std::size_t estimate_stack_depth(index_t n) {
    if (n < 2) return 2;
    double est = std::ceil(1.3 * std::log2(static_cast<double>(n)));
    return std::max<std::size_t>(2, static_cast<std::size_t>(est));
}

template<typename RandomIt, typename Compare>
void quick_sort(RandomIt first, index_t n, Compare& comp) {
    std::vector<span> stack;
    stack.reserve(estimate_stack_depth(n));
    stack.push_back({0, n});

    while (!stack.empty()) {
        span s = stack.back();
        stack.pop_back();

        index_t len = s.end - s.start;
        RandomIt a = first + s.start;

        if (len <= 1) continue;
        if (len <= network_max) {
            small_sort(a, len, comp);
            continue;
        }
        if (len < threshold) {
            insertion_sort(a, len, comp);
            continue;
        }

        median_to_front(a, len, comp);

        // Predecessor equal to the pivot: we are inside a run of duplicates.
        if (s.start > 0 && !comp(first[s.start - 1], a[0])) {
            index_t p = s.start + partition_left(a, len, comp);
            if (s.end - p > 2) stack.push_back({p + 1, s.end});
            continue;
        }

        index_t p = s.start + partition_right(a, len, comp);
        span lower{s.start, p};
        span upper{p + 1, s.end};

        // Larger side goes on first so the smaller one is popped next
        if (lower.end - lower.start < upper.end - upper.start) std::swap(lower, upper);
        if (lower.end - lower.start > 1) stack.push_back(lower);
        if (upper.end - upper.start > 1) stack.push_back(upper);
    }
}

// =============================================================================
// MERGE SORT (bottom-up, stable)
// =============================================================================

// Scratch storage for the merge passes, obtained from an allocator as raw
// memory. Slots are move-constructed on their first write and assigned after
// that; writes always start at slot 0, so [0, constructed) are live objects.
// Whatever was constructed is destroyed, and the storage returned, on every
// exit path.
template<typename T, typename Alloc>
class temporary_buffer {
    using traits = std::allocator_traits<Alloc>;

public:
    temporary_buffer(index_t n, const Alloc& alloc)
        : alloc_(alloc),
          data_(traits::allocate(alloc_, static_cast<std::size_t>(n))),
          capacity_(n) {}

    ~temporary_buffer() {
        for (index_t i = 0; i < constructed_; i++) {
            traits::destroy(alloc_, data_ + i);
        }
        traits::deallocate(alloc_, data_, static_cast<std::size_t>(capacity_));
    }

    temporary_buffer(const temporary_buffer&) = delete;
    temporary_buffer& operator=(const temporary_buffer&) = delete;

    void put(index_t i, T&& value) {
        if (i < constructed_) {
            data_[i] = std::move(value);
        } else {
            traits::construct(alloc_, data_ + i, std::move(value));
            ++constructed_;
        }
    }

    T* data() { return data_; }

private:
    Alloc alloc_;
    T* data_;
    index_t capacity_;
    index_t constructed_ = 0;
};

// A caller-supplied buffer whose slots already hold live objects.
template<typename T>
class assigned_buffer {
public:
    explicit assigned_buffer(T* data) : data_(data) {}

    void put(index_t i, T&& value) { data_[i] = std::move(value); }

    T* data() { return data_; }

private:
    T* data_;
};

// Merges the sorted runs [0, mid) and [mid, n) of a through buffer. Ties take
// the left run. Whatever is left of the right run is already in place.
template<typename RandomIt, typename Compare, typename Buffer>
void merge_runs(RandomIt a, index_t mid, index_t n, Buffer& buffer, Compare& comp) {
    if (!comp(a[mid], a[mid - 1])) return;

    index_t i = 0;
    index_t j = mid;
    index_t out = 0;

    while (i < mid && j < n) {
        if (comp(a[j], a[i])) {
            buffer.put(out++, std::move(a[j++]));
        } else {
            buffer.put(out++, std::move(a[i++]));
        }
    }
    while (i < mid) {
        buffer.put(out++, std::move(a[i++]));
    }

    std::move(buffer.data(), buffer.data() + out, a);
}

// buffer must hold at least n elements.
template<typename RandomIt, typename Compare, typename Buffer>
void merge_sort(RandomIt a, index_t n, Buffer& buffer, Compare& comp) {
    for (index_t lo = 0; lo < n; lo += threshold) {
        insertion_sort(a + lo, std::min(threshold, n - lo), comp);
    }

    for (index_t width = threshold; width < n; width *= 2) {
        for (index_t lo = 0; lo < n - width; lo += 2 * width) {
            index_t hi = std::min(lo + 2 * width, n);
            merge_runs(a + lo, width, hi - lo, buffer, comp);
        }
    }
}

// =============================================================================
// QUICKSELECT
// =============================================================================

template<typename RandomIt, typename Compare>
void select(RandomIt first, index_t n, index_t k, Compare& comp) {
    index_t lo = 0;
    index_t hi = n;

    while (hi - lo > 1) {
        RandomIt a = first + lo;
        index_t len = hi - lo;

        median_to_front(a, len, comp);

        if (lo > 0 && !comp(first[lo - 1], a[0])) {
            index_t p = lo + partition_left(a, len, comp);
            // [lo, p] is a run equal to the pivot
            if (k <= p) return;
            lo = p + 1;
            continue;
        }

        index_t p = lo + partition_right(a, len, comp);
        if (p == k) return;
        if (k < p) {
            hi = p;
        } else {
            lo = p + 1;
        }
    }
}

} // namespace detail

// =============================================================================
// PUBLIC API
// =============================================================================

/**
 * Sort a range in place. Not stable.
 *
 * Average O(n log n), O(log n) extra space for the pending-span stack.
 * Worst case is O(n^2) on adversarial input (no introsort fallback).
 *
 * @param first Iterator to the beginning of the range
 * @param last Iterator to the end of the range
 * @param comp Strict weak ordering; comp(a, b) is true if a must precede b
 */
template<typename RandomIt, typename Compare>
void sort(RandomIt first, RandomIt last, Compare comp) {
    static_assert(detail::is_random_access_v<RandomIt>, "hybridsort requires random access iterators");

    detail::index_t n = std::distance(first, last);
    if (n <= 1) return;

    if (n <= detail::network_max) {
        detail::small_sort(first, n, comp);
    } else if (n < detail::threshold) {
        detail::insertion_sort(first, n, comp);
    } else {
        detail::quick_sort(first, n, comp);
    }
}

template<typename RandomIt>
void sort(RandomIt first, RandomIt last) {
    hybrid::sort(first, last, std::less<>());
}

/**
 * Stable sort of a range, using an internally allocated buffer of
 * (last - first) elements obtained from alloc.
 *
 * O(n log n) worst case. The buffer is allocated before the range is
 * touched, so an allocation failure leaves the input unchanged and
 * propagates the allocator's exception (std::bad_alloc by default).
 *
 * The buffer is raw storage; value_type only needs to be move
 * constructible and move assignable.
 *
 * @param first Iterator to the beginning of the range
 * @param last Iterator to the end of the range
 * @param comp Strict weak ordering
 * @param alloc Allocator used for the temporary buffer
 */
template<typename RandomIt, typename Compare, typename Alloc>
std::enable_if_t<!detail::is_buffer_v<RandomIt, Compare>>
stable_sort(RandomIt first, RandomIt last, Compare comp, const Alloc& alloc) {
    using T = detail::value_type_t<RandomIt>;
    static_assert(detail::is_random_access_v<RandomIt>, "hybridsort requires random access iterators");
    static_assert(std::is_same_v<typename std::allocator_traits<Alloc>::value_type, T>,
                  "allocator value_type must match the element type");

    detail::index_t n = std::distance(first, last);
    if (n < detail::threshold) {
        detail::insertion_sort(first, n, comp);
        return;
    }

    detail::temporary_buffer<T, Alloc> buffer(n, alloc);
    detail::merge_sort(first, n, buffer, comp);
}

template<typename RandomIt, typename Compare>
std::enable_if_t<!detail::is_buffer_v<RandomIt, Compare>>
stable_sort(RandomIt first, RandomIt last, Compare comp) {
    hybrid::stable_sort(first, last, comp, std::allocator<detail::value_type_t<RandomIt>>());
}

template<typename RandomIt>
void stable_sort(RandomIt first, RandomIt last) {
    hybrid::stable_sort(first, last, std::less<>());
}

/**
 * Stable sort using a provided buffer (avoids allocation).
 *
 * @param first Iterator to the beginning of the range
 * @param last Iterator to the end of the range
 * @param buffer Temporary buffer of at least (last - first) elements
 * @param comp Strict weak ordering
 */
template<typename RandomIt, typename Compare>
void stable_sort(RandomIt first, RandomIt last, detail::value_type_t<RandomIt>* buffer, Compare comp) {
    static_assert(detail::is_random_access_v<RandomIt>, "hybridsort requires random access iterators");

    detail::index_t n = std::distance(first, last);
    if (n < detail::threshold) {
        detail::insertion_sort(first, n, comp);
        return;
    }

    detail::assigned_buffer<detail::value_type_t<RandomIt>> slots(buffer);
    detail::merge_sort(first, n, slots, comp);
}

template<typename RandomIt>
void stable_sort(RandomIt first, RandomIt last, detail::value_type_t<RandomIt>* buffer) {
    hybrid::stable_sort(first, last, buffer, std::less<>());
}

/**
 * Sort a range, choosing the stable or unstable strategy at run time.
 */
template<typename RandomIt, typename Compare>
void sort(RandomIt first, RandomIt last, Compare comp, bool stable) {
    if (stable) {
        hybrid::stable_sort(first, last, comp);
    } else {
        hybrid::sort(first, last, comp);
    }
}

/**
 * Rearrange a range so that the element at offset k is the one a full sort
 * would put there, nothing before it compares after it and nothing after it
 * compares before it. Order within each side is unspecified.
 *
 * Average O(n). Same worst case as sort().
 *
 * @param first Iterator to the beginning of the range
 * @param last Iterator to the end of the range
 * @param k Zero-based rank, must be less than (last - first)
 * @param comp Strict weak ordering
 * @throws std::invalid_argument if k is out of range (including any k on an
 *         empty range); the range is not touched
 */
template<typename RandomIt, typename Compare>
void partition_by_rank(RandomIt first, RandomIt last, std::size_t k, Compare comp) {
    static_assert(detail::is_random_access_v<RandomIt>, "hybridsort requires random access iterators");

    detail::index_t n = std::distance(first, last);
    if (n <= 0 || k >= static_cast<std::size_t>(n)) {
        throw std::invalid_argument("hybrid::partition_by_rank: rank out of range");
    }
    detail::select(first, n, static_cast<detail::index_t>(k), comp);
}

template<typename RandomIt>
void partition_by_rank(RandomIt first, RandomIt last, std::size_t k) {
    hybrid::partition_by_rank(first, last, k, std::less<>());
}

/**
 * Stable insertion sort. O(n + inversions); meant for short or nearly
 * sorted ranges.
 */
template<typename RandomIt, typename Compare>
void insertion_sort(RandomIt first, RandomIt last, Compare comp) {
    static_assert(detail::is_random_access_v<RandomIt>, "hybridsort requires random access iterators");
    detail::insertion_sort(first, std::distance(first, last), comp);
}

template<typename RandomIt>
void insertion_sort(RandomIt first, RandomIt last) {
    hybrid::insertion_sort(first, last, std::less<>());
}

/**
 * Sort at most small_sort_max elements with a fixed compare-exchange
 * network. The number of comparisons depends only on the length.
 *
 * @throws std::invalid_argument if the range is longer than small_sort_max
 */
template<typename RandomIt, typename Compare>
void small_sort(RandomIt first, RandomIt last, Compare comp) {
    static_assert(detail::is_random_access_v<RandomIt>, "hybridsort requires random access iterators");

    detail::index_t n = std::distance(first, last);
    if (n > detail::network_max) {
        throw std::invalid_argument("hybrid::small_sort: range longer than small_sort_max");
    }
    detail::small_sort(first, n, comp);
}

template<typename RandomIt>
void small_sort(RandomIt first, RandomIt last) {
    hybrid::small_sort(first, last, std::less<>());
}

} // namespace hybrid

#endif // HYBRIDSORT_HPP
