/*
 * Copyright 2015 Georgia Institute of Technology
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file    common_prefix.hpp
 * @brief   Sequential algorithms for the longest common prefix of a set of
 *          strings: character scan, binary search on the prefix length, and
 *          trie traversal.
 *
 * All three take a non-empty range of `std::string` and return identical
 * results. An empty range throws `std::invalid_argument`, a single string
 * is its own common prefix.
 */
#ifndef COMMON_PREFIX_HPP
#define COMMON_PREFIX_HPP

#include <string>
#include <vector>
#include <iterator>
#include <algorithm>
#include <stdexcept>

#include "prefix_trie.hpp"

/// returns the length of the shortest string in the non-empty range [begin, end)
template <typename Iterator>
std::size_t min_string_length(Iterator begin, Iterator end) {
    std::size_t min_len = begin->size();
    for (Iterator it = begin; it != end; ++it) {
        min_len = std::min(min_len, it->size());
    }
    return min_len;
}

/// returns whether `prefix` is a prefix of `str`
inline bool is_prefix_of(const std::string& prefix, const std::string& str) {
    return prefix.size() <= str.size() && std::equal(prefix.begin(), prefix.end(), str.begin());
}

/// returns whether the first `len` characters of `*begin` are a prefix of
/// all strings in [begin, end). `len` must not exceed any string's length.
template <typename Iterator>
bool is_common_prefix_length(Iterator begin, Iterator end, std::size_t len) {
    if (len == 0)
        return true;
    const std::string& first = *begin;
    for (Iterator it = begin; it != end; ++it) {
        if (!std::equal(first.begin(), first.begin() + len, it->begin()))
            return false;
    }
    return true;
}

namespace detail {

template <typename Iterator>
inline void check_nonempty_input(Iterator begin, Iterator end) {
    if (begin == end) {
        throw std::invalid_argument("common prefix of an empty string list is undefined");
    }
}

} // namespace detail

/**
 * @brief   Character by character scan in O(min_len * n).
 *
 * Compares position `i` across all strings until the first mismatch, bound
 * by the length of the shortest string.
 */
template <typename Iterator>
std::string lcp_character(Iterator begin, Iterator end) {
    detail::check_nonempty_input(begin, end);
    if (std::next(begin) == end)
        return *begin;

    const std::string& first = *begin;
    std::size_t min_len = min_string_length(begin, end);
    std::size_t i = 0;
    for (; i < min_len; ++i) {
        char c = first[i];
        bool all_equal = true;
        for (Iterator it = std::next(begin); it != end; ++it) {
            if ((*it)[i] != c) {
                all_equal = false;
                break;
            }
        }
        if (!all_equal)
            break;
    }
    return first.substr(0, i);
}

/**
 * @brief   Binary search for the longest feasible prefix length.
 *
 * Feasibility of a length `l` (the first `l` characters of the first string
 * are a prefix of all strings) is monotone in `l`, so the maximal feasible
 * length in [0, min_len] is found with O(log(min_len)) feasibility tests.
 */
template <typename Iterator>
std::string lcp_binary_search(Iterator begin, Iterator end) {
    detail::check_nonempty_input(begin, end);
    if (std::next(begin) == end)
        return *begin;

    std::size_t low = 0;
    std::size_t high = min_string_length(begin, end);
    while (low < high) {
        // round up, otherwise `low = mid` doesn't make progress
        std::size_t mid = (low + high + 1) / 2;
        if (is_common_prefix_length(begin, end, mid)) {
            low = mid;
        } else {
            high = mid - 1;
        }
    }
    return begin->substr(0, low);
}

/**
 * @brief   Inserts all strings into a temporary `prefix_trie` and walks its
 *          single-child path from the root.
 */
template <typename Iterator>
std::string lcp_trie(Iterator begin, Iterator end) {
    detail::check_nonempty_input(begin, end);
    if (std::next(begin) == end)
        return *begin;

    prefix_trie<std::size_t> trie(begin, end);
    return trie.longest_common_prefix();
}

inline std::string lcp_character(const std::vector<std::string>& strings) {
    return lcp_character(strings.begin(), strings.end());
}

inline std::string lcp_binary_search(const std::vector<std::string>& strings) {
    return lcp_binary_search(strings.begin(), strings.end());
}

inline std::string lcp_trie(const std::vector<std::string>& strings) {
    return lcp_trie(strings.begin(), strings.end());
}

#endif // COMMON_PREFIX_HPP
