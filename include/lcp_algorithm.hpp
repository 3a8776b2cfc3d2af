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
 * @file    lcp_algorithm.hpp
 * @brief   Selection of one of the common prefix algorithms by identifier.
 */
#ifndef LCP_ALGORITHM_HPP
#define LCP_ALGORITHM_HPP

#include <string>
#include <vector>
#include <array>
#include <iostream>
#include <stdexcept>

#include "common_prefix.hpp"

enum class lcp_algorithm {
    character,
    binary_search,
    trie
};

constexpr lcp_algorithm default_lcp_algorithm = lcp_algorithm::character;

/// all algorithms, in the order they are reported
inline const std::array<lcp_algorithm, 3>& all_lcp_algorithms() {
    static const std::array<lcp_algorithm, 3> algos = {{
        lcp_algorithm::character,
        lcp_algorithm::binary_search,
        lcp_algorithm::trie
    }};
    return algos;
}

inline std::string lcp_algorithm_name(lcp_algorithm algo) {
    switch (algo) {
        case lcp_algorithm::character:
            return "character";
        case lcp_algorithm::binary_search:
            return "binary_search";
        case lcp_algorithm::trie:
            return "trie";
    }
    throw std::logic_error("invalid lcp_algorithm value");
}

/// comma separated list of the valid identifiers
inline std::string lcp_algorithm_names() {
    std::string names;
    for (lcp_algorithm a : all_lcp_algorithms()) {
        if (!names.empty())
            names += ", ";
        names += lcp_algorithm_name(a);
    }
    return names;
}

/**
 * @brief   Parses an algorithm identifier.
 *
 * @param name      One of "character", "binary_search", "trie".
 * @param algo[out] The parsed algorithm, untouched if `name` is unknown.
 *
 * @return  Whether `name` is a valid identifier.
 */
inline bool parse_lcp_algorithm(const std::string& name, lcp_algorithm& algo) {
    for (lcp_algorithm a : all_lcp_algorithms()) {
        if (name == lcp_algorithm_name(a)) {
            algo = a;
            return true;
        }
    }
    return false;
}

inline std::ostream& operator<<(std::ostream& os, lcp_algorithm algo) {
    return os << lcp_algorithm_name(algo);
}

typedef std::vector<std::string>::const_iterator string_iterator;
typedef std::string (*lcp_function)(string_iterator, string_iterator);

/// returns the implementation of `algo`
inline lcp_function get_lcp_function(lcp_algorithm algo) {
    switch (algo) {
        case lcp_algorithm::character:
            return &lcp_character<string_iterator>;
        case lcp_algorithm::binary_search:
            return &lcp_binary_search<string_iterator>;
        case lcp_algorithm::trie:
            return &lcp_trie<string_iterator>;
    }
    throw std::logic_error("invalid lcp_algorithm value");
}

/// runs `algo` on the non-empty range [begin, end)
inline std::string longest_common_prefix(string_iterator begin, string_iterator end, lcp_algorithm algo = default_lcp_algorithm) {
    return get_lcp_function(algo)(begin, end);
}

inline std::string longest_common_prefix(const std::vector<std::string>& strings, lcp_algorithm algo = default_lcp_algorithm) {
    return longest_common_prefix(strings.begin(), strings.end(), algo);
}

#endif // LCP_ALGORITHM_HPP
