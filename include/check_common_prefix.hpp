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
 * @file    check_common_prefix.hpp
 * @brief   Correctness checks for computed common prefixes and progressive
 *          runs.
 */
#ifndef CHECK_COMMON_PREFIX_HPP
#define CHECK_COMMON_PREFIX_HPP

#include <vector>
#include <string>
#include <iostream>
#include <algorithm>

#include "common_prefix.hpp"
#include "progressive_lcp.hpp"

/**
 * @brief   Checks whether `prefix` is a prefix of every string in
 *          [begin, end).
 *
 * @return  Whether `prefix` is a common prefix.
 */
template <typename Iterator>
bool check_common_prefix(Iterator begin, Iterator end, const std::string& prefix)
{
    bool success = true;
    std::size_t i = 0;
    for (Iterator it = begin; it != end; ++it, ++i) {
        if (!is_prefix_of(prefix, *it)) {
            std::cerr << "[ERROR] '" << prefix << "' is not a prefix of strings[" << i << "]='" << *it << "'" << std::endl;
            success = false;
        }
    }
    return success;
}

/**
 * @brief   Checks that no common prefix of [begin, end) is longer than
 *          `prefix`, i.e., `prefix` is as long as the shortest string, or the
 *          character following it is not the same in all strings.
 *
 * Assumes that `prefix` is a common prefix (see `check_common_prefix`).
 *
 * @return  Whether `prefix` is maximal.
 */
template <typename Iterator>
bool check_maximal_prefix(Iterator begin, Iterator end, const std::string& prefix)
{
    if (begin == end)
        return true;
    std::size_t len = prefix.size();
    if (len >= min_string_length(begin, end))
        return true;
    // the next character of the first string has to mismatch somewhere
    char c = (*begin)[len];
    for (Iterator it = begin; it != end; ++it) {
        if ((*it)[len] != c)
            return true;
    }
    std::cerr << "[ERROR] '" << prefix << "' is not maximal, all strings continue with '" << c << "'" << std::endl;
    return false;
}

/**
 * @brief   Checks a progressive run over `strings`: step numbering and
 *          counts, that each step's prefix is the longest common prefix of
 *          the analyzed strings, and that prefix lengths never increase.
 *
 * All violations are reported on `std::cerr`.
 *
 * @return  Whether the run is correct.
 */
inline bool check_progressive_run(const std::vector<std::string>& strings, const run_result& result)
{
    if (strings.empty()) {
        if (result.ok() || !result.results.empty()) {
            std::cerr << "[ERROR] empty input must give an error and no steps" << std::endl;
            return false;
        }
        return true;
    }
    if (!result.ok()) {
        std::cerr << "[ERROR] run failed: " << result.error << std::endl;
        return false;
    }

    bool success = true;
    std::size_t expected_steps = (strings.size() == 1) ? 1 : strings.size() - 1;
    if (result.results.size() != expected_steps || result.total_steps != expected_steps) {
        std::cerr << "[ERROR] number of steps is wrong: " << result.results.size() << "!=" << expected_steps << std::endl;
        success = false;
    }

    // extra steps are reported above, never checked against the input
    std::size_t n = std::min(result.results.size(), expected_steps);
    for (std::size_t i = 0; i < n; ++i) {
        const lcp_step& s = result.results[i];
        std::size_t k = (strings.size() == 1) ? 1 : i + 2;
        if (s.step != i + 1 || s.strings_count != k) {
            std::cerr << "[ERROR] step " << i << ": (step, strings_count)=(" << s.step << "," << s.strings_count
                      << ") != (" << i + 1 << "," << k << ")" << std::endl;
            success = false;
        }
        if (s.num_analyzed() != k
            || !std::equal(s.analyzed_begin(), s.analyzed_end(), strings.begin())) {
            std::cerr << "[ERROR] step " << i + 1 << ": analyzed strings are not the first " << k << " input strings" << std::endl;
            success = false;
        }
        if (!check_common_prefix(strings.begin(), strings.begin() + k, s.common_prefix)
            || !check_maximal_prefix(strings.begin(), strings.begin() + k, s.common_prefix)) {
            std::cerr << "[ERROR] step " << i + 1 << ": wrong common prefix '" << s.common_prefix << "'" << std::endl;
            success = false;
        }
        if (i > 0 && s.common_prefix.size() > result.results[i-1].common_prefix.size()) {
            std::cerr << "[ERROR] step " << i + 1 << ": prefix grew from " << result.results[i-1].common_prefix.size()
                      << " to " << s.common_prefix.size() << " characters" << std::endl;
            success = false;
        }
    }

    if (!result.results.empty() && result.summary.final_common_prefix != result.results.back().common_prefix) {
        std::cerr << "[ERROR] summary prefix '" << result.summary.final_common_prefix << "' != last step prefix '"
                  << result.results.back().common_prefix << "'" << std::endl;
        success = false;
    }
    return success;
}

#endif // CHECK_COMMON_PREFIX_HPP
