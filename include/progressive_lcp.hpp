/*
 * Copyright 2016 Georgia Institute of Technology
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
 * @file    progressive_lcp.hpp
 * @brief   Progressive common prefix analysis: the common prefix of the
 *          first 2, 3, ..., n strings of a list.
 */
#ifndef PROGRESSIVE_LCP_HPP
#define PROGRESSIVE_LCP_HPP

#include <string>
#include <vector>
#include <memory>
#include <algorithm>

#include "lcp_algorithm.hpp"
#include "perf_stats.hpp"

/// result of analyzing the first `strings_count` strings
struct lcp_step {
    // 1-based step index
    std::size_t step;
    std::size_t strings_count;
    std::string common_prefix;
    // the run's input, shared by all of its steps
    std::shared_ptr<const std::vector<std::string>> input;

    lcp_step() : step(0), strings_count(0) {}
    lcp_step(std::size_t step, std::size_t strings_count, const std::string& prefix,
             const std::shared_ptr<const std::vector<std::string>>& input)
        : step(step), strings_count(strings_count), common_prefix(prefix), input(input) {}

    /// number of analyzed strings actually available from `input`
    std::size_t num_analyzed() const {
        return std::min(strings_count, source().size());
    }

    /// the analyzed strings are [analyzed_begin(), analyzed_end())
    string_iterator analyzed_begin() const {
        return source().begin();
    }

    string_iterator analyzed_end() const {
        return source().begin() + num_analyzed();
    }

protected:
    const std::vector<std::string>& source() const {
        static const std::vector<std::string> none;
        return input ? *input : none;
    }
};

struct run_summary {
    std::size_t initial_strings_count;
    std::string final_common_prefix;
    std::size_t prefix_length;

    run_summary() : initial_strings_count(0), prefix_length(0) {}
};

struct run_result {
    std::vector<lcp_step> results;
    std::size_t total_steps;
    std::string algorithm_used;
    run_summary summary;

    // empty if the run succeeded
    std::string error;

    // only filled with `include_performance`
    bool has_performance;
    std::vector<perf_record> performance_data;
    perf_summary performance_summary;

    run_result() : total_steps(0), has_performance(false) {}

    bool ok() const {
        return error.empty();
    }
};

namespace detail {

inline run_result error_result(const std::string& algorithm_name, std::size_t n, const std::string& msg) {
    run_result r;
    r.algorithm_used = algorithm_name;
    r.summary.initial_strings_count = n;
    r.error = msg;
    return r;
}

} // namespace detail

/**
 * @brief   Computes the common prefix of the first k strings for each
 *          k = 2, ..., n, using the given algorithm.
 *
 * A single input string yields one step whose prefix is the string itself.
 * An empty input yields no steps and an error message. This function does
 * not throw on malformed input.
 *
 * @param strings               The input strings, order defines the steps.
 * @param algo                  The common prefix algorithm.
 * @param include_performance   Whether to time every step and attach
 *                              `performance_data` and `performance_summary`.
 */
inline run_result progressive_lcp(const std::vector<std::string>& strings, lcp_algorithm algo = default_lcp_algorithm, bool include_performance = false) {
    if (strings.empty()) {
        return detail::error_result(lcp_algorithm_name(algo), 0, "Empty string list provided");
    }

    run_result result;
    result.algorithm_used = lcp_algorithm_name(algo);
    result.has_performance = include_performance;
    lcp_function f = get_lcp_function(algo);
    // single copy of the input, steps refer to a prefix of it
    std::shared_ptr<const std::vector<std::string>> input = std::make_shared<const std::vector<std::string>>(strings);

    // a single string is its own prefix, otherwise start with 2 strings
    std::size_t first_k = (strings.size() == 1) ? 1 : 2;
    for (std::size_t k = first_k; k <= strings.size(); ++k) {
        std::size_t step = (strings.size() == 1) ? 1 : k - 1;
        string_iterator end = input->begin() + k;
        std::string prefix;
        if (include_performance) {
            result.performance_data.push_back(timed_step(step, input->begin(), end, f, prefix));
        } else {
            prefix = f(input->begin(), end);
        }
        result.results.emplace_back(step, k, prefix, input);
    }

    result.total_steps = result.results.size();
    result.summary.initial_strings_count = strings.size();
    result.summary.final_common_prefix = result.results.back().common_prefix;
    result.summary.prefix_length = result.summary.final_common_prefix.size();
    if (include_performance) {
        result.performance_summary = summarize_performance(result.performance_data);
    }
    return result;
}

/// same as above, with the algorithm given by its identifier
inline run_result progressive_lcp(const std::vector<std::string>& strings, const std::string& algorithm_name, bool include_performance = false) {
    if (strings.empty()) {
        return detail::error_result(algorithm_name, 0, "Empty string list provided");
    }
    lcp_algorithm algo;
    if (!parse_lcp_algorithm(algorithm_name, algo)) {
        return detail::error_result(algorithm_name, strings.size(),
                                    "Unknown algorithm: " + algorithm_name + " (valid: " + lcp_algorithm_names() + ")");
    }
    return progressive_lcp(strings, algo, include_performance);
}

#endif // PROGRESSIVE_LCP_HPP
