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
 * @brief   Unit tests for the progressive common prefix analysis.
 */

#include <gtest/gtest.h>

#include <progressive_lcp.hpp>
#include <check_common_prefix.hpp>
#include <rand_strings.hpp>

typedef std::vector<std::string> strs;

TEST(PlcpProgressive, PrefixExample) {
    strs input = {"prefix_test_1", "prefix_test_2", "prefix_demo", "prefix_example"};
    for (lcp_algorithm a : all_lcp_algorithms()) {
        run_result r = progressive_lcp(input, a);
        ASSERT_TRUE(r.ok());
        ASSERT_EQ(lcp_algorithm_name(a), r.algorithm_used);
        ASSERT_EQ(3u, r.total_steps);
        ASSERT_EQ(3u, r.results.size());

        ASSERT_EQ(1u, r.results[0].step);
        ASSERT_EQ(2u, r.results[0].strings_count);
        ASSERT_EQ("prefix_test_", r.results[0].common_prefix);

        ASSERT_EQ(2u, r.results[1].step);
        ASSERT_EQ(3u, r.results[1].strings_count);
        ASSERT_EQ("prefix_", r.results[1].common_prefix);

        ASSERT_EQ(3u, r.results[2].step);
        ASSERT_EQ(4u, r.results[2].strings_count);
        ASSERT_EQ("prefix_", r.results[2].common_prefix);

        ASSERT_EQ(4u, r.summary.initial_strings_count);
        ASSERT_EQ("prefix_", r.summary.final_common_prefix);
        ASSERT_EQ(7u, r.summary.prefix_length);
        ASSERT_FALSE(r.has_performance);
        ASSERT_TRUE(r.performance_data.empty());
    }
}

TEST(PlcpProgressive, AnalyzedStrings) {
    strs input = {"a1", "a2", "a3", "a4", "a5"};
    run_result r = progressive_lcp(input);
    ASSERT_EQ(4u, r.results.size());
    for (std::size_t i = 0; i < r.results.size(); ++i) {
        strs expected(input.begin(), input.begin() + i + 2);
        ASSERT_EQ(i + 2, r.results[i].num_analyzed());
        ASSERT_EQ(expected, strs(r.results[i].analyzed_begin(), r.results[i].analyzed_end()));
    }
    // input is untouched
    ASSERT_EQ(strs({"a1", "a2", "a3", "a4", "a5"}), input);
}

TEST(PlcpProgressive, EmptyInput) {
    run_result r = progressive_lcp(strs());
    ASSERT_FALSE(r.ok());
    ASSERT_EQ("Empty string list provided", r.error);
    ASSERT_EQ(0u, r.total_steps);
    ASSERT_TRUE(r.results.empty());
    ASSERT_EQ(0u, r.summary.initial_strings_count);
    ASSERT_EQ("", r.summary.final_common_prefix);
    ASSERT_EQ(0u, r.summary.prefix_length);

    // empty input takes precedence over an unknown algorithm
    run_result r2 = progressive_lcp(strs(), "nonsense");
    ASSERT_EQ("Empty string list provided", r2.error);
}

TEST(PlcpProgressive, SingleString) {
    for (lcp_algorithm a : all_lcp_algorithms()) {
        run_result r = progressive_lcp(strs{"single"}, a, true);
        ASSERT_TRUE(r.ok());
        ASSERT_EQ(1u, r.total_steps);
        ASSERT_EQ(1u, r.results.size());
        ASSERT_EQ(1u, r.results[0].step);
        ASSERT_EQ(1u, r.results[0].strings_count);
        ASSERT_EQ("single", r.results[0].common_prefix);
        ASSERT_EQ(strs{"single"}, strs(r.results[0].analyzed_begin(), r.results[0].analyzed_end()));
        ASSERT_EQ(1u, r.summary.initial_strings_count);
        ASSERT_EQ("single", r.summary.final_common_prefix);
        ASSERT_EQ(6u, r.summary.prefix_length);
        ASSERT_EQ(1u, r.performance_data.size());
        ASSERT_EQ(1u, r.performance_summary.total_strings_processed);
    }
}

TEST(PlcpProgressive, NoCommonPrefix) {
    run_result r = progressive_lcp(strs{"abc", "xyz"});
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(1u, r.total_steps);
    ASSERT_EQ("", r.results[0].common_prefix);
    ASSERT_EQ(0u, r.summary.prefix_length);

    r = progressive_lcp(strs{"", "abc"}, lcp_algorithm::trie);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ("", r.summary.final_common_prefix);

    r = progressive_lcp(strs{"", "", ""}, lcp_algorithm::binary_search);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(2u, r.total_steps);
    ASSERT_EQ("", r.summary.final_common_prefix);
}

TEST(PlcpProgressive, AlgorithmByName) {
    strs input = {"getUserData", "getUserInfo", "getUserProfile", "getPostData"};
    run_result r = progressive_lcp(input, "binary_search");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ("binary_search", r.algorithm_used);
    ASSERT_EQ("getUser", r.results[0].common_prefix);
    ASSERT_EQ("getUser", r.results[1].common_prefix);
    ASSERT_EQ("get", r.results[2].common_prefix);
}

TEST(PlcpProgressive, UnknownAlgorithm) {
    run_result r = progressive_lcp(strs{"abc", "abd"}, "suffix_tree");
    ASSERT_FALSE(r.ok());
    ASSERT_EQ(0u, r.total_steps);
    ASSERT_TRUE(r.results.empty());
    ASSERT_EQ("suffix_tree", r.algorithm_used);
    ASSERT_NE(std::string::npos, r.error.find("Unknown algorithm: suffix_tree"));
    ASSERT_NE(std::string::npos, r.error.find("character, binary_search, trie"));

    // also for a single string
    r = progressive_lcp(strs{"abc"}, "");
    ASSERT_FALSE(r.ok());
    ASSERT_TRUE(r.results.empty());
}

TEST(PlcpProgressive, Performance) {
    strs input = {"performance_test_string_1", "performance_test_string_2", "performance_test_different"};
    run_result r = progressive_lcp(input, lcp_algorithm::character, true);
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(r.has_performance);
    ASSERT_EQ(r.results.size(), r.performance_data.size());

    double total = 0.0;
    std::size_t strings = 0;
    for (std::size_t i = 0; i < r.performance_data.size(); ++i) {
        const perf_record& p = r.performance_data[i];
        ASSERT_EQ(r.results[i].step, p.step);
        ASSERT_EQ(r.results[i].strings_count, p.strings_count);
        ASSERT_GE(p.execution_time_ms, 0.0);
        total += p.execution_time_ms;
        strings += p.strings_count;
    }
    ASSERT_NEAR(total, r.performance_summary.total_execution_time_ms, 1e-9);
    ASSERT_EQ(strings, r.performance_summary.total_strings_processed);
    ASSERT_EQ(5u, r.performance_summary.total_strings_processed);

    // step 2: 25 + 25 + 26 input chars, "performance_test_" output
    const memory_estimate& m = r.performance_data[1].memory;
    ASSERT_EQ(76u, m.input_chars);
    ASSERT_EQ(17u, m.output_chars);
    ASSERT_EQ(3u, m.strings_count);
    ASSERT_EQ(4u * (76u + 17u), m.estimated_bytes);
    ASSERT_EQ(m.estimated_bytes, r.performance_summary.peak_memory_estimate_bytes);
}

// steps refer to one shared copy of the input instead of copying it per step
TEST(PlcpProgressive, LargeInputSharesStrings) {
    strs input = rand_prefixed_strings(4000, 64, 32, 3);
    run_result r = progressive_lcp(input, lcp_algorithm::character, true);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(3999u, r.total_steps);

    const std::vector<std::string>* shared = r.results.front().input.get();
    ASSERT_TRUE(shared != nullptr);
    ASSERT_NE(&input, shared);
    for (std::size_t i = 0; i < r.results.size(); ++i) {
        ASSERT_EQ(shared, r.results[i].input.get());
        ASSERT_EQ(i + 2, r.results[i].num_analyzed());
    }
    // no copies besides the one held by the steps
    ASSERT_EQ(static_cast<long>(r.results.size()), r.results.front().input.use_count());
    ASSERT_EQ(input, *r.results.front().input);

    // the last step analyzes all strings and has the peak estimate
    ASSERT_EQ(4u * (64u * 4000u + r.results.back().common_prefix.size()),
              r.performance_summary.peak_memory_estimate_bytes);
    ASSERT_LE(32u, r.summary.prefix_length);
}

// all algorithms produce correct, monotonically shrinking prefixes
TEST(PlcpProgressive, RandomRunsAreCorrect) {
    for (int seed = 1; seed <= 50; ++seed) {
        strs input = rand_short_strings(1 + seed % 20, 10, seed);
        run_result ref = progressive_lcp(input, lcp_algorithm::character);
        for (lcp_algorithm a : all_lcp_algorithms()) {
            run_result r = progressive_lcp(input, a);
            ASSERT_TRUE(check_progressive_run(input, r)) << "seed " << seed << ", algorithm " << a;
            ASSERT_EQ(input.size() == 1 ? 1u : input.size() - 1, r.total_steps);
            for (std::size_t i = 0; i < r.results.size(); ++i) {
                ASSERT_EQ(ref.results[i].common_prefix, r.results[i].common_prefix);
                if (i > 0) {
                    ASSERT_GE(r.results[i-1].common_prefix.size(), r.results[i].common_prefix.size());
                }
            }
        }
    }
}
