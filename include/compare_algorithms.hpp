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
 * @file    compare_algorithms.hpp
 * @brief   Runs the progressive analysis with every common prefix algorithm
 *          on the same input and cross-checks the results.
 */
#ifndef COMPARE_ALGORITHMS_HPP
#define COMPARE_ALGORITHMS_HPP

#include <string>
#include <vector>
#include <sstream>
#include <algorithm>

#include "progressive_lcp.hpp"

/// a disagreement between the reference run and another algorithm's run
struct lcp_discrepancy {
    // 0 if the disagreement is not about a single step
    std::size_t step;
    std::string algorithm;
    std::string expected;
    std::string actual;
    std::string message;
};

struct algorithm_run {
    std::string algorithm;
    run_result result;
};

/// per-algorithm series for plotting
struct visualization_data {
    struct time_point {
        std::size_t step;
        double time_ms;
    };
    struct memory_point {
        std::size_t step;
        std::size_t memory_bytes;
    };
    struct series {
        std::string algorithm;
        std::vector<time_point> performance_chart;
        std::vector<memory_point> memory_usage;
        // final common prefix of this algorithm's run
        std::string accuracy_check;
    };

    std::vector<series> algorithms;
};

struct comparison_report {
    std::vector<std::string> algorithms_compared;
    std::size_t input_strings_count;
    std::vector<algorithm_run> comparison_results;
    bool all_agree;
    std::vector<lcp_discrepancy> discrepancies;
    bool has_visualization;
    visualization_data visualization;

    comparison_report() : input_strings_count(0), all_agree(true), has_visualization(false) {}
};

/**
 * @brief   Cross-checks the runs in `report.comparison_results` against the
 *          first one and records every mismatch in `report.discrepancies`.
 *
 * @return  Whether all runs agree on every step.
 */
inline bool check_agreement(comparison_report& report) {
    report.discrepancies.clear();
    if (report.comparison_results.empty()) {
        report.all_agree = true;
        return true;
    }

    const algorithm_run& ref = report.comparison_results.front();
    for (std::size_t a = 1; a < report.comparison_results.size(); ++a) {
        const algorithm_run& other = report.comparison_results[a];
        if (ref.result.error != other.result.error) {
            lcp_discrepancy d;
            d.step = 0;
            d.algorithm = other.algorithm;
            d.expected = ref.result.error;
            d.actual = other.result.error;
            d.message = "error state differs from " + ref.algorithm;
            report.discrepancies.push_back(d);
        }
        if (ref.result.results.size() != other.result.results.size()) {
            std::stringstream ss;
            ss << "step count " << other.result.results.size() << " differs from "
               << ref.algorithm << " (" << ref.result.results.size() << ")";
            lcp_discrepancy d;
            d.step = 0;
            d.algorithm = other.algorithm;
            d.message = ss.str();
            report.discrepancies.push_back(d);
        }
        std::size_t n = std::min(ref.result.results.size(), other.result.results.size());
        for (std::size_t i = 0; i < n; ++i) {
            const lcp_step& r = ref.result.results[i];
            const lcp_step& o = other.result.results[i];
            if (r.common_prefix != o.common_prefix) {
                lcp_discrepancy d;
                d.step = r.step;
                d.algorithm = other.algorithm;
                d.expected = r.common_prefix;
                d.actual = o.common_prefix;
                d.message = "common prefix differs from " + ref.algorithm;
                report.discrepancies.push_back(d);
            }
        }
    }
    report.all_agree = report.discrepancies.empty();
    return report.all_agree;
}

inline visualization_data make_visualization(const std::vector<algorithm_run>& runs) {
    visualization_data viz;
    for (const algorithm_run& run : runs) {
        if (!run.result.ok() || !run.result.has_performance)
            continue;
        visualization_data::series s;
        s.algorithm = run.algorithm;
        for (const perf_record& p : run.result.performance_data) {
            visualization_data::time_point tp;
            tp.step = p.step;
            tp.time_ms = p.execution_time_ms;
            s.performance_chart.push_back(tp);
            visualization_data::memory_point mp;
            mp.step = p.step;
            mp.memory_bytes = p.memory.estimated_bytes;
            s.memory_usage.push_back(mp);
        }
        s.accuracy_check = run.result.summary.final_common_prefix;
        viz.algorithms.push_back(s);
    }
    return viz;
}

/**
 * @brief   Runs the progressive analysis (with performance data) once per
 *          algorithm over `strings` and compares the per-step prefixes.
 *
 * Disagreements are never dropped: they are listed in the returned report's
 * `discrepancies` and clear its `all_agree` flag.
 */
inline comparison_report compare_algorithms(const std::vector<std::string>& strings, bool include_visualization = false) {
    comparison_report report;
    report.input_strings_count = strings.size();
    for (lcp_algorithm algo : all_lcp_algorithms()) {
        algorithm_run run;
        run.algorithm = lcp_algorithm_name(algo);
        run.result = progressive_lcp(strings, algo, true);
        report.algorithms_compared.push_back(run.algorithm);
        report.comparison_results.push_back(run);
    }
    check_agreement(report);
    if (include_visualization) {
        report.has_visualization = true;
        report.visualization = make_visualization(report.comparison_results);
    }
    return report;
}

#endif // COMPARE_ALGORITHMS_HPP
