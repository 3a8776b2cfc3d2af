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
 * @file    result_output.hpp
 * @brief   Text and JSON output of progressive runs and comparison reports.
 */
#ifndef RESULT_OUTPUT_HPP
#define RESULT_OUTPUT_HPP

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cstdio>
#include <algorithm>

#include "progressive_lcp.hpp"
#include "compare_algorithms.hpp"

/// number of analyzed strings shown per step before eliding with "..."
constexpr std::size_t max_shown_strings = 3;

/// writes `str` as a JSON string literal, including quotes
inline void write_json_string(std::ostream& os, const std::string& str) {
    os << '"';
    for (char c : str) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    os << buf;
                } else {
                    os << c;
                }
        }
    }
    os << '"';
}

namespace detail {

// fixed 4 decimals for times, restores the stream state
struct ms_format {
    double ms;
    explicit ms_format(double ms) : ms(ms) {}
};

inline std::ostream& operator<<(std::ostream& os, const ms_format& f) {
    std::ios::fmtflags flags = os.flags();
    std::streamsize prec = os.precision();
    os << std::fixed << std::setprecision(4) << f.ms;
    os.flags(flags);
    os.precision(prec);
    return os;
}

template <typename Iterator>
void write_json_strings(std::ostream& os, Iterator begin, Iterator end) {
    os << "[";
    for (Iterator it = begin; it != end; ++it) {
        if (it != begin)
            os << ", ";
        write_json_string(os, *it);
    }
    os << "]";
}

inline void write_json_strings(std::ostream& os, const std::vector<std::string>& strs) {
    write_json_strings(os, strs.begin(), strs.end());
}

inline void write_json_perf_record(std::ostream& os, const perf_record& p) {
    os << "{\"step\": " << p.step
       << ", \"strings_count\": " << p.strings_count
       << ", \"execution_time_ms\": " << ms_format(p.execution_time_ms)
       << ", \"memory_estimate\": {\"input_chars\": " << p.memory.input_chars
       << ", \"output_chars\": " << p.memory.output_chars
       << ", \"strings_count\": " << p.memory.strings_count
       << ", \"estimated_bytes\": " << p.memory.estimated_bytes << "}}";
}

inline void write_json_perf_summary(std::ostream& os, const perf_summary& s) {
    os << "{\"total_execution_time_ms\": " << ms_format(s.total_execution_time_ms)
       << ", \"average_execution_time_ms\": " << ms_format(s.average_execution_time_ms)
       << ", \"max_execution_time_ms\": " << ms_format(s.max_execution_time_ms)
       << ", \"min_execution_time_ms\": " << ms_format(s.min_execution_time_ms)
       << ", \"peak_memory_estimate_bytes\": " << s.peak_memory_estimate_bytes
       << ", \"total_strings_processed\": " << s.total_strings_processed << "}";
}

} // namespace detail

/**
 * @brief   Writes a run as a JSON object with the fields `results`,
 *          `total_steps`, `algorithm_used`, `summary`, and if present
 *          `error`, `performance_data` and `performance_summary`.
 */
inline void write_json(std::ostream& os, const run_result& r) {
    os << "{";
    if (!r.ok()) {
        os << "\"error\": ";
        write_json_string(os, r.error);
        os << ", ";
    }
    os << "\"results\": [";
    for (std::size_t i = 0; i < r.results.size(); ++i) {
        const lcp_step& s = r.results[i];
        if (i > 0)
            os << ", ";
        os << "{\"step\": " << s.step << ", \"strings_count\": " << s.strings_count << ", \"common_prefix\": ";
        write_json_string(os, s.common_prefix);
        os << ", \"analyzed_strings\": ";
        detail::write_json_strings(os, s.analyzed_begin(), s.analyzed_end());
        os << "}";
    }
    os << "], \"total_steps\": " << r.total_steps << ", \"algorithm_used\": ";
    write_json_string(os, r.algorithm_used);
    os << ", \"summary\": {\"initial_strings_count\": " << r.summary.initial_strings_count
       << ", \"final_common_prefix\": ";
    write_json_string(os, r.summary.final_common_prefix);
    os << ", \"prefix_length\": " << r.summary.prefix_length << "}";
    if (r.has_performance) {
        os << ", \"performance_data\": [";
        for (std::size_t i = 0; i < r.performance_data.size(); ++i) {
            if (i > 0)
                os << ", ";
            detail::write_json_perf_record(os, r.performance_data[i]);
        }
        os << "], \"performance_summary\": ";
        detail::write_json_perf_summary(os, r.performance_summary);
    }
    os << "}";
}

inline void write_json(std::ostream& os, const comparison_report& rep) {
    os << "{\"algorithms_compared\": ";
    detail::write_json_strings(os, rep.algorithms_compared);
    os << ", \"input_strings_count\": " << rep.input_strings_count;
    os << ", \"comparison_results\": {";
    for (std::size_t i = 0; i < rep.comparison_results.size(); ++i) {
        if (i > 0)
            os << ", ";
        write_json_string(os, rep.comparison_results[i].algorithm);
        os << ": ";
        write_json(os, rep.comparison_results[i].result);
    }
    os << "}, \"all_agree\": " << (rep.all_agree ? "true" : "false");
    os << ", \"discrepancies\": [";
    for (std::size_t i = 0; i < rep.discrepancies.size(); ++i) {
        const lcp_discrepancy& d = rep.discrepancies[i];
        if (i > 0)
            os << ", ";
        os << "{\"step\": " << d.step << ", \"algorithm\": ";
        write_json_string(os, d.algorithm);
        os << ", \"expected\": ";
        write_json_string(os, d.expected);
        os << ", \"actual\": ";
        write_json_string(os, d.actual);
        os << ", \"message\": ";
        write_json_string(os, d.message);
        os << "}";
    }
    os << "]";
    if (rep.has_visualization) {
        const std::vector<visualization_data::series>& algos = rep.visualization.algorithms;
        os << ", \"visualization\": {\"performance_chart\": {";
        for (std::size_t i = 0; i < algos.size(); ++i) {
            if (i > 0)
                os << ", ";
            write_json_string(os, algos[i].algorithm);
            os << ": [";
            for (std::size_t j = 0; j < algos[i].performance_chart.size(); ++j) {
                if (j > 0)
                    os << ", ";
                os << "{\"step\": " << algos[i].performance_chart[j].step
                   << ", \"time_ms\": " << detail::ms_format(algos[i].performance_chart[j].time_ms) << "}";
            }
            os << "]";
        }
        os << "}, \"memory_usage\": {";
        for (std::size_t i = 0; i < algos.size(); ++i) {
            if (i > 0)
                os << ", ";
            write_json_string(os, algos[i].algorithm);
            os << ": [";
            for (std::size_t j = 0; j < algos[i].memory_usage.size(); ++j) {
                if (j > 0)
                    os << ", ";
                os << "{\"step\": " << algos[i].memory_usage[j].step
                   << ", \"memory_bytes\": " << algos[i].memory_usage[j].memory_bytes << "}";
            }
            os << "]";
        }
        os << "}, \"accuracy_check\": {";
        for (std::size_t i = 0; i < algos.size(); ++i) {
            if (i > 0)
                os << ", ";
            write_json_string(os, algos[i].algorithm);
            os << ": ";
            write_json_string(os, algos[i].accuracy_check);
        }
        os << "}}";
    }
    os << "}";
}

/// human readable listing of the steps, the summary and performance data
inline void print_run_result(std::ostream& os, const run_result& r) {
    if (!r.ok()) {
        os << "error: " << r.error << std::endl;
        return;
    }
    for (const lcp_step& s : r.results) {
        os << "Step " << s.step << ": " << s.strings_count << " strings -> '" << s.common_prefix << "'";
        os << "  [";
        std::size_t n = s.num_analyzed();
        std::size_t shown = std::min(max_shown_strings, n);
        string_iterator it = s.analyzed_begin();
        for (std::size_t i = 0; i < shown; ++i, ++it) {
            if (i > 0)
                os << ", ";
            os << "'" << *it << "'";
        }
        if (n > shown)
            os << ", ... (" << n - shown << " more)";
        os << "]" << std::endl;
    }
    os << "Algorithm: " << r.algorithm_used << std::endl;
    os << "Final common prefix: '" << r.summary.final_common_prefix << "' (length: " << r.summary.prefix_length << ")" << std::endl;
    if (r.has_performance) {
        for (const perf_record& p : r.performance_data) {
            os << "Step " << p.step << ": " << detail::ms_format(p.execution_time_ms) << " ms, "
               << p.memory.estimated_bytes << " bytes" << std::endl;
        }
        const perf_summary& s = r.performance_summary;
        os << "Total time: " << detail::ms_format(s.total_execution_time_ms) << " ms" << std::endl;
        os << "Average time: " << detail::ms_format(s.average_execution_time_ms) << " ms" << std::endl;
        os << "Max time: " << detail::ms_format(s.max_execution_time_ms) << " ms" << std::endl;
        os << "Min time: " << detail::ms_format(s.min_execution_time_ms) << " ms" << std::endl;
        os << "Peak memory estimate: " << s.peak_memory_estimate_bytes << " bytes" << std::endl;
        os << "Total strings processed: " << s.total_strings_processed << std::endl;
    }
}

inline void print_comparison(std::ostream& os, const comparison_report& rep) {
    for (const algorithm_run& run : rep.comparison_results) {
        os << run.algorithm << ": ";
        if (!run.result.ok()) {
            os << "error - " << run.result.error << std::endl;
            continue;
        }
        os << "'" << run.result.summary.final_common_prefix << "'";
        if (run.result.has_performance) {
            os << ", total " << detail::ms_format(run.result.performance_summary.total_execution_time_ms) << " ms"
               << ", average " << detail::ms_format(run.result.performance_summary.average_execution_time_ms) << " ms"
               << ", peak " << run.result.performance_summary.peak_memory_estimate_bytes << " bytes";
        }
        os << std::endl;
    }
    if (rep.all_agree) {
        os << "All algorithms agree" << std::endl;
    } else {
        for (const lcp_discrepancy& d : rep.discrepancies) {
            os << "[ERROR] " << d.algorithm;
            if (d.step > 0)
                os << " step " << d.step;
            os << ": " << d.message;
            if (!d.expected.empty() || !d.actual.empty())
                os << " ('" << d.actual << "' != '" << d.expected << "')";
            os << std::endl;
        }
    }
}

#endif // RESULT_OUTPUT_HPP
