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
 * @file    perf_stats.hpp
 * @brief   Per-step timing and memory estimates for the progressive common
 *          prefix computation, and their aggregation.
 */
#ifndef PERF_STATS_HPP
#define PERF_STATS_HPP

#include <string>
#include <vector>
#include <algorithm>

#include "cpptimer.hpp"

/// bytes accounted per character in the memory estimate
constexpr std::size_t estimate_bytes_per_char = 4;

/**
 * @brief   Deterministic estimate of the memory touched by one step.
 *
 * This is computed from character counts only and is not a measurement. It
 * is meaningful only relative to other steps of the same run.
 */
struct memory_estimate {
    std::size_t input_chars;
    std::size_t output_chars;
    std::size_t strings_count;
    std::size_t estimated_bytes;

    memory_estimate() : input_chars(0), output_chars(0), strings_count(0), estimated_bytes(0) {}
};

struct perf_record {
    std::size_t step;
    std::size_t strings_count;
    double execution_time_ms;
    memory_estimate memory;

    perf_record() : step(0), strings_count(0), execution_time_ms(0.0), memory() {}
};

struct perf_summary {
    double total_execution_time_ms;
    double average_execution_time_ms;
    double max_execution_time_ms;
    double min_execution_time_ms;
    std::size_t peak_memory_estimate_bytes;
    std::size_t total_strings_processed;

    perf_summary()
        : total_execution_time_ms(0.0), average_execution_time_ms(0.0),
          max_execution_time_ms(0.0), min_execution_time_ms(0.0),
          peak_memory_estimate_bytes(0), total_strings_processed(0) {}
};

template <typename Iterator>
memory_estimate estimate_memory(Iterator begin, Iterator end, const std::string& prefix) {
    memory_estimate m;
    for (Iterator it = begin; it != end; ++it) {
        m.input_chars += it->size();
        m.strings_count++;
    }
    m.output_chars = prefix.size();
    m.estimated_bytes = estimate_bytes_per_char * (m.input_chars + m.output_chars);
    return m;
}

/**
 * @brief   Times a single invocation of `f(begin, end)`.
 *
 * @param step          The step index to record.
 * @param prefix[out]   The result of `f`.
 */
template <typename Iterator, typename Func>
perf_record timed_step(std::size_t step, Iterator begin, Iterator end, Func f, std::string& prefix) {
    timer t;
    t.tic();
    prefix = f(begin, end);
    t.toc();

    perf_record r;
    r.step = step;
    r.execution_time_ms = t.get_ms();
    r.memory = estimate_memory(begin, end, prefix);
    r.strings_count = r.memory.strings_count;
    return r;
}

/// aggregates per-step records, an empty input gives an all-zero summary
inline perf_summary summarize_performance(const std::vector<perf_record>& records) {
    perf_summary s;
    if (records.empty())
        return s;

    s.max_execution_time_ms = records.front().execution_time_ms;
    s.min_execution_time_ms = records.front().execution_time_ms;
    for (const perf_record& r : records) {
        s.total_execution_time_ms += r.execution_time_ms;
        s.max_execution_time_ms = std::max(s.max_execution_time_ms, r.execution_time_ms);
        s.min_execution_time_ms = std::min(s.min_execution_time_ms, r.execution_time_ms);
        s.peak_memory_estimate_bytes = std::max(s.peak_memory_estimate_bytes, r.memory.estimated_bytes);
        s.total_strings_processed += r.strings_count;
    }
    s.average_execution_time_ms = s.total_execution_time_ms / records.size();
    return s;
}

#endif // PERF_STATS_HPP
