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
 * @file    plcp_benchmark.cpp
 * @brief   Times the progressive common prefix computation with each
 *          algorithm on random strings that share a prefix.
 */

#include <iostream>
#include <vector>
#include <string>
#include <cstdlib>

// using TCLAP for command line parsing
#include <tclap/CmdLine.h>

#include <cxx-prettyprint/prettyprint.hpp>

#include <progressive_lcp.hpp>
#include <compare_algorithms.hpp>
#include <rand_strings.hpp>
#include <cpptimer.hpp>

// returns false if the algorithms disagree
bool benchmark_all(const std::vector<std::string>& strings)
{
    std::vector<std::string> prefixes;
    for (lcp_algorithm algo : all_lcp_algorithms()) {
        std::string method_name = lcp_algorithm_name(algo);
        run_result r;
        {
            timed_section s(method_name);
            r = progressive_lcp(strings, algo, true);
        }
        std::cout << strings.size() << ";" << method_name << ";" << r.performance_summary.total_execution_time_ms << std::endl;
        prefixes.push_back(r.summary.final_common_prefix);
    }
    for (std::size_t i = 1; i < prefixes.size(); ++i) {
        if (prefixes[i] != prefixes[0]) {
            std::cerr << "[ERROR] algorithms disagree on the final prefix: " << prefixes << std::endl;
            return false;
        }
    }
    return true;
}

int main(int argc, char *argv[])
{
    try {
    // define commandline usage
    TCLAP::CmdLine cmd("Benchmark the common prefix algorithms on progressive analysis.");
    TCLAP::ValueArg<std::size_t> numArg("n", "num-strings", "Number of random strings", false, 1000, "num");
    cmd.add(numArg);
    TCLAP::ValueArg<std::size_t> lenArg("l", "length", "Length of every string", false, 64, "size");
    cmd.add(lenArg);
    TCLAP::ValueArg<std::size_t> prefixArg("P", "prefix", "Length of the shared prefix", false, 32, "size");
    cmd.add(prefixArg);
    TCLAP::ValueArg<int> seedArg("s", "seed", "Sets the seed for the random input generation", false, 0, "int");
    cmd.add(seedArg);
    TCLAP::ValueArg<int> iterArg("i", "iterations", "Number of iterations to run", false, 1, "num");
    cmd.add(iterArg);
    cmd.parse(argc, argv);

    std::vector<std::string> strings = rand_prefixed_strings(numArg.getValue(), lenArg.getValue(), prefixArg.getValue(), seedArg.getValue());

    // run all benchmarks
    for (int i = 0; i < iterArg.getValue(); ++i) {
        if (!benchmark_all(strings))
            return 1;
    }

    // catch any TCLAP exception
    } catch (TCLAP::ArgException& e) {
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
        exit(EXIT_FAILURE);
    }

    return 0;
}
