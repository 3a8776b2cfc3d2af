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
 * @file    plcp.cpp
 * @brief   Computes the progressive common prefixes of the given strings.
 */

// C++ includes
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>

// using TCLAP for command line parsing
#include <tclap/CmdLine.h>

// printing of std containers
#include <cxx-prettyprint/prettyprint.hpp>

// progressive common prefix
#include <progressive_lcp.hpp>
#include <compare_algorithms.hpp>
#include <check_common_prefix.hpp>
#include <usage_examples.hpp>
#include <result_output.hpp>

// reads one string per line, empty lines are empty strings
bool read_lines(const std::string& filename, std::vector<std::string>& lines) {
    std::ifstream in(filename.c_str());
    if (!in.good()) {
        std::cerr << "[ERROR] cannot open file `" << filename << "`" << std::endl;
        return false;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line[line.size()-1] == '\r')
            line.erase(line.size()-1);
        lines.push_back(line);
    }
    return true;
}

// runs every usage example through all algorithms, returns the number of failures
int run_examples(bool json) {
    int failures = 0;
    for (const usage_example& ex : usage_examples()) {
        comparison_report rep = compare_algorithms(ex.input);
        const run_result& r = rep.comparison_results.front().result;
        bool correct = rep.all_agree && (ex.expect_error ? !r.ok() : (r.ok() && r.summary.final_common_prefix == ex.expected_prefix));
        if (!correct)
            ++failures;
        if (json) {
            write_json(std::cout, rep);
            std::cout << std::endl;
            continue;
        }
        std::cout << ex.name << ": " << ex.description << " (" << ex.use_case << ")" << std::endl;
        std::cout << "  Input: " << ex.input << std::endl;
        if (r.ok()) {
            std::cout << "  Common prefix: '" << r.summary.final_common_prefix << "'" << std::endl;
        } else {
            std::cout << "  Error: " << r.error << std::endl;
        }
        if (!correct) {
            std::cout << "  [ERROR] expected '" << ex.expected_prefix << "'" << std::endl;
        }
    }
    return failures;
}

int main(int argc, char *argv[]) {
    try {
    // define commandline usage
    TCLAP::CmdLine cmd("Progressive longest common prefix of a list of strings.");
    TCLAP::ValueArg<std::string> fileArg("f", "file", "Input filename, one string per line.", false, "", "filename");
    cmd.add(fileArg);
    TCLAP::ValueArg<std::string> algoArg("a", "algorithm", "Common prefix algorithm: " + lcp_algorithm_names() + ".", false, lcp_algorithm_name(default_lcp_algorithm), "name");
    cmd.add(algoArg);
    TCLAP::SwitchArg perfArg("p", "performance", "Time every step and estimate its memory use.", false);
    cmd.add(perfArg);
    TCLAP::SwitchArg checkArg("c", "check", "Check correctness of every step.", false);
    cmd.add(checkArg);
    TCLAP::SwitchArg compareArg("", "compare", "Run all algorithms and compare their results.", false);
    cmd.add(compareArg);
    TCLAP::SwitchArg vizArg("", "viz", "Include per-algorithm visualization series in the comparison.", false);
    cmd.add(vizArg);
    TCLAP::SwitchArg jsonArg("j", "json", "Output JSON.", false);
    cmd.add(jsonArg);
    TCLAP::SwitchArg examplesArg("", "examples", "Run the built-in usage examples.", false);
    cmd.add(examplesArg);
    TCLAP::UnlabeledMultiArg<std::string> stringsArg("strings", "Input strings.", false, "string");
    cmd.add(stringsArg);
    cmd.parse(argc, argv);

    if (examplesArg.getValue()) {
        return run_examples(jsonArg.getValue()) == 0 ? 0 : 1;
    }

    // read input strings from file or command line
    std::vector<std::string> strings;
    if (fileArg.getValue() != "") {
        if (!read_lines(fileArg.getValue(), strings))
            return 1;
    }
    strings.insert(strings.end(), stringsArg.getValue().begin(), stringsArg.getValue().end());

    if (!jsonArg.getValue()) {
        std::cerr << "Input strings: " << strings << std::endl;
    }

    if (compareArg.getValue()) {
        comparison_report rep = compare_algorithms(strings, vizArg.getValue());
        if (jsonArg.getValue()) {
            write_json(std::cout, rep);
            std::cout << std::endl;
        } else {
            print_comparison(std::cout, rep);
        }
        return (rep.all_agree && rep.comparison_results.front().result.ok()) ? 0 : 1;
    }

    run_result result = progressive_lcp(strings, algoArg.getValue(), perfArg.getValue());
    if (jsonArg.getValue()) {
        write_json(std::cout, result);
        std::cout << std::endl;
    } else {
        print_run_result(std::cout, result);
    }
    if (!result.ok())
        return 1;

    if (checkArg.getValue()) {
        if (!check_progressive_run(strings, result)) {
            std::cerr << "[ERROR] Test unsuccessful" << std::endl;
            return 1;
        }
        std::cerr << "[SUCCESS] All common prefixes are correct" << std::endl;
    }

    // catch any TCLAP exception
    } catch (TCLAP::ArgException& e) {
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
        exit(EXIT_FAILURE);
    }

    return 0;
}
