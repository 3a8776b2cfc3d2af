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
 * @file    usage_examples.hpp
 * @brief   Fixed table of example inputs with their expected final common
 *          prefix, for documentation and tests.
 */
#ifndef USAGE_EXAMPLES_HPP
#define USAGE_EXAMPLES_HPP

#include <string>
#include <vector>

struct usage_example {
    std::string name;
    std::string description;
    std::string use_case;
    std::vector<std::string> input;
    // final common prefix of the progressive analysis
    std::string expected_prefix;
    // whether the input is rejected (empty list)
    bool expect_error;
};

inline std::vector<usage_example> usage_examples() {
    typedef std::vector<std::string> strs;
    std::vector<usage_example> ex = {
        {"basic_usage", "Basic progressive prefix finding", "Progressive analysis",
         strs{"prefix_test_1", "prefix_test_2", "prefix_demo", "prefix_example"},
         "prefix_", false},
        {"file_paths", "Finding common directory paths", "File path analysis",
         strs{"/home/user/documents/file1.txt", "/home/user/documents/file2.txt", "/home/user/downloads/file3.txt"},
         "/home/user/do", false},
        {"urls", "URL prefix extraction", "Web crawling and analysis",
         strs{"https://example.com/api/v1/users", "https://example.com/api/v1/posts", "https://example.com/api/v2/users"},
         "https://example.com/api/v", false},
        {"code_patterns", "Identifying common naming patterns", "Code refactoring",
         strs{"getUserData", "getUserInfo", "getUserProfile", "getPostData"},
         "get", false},
        {"database_tables", "Database schema analysis", "Schema refactoring",
         strs{"user_profile_data", "user_login_history", "user_preferences", "admin_user_management"},
         "", false},
        // edge cases
        {"empty_list", "Empty list", "Edge case handling",
         strs{}, "", true},
        {"single_string", "Single string", "Edge case handling",
         strs{"single"}, "single", false},
        {"no_common_prefix", "No common prefix", "Edge case handling",
         strs{"abc", "xyz"}, "", false},
        {"empty_string", "Empty string in list", "Edge case handling",
         strs{"", "abc"}, "", false},
        {"identical_strings", "Identical strings", "Edge case handling",
         strs{"same", "same", "same"}, "same", false},
        {"one_char_difference", "One character difference", "Edge case handling",
         strs{"test1", "test2", "test3"}, "test", false}
    };
    return ex;
}

#endif // USAGE_EXAMPLES_HPP
