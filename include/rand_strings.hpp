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
#ifndef RAND_STRINGS_HPP
#define RAND_STRINGS_HPP

#include <vector>
#include <string>
#include <cstdlib>

/*******************************
 *  create random string input  *
 *******************************/

inline char rand_dna_char() {
    const static char DNA[4] = {'A', 'C', 'G', 'T'};
    return DNA[rand() % 4];
}

/// random DNA string of the given size, drawn from the current rand() state
inline std::string rand_dna(std::size_t size) {
    std::string str;
    str.resize(size, ' ');
    for (std::size_t i = 0; i < size; ++i) {
        str[i] = rand_dna_char();
    }
    return str;
}

inline std::string rand_dna(std::size_t size, int seed) {
    srand(1337*seed);
    return rand_dna(size);
}

/**
 * @brief   Generates `n` random DNA strings which all start with the same
 *          random prefix of length `prefix_len`, followed by a random tail
 *          of length `len - prefix_len`.
 *
 * The common prefix of the result is at least `prefix_len` long (tails may
 * share leading characters by chance).
 */
inline std::vector<std::string> rand_prefixed_strings(std::size_t n, std::size_t len, std::size_t prefix_len, int seed) {
    srand(1337*seed);
    if (prefix_len > len)
        prefix_len = len;
    std::string prefix = rand_dna(prefix_len);
    std::vector<std::string> strs(n);
    for (std::size_t i = 0; i < n; ++i) {
        strs[i] = prefix + rand_dna(len - prefix_len);
    }
    return strs;
}

/**
 * @brief   Generates `n` strings of random length in [0, max_len] over a
 *          small alphabet, so that common prefixes, duplicates, and empty
 *          strings occur frequently.
 */
inline std::vector<std::string> rand_short_strings(std::size_t n, std::size_t max_len, int seed) {
    srand(1337*seed);
    const static char alpha[3] = {'a', 'b', 'c'};
    std::vector<std::string> strs(n);
    for (std::size_t i = 0; i < n; ++i) {
        std::size_t len = rand() % (max_len + 1);
        strs[i].resize(len);
        for (std::size_t j = 0; j < len; ++j) {
            // bias towards 'a' to get longer common prefixes
            strs[i][j] = (rand() % 4 == 0) ? alpha[rand() % 3] : 'a';
        }
    }
    return strs;
}

#endif // RAND_STRINGS_HPP
