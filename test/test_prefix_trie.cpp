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
 * @brief   Unit tests for the prefix trie.
 */

#include <gtest/gtest.h>

#include <prefix_trie.hpp>
#include <stdint.h>

TEST(PlcpTrie, Empty) {
    prefix_trie<> t;
    ASSERT_TRUE(t.empty());
    ASSERT_EQ(0u, t.size());
    ASSERT_EQ(1u, t.num_nodes());
    ASSERT_EQ("", t.longest_common_prefix());
}

TEST(PlcpTrie, SingleWord) {
    prefix_trie<> t;
    t.insert("hello");
    ASSERT_EQ(1u, t.size());
    ASSERT_EQ(6u, t.num_nodes());
    ASSERT_EQ("hello", t.longest_common_prefix());
}

TEST(PlcpTrie, ShrinkingPrefix) {
    prefix_trie<> t;
    t.insert("abcdef");
    t.insert("abcdef");
    ASSERT_EQ("abcdef", t.longest_common_prefix());
    // duplicates don't add nodes
    ASSERT_EQ(7u, t.num_nodes());
    ASSERT_EQ(2u, t.size());

    t.insert("abcxyz");
    ASSERT_EQ("abc", t.longest_common_prefix());

    // "ab" ends inside the shared path
    t.insert("ab");
    ASSERT_EQ("ab", t.longest_common_prefix());
}

TEST(PlcpTrie, NoSharedFirstChar) {
    prefix_trie<> t;
    t.insert("abc");
    t.insert("xyz");
    ASSERT_EQ("", t.longest_common_prefix());
}

TEST(PlcpTrie, EmptyString) {
    prefix_trie<> t;
    t.insert("");
    ASSERT_EQ("", t.longest_common_prefix());
    ASSERT_TRUE(t.contains(""));
    t.insert("abc");
    ASSERT_EQ("", t.longest_common_prefix());
}

TEST(PlcpTrie, Contains) {
    prefix_trie<uint32_t> t;
    t.insert("abc");
    t.insert("abd");
    ASSERT_EQ(5u, t.num_nodes());
    ASSERT_TRUE(t.contains("abc"));
    ASSERT_TRUE(t.contains("abd"));
    ASSERT_FALSE(t.contains("ab"));
    ASSERT_FALSE(t.contains("abcd"));
    ASSERT_FALSE(t.contains(""));
    ASSERT_EQ("ab", t.longest_common_prefix());
}

TEST(PlcpTrie, RangeConstructAndClear) {
    std::vector<std::string> words = {"interview", "internet", "interval", "internal"};
    prefix_trie<> t(words.begin(), words.end());
    ASSERT_EQ(4u, t.size());
    ASSERT_EQ("inter", t.longest_common_prefix());

    t.clear();
    ASSERT_TRUE(t.empty());
    ASSERT_EQ(1u, t.num_nodes());
    ASSERT_EQ("", t.longest_common_prefix());
    ASSERT_FALSE(t.contains("internet"));

    t.insert("internet");
    ASSERT_EQ("internet", t.longest_common_prefix());
}

TEST(PlcpTrie, BinaryCharacters) {
    prefix_trie<> t;
    std::string a("\x00\xff\x01", 3);
    std::string b("\x00\xff\x02", 3);
    t.insert(a);
    t.insert(b);
    ASSERT_EQ(std::string("\x00\xff", 2), t.longest_common_prefix());
}
