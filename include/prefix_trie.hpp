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
 * @file    prefix_trie.hpp
 * @brief   A minimal character trie for finding the prefix shared by all
 *          inserted strings.
 */
#ifndef PREFIX_TRIE_HPP
#define PREFIX_TRIE_HPP

#include <string>
#include <vector>
#include <map>
#include <limits>
#include <assert.h>

/**
 * @brief   Prefix tree over `char` code units.
 *
 * All nodes are kept in a single arena (`std::vector`) and reference their
 * children by index into that arena. Node 0 is the root. Destroying the trie
 * releases all nodes at once.
 *
 * @tparam index_t  The node handle type (e.g. uint32_t, or std::size_t).
 */
template <typename index_t = std::size_t>
class prefix_trie {
protected:
    struct node {
        // child node handle per character
        std::map<char, index_t> children;
        // number of inserted strings whose path passes through this node
        std::size_t count;
        // whether some inserted string ends at this node
        bool end_of_word;

        node() : children(), count(0), end_of_word(false) {}
    };

    std::vector<node> nodes;

    // number of inserted strings
    std::size_t n_words;

    index_t new_node() {
        assert(nodes.size() < static_cast<std::size_t>(std::numeric_limits<index_t>::max()));
        nodes.emplace_back();
        return static_cast<index_t>(nodes.size() - 1);
    }

public:
    prefix_trie() : nodes(1), n_words(0) {}

    prefix_trie(const prefix_trie& o) = default;
    prefix_trie(prefix_trie&& o) = default;
    prefix_trie& operator=(const prefix_trie& o) = default;
    prefix_trie& operator=(prefix_trie&& o) = default;

    template <typename Iterator>
    prefix_trie(Iterator begin, Iterator end) : nodes(1), n_words(0) {
        for (Iterator it = begin; it != end; ++it) {
            insert(*it);
        }
    }

    /// inserts `word`, incrementing the pass-through count along its path
    void insert(const std::string& word) {
        index_t cur = 0;
        nodes[cur].count++;
        for (char c : word) {
            typename std::map<char, index_t>::iterator it = nodes[cur].children.find(c);
            index_t next;
            if (it == nodes[cur].children.end()) {
                // NOTE: `new_node()` may reallocate the arena, so never hold
                //       a reference to a node across this call
                next = new_node();
                nodes[cur].children[c] = next;
            } else {
                next = it->second;
            }
            cur = next;
            nodes[cur].count++;
        }
        nodes[cur].end_of_word = true;
        ++n_words;
    }

    /**
     * @brief   Returns the longest prefix shared by all inserted strings.
     *
     * Walks down from the root as long as the current node has a single
     * child through which all inserted strings pass, and no inserted string
     * ends at the current node.
     */
    std::string longest_common_prefix() const {
        std::string prefix;
        if (n_words == 0)
            return prefix;

        index_t cur = 0;
        while (!nodes[cur].end_of_word && nodes[cur].children.size() == 1) {
            typename std::map<char, index_t>::const_iterator child = nodes[cur].children.begin();
            if (nodes[child->second].count != n_words)
                break;
            prefix.push_back(child->first);
            cur = child->second;
        }
        return prefix;
    }

    /// returns whether `word` was inserted (exact match)
    bool contains(const std::string& word) const {
        index_t cur = 0;
        for (char c : word) {
            typename std::map<char, index_t>::const_iterator it = nodes[cur].children.find(c);
            if (it == nodes[cur].children.end())
                return false;
            cur = it->second;
        }
        return nodes[cur].end_of_word;
    }

    void clear() {
        nodes.clear();
        nodes.emplace_back();
        n_words = 0;
    }

    /// number of inserted strings (duplicates included)
    std::size_t size() const {
        return n_words;
    }

    bool empty() const {
        return n_words == 0;
    }

    /// number of nodes, including the root
    std::size_t num_nodes() const {
        return nodes.size();
    }
};

#endif // PREFIX_TRIE_HPP
