#include "conduit/byte_options.hpp"

#include <algorithm>
#include <cassert>
#include <numeric>

namespace conduit {

    namespace {

        inline std::int32_t byte_at(const std::string& s, std::size_t i) {
            return static_cast<unsigned char>(s[i]);
        }

        inline bool starts_with(const std::string& s, const std::string& p) {
            return s.size() >= p.size() &&
                   std::equal(p.begin(), p.end(), s.begin());
        }

        /// @brief Append the node for strings[from, to) at @p byte_offset to
        /// @p node, which itself starts at absolute position @p node_offset.
        void build_trie_recursive(std::int64_t node_offset,
                                  std::vector<std::int32_t>& node,
                                  std::size_t byte_offset,
                                  const std::vector<std::string>& strings,
                                  std::size_t from, std::size_t to,
                                  const std::vector<int>& indexes) {
            assert(from < to);

            int prefix_index = -1;

            // The first string ends here: it is the result if nothing longer
            // matches.
            if (byte_offset == strings[from].size()) {
                prefix_index = indexes[from];
                ++from;
            }

            const std::string& first = strings[from];
            const std::string& last = strings[to - 1];

            if (byte_at(first, byte_offset) != byte_at(last, byte_offset)) {
                std::int32_t choice_count = 1;
                for (std::size_t i = from + 1; i < to; ++i) {
                    if (byte_at(strings[i - 1], byte_offset) !=
                        byte_at(strings[i], byte_offset)) {
                        ++choice_count;
                    }
                }

                const std::int64_t child_nodes_offset =
                    node_offset + static_cast<std::int64_t>(node.size()) + 2 +
                    (choice_count * 2);

                node.push_back(choice_count);
                node.push_back(prefix_index);

                for (std::size_t i = from; i < to; ++i) {
                    if (i == from || byte_at(strings[i], byte_offset) !=
                                         byte_at(strings[i - 1], byte_offset)) {
                        node.push_back(byte_at(strings[i], byte_offset));
                    }
                }

                std::vector<std::int32_t> child_nodes;
                std::size_t range_start = from;
                while (range_start < to) {
                    const std::int32_t range_byte =
                        byte_at(strings[range_start], byte_offset);
                    std::size_t range_end = to;
                    for (std::size_t i = range_start + 1; i < to; ++i) {
                        if (range_byte != byte_at(strings[i], byte_offset)) {
                            range_end = i;
                            break;
                        }
                    }

                    if (range_start + 1 == range_end &&
                        byte_offset + 1 == strings[range_start].size()) {
                        node.push_back(indexes[range_start]);
                    } else {
                        const std::int64_t child_offset =
                            child_nodes_offset +
                            static_cast<std::int64_t>(child_nodes.size());
                        node.push_back(static_cast<std::int32_t>(-child_offset));
                        build_trie_recursive(child_nodes_offset, child_nodes,
                                             byte_offset + 1, strings,
                                             range_start, range_end, indexes);
                    }

                    range_start = range_end;
                }

                node.insert(node.end(), child_nodes.begin(), child_nodes.end());
                return;
            }

            // Every candidate shares the next byte: scan the common run.
            std::int32_t scan_byte_count = 0;
            for (std::size_t i = byte_offset,
                             max = std::min(first.size(), last.size());
                 i < max; ++i) {
                if (first[i] != last[i]) break;
                ++scan_byte_count;
            }

            const std::int64_t child_nodes_offset =
                node_offset + static_cast<std::int64_t>(node.size()) + 2 +
                scan_byte_count + 1;

            node.push_back(-scan_byte_count);
            node.push_back(prefix_index);

            for (std::size_t i = byte_offset; i < byte_offset + scan_byte_count;
                 ++i) {
                node.push_back(byte_at(first, i));
            }

            if (from + 1 == to) {
                assert(byte_offset + scan_byte_count == strings[from].size());
                node.push_back(indexes[from]);
                return;
            }

            std::vector<std::int32_t> child_nodes;
            node.push_back(static_cast<std::int32_t>(-child_nodes_offset));
            build_trie_recursive(child_nodes_offset, child_nodes,
                                 byte_offset + scan_byte_count, strings, from,
                                 to, indexes);
            node.insert(node.end(), child_nodes.begin(), child_nodes.end());
        }

    }  // namespace

    Result<ByteOptions> ByteOptions::of(std::vector<std::string> options) {
        if (options.empty()) {
            // Nothing to choose from: a SELECT node with no choices.
            return Result<ByteOptions>::ok(
                ByteOptions({}, std::vector<std::int32_t>{0, -1}));
        }

        // The trie builder needs the options sorted; remember where each one
        // came from.
        std::vector<int> order(options.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
            return options[static_cast<std::size_t>(a)] <
                   options[static_cast<std::size_t>(b)];
        });

        std::vector<std::string> sorted;
        std::vector<int> indexes;
        sorted.reserve(options.size());
        indexes.reserve(options.size());
        for (int i : order) {
            sorted.push_back(options[static_cast<std::size_t>(i)]);
            indexes.push_back(i);
        }

        if (sorted.front().empty()) {
            return Result<ByteOptions>::err(
                Error::Code::InvalidArgument,
                "the empty byte string is not a supported option");
        }

        // Drop options that follow their own prefix in caller order: given
        // ["abc", "abcde"], "abcde" can never be returned.
        for (std::size_t a = 0; a < sorted.size(); ++a) {
            const std::string prefix = sorted[a];
            for (std::size_t b = a + 1; b < sorted.size();) {
                if (!starts_with(sorted[b], prefix)) break;
                if (sorted[b].size() == prefix.size()) {
                    return Result<ByteOptions>::err(
                        Error::Code::InvalidArgument,
                        "duplicate option: " + sorted[b]);
                }
                if (indexes[b] > indexes[a]) {
                    sorted.erase(sorted.begin() +
                                 static_cast<std::ptrdiff_t>(b));
                    indexes.erase(indexes.begin() +
                                  static_cast<std::ptrdiff_t>(b));
                } else {
                    ++b;
                }
            }
        }

        std::vector<std::int32_t> trie;
        build_trie_recursive(0, trie, 0, sorted, 0, sorted.size(), indexes);

        return Result<ByteOptions>::ok(
            ByteOptions(std::move(options), std::move(trie)));
    }

    int ByteOptions::select_prefix(std::string_view input,
                                   bool select_truncated) const noexcept {
        if (input.empty()) {
            return select_truncated ? kTruncated : kNoMatch;
        }

        const std::int32_t* trie = m_trie.data();
        std::size_t pos = 0;
        std::size_t trie_pos = 0;
        int prefix_index = -1;

        for (;;) {
            const std::int32_t scan_or_select = trie[trie_pos++];
            const std::int32_t possible_prefix_index = trie[trie_pos++];
            if (possible_prefix_index != -1) {
                prefix_index = possible_prefix_index;
            }

            if (pos == input.size()) break;

            std::int32_t next_step = 0;
            if (scan_or_select < 0) {
                // SCAN: every byte of the run must match in order.
                const std::size_t trie_limit =
                    trie_pos + static_cast<std::size_t>(-scan_or_select);
                bool exhausted = false;
                for (;;) {
                    const std::int32_t b =
                        static_cast<unsigned char>(input[pos++]);
                    if (b != trie[trie_pos++]) return prefix_index;
                    if (trie_pos == trie_limit) {
                        next_step = trie[trie_pos];
                        break;
                    }
                    if (pos == input.size()) {
                        exhausted = true;
                        break;
                    }
                }
                if (exhausted) break;
            } else {
                // SELECT: one byte picks one branch.
                const std::int32_t b = static_cast<unsigned char>(input[pos++]);
                const std::size_t choice_count =
                    static_cast<std::size_t>(scan_or_select);
                const std::size_t select_limit = trie_pos + choice_count;
                for (;;) {
                    if (trie_pos == select_limit) return prefix_index;
                    if (b == trie[trie_pos]) {
                        next_step = trie[trie_pos + choice_count];
                        break;
                    }
                    ++trie_pos;
                }
            }

            if (next_step >= 0) return next_step;
            trie_pos = static_cast<std::size_t>(-next_step);
        }

        // Input ran out before the trie did.
        if (select_truncated) return kTruncated;
        return prefix_index;
    }

    int ByteOptions::consume(std::string_view& cursor) const noexcept {
        const int index = select(cursor);
        if (index >= 0) {
            cursor.remove_prefix(m_options[static_cast<std::size_t>(index)].size());
        }
        return index;
    }

}  // namespace conduit
