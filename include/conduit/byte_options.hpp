#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "result.hpp"

namespace conduit {

    /**
     * @brief A fixed set of byte strings compiled into a flat trie for fast
     * selection from a byte cursor.
     *
     * The trie is a single int32 array holding two node kinds:
     *
     * SELECT nodes:
     * - selectChoiceCount: the number of bytes to choose between (> 0)
     * - prefixIndex: result index at this position, or -1
     * - selectChoiceCount sorted bytes to match against the input
     * - selectChoiceCount result indexes (>= 0) or negated offsets (< 0) of
     *   the next node, one per byte above
     *
     * SCAN nodes:
     * - -scanByteCount: the negated number of bytes to match in sequence
     * - prefixIndex: result index at this position, or -1
     * - scanByteCount bytes to match
     * - nextStep: result index (>= 0) or negated offset (< 0) of the next node
     *
     * Offsets always point forward, so the array needs no fix-up when copied.
     */
    class ByteOptions {
       public:
        /// @brief Returned when no option matches the input.
        static constexpr int kNoMatch = -1;
        /// @brief Returned by select_prefix() when the input ended inside the
        /// trie and the caller asked to be told about it.
        static constexpr int kTruncated = -2;

        /**
         * @brief Compile a matcher for @p options.
         * @return InvalidArgument when an option is empty or duplicated.
         * @note An option that starts with an earlier-listed option can never
         * be selected and is dropped from the trie.
         */
        static Result<ByteOptions> of(std::vector<std::string> options);

        /// @brief Index of the option @p input starts with, or kNoMatch.
        [[nodiscard]] int select(std::string_view input) const noexcept {
            return select_prefix(input, false);
        }

        /**
         * @brief Walk the trie over @p input.
         * @param select_truncated When true and @p input is exhausted before
         * the trie decides, return kTruncated instead of the best match so
         * far.
         */
        [[nodiscard]] int select_prefix(std::string_view input,
                                        bool select_truncated) const noexcept;

        /// @brief Select from @p cursor and on a match advance it past the
        /// matched option.
        int consume(std::string_view& cursor) const noexcept;

        [[nodiscard]] std::size_t size() const noexcept {
            return m_options.size();
        }

        const std::string& operator[](std::size_t i) const {
            return m_options[i];
        }

        const std::vector<std::string>& options() const noexcept {
            return m_options;
        }

        /// @brief The encoded trie, see the class comment for its layout.
        const std::vector<std::int32_t>& trie() const noexcept { return m_trie; }

       private:
        ByteOptions(std::vector<std::string> options,
                    std::vector<std::int32_t> trie)
            : m_options(std::move(options)), m_trie(std::move(trie)) {}

        std::vector<std::string> m_options;
        std::vector<std::int32_t> m_trie;
    };

}  // namespace conduit
