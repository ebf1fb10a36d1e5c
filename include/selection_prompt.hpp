/**
 * @file selection_prompt.hpp
 * @brief Interactive choice of the sites to back up.
 *
 * The operator answers with a 1-based index, "a" for every site or "q" to quit.
 * Anything else is rejected and the question is asked again.
 */

#ifndef SELECTION_PROMPT_HPP
#define SELECTION_PROMPT_HPP

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>
#include "backup_types.hpp"

/**
 * @brief Answer selecting one site; index is 0-based.
 */
struct IndexChoice {
    std::size_t index;
};

struct AllChoice {};
struct QuitChoice {};
struct InvalidChoice {};

/**
 * @brief Classification of one line of operator input.
 */
using SelectionInput = std::variant<IndexChoice, AllChoice, QuitChoice, InvalidChoice>;

/**
 * @brief Classifies one answer against the current number of sites.
 *
 * Surrounding whitespace is ignored. Indices must be all digits and within
 * [1, siteCount]; everything else that is not "a" or "q" is InvalidChoice.
 */
SelectionInput classifySelection(std::string_view input, std::size_t siteCount);

class SelectionPrompt {
public:
    static constexpr std::string_view kAllToken = "a";
    static constexpr std::string_view kQuitToken = "q";

    /**
     * @brief Constructs a prompt reading answers from @p in and writing to @p out.
     */
    SelectionPrompt(std::istream& in, std::ostream& out);

    /**
     * @brief Lists @p sites and asks until a valid answer arrives.
     *
     * @param sites Discovered sites, in display order.
     * @return std::optional<std::vector<Site>> The chosen sites (one, or all in the given
     *         order), or std::nullopt when the operator quits or the input ends.
     */
    std::optional<std::vector<Site>> select(const std::vector<Site>& sites);

private:
    std::istream& in;
    std::ostream& out;
};

#endif // SELECTION_PROMPT_HPP
