#include "selection_prompt.hpp"
#include <algorithm>
#include <charconv>
#include <istream>
#include <ostream>
#include <string>

namespace {

// Overload set for std::visit.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

std::string_view trim(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

SelectionInput classifySelection(std::string_view input, std::size_t siteCount) {
    auto answer = trim(input);
    if (answer == SelectionPrompt::kAllToken) {
        return AllChoice{};
    }
    if (answer == SelectionPrompt::kQuitToken) {
        return QuitChoice{};
    }
    if (answer.empty() || !std::ranges::all_of(answer, [](char c) { return c >= '0' && c <= '9'; })) {
        return InvalidChoice{};
    }

    std::size_t number = 0;
    auto [ptr, err] = std::from_chars(answer.data(), answer.data() + answer.size(), number);
    if (err != std::errc() || number < 1 || number > siteCount) {
        return InvalidChoice{};
    }
    return IndexChoice{number - 1};
}

SelectionPrompt::SelectionPrompt(std::istream& in, std::ostream& out) : in(in), out(out) {}

std::optional<std::vector<Site>> SelectionPrompt::select(const std::vector<Site>& sites) {
    for (std::size_t i = 0; i < sites.size(); ++i) {
        out << (i + 1) << ") " << sites[i].id << '\n';
    }
    out << kAllToken << ") All sites\n";
    out << kQuitToken << ") Quit\n";

    std::string line;
    while (true) {
        out << "Select site to backup (number/" << kAllToken << "/" << kQuitToken << "): " << std::flush;
        if (!std::getline(in, line)) {
            out << "\nNo more input, exiting\n";
            return std::nullopt;
        }

        std::optional<std::vector<Site>> selection;
        bool answered = std::visit(Overloaded{
            [&](const IndexChoice& c) {
                out << "Selected: " << sites[c.index].id << '\n';
                selection = std::vector<Site>{sites[c.index]};
                return true;
            },
            [&](const AllChoice&) {
                out << "Selected: All sites\n";
                selection = sites;
                return true;
            },
            [&](const QuitChoice&) {
                out << "Exiting\n";
                return true;
            },
            [&](const InvalidChoice&) {
                out << "Invalid. Please select a valid option.\n";
                return false;
            }
        }, classifySelection(line, sites.size()));

        if (answered) {
            return selection;
        }
    }
}
