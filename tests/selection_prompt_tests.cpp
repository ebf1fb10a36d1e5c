#include "selection_prompt.hpp"
#include "test_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

using ::testing::HasSubstr;

namespace {

std::vector<Site> ThreeSites()
{
    return {Site{"alpha", "/var/www/alpha", std::nullopt},
            Site{"blog", "/var/www/blog", std::nullopt},
            Site{"shop", "/var/www/shop", std::nullopt}};
}

std::vector<std::string> Ids(const std::vector<Site>& sites)
{
    std::vector<std::string> ids;
    for (const auto& site : sites)
    {
        ids.push_back(site.id);
    }
    return ids;
}

std::size_t CountOccurrences(const std::string& text, const std::string& needle)
{
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size()))
    {
        ++count;
    }
    return count;
}

} // namespace

TEST(ClassifySelectionTest, ValidAnswers)
{
    auto first = classifySelection("1", 3);
    ASSERT_TRUE(std::holds_alternative<IndexChoice>(first));
    EXPECT_EQ(std::get<IndexChoice>(first).index, 0u);

    auto last = classifySelection(" 3 \r", 3);
    ASSERT_TRUE(std::holds_alternative<IndexChoice>(last));
    EXPECT_EQ(std::get<IndexChoice>(last).index, 2u);

    EXPECT_TRUE(std::holds_alternative<AllChoice>(classifySelection("a", 3)));
    EXPECT_TRUE(std::holds_alternative<QuitChoice>(classifySelection("q", 3)));
}

TEST(ClassifySelectionTest, InvalidAnswers)
{
    for (const char* input : {"", "   ", "0", "4", "-1", "+1", "1a", "abc", "A", "Q", "all", "1.0", "99999999999999999999999"})
    {
        EXPECT_TRUE(std::holds_alternative<InvalidChoice>(classifySelection(input, 3))) << "input: '" << input << "'";
    }
}

TEST(SelectionPromptTest, ListsSitesAndChoices)
{
    std::istringstream in("q\n");
    std::ostringstream out;

    SelectionPrompt(in, out).select(ThreeSites());

    EXPECT_THAT(out.str(), HasSubstr("1) alpha\n2) blog\n3) shop\na) All sites\nq) Quit\n"));
    EXPECT_THAT(out.str(), HasSubstr("Select site to backup (number/a/q): "));
}

TEST(SelectionPromptTest, InvalidAnswersAskAgain)
{
    std::istringstream in("x\n0\n\n7\n2\n");
    std::ostringstream out;

    auto selection = SelectionPrompt(in, out).select(ThreeSites());

    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(Ids(*selection), std::vector<std::string>{"blog"});
    EXPECT_EQ(CountOccurrences(out.str(), "Invalid. Please select a valid option."), 4u);
}

TEST(SelectionPromptTest, AllKeepsDisplayOrder)
{
    std::istringstream in("a\n");
    std::ostringstream out;

    auto selection = SelectionPrompt(in, out).select(ThreeSites());

    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(Ids(*selection), (std::vector<std::string>{"alpha", "blog", "shop"}));
}

TEST(SelectionPromptTest, QuitReturnsNothing)
{
    std::istringstream in("q\n");
    std::ostringstream out;

    EXPECT_FALSE(SelectionPrompt(in, out).select(ThreeSites()).has_value());
    EXPECT_THAT(out.str(), HasSubstr("Exiting"));
}

TEST(SelectionPromptTest, EndOfInputCancels)
{
    std::istringstream in("nope\n");
    std::ostringstream out;

    EXPECT_FALSE(SelectionPrompt(in, out).select(ThreeSites()).has_value());
    EXPECT_THAT(out.str(), HasSubstr("No more input"));
}
