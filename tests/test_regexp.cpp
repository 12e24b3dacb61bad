/*
 * Unit tests for the Regexp convenience layer
 */

#include "regexp.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace rexbind;

TEST(Regexp, Basics)
{
    Regexp re("(?<word>[a-z]+)(\\d)?");
    EXPECT_EQ(re.source(), "(?<word>[a-z]+)(\\d)?");
    EXPECT_EQ(re.num_subexp(), 2);
    EXPECT_EQ(re.subexp_names(), (std::vector<std::string>{"", "word", ""}));
    EXPECT_TRUE(re.match("123 abc"));
    EXPECT_FALSE(re.match("123 456"));
}

TEST(Regexp, BadPatternThrows)
{
    EXPECT_THROW(Regexp("(abc"), pcre2_regex::compile_error);
}

TEST(Regexp, Find)
{
    Regexp re("b+");
    auto span = re.find_index("aabbbc");
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->begin, 2);
    EXPECT_EQ(span->end, 5);
    EXPECT_EQ(re.find("aabbbc"), std::optional<std::string>("bbb"));
    EXPECT_FALSE(re.find("xyz").has_value());
}

TEST(Regexp, FindSubmatch)
{
    Regexp re("(a)|(b)");
    auto groups = re.find_submatch("xb");
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0], std::optional<std::string>("b"));
    EXPECT_FALSE(groups[1].has_value());
    EXPECT_EQ(groups[2], std::optional<std::string>("b"));

    auto spans = re.find_submatch_index("xb");
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_FALSE(spans[1].matched());
    EXPECT_EQ(spans[1].begin, Span::unset);

    EXPECT_TRUE(re.find_submatch("zzz").empty());
}

TEST(Regexp, FindAll)
{
    Regexp re("\\d+");
    EXPECT_EQ(re.find_all("a1 b22 c333"), (std::vector<std::string>{"1", "22", "333"}));
    EXPECT_EQ(re.find_all("a1 b22 c333", 2), (std::vector<std::string>{"1", "22"}));
    EXPECT_TRUE(re.find_all("abc").empty());
    EXPECT_TRUE(re.find_all("a1", 0).empty());
}

TEST(Regexp, FindAllEmptyMatches)
{
    Regexp re("");
    auto spans = re.find_all_index("ab");
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[0].begin, 0);
    EXPECT_EQ(spans[1].begin, 1);
    EXPECT_EQ(spans[2].begin, 2);
}

TEST(Regexp, FindAllEmptyMatchesUtf)
{
    Regexp re("", CompileOption::utf);
    // "é" is two bytes; the empty match must not land inside it
    auto spans = re.find_all_index("\xc3\xa9");
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].begin, 0);
    EXPECT_EQ(spans[1].begin, 2);
}

TEST(Regexp, FindAllEmptyMatchesUtfVerb)
{
    // UTF mode switched on inside the pattern rather than by option
    Regexp re("(*UTF)x*");
    auto spans = re.find_all_index("\xc3\xa9");
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].begin, 0);
    EXPECT_EQ(spans[1].begin, 2);
    EXPECT_EQ(re.replace_all("\xc3\xa9", "-"), "-\xc3\xa9-");
}

TEST(Regexp, FindAllSubmatchIndex)
{
    Regexp re("(\\w)=(\\d)");
    auto all = re.find_all_submatch_index("a=1, b=2");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1][1].begin, 5);
    EXPECT_EQ(all[1][2].begin, 7);
}

TEST(Regexp, NamedCaptures)
{
    Regexp re("(?<year>\\d{4})-(?<month>\\d{2})(?:-(?<day>\\d{2}))?");
    auto caps = re.named_captures("on 2024-06");
    EXPECT_EQ(caps["year"], "2024");
    EXPECT_EQ(caps["month"], "06");
    EXPECT_EQ(caps["day"], "");
    EXPECT_TRUE(re.named_captures("nothing").empty());
}

TEST(Regexp, NamedCapturesDuplicateName)
{
    Regexp re("(?<x>a)|(?<x>b)");
    EXPECT_EQ(re.named_captures("b")["x"], "b");
    EXPECT_EQ(re.named_captures("a")["x"], "a");
}

TEST(Regexp, ReplaceAll)
{
    Regexp re("(?<key>\\w+)=(?<value>\\w+)");
    EXPECT_EQ(re.replace_all("a=1 b=2", "\\2:\\1"), "1:a 2:b");
    EXPECT_EQ(re.replace_all("a=1 b=2", "\\k<value>=\\k<key>"), "1=a 2=b");
    EXPECT_EQ(re.replace_all("a=1", "\\g<value>\\g<1>"), "1a");
    EXPECT_EQ(re.replace_all("a=1", "[\\0]"), "[a=1]");
    EXPECT_EQ(re.replace_all("a=1", "\\\\\\t\\n"), "\\\t\n");
    EXPECT_EQ(re.replace_all("a=1", "\\k<missing>!"), "!");
    EXPECT_EQ(re.replace_all("no match", "x"), "no match");
}

TEST(Regexp, ReplaceDuplicateNameUsesParticipatingGroup)
{
    Regexp re("(?<v>a)|(?<v>b)");
    EXPECT_EQ(re.replace_all("ab", "<\\k<v>>"), "<a><b>");
}

TEST(Regexp, DuplicateNameBothParticipating)
{
    Regexp re("(?<x>a)(?<x>b)");
    EXPECT_EQ(re.named_captures("ab")["x"], "b");
    EXPECT_EQ(re.replace_all("ab", "[\\k<x>]"), "[b]");
}

TEST(Regexp, ReplaceFirst)
{
    Regexp re("o");
    EXPECT_EQ(re.replace_first("foo boo", "0"), "f0o boo");
}

TEST(Regexp, ReplaceLiteral)
{
    Regexp re("(\\d)");
    EXPECT_EQ(re.replace_all_literal("a1b2", "\\1"), "a\\1b\\1");
}

TEST(Regexp, ReplaceFunc)
{
    Regexp re("[a-z]+");
    auto result = re.replace_all_func("ab 12 cde", [](std::string_view m) {
        return std::to_string(m.size());
    });
    EXPECT_EQ(result, "2 12 3");
}

TEST(Regexp, ReplaceEmptyMatches)
{
    Regexp re("x*");
    EXPECT_EQ(re.replace_all("ab", "-"), "-a-b-");
}

TEST(Regexp, QuoteMeta)
{
    std::string text = "a.b*c (1+1) [x] {2} ^$ | ? \\ # -";
    Regexp re(Regexp::quote_meta(text));
    EXPECT_TRUE(re.match(text));
    EXPECT_FALSE(re.match("axb*c (1+1) [x] {2} ^$ | ? \\ # -"));

    Regexp extended(Regexp::quote_meta("a b#c"), CompileOption::extended);
    EXPECT_TRUE(extended.match("a b#c"));
}

TEST(Regexp, SharedBetweenThreads)
{
    Regexp re("(\\d+)");
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&, t] {
            std::string subject = "n=" + std::to_string(t * 111);
            for (int i = 0; i < 500; i++) {
                auto found = re.find(subject);
                if (!found || *found != std::to_string(t * 111)) failures++;
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(failures.load(), 0);
}
