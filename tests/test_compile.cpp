/*
 * Unit tests for pattern compilation and CompiledPattern lifetime
 */

#include "pcre2_regex.hpp"
#include "diagnostics.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <new>
#include <string>
#include <vector>

using namespace rexbind;
using namespace rexbind::pcre2_regex;

// Armed by a test to make the next operator new fail
static bool fail_next_allocation = false;

void* operator new(std::size_t size)
{
    if (fail_next_allocation) {
        fail_next_allocation = false;
        throw std::bad_alloc();
    }
    void* p = std::malloc(size == 0 ? 1 : size);
    if (p == nullptr) throw std::bad_alloc();
    return p;
}

void operator delete(void* p) noexcept
{
    std::free(p);
}

void operator delete(void* p, std::size_t) noexcept
{
    std::free(p);
}

TEST(Compile, ValidPattern)
{
    auto p = compile("(a)(b)?c");
    EXPECT_TRUE(p.valid());
    EXPECT_EQ(p.group_count(), 2);
    EXPECT_EQ(p.source(), "(a)(b)?c");
    EXPECT_EQ(p.options(), CompileOption::none);
}

TEST(Compile, UnbalancedParenthesis)
{
    try {
        compile("(abc");
        FAIL() << "compile should have thrown";
    } catch (const compile_error& e) {
        EXPECT_EQ(e.code(), PCRE2_ERROR_MISSING_CLOSING_PARENTHESIS);
        EXPECT_NE(e.code(), 0);
        EXPECT_FALSE(std::string(e.what()).empty());
        // Engine text is passed through unchanged
        EXPECT_EQ(std::string(e.what()), error_message(e.code()));
        EXPECT_EQ(e.offset(), 4u);
    }
}

TEST(Compile, ErrorsAreRegexErrors)
{
    EXPECT_THROW(compile("a{2,1}"), compile_error);
    EXPECT_THROW(compile("[z-a]"), regex_error);
    EXPECT_THROW(compile("*"), std::runtime_error);
}

TEST(Compile, ValidatePattern)
{
    EXPECT_NO_THROW(validate_pattern("\\d+"));
    EXPECT_THROW(validate_pattern("(?<name"), compile_error);
}

TEST(Compile, EmbeddedNulInPattern)
{
    std::string pattern("a\0b", 3);
    auto p = compile(pattern);
    EXPECT_EQ(p.source().size(), 3u);

    MatchRegion region(p);
    std::string subject("xxa\0b", 5);
    ASSERT_EQ(search(p, subject, 0, region), MatchOutcome::matched);
    EXPECT_EQ(region.begin(0), 2);
    EXPECT_EQ(region.end(0), 5);
}

TEST(Compile, OptionsCompose)
{
    auto opts = CompileOption::ignore_case | CompileOption::extended;
    EXPECT_TRUE(has_option(opts, CompileOption::ignore_case));
    EXPECT_TRUE(has_option(opts, CompileOption::extended));
    EXPECT_FALSE(has_option(opts, CompileOption::multiline));
    EXPECT_EQ(to_bits(opts), static_cast<uint32_t>(PCRE2_CASELESS | PCRE2_EXTENDED));

    auto p = compile("a b c  # spaced out", opts);
    MatchRegion region(p);
    EXPECT_EQ(search(p, "xxABC", 0, region), MatchOutcome::matched);
    EXPECT_EQ(region.begin(0), 2);
    EXPECT_EQ(p.options(), opts);
}

TEST(Compile, DuplicateNamesAlwaysAllowed)
{
    EXPECT_NO_THROW(compile("(?<x>a)|(?<x>b)"));
}

TEST(Compile, NoAutoCapture)
{
    auto p = compile("(a)(?<n>b)", CompileOption::no_auto_capture);
    EXPECT_EQ(p.group_count(), 1);
}

TEST(Compile, UtfModeFromOptionOrVerb)
{
    EXPECT_FALSE(compile("x").utf());
    EXPECT_TRUE(compile("x", CompileOption::utf).utf());
    EXPECT_TRUE(compile("(*UTF)x").utf());
}

TEST(Compile, AllocationFailureAfterCompile)
{
    // Long enough that copying the source needs the heap. The engine block
    // comes from malloc, so the first operator new is that copy; a leak
    // here shows up under LeakSanitizer.
    std::string pattern(200, 'a');
    fail_next_allocation = true;
    EXPECT_THROW(compile(pattern), std::bad_alloc);
    fail_next_allocation = false;

    EXPECT_TRUE(compile(pattern).valid());
}

TEST(Lifetime, ReleaseInvalidates)
{
    auto p = compile("abc");
    p.release();
    EXPECT_FALSE(p.valid());
    EXPECT_THROW(p.group_count(), contract_violation);
    EXPECT_THROW(p.source(), contract_violation);
    EXPECT_THROW(p.code(), contract_violation);
    EXPECT_THROW(p.capture_names(), contract_violation);
    EXPECT_THROW(MatchRegion{p}, contract_violation);
}

TEST(Lifetime, DoubleReleaseWarns)
{
    std::vector<std::string> warnings;
    auto previous = diagnostics::set_warning_handler([&](const std::string& msg) {
        warnings.push_back(msg);
    });

    auto p = compile("abc");
    p.release();
    EXPECT_TRUE(warnings.empty());
    p.release();
    EXPECT_EQ(warnings.size(), 1u);
    EXPECT_FALSE(p.valid());

    diagnostics::set_warning_handler(previous);
}

TEST(Lifetime, MoveTransfersOwnership)
{
    auto a = compile("(x)");
    auto serial = a.serial();
    CompiledPattern b = std::move(a);
    EXPECT_FALSE(a.valid());
    EXPECT_TRUE(b.valid());
    EXPECT_EQ(b.serial(), serial);
    EXPECT_EQ(b.group_count(), 1);
    EXPECT_THROW(a.group_count(), contract_violation);
}

TEST(Lifetime, SerialsAreUnique)
{
    auto a = compile("abc");
    auto b = compile("abc");
    EXPECT_NE(a.serial(), b.serial());
}
