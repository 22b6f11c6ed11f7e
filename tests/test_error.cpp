#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "paste_error.h"
#include "paste_log.h"

using namespace paste_lib;

TEST(ErrorTest, ErrorTextIsTheCodeName)
{
    EXPECT_STREQ(get_error_text(ok), "ok");
    EXPECT_STREQ(get_error_text(error_file_not_found), "file_not_found");
    EXPECT_STREQ(get_error_text(error_degenerate_pad), "degenerate_pad");
    EXPECT_STREQ(get_error_text(error_negative_thickness), "negative_thickness");
}

TEST(ErrorTest, UnknownCodeHasPlaceholderText)
{
    EXPECT_STREQ(get_error_text(static_cast<paste_error_code>(100000)), "?");
}

TEST(ErrorTest, StringFromCharEscapesControlCharacters)
{
    EXPECT_EQ(string_from_char('X'), "X");
    EXPECT_EQ(string_from_char('\n'), "0x0a");
}

namespace
{
    LOG_CONTEXT("error_test", debug);

    paste_error_code fails_with(paste_error_code code)
    {
        FAIL_IF(code != ok, code);
        return ok;
    }

    paste_error_code passes_through(paste_error_code code)
    {
        CHECK(fails_with(code));
        return ok;
    }
}    // namespace

TEST(ErrorTest, CheckPropagatesTheFirstError)
{
    EXPECT_EQ(passes_through(ok), ok);
    EXPECT_EQ(passes_through(error_invalid_thickness), error_invalid_thickness);
}

namespace
{
    std::vector<std::string> captured_lines;

    int capture_line(char const *line)
    {
        captured_lines.push_back(line);
        return 0;
    }
}    // namespace

TEST(LogTest, LevelFiltersWhatIsEmitted)
{
    paste_log_level old_level = log_level;
    paste_log_emitter_function old_emitter = log_emitter_function;

    captured_lines.clear();
    log_set_emitter_function(capture_line);
    log_set_level(log_level_warning);

    LOG_INFO("not shown {}", 1);
    LOG_WARNING("pad {} skipped", 42);

    log_set_emitter_function(old_emitter);
    log_set_level(old_level);

    ASSERT_EQ(captured_lines.size(), 1u);
    EXPECT_NE(captured_lines[0].find("pad 42 skipped"), std::string::npos);
    EXPECT_NE(captured_lines[0].find("error_test"), std::string::npos);
}

TEST(LogTest, LevelNames)
{
    paste_log_level level = log_level_none;
    EXPECT_TRUE(log_level_from_name("Verbose", &level));
    EXPECT_EQ(level, log_level_verbose);
    EXPECT_TRUE(log_level_from_name("none", &level));
    EXPECT_EQ(level, log_level_none);
    EXPECT_FALSE(log_level_from_name("loud", &level));
    EXPECT_EQ(level, log_level_none);
}
