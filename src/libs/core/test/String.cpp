/*
 * Copyright (C) 2019 Emeric Poupon
 *
 * This file is part of LMR.
 *
 * LMR is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * LMR is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with LMR.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>

#include "core/String.hpp"

namespace lmr::core::stringUtils::tests
{
    TEST(StringUtils, escapeAndJoinStrings)
    {
        struct TestCase
        {
            std::vector<std::string_view> input;
            std::string expectedOutput;
        };

        TestCase tests[]{
            { {}, "" },
            { { "" }, "" },
            { { "a" }, "a" },
            { { "a", "b" }, "a\tb" },
            { { "a", "" }, "a\t" },
            { { "a\tb", "c" }, "a\\\tb\tc" },
            { { "a\\b", "c" }, "a\\\\b\tc" },
            { { "Track\nLive", "c" }, "Track\\nLive\tc" },
            { { "a\r\n" }, "a\\r\\n" },
        };

        for (const TestCase& test : tests)
        {
            const std::string res{ escapeAndJoinStrings(test.input, '\t', '\\') };
            EXPECT_EQ(res, test.expectedOutput);
        }
    }

    TEST(StringUtils, splitEscapedStrings)
    {
        struct TestCase
        {
            std::string_view input;
            std::vector<std::string> expectedOutput;
        };

        TestCase tests[]{
            { "", {} },
            { "a", { "a" } },
            { "a\tb", { "a", "b" } },
            { "a\t", { "a", "" } },
            { "\tb", { "", "b" } },
            { "a\\\tb\tc", { "a\tb", "c" } },
            { "a\\\\b\tc", { "a\\b", "c" } },
            { "Track\\nLive\tc", { "Track\nLive", "c" } },
            { "a\\r\\n", { "a\r\n" } },
            { "a\\\\n", { "a\\n" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string> res{ splitEscapedStrings(test.input, '\t', '\\') };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "'";
        }
    }

    TEST(StringUtils, stringTrim)
    {
        EXPECT_EQ(stringTrim(""), "");
        EXPECT_EQ(stringTrim("   "), "");
        EXPECT_EQ(stringTrim("a"), "a");
        EXPECT_EQ(stringTrim(" a "), "a");
        EXPECT_EQ(stringTrim("\ta b\r"), "a b");
    }

    TEST(StringUtils, stringToLower)
    {
        EXPECT_EQ(stringToLower("ABC def"), "abc def");
        // non ASCII bytes are left untouched
        EXPECT_EQ(stringToLower("\xC3\x84"), "\xC3\x84");
    }

    TEST(StringUtils, stringCaseInsensitiveEqual)
    {
        EXPECT_TRUE(stringCaseInsensitiveEqual("Info", "info"));
        EXPECT_TRUE(stringCaseInsensitiveEqual("", ""));
        EXPECT_FALSE(stringCaseInsensitiveEqual("info", "infos"));
        EXPECT_FALSE(stringCaseInsensitiveEqual("debug", "error"));
    }

    TEST(StringUtils, readAs)
    {
        EXPECT_EQ(readAs<unsigned>("42"), 42u);
        EXPECT_EQ(readAs<unsigned>("foo"), std::nullopt);
        EXPECT_EQ(readAs<std::size_t>("123456789"), 123456789u);
        EXPECT_EQ(readAs<double>("0.5"), 0.5);
    }
} // namespace lmr::core::stringUtils::tests
