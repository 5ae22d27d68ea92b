/*
 * Copyright (C) 2024 Emeric Poupon
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

#include <sstream>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "dataset/InteractionReader.hpp"

namespace lmr::dataset::tests
{
    TEST(InteractionReader, empty)
    {
        std::istringstream is{ "" };

        ReadStats stats;
        const InteractionContainer interactions{ readInteractions(is, &stats) };
        EXPECT_TRUE(interactions.empty());
        EXPECT_EQ(stats.lineCount, 0);
        EXPECT_EQ(stats.badLineCount, 0);
    }

    TEST(InteractionReader, headerOnly)
    {
        std::istringstream is{ R"("user_id", "artistname", "trackname", "playlistname")" };

        const InteractionContainer interactions{ readInteractions(is) };
        EXPECT_TRUE(interactions.empty());
    }

    TEST(InteractionReader, basic)
    {
        std::istringstream is{ R"("user_id","artistname","trackname","playlistname"
"u1","Elvis Costello","(The Angels Wanna Wear My) Red Shoes","HARD ROCK 2010"
u2,Lissie,All Be Okay,Starred
)" };

        ReadStats stats;
        const InteractionContainer interactions{ readInteractions(is, &stats) };
        ASSERT_EQ(interactions.size(), 2);
        EXPECT_EQ(stats.lineCount, 2);
        EXPECT_EQ(stats.badLineCount, 0);

        EXPECT_EQ(interactions[0].userId, "u1");
        EXPECT_EQ(interactions[0].artistName, "Elvis Costello");
        EXPECT_EQ(interactions[0].trackName, "(The Angels Wanna Wear My) Red Shoes");
        EXPECT_EQ(interactions[0].playlistName, "HARD ROCK 2010");

        EXPECT_EQ(interactions[1].userId, "u2");
        EXPECT_EQ(interactions[1].artistName, "Lissie");
        EXPECT_EQ(interactions[1].trackName, "All Be Okay");
        EXPECT_EQ(interactions[1].playlistName, "Starred");
    }

    TEST(InteractionReader, quotedComma)
    {
        std::istringstream is{ "header\n\"u1\",\"Crosby, Stills & Nash\",\"Suite: Judy Blue Eyes\",\"70s\"\n" };

        const InteractionContainer interactions{ readInteractions(is) };
        ASSERT_EQ(interactions.size(), 1);
        EXPECT_EQ(interactions[0].artistName, "Crosby, Stills & Nash");
        EXPECT_EQ(interactions[0].trackName, "Suite: Judy Blue Eyes");
    }

    TEST(InteractionReader, crlf)
    {
        std::istringstream is{ "header\r\nu1,Artist,Track,Playlist\r\n" };

        const InteractionContainer interactions{ readInteractions(is) };
        ASSERT_EQ(interactions.size(), 1);
        EXPECT_EQ(interactions[0].playlistName, "Playlist");
    }

    TEST(InteractionReader, badLines)
    {
        std::istringstream is{ R"(header
u1,Artist,Track
u1,Artist,Track,Playlist,Extra
u2,Artist,Track,Playlist
u3,"Artist,Track,Playlist
)" };

        ReadStats stats;
        const InteractionContainer interactions{ readInteractions(is, &stats) };
        ASSERT_EQ(interactions.size(), 1);
        EXPECT_EQ(interactions[0].userId, "u2");
        EXPECT_EQ(stats.lineCount, 4);
        EXPECT_EQ(stats.badLineCount, 3);
    }

    TEST(InteractionReader, blankLines)
    {
        std::istringstream is{ "header\n\nu1,Artist,Track,Playlist\n\r\n" };

        ReadStats stats;
        const InteractionContainer interactions{ readInteractions(is, &stats) };
        ASSERT_EQ(interactions.size(), 1);
        EXPECT_EQ(stats.badLineCount, 0);
    }

    TEST(InteractionReader, backslashIsLiteral)
    {
        std::istringstream is{ R"(header
u1,"AC\DC",Back In Black,Rock
u1,AC\DC,"Track\nLive",Rock
)" };

        ReadStats stats;
        const InteractionContainer interactions{ readInteractions(is, &stats) };
        ASSERT_EQ(interactions.size(), 2);
        EXPECT_EQ(stats.badLineCount, 0);
        EXPECT_EQ(interactions[0].artistName, "AC\\DC");
        EXPECT_EQ(interactions[1].artistName, "AC\\DC");
        EXPECT_EQ(interactions[1].trackName, "Track\\nLive");
    }

    TEST(InteractionReader, doubledQuotes)
    {
        std::istringstream is{ R"(header
u1,Artist,"He said ""hi""",Playlist
u1,Artist,"""Heroes""",Playlist
u1,Rock "n" Roll,Track,Playlist
)" };

        const InteractionContainer interactions{ readInteractions(is) };
        ASSERT_EQ(interactions.size(), 3);
        EXPECT_EQ(interactions[0].trackName, R"(He said "hi")");
        EXPECT_EQ(interactions[1].trackName, R"("Heroes")");
        EXPECT_EQ(interactions[2].artistName, R"(Rock "n" Roll)");
    }

    TEST(InteractionReader, multiLineField)
    {
        std::istringstream is{ "header\r\nu1,Artist,\"Track\r\nLive\",Playlist\r\nu2,Artist,Track,Playlist\r\n" };

        ReadStats stats;
        const InteractionContainer interactions{ readInteractions(is, &stats) };
        ASSERT_EQ(interactions.size(), 2);
        EXPECT_EQ(stats.lineCount, 3);
        EXPECT_EQ(stats.badLineCount, 0);
        EXPECT_EQ(interactions[0].trackName, "Track\nLive");
        EXPECT_EQ(interactions[0].playlistName, "Playlist");
        EXPECT_EQ(interactions[1].userId, "u2");
    }

    TEST(InteractionReader, missingFieldsAreKept)
    {
        std::istringstream is{ "header\nu1,,Track,Playlist\n" };

        const InteractionContainer interactions{ readInteractions(is) };
        ASSERT_EQ(interactions.size(), 1);
        EXPECT_TRUE(interactions[0].artistName.empty());
    }

    TEST(InteractionReader, missingValue)
    {
        struct TestCase
        {
            std::string_view input;
            bool expectedResult;
        };

        constexpr TestCase tests[]{
            { "", true },
            { "NA", true },
            { "NaN", true },
            { "null", true },
            { "NULL", true },
            { "None", true },
            { "#N/A", true },
            { "#N/A N/A", true },
            { "-1.#QNAN", true },
            { "   ", false },
            { " None ", false },
            { "Nana", false },
            { "0", false },
            { "none", false },
            { "The Nulls", false },
        };

        for (const TestCase& test : tests)
        {
            EXPECT_EQ(isMissingValue(test.input), test.expectedResult) << "Input = '" << test.input << "'";
        }
    }

    TEST(InteractionReader, fileNotFound)
    {
        EXPECT_THROW(readInteractions(std::filesystem::path{ "/this/file/does/not/exist.csv" }), core::FileException);
    }
} // namespace lmr::dataset::tests
