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

#include <algorithm>

#include <gtest/gtest.h>

#include "recommendation/Exception.hpp"
#include "recommendation/IRecommendationEngine.hpp"

#include "TestArtifacts.hpp"

namespace lmr::recommendation::tests
{
    namespace
    {
        // A has the highest total rating, B and C are tied
        std::shared_ptr<const artifacts::Artifacts> createPopularityArtifacts()
        {
            return createArtifacts({
                { "u1", "A", 3 },
                { "u1", "B", 1 },
                { "u2", "A", 2 },
                { "u2", "C", 1 },
                { "u3", "A", 1 },
                { "u3", "D", 2 },
            });
        }

        // A and B have identical rating vectors
        std::shared_ptr<const artifacts::Artifacts> createSimilarityArtifacts()
        {
            return createArtifacts({
                { "u1", "A", 1 },
                { "u1", "B", 1 },
                { "u1", "C", 1 },
                { "u2", "A", 2 },
                { "u2", "B", 2 },
                { "u3", "C", 1 },
                { "u3", "D", 1 },
            });
        }

        bool containsAny(const ArtistNameContainer& artists, const std::vector<std::string>& searchedArtists)
        {
            return std::any_of(std::cbegin(searchedArtists), std::cend(searchedArtists), [&](const std::string& artist) {
                return std::find(std::cbegin(artists), std::cend(artists), artist) != std::cend(artists);
            });
        }
    } // namespace

    TEST(RecommendationEngine, popularity)
    {
        const auto engine{ createRecommendationEngine(createPopularityArtifacts()) };

        const ArtistNameContainer expected{ "A", "D", "C", "B" };
        EXPECT_EQ(engine->getPopularArtists(), expected);
        // stable across calls
        EXPECT_EQ(engine->getPopularArtists(), expected);
    }

    TEST(RecommendationEngine, popularityMaxCount)
    {
        RecommendationSettings settings;
        settings.maxCount = 2;
        const auto engine{ createRecommendationEngine(createPopularityArtifacts(), settings) };

        const ArtistNameContainer expected{ "A", "D" };
        EXPECT_EQ(engine->getPopularArtists(), expected);
    }

    TEST(RecommendationEngine, popularityAtMostTen)
    {
        const auto artifacts{ createArtifacts({
            { "u1", "A1", 1 },
            { "u1", "A2", 2 },
            { "u1", "A3", 3 },
            { "u1", "A4", 4 },
            { "u1", "A5", 5 },
            { "u1", "A6", 6 },
            { "u1", "A7", 7 },
            { "u1", "A8", 8 },
            { "u1", "A9", 9 },
            { "u2", "B1", 10 },
            { "u2", "B2", 11 },
            { "u2", "B3", 12 },
        }) };
        const auto engine{ createRecommendationEngine(artifacts) };

        const ArtistNameContainer popularArtists{ engine->getPopularArtists() };
        ASSERT_EQ(popularArtists.size(), 10);
        EXPECT_EQ(popularArtists.front(), "B3");
        EXPECT_EQ(popularArtists.back(), "A3");
    }

    TEST(RecommendationEngine, popularityEmpty)
    {
        const auto engine{ createRecommendationEngine(createArtifacts({})) };

        EXPECT_TRUE(engine->getPopularArtists().empty());
    }

    TEST(RecommendationEngine, itemBasedIdenticalArtists)
    {
        const auto engine{ createRecommendationEngine(createSimilarityArtifacts()) };

        const std::vector<std::string> selection{ "A" };
        const ArtistNameContainer expected{ "B", "C", "D" };
        EXPECT_EQ(engine->getItemBasedRecommendations(selection), expected);
    }

    TEST(RecommendationEngine, itemBasedDuplicatedSelection)
    {
        const auto engine{ createRecommendationEngine(createSimilarityArtifacts()) };

        const std::vector<std::string> selection{ "A", "A" };
        const ArtistNameContainer expected{ "B", "C", "D" };
        EXPECT_EQ(engine->getItemBasedRecommendations(selection), expected);
    }

    TEST(RecommendationEngine, itemBasedExcludesSelection)
    {
        const auto engine{ createRecommendationEngine(createSimilarityArtifacts()) };

        const std::vector<std::string> selection{ "B", "A" };
        const ArtistNameContainer expected{ "C", "D" };
        EXPECT_EQ(engine->getItemBasedRecommendations(selection), expected);
    }

    TEST(RecommendationEngine, itemBasedTiesLowerIndexFirst)
    {
        // D and E are both unrelated to A
        const auto engine{ createRecommendationEngine(createArtifacts({
            { "u1", "A", 1 },
            { "u2", "D", 1 },
            { "u3", "E", 1 },
        })) };

        const std::vector<std::string> selection{ "A" };
        const ArtistNameContainer expected{ "D", "E" };
        EXPECT_EQ(engine->getItemBasedRecommendations(selection), expected);
    }

    TEST(RecommendationEngine, userBased)
    {
        const auto engine{ createRecommendationEngine(createSimilarityArtifacts()) };

        const std::vector<std::string> selection{ "A" };
        const ArtistNameContainer expected{ "B", "C", "D" };
        EXPECT_EQ(engine->getUserBasedRecommendations(selection), expected);
    }

    TEST(RecommendationEngine, userBasedDividesByNeighborRatingMass)
    {
        // u1 is the closest neighbor (1/sqrt(17) > 1/sqrt(26)) but spreads its ratings: 9 in total vs 6 for u2
        // Divided by the rating mass, u2 weighs more (1/(sqrt(26)*6) > 1/(sqrt(17)*9)) and Y comes first
        // Divided by the similarity sum, u1 would weigh more and Y would come last
        const auto engine{ createRecommendationEngine(createArtifacts({
            { "u1", "Q", 1 },
            { "u1", "X", 2 },
            { "u1", "Z1", 2 },
            { "u1", "Z2", 2 },
            { "u1", "Z3", 2 },
            { "u2", "Q", 1 },
            { "u2", "Y", 5 },
        })) };

        const std::vector<std::string> selection{ "Q" };
        const ArtistNameContainer expected{ "Y", "Z3", "Z2", "Z1", "X" };
        EXPECT_EQ(engine->getUserBasedRecommendations(selection), expected);
    }

    TEST(RecommendationEngine, userBasedSingleNeighbor)
    {
        // the only neighbor is its own mean: every artist gets the same score
        RecommendationSettings settings;
        settings.neighborCount = 1;
        const auto engine{ createRecommendationEngine(createSimilarityArtifacts(), settings) };

        const std::vector<std::string> selection{ "A" };
        const ArtistNameContainer expected{ "D", "C", "B" };
        EXPECT_EQ(engine->getUserBasedRecommendations(selection), expected);
    }

    TEST(RecommendationEngine, userBasedExcludesSelection)
    {
        const auto engine{ createRecommendationEngine(createPopularityArtifacts()) };

        const std::vector<std::vector<std::string>> selections{
            { "A" },
            { "B" },
            { "A", "D" },
            { "C", "C", "B" },
            { "A", "B", "C" },
        };

        for (const std::vector<std::string>& selection : selections)
        {
            const ArtistNameContainer userBased{ engine->getUserBasedRecommendations(selection) };
            EXPECT_FALSE(containsAny(userBased, selection));
            EXPECT_LE(userBased.size(), 4 - 1);

            const ArtistNameContainer itemBased{ engine->getItemBasedRecommendations(selection) };
            EXPECT_FALSE(containsAny(itemBased, selection));
        }
    }

    TEST(RecommendationEngine, allArtistsSelected)
    {
        const auto engine{ createRecommendationEngine(createPopularityArtifacts()) };

        const std::vector<std::string> selection{ "D", "C", "B", "A" };
        EXPECT_TRUE(engine->getItemBasedRecommendations(selection).empty());
        EXPECT_TRUE(engine->getUserBasedRecommendations(selection).empty());
    }

    TEST(RecommendationEngine, emptySelection)
    {
        const auto engine{ createRecommendationEngine(createSimilarityArtifacts()) };

        EXPECT_TRUE(engine->getItemBasedRecommendations({}).empty());
        EXPECT_TRUE(engine->getUserBasedRecommendations({}).empty());
    }

    TEST(RecommendationEngine, unknownArtist)
    {
        const auto engine{ createRecommendationEngine(createSimilarityArtifacts()) };

        const std::vector<std::string> selection{ "A", "Nobody" };
        EXPECT_THROW(engine->getItemBasedRecommendations(selection), ArtistNotFoundException);
        EXPECT_THROW(engine->getUserBasedRecommendations(selection), ArtistNotFoundException);

        try
        {
            engine->getItemBasedRecommendations(selection);
            FAIL() << "Expected ArtistNotFoundException";
        }
        catch (const ArtistNotFoundException& e)
        {
            EXPECT_EQ(e.getArtistName(), "Nobody");
        }
    }
} // namespace lmr::recommendation::tests
