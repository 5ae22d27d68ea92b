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

#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "artifacts/Artifacts.hpp"

namespace lmr::recommendation::tests
{
    struct TestRating
    {
        std::string user;
        std::string artist;
        artifacts::Rating rating;
    };

    // Users and artists not listed in the ratings can be added to get empty rows or columns
    inline std::shared_ptr<const artifacts::Artifacts> createArtifacts(std::initializer_list<TestRating> testRatings, std::vector<std::string> extraArtists = {})
    {
        std::vector<std::string> users;
        std::vector<std::string> artists{ std::move(extraArtists) };
        for (const TestRating& testRating : testRatings)
        {
            users.push_back(testRating.user);
            artists.push_back(testRating.artist);
        }

        artifacts::CategoricalIndex userIndex{ artifacts::CategoricalIndex::fromValues(std::move(users)) };
        artifacts::CategoricalIndex artistIndex{ artifacts::CategoricalIndex::fromValues(std::move(artists)) };

        std::vector<Eigen::Triplet<artifacts::Rating>> triplets;
        for (const TestRating& testRating : testRatings)
            triplets.emplace_back(static_cast<Eigen::Index>(*userIndex.find(testRating.user)), static_cast<Eigen::Index>(*artistIndex.find(testRating.artist)), testRating.rating);

        artifacts::RatingMatrix ratings(static_cast<Eigen::Index>(userIndex.size()), static_cast<Eigen::Index>(artistIndex.size()));
        ratings.setFromTriplets(std::cbegin(triplets), std::cend(triplets));

        return std::make_shared<const artifacts::Artifacts>(artifacts::Artifacts{
            core::UUID::generate(),
            dataset::FilteredDataset{},
            artifacts::InteractionMatrix{ std::move(userIndex), std::move(artistIndex), std::move(ratings) },
            artifacts::Tracklist{},
        });
    }
} // namespace lmr::recommendation::tests
