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

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "artifacts/Artifacts.hpp"

namespace lmr::core
{
    class IConfig;
}

namespace lmr::recommendation
{
    using ArtistNameContainer = std::vector<std::string>;

    struct RecommendationSettings
    {
        std::size_t maxCount{ 10 };
        std::size_t neighborCount{ 10 }; // user based only

        static RecommendationSettings fromConfig(core::IConfig& config);
    };

    // All the methods are thread safe
    class IRecommendationEngine
    {
    public:
        virtual ~IRecommendationEngine() = default;

        // Artists with the highest total rating
        virtual ArtistNameContainer getPopularArtists() const = 0;

        // Selected artists are never part of the results, an empty selection gives empty results
        // Throw ArtistNotFoundException if a selected artist is unknown
        virtual ArtistNameContainer getItemBasedRecommendations(std::span<const std::string> selectedArtists) const = 0;
        virtual ArtistNameContainer getUserBasedRecommendations(std::span<const std::string> selectedArtists) const = 0;
    };

    std::unique_ptr<IRecommendationEngine> createRecommendationEngine(std::shared_ptr<const artifacts::Artifacts> artifacts, const RecommendationSettings& settings = {});
} // namespace lmr::recommendation
