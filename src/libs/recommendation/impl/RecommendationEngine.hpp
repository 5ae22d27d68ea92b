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

#include <vector>

#include <Eigen/Dense>

#include "artifacts/CategoricalIndex.hpp"
#include "recommendation/IRecommendationEngine.hpp"
#include "recommendation/SimilarityEngine.hpp"

namespace lmr::recommendation
{
    class RecommendationEngine : public IRecommendationEngine
    {
    public:
        RecommendationEngine(std::shared_ptr<const artifacts::Artifacts> artifacts, const RecommendationSettings& settings);
        ~RecommendationEngine() override = default;
        RecommendationEngine(const RecommendationEngine&) = delete;
        RecommendationEngine& operator=(const RecommendationEngine&) = delete;

    private:
        ArtistNameContainer getPopularArtists() const override;
        ArtistNameContainer getItemBasedRecommendations(std::span<const std::string> selectedArtists) const override;
        ArtistNameContainer getUserBasedRecommendations(std::span<const std::string> selectedArtists) const override;

        using ArtistIndex = artifacts::CategoricalIndex::IndexType;

        enum class TieOrder
        {
            LowerIndexFirst,
            HigherIndexFirst,
        };
        static std::vector<Eigen::Index> sortByDescendingScore(const Eigen::VectorXd& scores, TieOrder tieOrder);

        std::vector<ArtistIndex> findArtists(std::span<const std::string> artistNames) const;
        ArtistNameContainer toArtistNames(const std::vector<Eigen::Index>& rankedArtists, const std::vector<ArtistIndex>& excludedArtists) const;

        const std::shared_ptr<const artifacts::Artifacts> _artifacts;
        const RecommendationSettings _settings;
        const SimilarityEngine _similarityEngine;
        Eigen::VectorXd _artistPopularities; // column sums
        Eigen::VectorXd _userRatingMasses;   // row sums
    };
} // namespace lmr::recommendation
