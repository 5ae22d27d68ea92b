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

#include "RecommendationEngine.hpp"

#include <algorithm>
#include <numeric>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "recommendation/Exception.hpp"

namespace lmr::recommendation
{
    RecommendationSettings RecommendationSettings::fromConfig(core::IConfig& config)
    {
        RecommendationSettings settings;

        settings.maxCount = config.getULong("recommendation-max-count", settings.maxCount);
        settings.neighborCount = config.getULong("recommendation-neighbor-count", settings.neighborCount);

        return settings;
    }

    std::unique_ptr<IRecommendationEngine> createRecommendationEngine(std::shared_ptr<const artifacts::Artifacts> artifacts, const RecommendationSettings& settings)
    {
        return std::make_unique<RecommendationEngine>(std::move(artifacts), settings);
    }

    RecommendationEngine::RecommendationEngine(std::shared_ptr<const artifacts::Artifacts> artifacts, const RecommendationSettings& settings)
        : _artifacts{ std::move(artifacts) }
        , _settings{ settings }
        , _similarityEngine{ _artifacts->matrix }
    {
        const artifacts::RatingMatrix& ratings{ _artifacts->matrix.getRatings() };

        _artistPopularities = ratings.transpose() * Eigen::VectorXd::Ones(ratings.rows());
        _userRatingMasses = ratings * Eigen::VectorXd::Ones(ratings.cols());

        LMR_LOG(RECOMMENDATION, INFO, "Recommendation engine ready, build '" << _artifacts->buildId.getAsString() << "'");
    }

    ArtistNameContainer RecommendationEngine::getPopularArtists() const
    {
        return toArtistNames(sortByDescendingScore(_artistPopularities, TieOrder::HigherIndexFirst), {});
    }

    ArtistNameContainer RecommendationEngine::getItemBasedRecommendations(std::span<const std::string> selectedArtists) const
    {
        if (selectedArtists.empty())
            return {};

        const std::vector<ArtistIndex> selectedArtistIndexes{ findArtists(selectedArtists) };

        // duplicated selections are counted several times
        const Eigen::MatrixXd& similarities{ _similarityEngine.getArtistSimilarities() };
        Eigen::VectorXd scores = Eigen::VectorXd::Zero(similarities.cols());
        for (const ArtistIndex artist : selectedArtistIndexes)
            scores += similarities.row(static_cast<Eigen::Index>(artist)).transpose();

        return toArtistNames(sortByDescendingScore(scores, TieOrder::LowerIndexFirst), selectedArtistIndexes);
    }

    ArtistNameContainer RecommendationEngine::getUserBasedRecommendations(std::span<const std::string> selectedArtists) const
    {
        if (selectedArtists.empty())
            return {};

        const std::vector<ArtistIndex> selectedArtistIndexes{ findArtists(selectedArtists) };

        const artifacts::RatingMatrix& ratings{ _artifacts->matrix.getRatings() };
        const Eigen::Index artistCount{ ratings.cols() };

        Eigen::VectorXd queryRatings = Eigen::VectorXd::Zero(artistCount);
        for (const ArtistIndex artist : selectedArtistIndexes)
            queryRatings[static_cast<Eigen::Index>(artist)] += 1;

        const Eigen::VectorXd userSimilarities = _similarityEngine.computeUserSimilarities(queryRatings);

        std::vector<Eigen::Index> neighbors{ sortByDescendingScore(userSimilarities, TieOrder::HigherIndexFirst) };
        if (neighbors.size() > _settings.neighborCount)
            neighbors.resize(_settings.neighborCount);

        const double averageRating{ static_cast<double>(selectedArtistIndexes.size()) / static_cast<double>(artistCount) };
        Eigen::VectorXd scores = Eigen::VectorXd::Constant(artistCount, averageRating);

        if (!neighbors.empty())
        {
            Eigen::MatrixXd neighborRatings = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(neighbors.size()), artistCount);
            for (std::size_t i{}; i < neighbors.size(); ++i)
            {
                for (artifacts::RatingMatrix::InnerIterator it{ ratings, neighbors[i] }; it; ++it)
                    neighborRatings(static_cast<Eigen::Index>(i), it.col()) = it.value();
            }

            const Eigen::RowVectorXd meanNeighborRatings = neighborRatings.colwise().mean();

            // each neighbor deviation is weighted by its similarity and divided by its own rating mass
            for (std::size_t i{}; i < neighbors.size(); ++i)
            {
                const double ratingMass{ _userRatingMasses[neighbors[i]] };
                if (ratingMass == 0)
                    continue;

                const double weight{ userSimilarities[neighbors[i]] / ratingMass };
                scores += ((neighborRatings.row(static_cast<Eigen::Index>(i)) - meanNeighborRatings) * weight).transpose();
            }
        }

        LMR_LOG(RECOMMENDATION, DEBUG, "User based: " << selectedArtistIndexes.size() << " selected artists, " << neighbors.size() << " neighbors");

        return toArtistNames(sortByDescendingScore(scores, TieOrder::HigherIndexFirst), selectedArtistIndexes);
    }

    std::vector<Eigen::Index> RecommendationEngine::sortByDescendingScore(const Eigen::VectorXd& scores, TieOrder tieOrder)
    {
        std::vector<Eigen::Index> res(static_cast<std::size_t>(scores.size()));
        std::iota(std::begin(res), std::end(res), Eigen::Index{ 0 });

        std::sort(std::begin(res), std::end(res), [&](Eigen::Index lhs, Eigen::Index rhs) {
            if (scores[lhs] != scores[rhs])
                return scores[lhs] > scores[rhs];

            return tieOrder == TieOrder::LowerIndexFirst ? lhs < rhs : lhs > rhs;
        });

        return res;
    }

    std::vector<RecommendationEngine::ArtistIndex> RecommendationEngine::findArtists(std::span<const std::string> artistNames) const
    {
        const artifacts::CategoricalIndex& artistIndex{ _artifacts->matrix.getArtistIndex() };

        std::vector<ArtistIndex> res;
        res.reserve(artistNames.size());
        for (const std::string& artistName : artistNames)
        {
            const std::optional<ArtistIndex> artist{ artistIndex.find(artistName) };
            if (!artist)
            {
                LMR_LOG(RECOMMENDATION, DEBUG, "Artist '" << artistName << "' not found");
                throw ArtistNotFoundException{ artistName };
            }

            res.push_back(*artist);
        }

        return res;
    }

    ArtistNameContainer RecommendationEngine::toArtistNames(const std::vector<Eigen::Index>& rankedArtists, const std::vector<ArtistIndex>& excludedArtists) const
    {
        const artifacts::CategoricalIndex& artistIndex{ _artifacts->matrix.getArtistIndex() };

        ArtistNameContainer res;
        for (const Eigen::Index rankedArtist : rankedArtists)
        {
            if (res.size() >= _settings.maxCount)
                break;

            const ArtistIndex artist{ static_cast<ArtistIndex>(rankedArtist) };
            if (std::find(std::cbegin(excludedArtists), std::cend(excludedArtists), artist) != std::cend(excludedArtists))
                continue;

            res.push_back(artistIndex.getName(artist));
        }

        return res;
    }
} // namespace lmr::recommendation
