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

#include <Eigen/SparseCore>

#include "artifacts/CategoricalIndex.hpp"

namespace lmr::artifacts
{
    // Number of distinct playlists in which a user played an artist
    using Rating = double;
    // rows = users, cols = artists
    using RatingMatrix = Eigen::SparseMatrix<Rating, Eigen::RowMajor>;

    class InteractionMatrix
    {
    public:
        InteractionMatrix() = default;
        // Throws ArtifactConsistencyException if dimensions do not match the indexes
        InteractionMatrix(CategoricalIndex userIndex, CategoricalIndex artistIndex, RatingMatrix ratings);

        const CategoricalIndex& getUserIndex() const { return _userIndex; }
        const CategoricalIndex& getArtistIndex() const { return _artistIndex; }
        const RatingMatrix& getRatings() const { return _ratings; }

        std::size_t getUserCount() const { return _userIndex.size(); }
        std::size_t getArtistCount() const { return _artistIndex.size(); }
        std::size_t getRatingCount() const { return static_cast<std::size_t>(_ratings.nonZeros()); }

        Rating getRating(CategoricalIndex::IndexType user, CategoricalIndex::IndexType artist) const;

        bool operator==(const InteractionMatrix& other) const;

    private:
        CategoricalIndex _userIndex;
        CategoricalIndex _artistIndex;
        RatingMatrix _ratings;
    };
} // namespace lmr::artifacts
