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

#include <Eigen/Dense>

#include "artifacts/InteractionMatrix.hpp"

namespace lmr::recommendation
{
    // Cosine similarities over the rating matrix
    // Similarity with a zero vector is 0
    class SimilarityEngine
    {
    public:
        // The matrix must outlive the engine
        explicit SimilarityEngine(const artifacts::InteractionMatrix& matrix);

        // A x A, computed once
        const Eigen::MatrixXd& getArtistSimilarities() const { return _artistSimilarities; }

        // Similarity between the given artist ratings (size A) and each user row, computed on each call
        Eigen::VectorXd computeUserSimilarities(const Eigen::VectorXd& artistRatings) const;

    private:
        const artifacts::InteractionMatrix& _matrix;
        Eigen::MatrixXd _artistSimilarities;
        Eigen::VectorXd _userNorms;
    };
} // namespace lmr::recommendation
