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

#include "recommendation/SimilarityEngine.hpp"

#include <chrono>
#include <cmath>

#include <Eigen/SparseCore>

#include "core/ILogger.hpp"

namespace lmr::recommendation
{
    namespace
    {
        Eigen::VectorXd computeInverse(const Eigen::VectorXd& norms)
        {
            return norms.unaryExpr([](double norm) { return norm > 0 ? 1. / norm : 0.; });
        }
    } // namespace

    SimilarityEngine::SimilarityEngine(const artifacts::InteractionMatrix& matrix)
        : _matrix{ matrix }
    {
        const artifacts::RatingMatrix& ratings{ _matrix.getRatings() };
        const auto begin{ std::chrono::steady_clock::now() };

        Eigen::VectorXd artistNorms = Eigen::VectorXd::Zero(ratings.cols());
        _userNorms = Eigen::VectorXd::Zero(ratings.rows());
        for (Eigen::Index row{}; row < ratings.outerSize(); ++row)
        {
            for (artifacts::RatingMatrix::InnerIterator it{ ratings, row }; it; ++it)
            {
                artistNorms[it.col()] += it.value() * it.value();
                _userNorms[it.row()] += it.value() * it.value();
            }
        }
        artistNorms = artistNorms.cwiseSqrt();
        _userNorms = _userNorms.cwiseSqrt();

        // zero columns stay zero once normalized, so do their similarities
        const Eigen::SparseMatrix<double> normalizedRatings = ratings * computeInverse(artistNorms).asDiagonal();
        const Eigen::SparseMatrix<double> similarities = normalizedRatings.transpose() * normalizedRatings;
        _artistSimilarities = Eigen::MatrixXd(similarities);

        LMR_LOG(SIMILARITY, INFO, "Computed " << _artistSimilarities.rows() << "x" << _artistSimilarities.cols() << " artist similarities in "
                                                << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin).count() << " ms");
    }

    Eigen::VectorXd SimilarityEngine::computeUserSimilarities(const Eigen::VectorXd& artistRatings) const
    {
        const artifacts::RatingMatrix& ratings{ _matrix.getRatings() };

        const double queryNorm{ artistRatings.norm() };
        if (queryNorm == 0)
            return Eigen::VectorXd::Zero(ratings.rows());

        const Eigen::VectorXd dotProducts = ratings * artistRatings;
        return dotProducts.cwiseProduct(computeInverse(_userNorms)) / queryNorm;
    }
} // namespace lmr::recommendation
