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

#include "artifacts/InteractionMatrix.hpp"

#include <string>

#include "artifacts/Exception.hpp"

namespace lmr::artifacts
{
    InteractionMatrix::InteractionMatrix(CategoricalIndex userIndex, CategoricalIndex artistIndex, RatingMatrix ratings)
        : _userIndex{ std::move(userIndex) }
        , _artistIndex{ std::move(artistIndex) }
        , _ratings{ std::move(ratings) }
    {
        if (static_cast<std::size_t>(_ratings.rows()) != _userIndex.size() || static_cast<std::size_t>(_ratings.cols()) != _artistIndex.size())
        {
            throw ArtifactConsistencyException{ "Rating matrix is " + std::to_string(_ratings.rows()) + "x" + std::to_string(_ratings.cols())
                                                + ", expected " + std::to_string(_userIndex.size()) + "x" + std::to_string(_artistIndex.size()) };
        }

        _ratings.makeCompressed();
    }

    Rating InteractionMatrix::getRating(CategoricalIndex::IndexType user, CategoricalIndex::IndexType artist) const
    {
        return _ratings.coeff(static_cast<Eigen::Index>(user), static_cast<Eigen::Index>(artist));
    }

    bool InteractionMatrix::operator==(const InteractionMatrix& other) const
    {
        if (_userIndex != other._userIndex || _artistIndex != other._artistIndex)
            return false;

        if (_ratings.nonZeros() != other._ratings.nonZeros())
            return false;

        for (Eigen::Index row{}; row < _ratings.outerSize(); ++row)
        {
            RatingMatrix::InnerIterator it{ _ratings, row };
            RatingMatrix::InnerIterator otherIt{ other._ratings, row };
            for (; it && otherIt; ++it, ++otherIt)
            {
                if (it.col() != otherIt.col() || it.value() != otherIt.value())
                    return false;
            }

            if (it || otherIt)
                return false;
        }

        return true;
    }
} // namespace lmr::artifacts
