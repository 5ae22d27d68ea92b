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

#include "artifacts/InteractionMatrix.hpp"
#include "artifacts/Tracklist.hpp"
#include "core/UUID.hpp"
#include "dataset/Types.hpp"

namespace lmr::artifacts
{
    // One build: all the members are derived from the same filtered dataset
    struct Artifacts
    {
        core::UUID buildId;
        dataset::FilteredDataset dataset;
        InteractionMatrix matrix;
        Tracklist tracklist;
    };
} // namespace lmr::artifacts
