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

#include "artifacts/Artifacts.hpp"
#include "dataset/Types.hpp"

namespace lmr::artifacts
{
    // Distinct (artist, track) pairs in first occurrence order, then stably sorted by artist name
    Tracklist buildTracklist(const dataset::FilteredDataset& dataset);

    // rating = number of distinct playlists per (user, artist)
    InteractionMatrix buildInteractionMatrix(const dataset::FilteredDataset& dataset);

    // Builds all the artifacts under a newly generated build id
    Artifacts buildArtifacts(dataset::FilteredDataset dataset);
} // namespace lmr::artifacts
