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
#include <string>
#include <string_view>

#include "dataset/Types.hpp"

namespace lmr::core
{
    class IConfig;
}

namespace lmr::dataset
{
    struct PreparerSettings
    {
        // Thresholds are strict: a value must be greater than the threshold to be kept
        std::size_t minArtistOccurrences{ 100 };
        std::size_t minUserDistinctTracks{ 100 };
        bool filterUniformPlaylists{};
        std::size_t minPlaylistDistinctArtists{ 10 };

        static PreparerSettings fromConfig(core::IConfig& config);

        bool operator==(const PreparerSettings&) const = default;
    };

    // Runs all the cleaning steps below, in order
    FilteredDataset prepareDataset(InteractionContainer interactions, const PreparerSettings& settings);

    // Removes rows having a missing field and exact duplicates (first occurrence kept)
    void removeIncompleteAndDuplicateInteractions(InteractionContainer& interactions);
    void removeDuplicateInteractions(InteractionContainer& interactions);

    // Lower case and keep only [a-z0-9äöüß], other characters are stripped
    std::string computeNormalizedName(std::string_view name);

    // Replaces each (artist, track) spelling by the most used spelling sharing the same normalized names
    // On equal counts, the spelling seen first in the dataset wins
    void canonicalizeTracks(InteractionContainer& interactions);

    void removeUnpopularArtists(InteractionContainer& interactions, std::size_t minArtistOccurrences);
    void removeInactiveUsers(InteractionContainer& interactions, std::size_t minUserDistinctTracks);
    void removeUniformPlaylists(InteractionContainer& interactions, std::size_t minPlaylistDistinctArtists);
} // namespace lmr::dataset
