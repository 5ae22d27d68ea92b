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

#include <functional>
#include <string>
#include <vector>

#include <boost/container_hash/hash.hpp>

namespace lmr::dataset
{
    // One line of the raw dataset: a track played by a user in one of its playlists
    struct RawInteraction
    {
        std::string userId;
        std::string artistName;
        std::string trackName;
        std::string playlistName;

        auto operator<=>(const RawInteraction&) const = default;
    };

    using InteractionContainer = std::vector<RawInteraction>;

    // Rows that survived the cleaning steps, in their original relative order
    struct FilteredDataset
    {
        InteractionContainer interactions;

        bool operator==(const FilteredDataset&) const = default;
    };
} // namespace lmr::dataset

namespace std
{
    template<>
    class hash<lmr::dataset::RawInteraction>
    {
    public:
        size_t operator()(const lmr::dataset::RawInteraction& interaction) const
        {
            size_t h{};
            boost::hash_combine(h, interaction.userId);
            boost::hash_combine(h, interaction.artistName);
            boost::hash_combine(h, interaction.trackName);
            boost::hash_combine(h, interaction.playlistName);

            return h;
        }
    };
} // namespace std
