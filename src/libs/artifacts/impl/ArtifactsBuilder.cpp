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

#include "artifacts/ArtifactsBuilder.hpp"

#include <algorithm>
#include <compare>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/container_hash/hash.hpp>

#include "core/ILogger.hpp"

namespace lmr::artifacts
{
    namespace
    {
        using TrackKey = std::pair<std::string_view, std::string_view>;

        CategoricalIndex buildIndex(const dataset::FilteredDataset& dataset, std::string dataset::RawInteraction::*member)
        {
            std::vector<std::string> values;
            values.reserve(dataset.interactions.size());

            for (const dataset::RawInteraction& interaction : dataset.interactions)
                values.push_back(interaction.*member);

            return CategoricalIndex::fromValues(std::move(values));
        }
    } // namespace

    Tracklist buildTracklist(const dataset::FilteredDataset& dataset)
    {
        std::unordered_set<TrackKey, boost::hash<TrackKey>> seenTracks;
        std::vector<TrackEntry> entries;

        for (const dataset::RawInteraction& interaction : dataset.interactions)
        {
            if (!seenTracks.emplace(interaction.artistName, interaction.trackName).second)
                continue;

            entries.push_back(TrackEntry{ interaction.artistName, interaction.trackName });
        }

        std::stable_sort(std::begin(entries), std::end(entries), [](const TrackEntry& lhs, const TrackEntry& rhs) { return lhs.artistName < rhs.artistName; });

        return Tracklist{ std::move(entries) };
    }

    InteractionMatrix buildInteractionMatrix(const dataset::FilteredDataset& dataset)
    {
        CategoricalIndex userIndex{ buildIndex(dataset, &dataset::RawInteraction::userId) };
        CategoricalIndex artistIndex{ buildIndex(dataset, &dataset::RawInteraction::artistName) };

        struct UserArtistPlaylist
        {
            CategoricalIndex::IndexType user;
            CategoricalIndex::IndexType artist;
            std::string_view playlist;

            auto operator<=>(const UserArtistPlaylist&) const = default;
        };

        std::vector<UserArtistPlaylist> entries;
        entries.reserve(dataset.interactions.size());
        for (const dataset::RawInteraction& interaction : dataset.interactions)
            entries.push_back(UserArtistPlaylist{ *userIndex.find(interaction.userId), *artistIndex.find(interaction.artistName), interaction.playlistName });

        std::sort(std::begin(entries), std::end(entries));
        entries.erase(std::unique(std::begin(entries), std::end(entries)), std::end(entries));

        // duplicated (user, artist) triplets are summed up: one per distinct playlist
        std::vector<Eigen::Triplet<Rating>> triplets;
        triplets.reserve(entries.size());
        for (const UserArtistPlaylist& entry : entries)
            triplets.emplace_back(static_cast<Eigen::Index>(entry.user), static_cast<Eigen::Index>(entry.artist), Rating{ 1 });

        RatingMatrix ratings(static_cast<Eigen::Index>(userIndex.size()), static_cast<Eigen::Index>(artistIndex.size()));
        ratings.setFromTriplets(std::cbegin(triplets), std::cend(triplets));

        LMR_LOG(ARTIFACTS, DEBUG, "Built interaction matrix: " << userIndex.size() << " users, " << artistIndex.size() << " artists, " << ratings.nonZeros() << " ratings");

        return InteractionMatrix{ std::move(userIndex), std::move(artistIndex), std::move(ratings) };
    }

    Artifacts buildArtifacts(dataset::FilteredDataset dataset)
    {
        LMR_LOG(ARTIFACTS, INFO, "Building artifacts from " << dataset.interactions.size() << " interactions...");

        Tracklist tracklist{ buildTracklist(dataset) };
        InteractionMatrix matrix{ buildInteractionMatrix(dataset) };
        Artifacts artifacts{ core::UUID::generate(), std::move(dataset), std::move(matrix), std::move(tracklist) };

        LMR_LOG(ARTIFACTS, INFO, "Built artifacts '" << artifacts.buildId.getAsString() << "': " << artifacts.tracklist.size() << " tracks, "
                                                      << artifacts.matrix.getArtistCount() << " artists, " << artifacts.matrix.getUserCount() << " users");

        return artifacts;
    }
} // namespace lmr::artifacts
