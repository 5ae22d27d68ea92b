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
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lmr::artifacts
{
    struct TrackEntry
    {
        std::string artistName;
        std::string trackName;

        // "{artist} - {track}"
        std::string getDisplayName() const;

        bool operator==(const TrackEntry&) const = default;
    };

    // Distinct (artist, track) pairs sorted by artist name
    // This order is used to present the tracks, it does not match the artist index of the interaction matrix
    class Tracklist
    {
    public:
        Tracklist() = default;
        explicit Tracklist(std::vector<TrackEntry> entries);

        std::size_t size() const { return _entries.size(); }
        bool empty() const { return _entries.empty(); }

        std::span<const TrackEntry> getEntries() const { return _entries; }
        std::vector<std::string> getDisplayNames() const;

        std::optional<std::string_view> findArtistName(std::string_view displayName) const;

        bool operator==(const Tracklist& other) const { return _entries == other._entries; }

    private:
        std::vector<TrackEntry> _entries;
        std::unordered_map<std::string, std::size_t> _entryByDisplayName;
    };
} // namespace lmr::artifacts
