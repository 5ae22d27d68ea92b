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

#include "artifacts/Tracklist.hpp"

namespace lmr::artifacts
{
    std::string TrackEntry::getDisplayName() const
    {
        return artistName + " - " + trackName;
    }

    Tracklist::Tracklist(std::vector<TrackEntry> entries)
        : _entries{ std::move(entries) }
    {
        // different entries may share the same display name, first one wins
        for (std::size_t i{}; i < _entries.size(); ++i)
            _entryByDisplayName.try_emplace(_entries[i].getDisplayName(), i);
    }

    std::vector<std::string> Tracklist::getDisplayNames() const
    {
        std::vector<std::string> res;
        res.reserve(_entries.size());

        for (const TrackEntry& entry : _entries)
            res.push_back(entry.getDisplayName());

        return res;
    }

    std::optional<std::string_view> Tracklist::findArtistName(std::string_view displayName) const
    {
        const auto it{ _entryByDisplayName.find(std::string{ displayName }) };
        if (it == std::cend(_entryByDisplayName))
            return std::nullopt;

        return _entries[it->second].artistName;
    }
} // namespace lmr::artifacts
