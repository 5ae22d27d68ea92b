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
#include <filesystem>
#include <istream>
#include <string_view>

#include "dataset/Types.hpp"

namespace lmr::dataset
{
    struct ReadStats
    {
        std::size_t lineCount{};    // physical lines, header excluded
        std::size_t badLineCount{}; // wrong field count or unterminated quoted field
    };

    // Reads "user_id,artist_name,track_name,playlist_name" RFC 4180 CSV data
    // The first line is a header and is always skipped, blank lines are ignored
    // Quoted fields may span several lines
    // Bad records are skipped, missing fields are kept as empty strings
    InteractionContainer readInteractions(std::istream& is, ReadStats* stats = nullptr);

    // Throws core::FileException if the file cannot be opened
    InteractionContainer readInteractions(const std::filesystem::path& p, ReadStats* stats = nullptr);

    // Empty values and the pandas default "NA", "NULL", "NaN"... markers, compared untrimmed
    bool isMissingValue(std::string_view value);
} // namespace lmr::dataset
