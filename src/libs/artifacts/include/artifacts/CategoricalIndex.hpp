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
#include <vector>

namespace lmr::artifacts
{
    // Immutable bidirectional name <-> index table
    // Indexes are assigned by ascending byte order of the distinct names
    class CategoricalIndex
    {
    public:
        using IndexType = std::size_t;

        CategoricalIndex() = default;

        // Duplicates are merged
        static CategoricalIndex fromValues(std::vector<std::string> values);

        std::size_t size() const { return _names.size(); }
        bool empty() const { return _names.empty(); }

        std::optional<IndexType> find(std::string_view name) const;
        const std::string& getName(IndexType index) const { return _names[index]; }
        std::span<const std::string> getNames() const { return _names; }

        bool operator==(const CategoricalIndex&) const = default;

    private:
        explicit CategoricalIndex(std::vector<std::string> sortedNames);

        std::vector<std::string> _names;
    };
} // namespace lmr::artifacts
