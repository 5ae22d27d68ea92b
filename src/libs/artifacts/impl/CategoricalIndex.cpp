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

#include "artifacts/CategoricalIndex.hpp"

#include <algorithm>

namespace lmr::artifacts
{
    CategoricalIndex CategoricalIndex::fromValues(std::vector<std::string> values)
    {
        std::sort(std::begin(values), std::end(values));
        values.erase(std::unique(std::begin(values), std::end(values)), std::end(values));

        return CategoricalIndex{ std::move(values) };
    }

    CategoricalIndex::CategoricalIndex(std::vector<std::string> sortedNames)
        : _names{ std::move(sortedNames) }
    {
    }

    std::optional<CategoricalIndex::IndexType> CategoricalIndex::find(std::string_view name) const
    {
        const auto it{ std::lower_bound(std::cbegin(_names), std::cend(_names), name, [](const std::string& value, std::string_view searchedName) { return std::string_view{ value } < searchedName; }) };
        if (it == std::cend(_names) || *it != name)
            return std::nullopt;

        return static_cast<IndexType>(std::distance(std::cbegin(_names), it));
    }
} // namespace lmr::artifacts
