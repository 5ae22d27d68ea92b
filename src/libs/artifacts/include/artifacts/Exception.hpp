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

#include <filesystem>

#include "core/Exception.hpp"

namespace lmr::artifacts
{
    class ArtifactsException : public core::LmrException
    {
    public:
        using LmrException::LmrException;
    };

    // Cached artifacts are partial, corrupted or do not come from the same build
    // Artifacts must be rebuilt from the raw dataset
    class ArtifactConsistencyException : public ArtifactsException
    {
    public:
        using ArtifactsException::ArtifactsException;
    };

    class ArtifactStoreException : public ArtifactsException
    {
    public:
        ArtifactStoreException(const std::filesystem::path& p, const std::string& error)
            : ArtifactsException{ "Cannot store artifacts in '" + p.string() + "': " + error } {}
    };
} // namespace lmr::artifacts
