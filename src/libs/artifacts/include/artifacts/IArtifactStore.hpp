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
#include <memory>

#include "artifacts/Artifacts.hpp"
#include "dataset/DatasetPreparer.hpp"

namespace lmr::core
{
    class IConfig;
}

namespace lmr::artifacts
{
    struct ArtifactStoreSettings
    {
        std::filesystem::path cacheDirectory;
        std::filesystem::path datasetFile;
        dataset::PreparerSettings preparerSettings;

        static ArtifactStoreSettings fromConfig(core::IConfig& config);
    };

    // Durable cache of the artifacts of one build
    class IArtifactStore
    {
    public:
        virtual ~IArtifactStore() = default;

        // Returns the cached build if any, otherwise builds the artifacts from the dataset file and writes them
        // Concurrent calls share the same result, the build is done only once
        // Throws ArtifactConsistencyException if the cached build is partial or inconsistent
        virtual std::shared_ptr<const Artifacts> load() = 0;

        // Replaces the cached build, atomically
        // Throws ArtifactStoreException on failure
        virtual void write(const Artifacts& artifacts) = 0;

        // Removes the cached build, next load will rebuild from the dataset file
        virtual void invalidate() = 0;
    };

    std::unique_ptr<IArtifactStore> createArtifactStore(const ArtifactStoreSettings& settings);
} // namespace lmr::artifacts
