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
#include <mutex>

#include "artifacts/IArtifactStore.hpp"

namespace lmr::artifacts
{
    // Cache directory layout:
    //   current          build id of the current build, replaced atomically
    //   <build id>/      manifest.xml, dataset, matrix, tracklist
    class ArtifactStore : public IArtifactStore
    {
    public:
        ArtifactStore(const ArtifactStoreSettings& settings);
        ~ArtifactStore() override = default;
        ArtifactStore(const ArtifactStore&) = delete;
        ArtifactStore& operator=(const ArtifactStore&) = delete;

    private:
        std::shared_ptr<const Artifacts> load() override;
        void write(const Artifacts& artifacts) override;
        void invalidate() override;

        std::shared_ptr<const Artifacts> readCache() const;
        std::shared_ptr<const Artifacts> buildFromDataset() const;
        void writeCache(const Artifacts& artifacts);
        void removeObsoleteBuilds(const std::filesystem::path& currentBuildDirectory);

        std::filesystem::path getCurrentBuildFilePath() const;

        const ArtifactStoreSettings _settings;

        std::mutex _mutex;
        std::shared_ptr<const Artifacts> _artifacts;
    };
} // namespace lmr::artifacts
