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

#include "ArtifactStore.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "artifacts/ArtifactsBuilder.hpp"
#include "artifacts/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "dataset/InteractionReader.hpp"

#include "ArtifactsSerializer.hpp"

namespace lmr::artifacts
{
    namespace
    {
        constexpr std::string_view currentBuildFileName{ "current" };
        constexpr std::string_view tmpSuffix{ ".tmp" };
    } // namespace

    ArtifactStoreSettings ArtifactStoreSettings::fromConfig(core::IConfig& config)
    {
        const std::filesystem::path workingDirectory{ config.getPath("working-dir", "/var/lmr") };

        ArtifactStoreSettings settings;
        settings.cacheDirectory = workingDirectory / "cache" / "artifacts";
        settings.datasetFile = config.getPath("dataset-file", workingDirectory / "spotify_dataset.csv");
        settings.preparerSettings = dataset::PreparerSettings::fromConfig(config);

        return settings;
    }

    std::unique_ptr<IArtifactStore> createArtifactStore(const ArtifactStoreSettings& settings)
    {
        return std::make_unique<ArtifactStore>(settings);
    }

    ArtifactStore::ArtifactStore(const ArtifactStoreSettings& settings)
        : _settings{ settings }
    {
    }

    std::shared_ptr<const Artifacts> ArtifactStore::load()
    {
        const std::scoped_lock lock{ _mutex };

        if (_artifacts)
            return _artifacts;

        std::shared_ptr<const Artifacts> artifacts{ readCache() };
        if (!artifacts)
        {
            artifacts = buildFromDataset();
            writeCache(*artifacts);
        }

        _artifacts = artifacts;
        return _artifacts;
    }

    void ArtifactStore::write(const Artifacts& artifacts)
    {
        const std::scoped_lock lock{ _mutex };

        writeCache(artifacts);
        // next load will read back this build
        _artifacts.reset();
    }

    void ArtifactStore::invalidate()
    {
        const std::scoped_lock lock{ _mutex };

        LMR_LOG(ARTIFACTS, INFO, "Invalidating artifacts cache in '" << _settings.cacheDirectory.string() << "'");

        _artifacts.reset();

        std::error_code ec;
        std::filesystem::remove_all(_settings.cacheDirectory, ec);
        if (ec)
            throw ArtifactStoreException{ _settings.cacheDirectory, ec.message() };
    }

    std::shared_ptr<const Artifacts> ArtifactStore::readCache() const
    {
        const std::filesystem::path currentBuildFilePath{ getCurrentBuildFilePath() };
        if (!std::filesystem::exists(currentBuildFilePath))
        {
            LMR_LOG(ARTIFACTS, INFO, "No cached artifacts found");
            return nullptr;
        }

        std::string buildIdStr;
        {
            std::ifstream ifs{ currentBuildFilePath };
            if (!ifs || !std::getline(ifs, buildIdStr))
                throw ArtifactConsistencyException{ "Cannot read current build file '" + currentBuildFilePath.string() + "'" };
        }

        const std::optional<core::UUID> buildId{ core::UUID::fromString(buildIdStr) };
        if (!buildId)
            throw ArtifactConsistencyException{ "Bad current build id '" + buildIdStr + "'" };

        const std::filesystem::path buildDirectory{ _settings.cacheDirectory / buildId->getAsString() };
        if (!std::filesystem::is_directory(buildDirectory))
            throw ArtifactConsistencyException{ "Missing build directory '" + buildDirectory.string() + "'" };

        LMR_LOG(ARTIFACTS, INFO, "Reading artifacts from cache...");
        auto artifacts{ std::make_shared<Artifacts>(serializer::readBuild(buildDirectory)) };
        if (artifacts->buildId != *buildId)
            throw ArtifactConsistencyException{ "Build directory '" + buildDirectory.string() + "' contains build '" + std::string{ artifacts->buildId.getAsString() } + "'" };

        LMR_LOG(ARTIFACTS, INFO, "Successfully read artifacts '" << artifacts->buildId.getAsString() << "' from cache");

        return artifacts;
    }

    std::shared_ptr<const Artifacts> ArtifactStore::buildFromDataset() const
    {
        dataset::FilteredDataset dataset{ dataset::prepareDataset(dataset::readInteractions(_settings.datasetFile), _settings.preparerSettings) };

        return std::make_shared<Artifacts>(buildArtifacts(std::move(dataset)));
    }

    void ArtifactStore::writeCache(const Artifacts& artifacts)
    {
        const std::string buildId{ artifacts.buildId.getAsString() };
        const std::filesystem::path buildDirectory{ _settings.cacheDirectory / buildId };
        const std::filesystem::path tmpBuildDirectory{ _settings.cacheDirectory / (buildId + std::string{ tmpSuffix }) };
        const std::filesystem::path currentBuildFilePath{ getCurrentBuildFilePath() };
        const std::filesystem::path tmpCurrentBuildFilePath{ currentBuildFilePath.string() + std::string{ tmpSuffix } };

        LMR_LOG(ARTIFACTS, INFO, "Writing artifacts '" << buildId << "' to cache...");

        try
        {
            std::filesystem::create_directories(_settings.cacheDirectory);

            std::filesystem::remove_all(tmpBuildDirectory);
            std::filesystem::create_directory(tmpBuildDirectory);
            serializer::writeBuild(tmpBuildDirectory, artifacts);

            std::filesystem::remove_all(buildDirectory);
            std::filesystem::rename(tmpBuildDirectory, buildDirectory);

            {
                std::ofstream ofs{ tmpCurrentBuildFilePath, std::ios::trunc };
                ofs << buildId << '\n';
                ofs.close();
                if (!ofs)
                    throw ArtifactStoreException{ tmpCurrentBuildFilePath, "write error" };
            }

            // the build becomes visible here
            std::filesystem::rename(tmpCurrentBuildFilePath, currentBuildFilePath);
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw ArtifactStoreException{ _settings.cacheDirectory, e.what() };
        }

        LMR_LOG(ARTIFACTS, INFO, "Successfully written artifacts to cache");

        removeObsoleteBuilds(buildDirectory);
    }

    void ArtifactStore::removeObsoleteBuilds(const std::filesystem::path& currentBuildDirectory)
    {
        std::vector<std::filesystem::path> obsoleteBuildDirectories;

        std::error_code ec;
        for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ _settings.cacheDirectory, ec })
        {
            if (entry.is_directory(ec) && entry.path() != currentBuildDirectory)
                obsoleteBuildDirectories.push_back(entry.path());
        }

        if (ec)
            LMR_LOG(ARTIFACTS, WARNING, "Cannot list cache directory '" << _settings.cacheDirectory.string() << "': " << ec.message());

        for (const std::filesystem::path& obsoleteBuildDirectory : obsoleteBuildDirectories)
        {
            LMR_LOG(ARTIFACTS, DEBUG, "Removing obsolete build '" << obsoleteBuildDirectory.string() << "'");

            std::filesystem::remove_all(obsoleteBuildDirectory, ec);
            if (ec)
                LMR_LOG(ARTIFACTS, WARNING, "Cannot remove '" << obsoleteBuildDirectory.string() << "': " << ec.message());
        }
    }

    std::filesystem::path ArtifactStore::getCurrentBuildFilePath() const
    {
        return _settings.cacheDirectory / currentBuildFileName;
    }
} // namespace lmr::artifacts
