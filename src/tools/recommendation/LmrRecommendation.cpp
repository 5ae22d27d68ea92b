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

#include <filesystem>
#include <iostream>
#include <stdlib.h>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "artifacts/Exception.hpp"
#include "artifacts/IArtifactStore.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "recommendation/Exception.hpp"
#include "recommendation/IRecommendationEngine.hpp"

namespace lmr
{
    void dumpArtists(std::string_view title, const recommendation::ArtistNameContainer& artistNames)
    {
        std::cout << "*** " << title << " (" << artistNames.size() << ") ***" << std::endl;
        for (const std::string& artistName : artistNames)
            std::cout << "\t- " << artistName << std::endl;
    }

    void dumpTracks(const artifacts::Tracklist& tracklist)
    {
        std::cout << "*** Tracks (" << tracklist.size() << ") ***" << std::endl;
        for (const artifacts::TrackEntry& entry : tracklist.getEntries())
            std::cout << entry.getDisplayName() << std::endl;
    }

    // Selected tracks are mapped to their artists
    std::vector<std::string> getSelectedArtists(const artifacts::Tracklist& tracklist, const std::vector<std::string>& artistNames, const std::vector<std::string>& trackDisplayNames)
    {
        std::vector<std::string> res{ artistNames };

        for (const std::string& trackDisplayName : trackDisplayNames)
        {
            const std::optional<std::string_view> artistName{ tracklist.findArtistName(trackDisplayName) };
            if (!artistName)
                throw core::LmrException{ "Track '" + trackDisplayName + "' not found" };

            res.emplace_back(*artistName);
        }

        return res;
    }

    std::optional<core::logging::Severity> getLogMinSeverity(core::IConfig& config)
    {
        const std::string_view severityStr{ config.getString("log-min-severity", "info") };
        return core::logging::parseSeverity(severityStr);
    }
} // namespace lmr

int main(int argc, char* argv[])
{
    try
    {
        using namespace lmr;
        namespace po = boost::program_options;

        po::options_description desc{ "Allowed options" };
        desc.add_options()("help,h", "print usage message")("conf,c", po::value<std::string>()->default_value("/etc/lmr.conf"), "LMR config file")("rebuild", "Rebuild artifacts from the dataset")("popular,p", "Display popular artists")("artist,a", po::value<std::vector<std::string>>()->composing(), "Select an artist")("track,t", po::value<std::vector<std::string>>()->composing(), "Select a track, using its \"ARTIST - TRACK\" name")("list-tracks,l", "List tracks that can be selected")("max,m", po::value<unsigned>(), "Max recommendation count");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };

        const std::optional<core::logging::Severity> minSeverity{ getLogMinSeverity(*config) };
        if (!minSeverity)
            throw core::LmrException{ "Bad value for 'log-min-severity'" };
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(*minSeverity, config->getPath("log-file", "")) };

        const auto artifactStore{ artifacts::createArtifactStore(artifacts::ArtifactStoreSettings::fromConfig(*config)) };
        if (vm.count("rebuild"))
            artifactStore->invalidate();

        std::shared_ptr<const artifacts::Artifacts> loadedArtifacts;
        try
        {
            loadedArtifacts = artifactStore->load();
        }
        catch (const artifacts::ArtifactConsistencyException& e)
        {
            LMR_LOG(MAIN, ERROR, "Inconsistent artifacts: " << e.what());
            std::cerr << "Cached artifacts are inconsistent: " << e.what() << std::endl;
            std::cerr << "Run again with --rebuild to rebuild them from the dataset" << std::endl;
            return EXIT_FAILURE;
        }

        if (vm.count("list-tracks"))
            dumpTracks(loadedArtifacts->tracklist);

        recommendation::RecommendationSettings settings{ recommendation::RecommendationSettings::fromConfig(*config) };
        if (vm.count("max"))
            settings.maxCount = vm["max"].as<unsigned>();

        std::cout << "Creating recommendation engine..." << std::endl;
        const auto engine{ recommendation::createRecommendationEngine(loadedArtifacts, settings) };
        std::cout << "Recommendation engine created!" << std::endl;

        if (vm.count("popular"))
            dumpArtists("Popular artists", engine->getPopularArtists());

        const std::vector<std::string> selectedArtists{ getSelectedArtists(loadedArtifacts->tracklist,
                                                                            vm.count("artist") ? vm["artist"].as<std::vector<std::string>>() : std::vector<std::string>{},
                                                                            vm.count("track") ? vm["track"].as<std::vector<std::string>>() : std::vector<std::string>{}) };
        if (!selectedArtists.empty())
        {
            try
            {
                dumpArtists("Item based recommendations", engine->getItemBasedRecommendations(selectedArtists));
                dumpArtists("User based recommendations", engine->getUserBasedRecommendations(selectedArtists));
            }
            catch (const recommendation::ArtistNotFoundException& e)
            {
                std::cerr << "Unknown artist '" << e.getArtistName() << "'" << std::endl;
                return EXIT_FAILURE;
            }
        }
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
