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

#include "dataset/DatasetPreparer.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <boost/container_hash/hash.hpp>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "dataset/InteractionReader.hpp"

namespace lmr::dataset
{
    namespace
    {
        // Number of bytes of the UTF-8 sequence starting with this byte, 1 for invalid bytes
        std::size_t getUTF8SequenceLength(unsigned char leadByte)
        {
            if (leadByte < 0x80)
                return 1;
            if ((leadByte & 0xE0) == 0xC0)
                return 2;
            if ((leadByte & 0xF0) == 0xE0)
                return 3;
            if ((leadByte & 0xF8) == 0xF0)
                return 4;

            return 1;
        }

        template<typename Predicate>
        void eraseInteractionsIf(InteractionContainer& interactions, Predicate&& pred)
        {
            interactions.erase(std::remove_if(std::begin(interactions), std::end(interactions), std::forward<Predicate>(pred)), std::end(interactions));
        }

        // Removes rows whose key has fewer than minCount distinct values
        template<typename KeyGetter, typename ValueGetter>
        void removeInteractionsWithFewDistinctValues(InteractionContainer& interactions, KeyGetter keyGetter, ValueGetter valueGetter, std::size_t minCount)
        {
            std::unordered_map<std::string_view, std::unordered_set<std::string_view>> distinctValuesByKey;
            for (const RawInteraction& interaction : interactions)
                distinctValuesByKey[keyGetter(interaction)].insert(valueGetter(interaction));

            std::unordered_set<std::string> keysToRemove;
            for (const auto& [key, values] : distinctValuesByKey)
            {
                if (values.size() <= minCount)
                    keysToRemove.emplace(key);
            }

            eraseInteractionsIf(interactions, [&](const RawInteraction& interaction) { return keysToRemove.contains(std::string{ keyGetter(interaction) }); });
        }
    } // namespace

    PreparerSettings PreparerSettings::fromConfig(core::IConfig& config)
    {
        PreparerSettings settings;

        settings.minArtistOccurrences = config.getULong("dataset-min-artist-occurrences", settings.minArtistOccurrences);
        settings.minUserDistinctTracks = config.getULong("dataset-min-user-distinct-tracks", settings.minUserDistinctTracks);
        settings.filterUniformPlaylists = config.getBool("dataset-filter-uniform-playlists", settings.filterUniformPlaylists);
        settings.minPlaylistDistinctArtists = config.getULong("dataset-min-playlist-distinct-artists", settings.minPlaylistDistinctArtists);

        return settings;
    }

    FilteredDataset prepareDataset(InteractionContainer interactions, const PreparerSettings& settings)
    {
        LMR_LOG(DATASET, INFO, "Preparing dataset from " << interactions.size() << " interactions...");

        auto runStep{ [&](std::string_view stepName, auto&& step) {
            const std::size_t countBefore{ interactions.size() };
            step();
            LMR_LOG(DATASET, DEBUG, "Step '" << stepName << "': removed " << (countBefore - interactions.size()) << " interactions, " << interactions.size() << " remaining");
        } };

        runStep("incomplete and duplicates", [&] { removeIncompleteAndDuplicateInteractions(interactions); });
        runStep("canonicalize tracks", [&] { canonicalizeTracks(interactions); });
        // canonical spellings may produce new duplicates
        runStep("duplicates after canonicalization", [&] { removeDuplicateInteractions(interactions); });
        runStep("unpopular artists", [&] { removeUnpopularArtists(interactions, settings.minArtistOccurrences); });
        runStep("inactive users", [&] { removeInactiveUsers(interactions, settings.minUserDistinctTracks); });
        if (settings.filterUniformPlaylists)
            runStep("uniform playlists", [&] { removeUniformPlaylists(interactions, settings.minPlaylistDistinctArtists); });

        LMR_LOG(DATASET, INFO, "Dataset prepared: " << interactions.size() << " interactions kept");
        LMR_LOG_IF(DATASET, WARNING, interactions.empty(), "No interaction survived the filters, recommendations will be empty");

        return FilteredDataset{ std::move(interactions) };
    }

    void removeIncompleteAndDuplicateInteractions(InteractionContainer& interactions)
    {
        eraseInteractionsIf(interactions, [](const RawInteraction& interaction) {
            return isMissingValue(interaction.userId)
                || isMissingValue(interaction.artistName)
                || isMissingValue(interaction.trackName)
                || isMissingValue(interaction.playlistName);
        });

        removeDuplicateInteractions(interactions);
    }

    void removeDuplicateInteractions(InteractionContainer& interactions)
    {
        std::unordered_set<RawInteraction> seenInteractions;
        seenInteractions.reserve(interactions.size());

        InteractionContainer uniqueInteractions;
        uniqueInteractions.reserve(interactions.size());
        for (RawInteraction& interaction : interactions)
        {
            if (seenInteractions.contains(interaction))
                continue;

            seenInteractions.insert(interaction);
            uniqueInteractions.push_back(std::move(interaction));
        }

        interactions = std::move(uniqueInteractions);
    }

    std::string computeNormalizedName(std::string_view name)
    {
        std::string res;
        res.reserve(name.size());

        std::size_t i{};
        while (i < name.size())
        {
            const unsigned char c{ static_cast<unsigned char>(name[i]) };
            if (c < 0x80)
            {
                if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z'))
                    res.push_back(static_cast<char>(c));
                else if (c >= 'A' && c <= 'Z')
                    res.push_back(static_cast<char>(c - 'A' + 'a'));

                i += 1;
                continue;
            }

            const std::size_t sequenceLength{ getUTF8SequenceLength(c) };
            const std::string_view sequence{ name.substr(i, sequenceLength) };
            i += sequenceLength;

            // U+00E4 U+00F6 U+00FC U+00DF are kept, U+00C4 U+00D6 U+00DC U+1E9E are lowered first
            if (sequence == "\xC3\xA4" || sequence == "\xC3\x84")
                res += "\xC3\xA4";
            else if (sequence == "\xC3\xB6" || sequence == "\xC3\x96")
                res += "\xC3\xB6";
            else if (sequence == "\xC3\xBC" || sequence == "\xC3\x9C")
                res += "\xC3\xBC";
            else if (sequence == "\xC3\x9F" || sequence == "\xE1\xBA\x9E")
                res += "\xC3\x9F";
        }

        return res;
    }

    void canonicalizeTracks(InteractionContainer& interactions)
    {
        using Spelling = std::pair<std::string_view, std::string_view>;
        using NormalizedSpelling = std::pair<std::string, std::string>;

        struct SpellingInfo
        {
            std::size_t count{};
            std::size_t firstIndex{};
            std::size_t groupId{};
        };

        constexpr std::size_t noRow{ std::numeric_limits<std::size_t>::max() };

        std::unordered_map<Spelling, SpellingInfo, boost::hash<Spelling>> spellings;
        std::unordered_map<NormalizedSpelling, std::size_t, boost::hash<NormalizedSpelling>> groupIds;
        for (std::size_t i{}; i < interactions.size(); ++i)
        {
            const RawInteraction& interaction{ interactions[i] };

            auto [itSpelling, inserted]{ spellings.try_emplace(Spelling{ interaction.artistName, interaction.trackName }) };
            SpellingInfo& info{ itSpelling->second };
            if (inserted)
            {
                NormalizedSpelling normalizedSpelling{ computeNormalizedName(interaction.artistName), computeNormalizedName(interaction.trackName) };
                const auto [itGroup, groupInserted]{ groupIds.try_emplace(std::move(normalizedSpelling), groupIds.size()) };

                info.firstIndex = i;
                info.groupId = itGroup->second;
            }
            info.count += 1;
        }

        // For each group, first row of the most used spelling
        std::vector<std::size_t> groupBestRows(groupIds.size(), noRow);
        std::vector<std::size_t> groupBestCounts(groupIds.size());
        for (const auto& [spelling, info] : spellings)
        {
            std::size_t& bestRow{ groupBestRows[info.groupId] };
            std::size_t& bestCount{ groupBestCounts[info.groupId] };
            if (bestRow == noRow || info.count > bestCount || (info.count == bestCount && info.firstIndex < bestRow))
            {
                bestRow = info.firstIndex;
                bestCount = info.count;
            }
        }

        std::vector<std::size_t> canonicalRows(interactions.size());
        for (std::size_t i{}; i < interactions.size(); ++i)
        {
            const RawInteraction& interaction{ interactions[i] };
            const SpellingInfo& info{ spellings.at(Spelling{ interaction.artistName, interaction.trackName }) };
            canonicalRows[i] = groupBestRows[info.groupId];
        }

        // views in spellings are about to be invalidated
        spellings.clear();

        std::size_t replacedCount{};
        for (std::size_t i{}; i < interactions.size(); ++i)
        {
            const std::size_t canonicalRow{ canonicalRows[i] };
            if (canonicalRow == i)
                continue;

            RawInteraction& interaction{ interactions[i] };
            const RawInteraction& canonicalInteraction{ interactions[canonicalRow] };
            if (interaction.artistName == canonicalInteraction.artistName && interaction.trackName == canonicalInteraction.trackName)
                continue;

            interaction.artistName = canonicalInteraction.artistName;
            interaction.trackName = canonicalInteraction.trackName;
            replacedCount += 1;
        }

        LMR_LOG(DATASET, DEBUG, "Canonicalized " << replacedCount << " track spellings, " << groupIds.size() << " distinct tracks");
    }

    void removeUnpopularArtists(InteractionContainer& interactions, std::size_t minArtistOccurrences)
    {
        std::unordered_map<std::string, std::size_t> artistOccurrences;
        for (const RawInteraction& interaction : interactions)
            artistOccurrences[interaction.artistName] += 1;

        eraseInteractionsIf(interactions, [&](const RawInteraction& interaction) { return artistOccurrences[interaction.artistName] <= minArtistOccurrences; });
    }

    void removeInactiveUsers(InteractionContainer& interactions, std::size_t minUserDistinctTracks)
    {
        removeInteractionsWithFewDistinctValues(
            interactions,
            [](const RawInteraction& interaction) -> std::string_view { return interaction.userId; },
            [](const RawInteraction& interaction) -> std::string_view { return interaction.trackName; },
            minUserDistinctTracks);
    }

    void removeUniformPlaylists(InteractionContainer& interactions, std::size_t minPlaylistDistinctArtists)
    {
        removeInteractionsWithFewDistinctValues(
            interactions,
            [](const RawInteraction& interaction) -> std::string_view { return interaction.playlistName; },
            [](const RawInteraction& interaction) -> std::string_view { return interaction.artistName; },
            minPlaylistDistinctArtists);
    }
} // namespace lmr::dataset
