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

#include "ArtifactsSerializer.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "artifacts/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace lmr::artifacts::serializer
{
    namespace
    {
        constexpr unsigned formatVersion{ 1 };

        constexpr char fieldDelimiter{ '\t' };
        constexpr char escapeChar{ '\\' };

        constexpr std::string_view manifestFileName{ "manifest.xml" };
        constexpr std::string_view datasetFileName{ "dataset" };
        constexpr std::string_view matrixFileName{ "matrix" };
        constexpr std::string_view tracklistFileName{ "tracklist" };

        struct Manifest
        {
            core::UUID buildId;
            std::size_t interactionCount;
            std::size_t userCount;
            std::size_t artistCount;
            std::size_t ratingCount;
            std::size_t trackCount;
        };

        void writeManifest(const std::filesystem::path& p, const Artifacts& artifacts)
        {
            try
            {
                boost::property_tree::ptree root;

                root.put("artifacts.version", formatVersion);
                root.put("artifacts.build_id", std::string{ artifacts.buildId.getAsString() });
                root.put("artifacts.interaction_count", artifacts.dataset.interactions.size());
                root.put("artifacts.user_count", artifacts.matrix.getUserCount());
                root.put("artifacts.artist_count", artifacts.matrix.getArtistCount());
                root.put("artifacts.rating_count", artifacts.matrix.getRatingCount());
                root.put("artifacts.track_count", artifacts.tracklist.size());

                boost::property_tree::write_xml(p.string(), root);
            }
            catch (boost::property_tree::ptree_error& error)
            {
                throw ArtifactStoreException{ p, error.what() };
            }
        }

        Manifest readManifest(const std::filesystem::path& p)
        {
            if (!std::filesystem::exists(p))
                throw ArtifactConsistencyException{ "Missing manifest '" + p.string() + "'" };

            try
            {
                boost::property_tree::ptree root;

                boost::property_tree::read_xml(p.string(), root);

                const unsigned version{ root.get<unsigned>("artifacts.version") };
                if (version != formatVersion)
                    throw ArtifactConsistencyException{ "Manifest '" + p.string() + "' has format version " + std::to_string(version) + ", expected " + std::to_string(formatVersion) };

                const std::string buildIdStr{ root.get<std::string>("artifacts.build_id") };
                const std::optional<core::UUID> buildId{ core::UUID::fromString(buildIdStr) };
                if (!buildId)
                    throw ArtifactConsistencyException{ "Manifest '" + p.string() + "' has a bad build id '" + buildIdStr + "'" };

                return Manifest{
                    *buildId,
                    root.get<std::size_t>("artifacts.interaction_count"),
                    root.get<std::size_t>("artifacts.user_count"),
                    root.get<std::size_t>("artifacts.artist_count"),
                    root.get<std::size_t>("artifacts.rating_count"),
                    root.get<std::size_t>("artifacts.track_count"),
                };
            }
            catch (boost::property_tree::ptree_error& error)
            {
                throw ArtifactConsistencyException{ "Cannot read manifest '" + p.string() + "': " + error.what() };
            }
        }

        // Line based file, the first line is the build id
        class DataFileWriter
        {
        public:
            DataFileWriter(const std::filesystem::path& p, const core::UUID& buildId)
                : _path{ p }
                , _ofs{ p, std::ios::trunc }
            {
                if (!_ofs)
                    throw ArtifactStoreException{ _path, "cannot open file" };

                _ofs << buildId.getAsString() << '\n';
            }

            void writeFields(std::span<const std::string_view> fields)
            {
                _ofs << core::stringUtils::escapeAndJoinStrings(fields, fieldDelimiter, escapeChar) << '\n';
            }

            void close()
            {
                _ofs.close();
                if (!_ofs)
                    throw ArtifactStoreException{ _path, "write error" };
            }

        private:
            const std::filesystem::path _path;
            std::ofstream _ofs;
        };

        class DataFileReader
        {
        public:
            DataFileReader(const std::filesystem::path& p, const core::UUID& expectedBuildId)
                : _path{ p }
                , _ifs{ p }
            {
                if (!_ifs)
                    throw ArtifactConsistencyException{ "Missing data file '" + _path.string() + "'" };

                const std::string buildId{ readLine() };
                if (buildId != expectedBuildId.getAsString())
                    throw ArtifactConsistencyException{ "Data file '" + _path.string() + "' comes from build '" + buildId + "', expected build '" + std::string{ expectedBuildId.getAsString() } + "'" };
            }

            std::vector<std::string> readFields(std::size_t expectedFieldCount)
            {
                std::vector<std::string> fields{ core::stringUtils::splitEscapedStrings(readLine(), fieldDelimiter, escapeChar) };
                if (fields.empty() && expectedFieldCount == 1)
                    fields.emplace_back();

                if (fields.size() != expectedFieldCount)
                    throw ArtifactConsistencyException{ "Data file '" + _path.string() + "', line " + std::to_string(_lineNumber) + ": expected " + std::to_string(expectedFieldCount) + " fields, got " + std::to_string(fields.size()) };

                return fields;
            }

            template<typename T>
            T readValue(const std::string& str)
            {
                const std::optional<T> value{ core::stringUtils::readAs<T>(str) };
                if (!value)
                    throw ArtifactConsistencyException{ "Data file '" + _path.string() + "', line " + std::to_string(_lineNumber) + ": bad value '" + str + "'" };

                return *value;
            }

            void checkEnd()
            {
                std::string line;
                while (std::getline(_ifs, line))
                {
                    if (!line.empty())
                        throw ArtifactConsistencyException{ "Data file '" + _path.string() + "' has unexpected trailing data" };
                }
            }

        private:
            std::string readLine()
            {
                std::string line;
                if (!std::getline(_ifs, line))
                    throw ArtifactConsistencyException{ "Data file '" + _path.string() + "' is truncated" };

                _lineNumber += 1;
                return line;
            }

            const std::filesystem::path _path;
            std::ifstream _ifs;
            std::size_t _lineNumber{};
        };

        void writeDataset(const std::filesystem::path& p, const Artifacts& artifacts)
        {
            DataFileWriter writer{ p, artifacts.buildId };

            for (const dataset::RawInteraction& interaction : artifacts.dataset.interactions)
            {
                const std::array<std::string_view, 4> fields{ interaction.userId, interaction.artistName, interaction.trackName, interaction.playlistName };
                writer.writeFields(fields);
            }

            writer.close();
        }

        dataset::FilteredDataset readDataset(const std::filesystem::path& p, const Manifest& manifest)
        {
            DataFileReader reader{ p, manifest.buildId };

            dataset::FilteredDataset res;
            res.interactions.reserve(manifest.interactionCount);
            for (std::size_t i{}; i < manifest.interactionCount; ++i)
            {
                std::vector<std::string> fields{ reader.readFields(4) };
                res.interactions.push_back(dataset::RawInteraction{ std::move(fields[0]), std::move(fields[1]), std::move(fields[2]), std::move(fields[3]) });
            }
            reader.checkEnd();

            return res;
        }

        void writeIndex(DataFileWriter& writer, const CategoricalIndex& index)
        {
            for (const std::string& name : index.getNames())
            {
                const std::array<std::string_view, 1> fields{ name };
                writer.writeFields(fields);
            }
        }

        CategoricalIndex readIndex(DataFileReader& reader, std::size_t count)
        {
            std::vector<std::string> names;
            names.reserve(count);
            for (std::size_t i{}; i < count; ++i)
                names.push_back(std::move(reader.readFields(1).front()));

            // indexes are written in their own order, reading them back must not reorder them
            CategoricalIndex index{ CategoricalIndex::fromValues(names) };
            if (!std::equal(std::cbegin(names), std::cend(names), std::cbegin(index.getNames()), std::cend(index.getNames())))
                throw ArtifactConsistencyException{ "Index entries are not sorted or not unique" };

            return index;
        }

        void writeMatrix(const std::filesystem::path& p, const Artifacts& artifacts)
        {
            DataFileWriter writer{ p, artifacts.buildId };

            const InteractionMatrix& matrix{ artifacts.matrix };
            writeIndex(writer, matrix.getUserIndex());
            writeIndex(writer, matrix.getArtistIndex());

            const RatingMatrix& ratings{ matrix.getRatings() };
            for (Eigen::Index row{}; row < ratings.outerSize(); ++row)
            {
                for (RatingMatrix::InnerIterator it{ ratings, row }; it; ++it)
                {
                    const std::string user{ std::to_string(it.row()) };
                    const std::string artist{ std::to_string(it.col()) };
                    const std::string rating{ std::to_string(static_cast<std::uint64_t>(it.value())) };

                    const std::array<std::string_view, 3> fields{ user, artist, rating };
                    writer.writeFields(fields);
                }
            }

            writer.close();
        }

        InteractionMatrix readMatrix(const std::filesystem::path& p, const Manifest& manifest)
        {
            DataFileReader reader{ p, manifest.buildId };

            CategoricalIndex userIndex{ readIndex(reader, manifest.userCount) };
            CategoricalIndex artistIndex{ readIndex(reader, manifest.artistCount) };

            std::vector<Eigen::Triplet<Rating>> triplets;
            triplets.reserve(manifest.ratingCount);
            for (std::size_t i{}; i < manifest.ratingCount; ++i)
            {
                const std::vector<std::string> fields{ reader.readFields(3) };

                const std::size_t user{ reader.readValue<std::size_t>(fields[0]) };
                const std::size_t artist{ reader.readValue<std::size_t>(fields[1]) };
                const std::uint64_t rating{ reader.readValue<std::uint64_t>(fields[2]) };
                if (user >= manifest.userCount || artist >= manifest.artistCount)
                    throw ArtifactConsistencyException{ "Data file '" + p.string() + "': rating out of bounds" };

                triplets.emplace_back(static_cast<Eigen::Index>(user), static_cast<Eigen::Index>(artist), static_cast<Rating>(rating));
            }
            reader.checkEnd();

            RatingMatrix ratings(static_cast<Eigen::Index>(manifest.userCount), static_cast<Eigen::Index>(manifest.artistCount));
            ratings.setFromTriplets(std::cbegin(triplets), std::cend(triplets));

            return InteractionMatrix{ std::move(userIndex), std::move(artistIndex), std::move(ratings) };
        }

        void writeTracklist(const std::filesystem::path& p, const Artifacts& artifacts)
        {
            DataFileWriter writer{ p, artifacts.buildId };

            for (const TrackEntry& entry : artifacts.tracklist.getEntries())
            {
                const std::array<std::string_view, 2> fields{ entry.artistName, entry.trackName };
                writer.writeFields(fields);
            }

            writer.close();
        }

        Tracklist readTracklist(const std::filesystem::path& p, const Manifest& manifest)
        {
            DataFileReader reader{ p, manifest.buildId };

            std::vector<TrackEntry> entries;
            entries.reserve(manifest.trackCount);
            for (std::size_t i{}; i < manifest.trackCount; ++i)
            {
                std::vector<std::string> fields{ reader.readFields(2) };
                entries.push_back(TrackEntry{ std::move(fields[0]), std::move(fields[1]) });
            }
            reader.checkEnd();

            return Tracklist{ std::move(entries) };
        }
    } // namespace

    void writeBuild(const std::filesystem::path& buildDirectory, const Artifacts& artifacts)
    {
        LMR_LOG(ARTIFACTS, DEBUG, "Writing build '" << artifacts.buildId.getAsString() << "' into '" << buildDirectory.string() << "'");

        writeDataset(buildDirectory / datasetFileName, artifacts);
        writeMatrix(buildDirectory / matrixFileName, artifacts);
        writeTracklist(buildDirectory / tracklistFileName, artifacts);
        writeManifest(buildDirectory / manifestFileName, artifacts);
    }

    Artifacts readBuild(const std::filesystem::path& buildDirectory)
    {
        LMR_LOG(ARTIFACTS, DEBUG, "Reading build from '" << buildDirectory.string() << "'");

        const Manifest manifest{ readManifest(buildDirectory / manifestFileName) };

        dataset::FilteredDataset dataset{ readDataset(buildDirectory / datasetFileName, manifest) };
        InteractionMatrix matrix{ readMatrix(buildDirectory / matrixFileName, manifest) };
        Tracklist tracklist{ readTracklist(buildDirectory / tracklistFileName, manifest) };

        return Artifacts{ manifest.buildId, std::move(dataset), std::move(matrix), std::move(tracklist) };
    }
} // namespace lmr::artifacts::serializer
