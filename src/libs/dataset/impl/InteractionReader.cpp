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

#include "dataset/InteractionReader.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <boost/tokenizer.hpp>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace lmr::dataset
{
    namespace
    {
        constexpr std::size_t fieldCount{ 4 };

        class UnterminatedQuoteException : public std::runtime_error
        {
        public:
            UnterminatedQuoteException()
                : std::runtime_error{ "unterminated quoted field" }
            {
            }
        };

        // RFC 4180 fields for boost::tokenizer
        // A quote opens a quoted field only at the start of the field, "" stands for " inside it
        // Backslashes are regular characters
        class CsvSeparator
        {
        public:
            void reset() { _last = false; }

            template<typename InputIterator, typename Token>
            bool operator()(InputIterator& it, InputIterator end, Token& token)
            {
                token = Token{};

                if (it == end)
                {
                    // trailing separator: one last empty field
                    const bool last{ _last };
                    _last = false;
                    return last;
                }

                _last = false;
                bool inQuotes{};
                bool fieldStart{ true };
                for (; it != end; ++it)
                {
                    const char c{ *it };
                    if (inQuotes)
                    {
                        if (c != quote)
                            token += c;
                        else if (std::next(it) != end && *std::next(it) == quote)
                        {
                            token += c;
                            ++it;
                        }
                        else
                            inQuotes = false;
                    }
                    else if (c == separator)
                    {
                        ++it;
                        _last = true;
                        return true;
                    }
                    else if (c == quote && fieldStart)
                        inQuotes = true;
                    else
                        token += c;

                    fieldStart = false;
                }

                if (inQuotes)
                    throw UnterminatedQuoteException{};

                return true;
            }

        private:
            static constexpr char separator{ ',' };
            static constexpr char quote{ '"' };
            bool _last{};
        };

        using Tokenizer = boost::tokenizer<CsvSeparator>;

        enum class TokenizeResult
        {
            Complete,
            WrongFieldCount,
            UnterminatedQuote,
        };

        TokenizeResult tokenizeRecord(const std::string& record, std::array<std::string, fieldCount>& fields)
        {
            try
            {
                const Tokenizer tokenizer{ record, CsvSeparator{} };

                std::size_t i{};
                for (const std::string& token : tokenizer)
                {
                    if (i == fieldCount)
                        return TokenizeResult::WrongFieldCount;

                    fields[i++] = token;
                }

                return i == fieldCount ? TokenizeResult::Complete : TokenizeResult::WrongFieldCount;
            }
            catch (const UnterminatedQuoteException&)
            {
                return TokenizeResult::UnterminatedQuote;
            }
        }
    } // namespace

    bool isMissingValue(std::string_view value)
    {
        // pandas read_csv defaults
        static constexpr std::array<std::string_view, 19> missingValueMarkers{
            "", "#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan", "1.#IND", "1.#QNAN", "<NA>", "N/A", "NA", "NULL", "NaN", "None", "n/a", "nan", "null"
        };

        return std::find(std::cbegin(missingValueMarkers), std::cend(missingValueMarkers), value) != std::cend(missingValueMarkers);
    }

    InteractionContainer readInteractions(std::istream& is, ReadStats* stats)
    {
        InteractionContainer res;
        ReadStats readStats;

        bool firstLine{ true };
        std::array<std::string, fieldCount> fields;
        std::string record; // may span several lines
        std::string line;
        while (std::getline(is, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            if (firstLine)
            {
                firstLine = false;
                continue;
            }

            readStats.lineCount += 1;

            if (record.empty())
            {
                if (line.empty())
                    continue;

                record = std::move(line);
            }
            else
            {
                record += '\n';
                record += line;
            }

            switch (tokenizeRecord(record, fields))
            {
            case TokenizeResult::UnterminatedQuote:
                continue;

            case TokenizeResult::WrongFieldCount:
                readStats.badLineCount += 1;
                LMR_LOG(DATASET, DEBUG, "Skipping bad record ending at line " << readStats.lineCount + 1);
                break;

            case TokenizeResult::Complete:
            {
                RawInteraction& interaction{ res.emplace_back() };
                interaction.userId = std::move(fields[0]);
                interaction.artistName = std::move(fields[1]);
                interaction.trackName = std::move(fields[2]);
                interaction.playlistName = std::move(fields[3]);
                break;
            }
            }

            record.clear();
        }

        if (!record.empty())
        {
            readStats.badLineCount += 1;
            LMR_LOG(DATASET, DEBUG, "Skipping last record: unterminated quoted field");
        }

        LMR_LOG(DATASET, INFO, "Read " << readStats.lineCount << " lines, " << res.size() << " interactions, skipped " << readStats.badLineCount << " bad records");

        if (stats)
            *stats = readStats;

        return res;
    }

    InteractionContainer readInteractions(const std::filesystem::path& p, ReadStats* stats)
    {
        std::ifstream ifs{ p };
        if (!ifs)
            core::throwFileException(p, "cannot open dataset file");

        LMR_LOG(DATASET, INFO, "Reading interactions from '" << p.string() << "'...");
        return readInteractions(ifs, stats);
    }
} // namespace lmr::dataset
