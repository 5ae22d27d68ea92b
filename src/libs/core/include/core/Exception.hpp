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

#include <cerrno>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace lmr::core
{
    class LmrException : public std::runtime_error
    {
    public:
        LmrException(const std::string& error = "")
            : std::runtime_error{ error } {}
    };

    class FileException : public LmrException
    {
    public:
        FileException(const std::filesystem::path& p, std::string_view message, std::error_code err = {})
            : LmrException{ "File '" + p.string() + "': " + std::string{ message } + (err ? ": " + err.message() : std::string{}) }
            , _path{ p }
        {
        }

        const std::filesystem::path& getPath() const { return _path; }

    private:
        std::filesystem::path _path;
    };

    [[noreturn]] inline void throwFileException(const std::filesystem::path& p, std::string_view message)
    {
        throw FileException{ p, message, std::error_code{ errno, std::generic_category() } };
    }
} // namespace lmr::core
