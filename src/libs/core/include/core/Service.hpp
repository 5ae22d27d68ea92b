/*
 * Copyright (C) 2019 Emeric Poupon
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

#include <cassert>
#include <memory>

namespace lmr::core
{
    // Process wide instance of an interface (logger, config)
    // The instance is owned by the Service object and released when it goes out of scope
    template<typename Class>
    class Service
    {
    public:
        Service() = default;
        Service(std::unique_ptr<Class> service)
        {
            assign(std::move(service));
        }

        ~Service()
        {
            _service.reset();
        }

        Service(const Service&) = delete;
        Service(Service&&) = delete;
        Service& operator=(const Service&) = delete;
        Service& operator=(Service&&) = delete;

        Class* operator->() const { return get(); }
        Class& operator*() const { return *get(); }

        static Class* get() { return _service.get(); }
        static bool exists() { return _service.get(); }

    private:
        static void assign(std::unique_ptr<Class> service)
        {
            assert(!_service);
            _service = std::move(service);
        }

        static inline std::unique_ptr<Class> _service;
    };
} // namespace lmr::core
