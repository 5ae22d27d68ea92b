/*
 * Copyright (C) 2020 Emeric Poupon
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

#include <gtest/gtest.h>

#include "core/UUID.hpp"

namespace lmr::core::tests
{
    TEST(UUID, caseInsensitive)
    {
        const std::optional<UUID> uuid1{ UUID::fromString("3f51c839-bee2-4e9d-a7b7-0693e45178fc") };
        const std::optional<UUID> uuid2{ UUID::fromString("3f51C839-bEE2-4e9d-a7B7-0693e45178fC") };

        ASSERT_TRUE(uuid1);
        EXPECT_EQ(uuid1, uuid2);
        EXPECT_EQ(uuid1->getAsString(), "3f51c839-bee2-4e9d-a7b7-0693e45178fc");
    }

    TEST(UUID, invalid)
    {
        EXPECT_FALSE(UUID::fromString(""));
        EXPECT_FALSE(UUID::fromString("3f51c839-bee2-4e9d-a7b7"));
        EXPECT_FALSE(UUID::fromString("3f51c839-bee2-4e9d-a7b7-0693e45178fz"));
    }

    TEST(UUID, generate)
    {
        const UUID uuid1{ UUID::generate() };
        const UUID uuid2{ UUID::generate() };

        EXPECT_NE(uuid1, uuid2);
        EXPECT_TRUE(UUID::fromString(uuid1.getAsString()));
    }
} // namespace lmr::core::tests
