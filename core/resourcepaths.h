/*
 * This file is part of Letterpress.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Letterpress is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Letterpress is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Letterpress. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <filesystem>
#include <string>

namespace ResourcePaths {
    inline constexpr const char* LETTERHEAD_FILE = "letterhead.pdf";
    inline constexpr const char* PACKAGED_LETTERHEAD = "templates/letterhead_template.pdf";

    // Directory containing the running executable, or empty if unknown.
    std::filesystem::path GetExecutableDir();

    // Path containing the built-in resources shipped with the executable.
    std::filesystem::path GetResourceRoot();

    // Per-user data directory (LETTERPRESS_DATA_DIR or ~/.letterpress).
    std::filesystem::path GetUserDataDir();

    // Default directory receipts are written to when none is configured.
    std::filesystem::path GetDefaultReceiptsDir();
}
