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
#include "resourcepaths.h"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace ResourcePaths {

namespace {

fs::path FromEnv(const char* name)
{
    if (const char* value = std::getenv(name)) {
        if (*value != '\0')
            return fs::u8path(value);
    }
    return {};
}

fs::path GetHomeDir()
{
    fs::path home = FromEnv("HOME");
    if (home.empty())
        home = FromEnv("USERPROFILE");
    return home;
}

} // namespace

fs::path GetExecutableDir()
{
    std::error_code ec;
#ifdef __linux__
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty())
        return exe.parent_path();
#endif
    return {};
}

fs::path GetResourceRoot()
{
    fs::path exeBase = GetExecutableDir();
    fs::path exeResources = exeBase.empty() ? fs::path("resources") : exeBase / "resources";

    std::error_code ec;
    if (fs::exists(exeResources, ec))
        return exeResources;

    fs::path cwdResources = fs::current_path(ec) / "resources";
    if (!ec && fs::exists(cwdResources, ec))
        return cwdResources;

    return exeResources;
}

fs::path GetUserDataDir()
{
    fs::path env = FromEnv("LETTERPRESS_DATA_DIR");
    if (!env.empty())
        return env;

    fs::path home = GetHomeDir();
    if (!home.empty())
        return home / ".letterpress";

    std::error_code ec;
    return fs::temp_directory_path(ec) / "letterpress";
}

fs::path GetDefaultReceiptsDir()
{
    fs::path home = GetHomeDir();
    if (!home.empty())
        return home / "Documents" / "Receipts";
    return GetUserDataDir() / "receipts";
}

} // namespace ResourcePaths
