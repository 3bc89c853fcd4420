/*
 *  Copyright (C) 2004-2023 Savoir-faire Linux Inc.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include "session_store.h"
#include "session_descriptor.h"
#include "fileutils.h"
#include "logger.h"

#include <cstring>
#include <cerrno>
#include <stdexcept>

namespace sapcast {

static constexpr const char* SESSION_FILE_EXT {".sdp"};

SessionStore::SessionStore(const std::filesystem::path& dir)
    : dir_(dir.empty() ? std::filesystem::path(".") : dir)
{
    if (not fileutils::check_dir(dir_))
        throw std::runtime_error("Unable to use output directory " + dir_.string());
}

std::filesystem::path
SessionStore::pathOf(const std::string& key) const
{
    return dir_ / sessionFileName(key);
}

void
SessionStore::write(const std::string& key, std::string_view payload)
{
    fileutils::saveFileAtomic(pathOf(key), payload);
}

bool
SessionStore::remove(const std::string& key)
{
    auto path = pathOf(key);
    if (fileutils::remove(path) < 0) {
        SAPCAST_ERROR("Unable to remove {}: {}", path.string(), strerror(errno));
        return false;
    }
    return true;
}

std::size_t
SessionStore::purge()
{
    std::size_t count = 0;
    for (const auto& path : fileutils::listFiles(dir_, SESSION_FILE_EXT)) {
        if (fileutils::remove(path) == 0)
            ++count;
        else
            SAPCAST_WARNING("Unable to remove {}: {}", path.string(), strerror(errno));
    }
    return count;
}

} // namespace sapcast
