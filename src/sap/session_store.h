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

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace sapcast {

/**
 * One <key>.sdp file per live session in a directory.
 */
class SessionStore
{
public:
    /**
     * @throw std::runtime_error if dir can't be created
     */
    explicit SessionStore(const std::filesystem::path& dir);

    std::filesystem::path pathOf(const std::string& key) const;

    /**
     * Atomically replace the file of key with payload.
     * @throw std::system_error
     */
    void write(const std::string& key, std::string_view payload);

    /**
     * @return false if the file existed and could not be removed
     */
    bool remove(const std::string& key);

    /**
     * Remove every session file of the directory.
     * @return number of files removed
     */
    std::size_t purge();

    const std::filesystem::path& directory() const { return dir_; }

private:
    std::filesystem::path dir_;
};

} // namespace sapcast
