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

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

#include <sys/stat.h> // mode_t

namespace sapcast {
namespace fileutils {

std::filesystem::path get_home_dir();

/**
 * Per-user configuration directory ($XDG_CONFIG_HOME/<pkg>, or
 * ~/.config/<pkg>). Not created.
 */
std::filesystem::path get_config_dir(const char* pkg = "sapcast");

/**
 * Expand a leading ~ and environment variables of a path.
 * Returns an empty string on failure.
 */
std::string expand_path(const std::string& path);

/**
 * Create the directory and its parents if needed.
 * @return true if the directory exists on return
 */
bool check_dir(const std::filesystem::path& path, mode_t dirmode = 0755);

bool isFile(const std::filesystem::path& path);

/**
 * Read the whole file.
 * @throw std::runtime_error if the file can't be read
 */
std::string loadTextFile(const std::filesystem::path& path);

/**
 * Replace the content of path atomically: data is written to a temporary
 * file in the same directory, flushed, then renamed over path. A reader
 * sees either the previous content or the new one, never a partial file.
 *
 * @throw std::system_error on I/O failure (the temporary file is removed)
 */
void saveFileAtomic(const std::filesystem::path& path,
                    std::string_view data,
                    mode_t mode = 0644);

/**
 * Remove a file.
 * @return 0 on success (or if the file was already gone), -1 with errno set otherwise
 */
int remove(const std::filesystem::path& path);

/**
 * List regular files in dir whose name ends with ext.
 */
std::vector<std::filesystem::path> listFiles(const std::filesystem::path& dir,
                                             std::string_view ext);

} // namespace fileutils
} // namespace sapcast
