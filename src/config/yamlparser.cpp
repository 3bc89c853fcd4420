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

#include "yamlparser.h"
#include "fileutils.h"

#include <stdexcept>

namespace sapcast {
namespace yaml_utils {

void
parsePathOptional(const YAML::Node& node, const char* key, std::string& path)
{
    std::string val;
    if (parseValueOptional(node, key, val)) {
        auto expanded = fileutils::expand_path(val);
        path = expanded.empty() ? val : expanded;
    }
}

YAML::Node
loadFile(const std::filesystem::path& path)
{
    try {
        return YAML::LoadFile(path.string());
    } catch (const YAML::BadFile& e) {
        throw std::runtime_error("Can't read configuration file " + path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid configuration file " + path.string() + ": " + e.what());
    }
}

} // namespace yaml_utils
} // namespace sapcast
