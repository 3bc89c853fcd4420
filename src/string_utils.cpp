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

#include "string_utils.h"

#include <algorithm>
#include <cctype>

namespace sapcast {

std::string_view
trim(std::string_view s)
{
    auto isSpace = [](unsigned char c) { return std::isspace(c); };
    auto first = std::find_if_not(s.cbegin(), s.cend(), isSpace);
    auto last = std::find_if_not(s.crbegin(), s.crend(), isSpace).base();
    if (first >= last)
        return {};
    return s.substr(first - s.cbegin(), last - first);
}

} // namespace sapcast
