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

#include "sap_error.h"

#include <cerrno>

namespace sapcast {

bool
isTransientNetworkError(const std::error_code& ec)
{
    if (ec.category() != std::generic_category() and ec.category() != std::system_category())
        return false;
    switch (ec.value()) {
    case ENETUNREACH:
    case EHOSTUNREACH:
    case ENETDOWN:
    case ENOBUFS:
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case EINTR:
    case ECONNREFUSED:
    case EADDRNOTAVAIL:
    case ENOMEM:
        return true;
    default:
        return false;
    }
}

void
throwNetworkError(const std::error_code& ec, const std::string& what)
{
    if (isTransientNetworkError(ec))
        throw NetworkTransientError(ec, what);
    throw ResourceFatalError(ec, what);
}

} // namespace sapcast
