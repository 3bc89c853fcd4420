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

#include <stdexcept>
#include <string>
#include <system_error>

namespace sapcast {

/**
 * A frame can't be built from the given descriptor (payload too large,
 * origin not representable). Caller error, never retried.
 */
class EncodingError : public std::runtime_error
{
public:
    explicit EncodingError(const std::string& what)
        : std::runtime_error(what)
    {}
};

/**
 * Received bytes are not a valid announcement frame.
 */
class MalformedFrameError : public std::runtime_error
{
public:
    explicit MalformedFrameError(const std::string& what)
        : std::runtime_error(what)
    {}
};

/**
 * Send or receive failed for a reason expected to go away on its own
 * (interface down, no route, buffers full).
 */
class NetworkTransientError : public std::system_error
{
public:
    NetworkTransientError(std::error_code ec, const std::string& what)
        : std::system_error(ec, what)
    {}
};

/**
 * The network resource is closed or unusable; the owning role must stop.
 */
class ResourceFatalError : public std::system_error
{
public:
    ResourceFatalError(std::error_code ec, const std::string& what)
        : std::system_error(ec, what)
    {}
};

bool isTransientNetworkError(const std::error_code& ec);

/**
 * Throw NetworkTransientError or ResourceFatalError for ec (which must be set).
 */
[[noreturn]] void throwNetworkError(const std::error_code& ec, const std::string& what);

} // namespace sapcast
