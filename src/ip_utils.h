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

#include <arpa/inet.h>
#include <netinet/in.h>
#include <net/if.h>
#include <sys/ioctl.h>

#include <string>
#include <string_view>
#include <optional>

/* An IPv4 equivalent to IN6_IS_ADDR_UNSPECIFIED */
#ifndef IN_IS_ADDR_UNSPECIFIED
#define IN_IS_ADDR_UNSPECIFIED(a) (((long int) (a)->s_addr) == 0x00000000)
#endif /* IN_IS_ADDR_UNSPECIFIED */

namespace sapcast {
namespace ip_utils {

static constexpr const char* DEFAULT_INTERFACE = "default";

/**
 * Parse a dotted-quad IPv4 address (no host name resolution).
 */
std::optional<in_addr> parseIpv4(std::string_view str);

std::string toString(const in_addr& addr);

/**
 * True for 224.0.0.0/4.
 */
bool isMulticast(const in_addr& addr);
bool isMulticast(std::string_view str);

/**
 * Address of the interface used for the default route.
 * Found by "connecting" an UDP socket, no packet is sent.
 * Returns an empty string if no address could be found.
 */
std::string getLocalAddr();

/**
 * IPv4 address of an interface by name (e.g. "eth0").
 * Falls back to getLocalAddr() for DEFAULT_INTERFACE or an empty name.
 */
std::string getInterfaceAddr(const std::string& interface);

} // namespace ip_utils
} // namespace sapcast
