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

#include "ip_utils.h"
#include "logger.h"

#include <cstring>
#include <cerrno>

#include <sys/socket.h>
#include <unistd.h>

namespace sapcast {
namespace ip_utils {

std::optional<in_addr>
parseIpv4(std::string_view str)
{
    if (str.empty() or str.size() > INET_ADDRSTRLEN)
        return {};
    std::string s(str);
    in_addr addr {};
    if (inet_pton(AF_INET, s.c_str(), &addr) != 1)
        return {};
    return addr;
}

std::string
toString(const in_addr& addr)
{
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr)
        return {};
    return buf;
}

bool
isMulticast(const in_addr& addr)
{
    return IN_MULTICAST(ntohl(addr.s_addr));
}

bool
isMulticast(std::string_view str)
{
    auto addr = parseIpv4(str);
    return addr and isMulticast(*addr);
}

std::string
getLocalAddr()
{
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        SAPCAST_ERROR("Could not open socket: {}", strerror(errno));
        return {};
    }

    sockaddr_in remote {};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(53);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    std::string ret;
    if (connect(fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) == 0) {
        sockaddr_in local {};
        socklen_t len = sizeof(local);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == 0
            and not IN_IS_ADDR_UNSPECIFIED(&local.sin_addr))
            ret = toString(local.sin_addr);
    } else {
        SAPCAST_WARNING("No default route: {}", strerror(errno));
    }
    close(fd);

    if (ret.empty()) {
        SAPCAST_ERROR("Could not get local IP, using loopback");
        ret = "127.0.0.1";
    }
    return ret;
}

std::string
getInterfaceAddr(const std::string& interface)
{
    if (interface.empty() or interface == DEFAULT_INTERFACE)
        return getLocalAddr();

    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        SAPCAST_ERROR("Could not open socket: {}", strerror(errno));
        return {};
    }

    ifreq ifr;
    strncpy(ifr.ifr_name, interface.c_str(), sizeof ifr.ifr_name);
    // guarantee that ifr_name is NULL-terminated
    ifr.ifr_name[sizeof(ifr.ifr_name) - 1] = '\0';

    memset(&ifr.ifr_addr, 0, sizeof(ifr.ifr_addr));
    ifr.ifr_addr.sa_family = AF_INET;

    if (ioctl(fd, SIOCGIFADDR, &ifr) < 0)
        SAPCAST_WARNING("Unable to get address of {}: {}", interface, strerror(errno));
    close(fd);

    const auto& sin = reinterpret_cast<const sockaddr_in&>(ifr.ifr_addr);
    if (IN_IS_ADDR_UNSPECIFIED(&sin.sin_addr))
        return getLocalAddr();
    return toString(sin.sin_addr);
}

} // namespace ip_utils
} // namespace sapcast
