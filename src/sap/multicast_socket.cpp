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

#include "multicast_socket.h"
#include "sap_error.h"
#include "sap_frame.h"
#include "ip_utils.h"
#include "logger.h"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sapcast {

static std::error_code
lastError()
{
    return std::error_code(errno, std::generic_category());
}

static in_addr
interfaceAddress(const std::string& interface)
{
    in_addr ret {};
    ret.s_addr = htonl(INADDR_ANY);
    if (interface.empty())
        return ret;
    if (auto addr = ip_utils::parseIpv4(interface))
        return *addr;
    if (auto addr = ip_utils::parseIpv4(ip_utils::getInterfaceAddr(interface)))
        return *addr;
    SAPCAST_WARNING("Unknown interface {}, using default", interface);
    return ret;
}

static int
udp_socket_create()
{
    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0)
        throw ResourceFatalError(lastError(), "socket() failed");
    return fd;
}

MulticastSocket::MulticastSocket(int fd, const MulticastOptions& options)
    : fd_(fd)
    , options_(options)
{
    auto group = ip_utils::parseIpv4(options.group);
    if (not group or not ip_utils::isMulticast(*group)) {
        close(fd);
        fd_ = -1;
        throw ResourceFatalError(std::make_error_code(std::errc::invalid_argument),
                                 "Invalid multicast group " + options.group);
    }
    dest_.sin_family = AF_INET;
    dest_.sin_port = htons(options.port);
    dest_.sin_addr = *group;
}

MulticastSocket::~MulticastSocket()
{
    shutdown();
}

std::unique_ptr<MulticastSocket>
MulticastSocket::sender(const MulticastOptions& options)
{
    int fd = udp_socket_create();
    std::unique_ptr<MulticastSocket> sock(new MulticastSocket(fd, options));

    auto fail = [&](const char* what) {
        auto ec = lastError();
        sock->shutdown();
        throw ResourceFatalError(ec, what);
    };

    unsigned char ttl = static_cast<unsigned char>(std::min(options.ttl, 255u));
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0)
        fail("setsockopt(IP_MULTICAST_TTL) failed");

    unsigned char loop = options.loopback ? 1 : 0;
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0)
        fail("setsockopt(IP_MULTICAST_LOOP) failed");

    if (not options.interface.empty()) {
        auto localAddr = interfaceAddress(options.interface);
        if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &localAddr, sizeof(localAddr)) < 0)
            fail("setsockopt(IP_MULTICAST_IF) failed");
    }

    SAPCAST_DEBUG("[sock:{}] sending to {}:{} ttl {}", fd, options.group, options.port, options.ttl);
    return sock;
}

std::unique_ptr<MulticastSocket>
MulticastSocket::listener(const MulticastOptions& options)
{
    int fd = udp_socket_create();
    std::unique_ptr<MulticastSocket> sock(new MulticastSocket(fd, options));

    auto fail = [&](const std::string& what) {
        auto ec = lastError();
        sock->shutdown();
        throw ResourceFatalError(ec, what);
    };

    int reuse = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
        fail("setsockopt(SO_REUSEADDR) failed");

    sockaddr_in bindAddr {};
    bindAddr.sin_family = AF_INET;
    bindAddr.sin_port = htons(options.port);
    bindAddr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&bindAddr), sizeof(bindAddr)) < 0)
        fail(fmt::format("bind() on port {} failed", options.port));

    sock->mreq_.imr_multiaddr = sock->dest_.sin_addr;
    sock->mreq_.imr_interface = interfaceAddress(options.interface);
    if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &sock->mreq_, sizeof(sock->mreq_)) < 0)
        fail("setsockopt(IP_ADD_MEMBERSHIP) failed for " + options.group);
    sock->joined_ = true;

    SAPCAST_DEBUG("[sock:{}] listening on {}:{}", fd, options.group, options.port);
    return sock;
}

void
MulticastSocket::shutdown()
{
    int fd = fd_.exchange(-1);
    if (fd < 0)
        return;
    if (joined_) {
        if (setsockopt(fd, IPPROTO_IP, IP_DROP_MEMBERSHIP, &mreq_, sizeof(mreq_)) < 0)
            SAPCAST_WARNING("[sock:{}] unable to leave {}: {}", fd, options_.group, strerror(errno));
        joined_ = false;
    }
    close(fd);
}

int
MulticastSocket::maxPayload() const
{
    return SapFrame::MAX_DATAGRAM;
}

int
MulticastSocket::waitForData(unsigned ms_timeout, std::error_code& ec) const
{
    int fd = fd_.load();
    if (fd < 0) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return -1;
    }
    struct pollfd p = {fd, POLLIN, 0};
    auto ret = poll(&p, 1, static_cast<int>(ms_timeout));
    if (ret < 0) {
        if (errno == EINTR)
            return 0;
        ec = lastError();
        return -1;
    }
    if (ret == 0)
        return 0;
    if (p.revents & POLLNVAL) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return -1;
    }
    return (p.revents & (POLLIN | POLLERR)) ? 1 : 0;
}

std::size_t
MulticastSocket::write(const ValueType* buf, std::size_t len, std::error_code& ec)
{
    int fd = fd_.load();
    if (fd < 0) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return 0;
    }
    auto ret = ::sendto(fd, buf, len, 0, reinterpret_cast<const sockaddr*>(&dest_), sizeof(dest_));
    if (ret < 0) {
        ec = lastError();
        return 0;
    }
    ec.clear();
    return ret;
}

std::size_t
MulticastSocket::read(ValueType* buf, std::size_t len, std::error_code& ec)
{
    int fd = fd_.load();
    if (fd < 0) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return 0;
    }
    auto ret = ::recv(fd, buf, len, MSG_TRUNC);
    if (ret < 0) {
        ec = lastError();
        return 0;
    }
    ec.clear();
    if (static_cast<std::size_t>(ret) > len) {
        // Datagram larger than buf: the tail was discarded
        ec = std::make_error_code(std::errc::message_size);
        return len;
    }
    return ret;
}

std::string
MulticastSocket::localAddr() const
{
    int fd = fd_.load();
    if (fd < 0)
        return {};
    sockaddr_in local {};
    socklen_t len = sizeof(local);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) < 0)
        return {};
    return fmt::format("{}:{}", ip_utils::toString(local.sin_addr), ntohs(local.sin_port));
}

} // namespace sapcast
