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

#include "generic_io.h"
#include "noncopyable.h"

#include <netinet/in.h>

#include <atomic>
#include <memory>
#include <string>

namespace sapcast {

struct MulticastOptions
{
    std::string group;
    uint16_t port {0};
    unsigned ttl {1};
    /** Interface name or IPv4 address, empty for the system default */
    std::string interface;
    bool loopback {true};
};

/**
 * IPv4 multicast UDP socket, either sending to a group or bound to it.
 */
class MulticastSocket : public DatagramSocket
{
public:
    /**
     * Socket sending to options.group:options.port with TTL, outgoing
     * interface and loopback set.
     * @throw ResourceFatalError
     */
    static std::unique_ptr<MulticastSocket> sender(const MulticastOptions& options);

    /**
     * Socket bound to options.port (SO_REUSEADDR) and member of options.group.
     * The membership is dropped on shutdown.
     * @throw ResourceFatalError
     */
    static std::unique_ptr<MulticastSocket> listener(const MulticastOptions& options);

    ~MulticastSocket();

    void shutdown() override;
    int maxPayload() const override;
    int waitForData(unsigned ms_timeout, std::error_code& ec) const override;
    std::size_t write(const ValueType* buf, std::size_t len, std::error_code& ec) override;
    std::size_t read(ValueType* buf, std::size_t len, std::error_code& ec) override;
    std::string localAddr() const override;

    using DatagramSocket::read;
    using DatagramSocket::write;

private:
    NON_COPYABLE(MulticastSocket);
    MulticastSocket(int fd, const MulticastOptions& options);

    std::atomic_int fd_ {-1};
    MulticastOptions options_;
    sockaddr_in dest_ {};
    ip_mreq mreq_ {};
    bool joined_ {false};
};

} // namespace sapcast
