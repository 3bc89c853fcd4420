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

#include "session_descriptor.h"

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sapcast {

enum class MessageType : uint8_t {
    Announce = 0,
    Withdraw = 1,
};

const char* toString(MessageType type);

/**
 * One announcement datagram.
 *
 * Wire layout (network byte order):
 *   0  flags      protocol version in bits 7..5, other bits zero
 *   1  type       MessageType
 *   2  msg hash   first 2 bytes of SHA-1(payload), informational
 *   4  origin     IPv4 address
 *   8  origin id
 *  12  version
 *  16  length     payload length
 *  18  payload
 */
struct SapFrame
{
    static constexpr uint8_t PROTOCOL_VERSION {1};
    static constexpr std::size_t HEADER_SIZE {18};
    /** 1500 bytes MTU minus IPv4 and UDP headers */
    static constexpr std::size_t MAX_DATAGRAM {1472};
    static constexpr std::size_t MAX_PAYLOAD {MAX_DATAGRAM - HEADER_SIZE};

    MessageType type {MessageType::Announce};
    OriginIdentity origin;
    uint32_t version {0};
    uint16_t hash {0};
    std::string payload;

    static SapFrame announce(const SessionDescriptor& desc);
    static SapFrame withdraw(const SessionDescriptor& desc);

    /**
     * Serialize the frame. The hash field is computed from the payload.
     * @param maxDatagram  largest datagram the transport sends atomically
     * @throw EncodingError
     */
    std::vector<uint8_t> encode(std::size_t maxDatagram = MAX_DATAGRAM) const;

    /**
     * Parse one datagram.
     * @throw MalformedFrameError
     */
    static SapFrame decode(const uint8_t* buf, std::size_t len);

    static SapFrame decode(const std::vector<uint8_t>& buf) { return decode(buf.data(), buf.size()); }

    bool operator==(const SapFrame& o) const
    {
        return type == o.type and origin == o.origin and version == o.version and payload == o.payload;
    }
};

uint16_t messageHash(std::string_view payload);

} // namespace sapcast
