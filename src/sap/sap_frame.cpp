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

#include "sap_frame.h"
#include "sap_error.h"
#include "hash_utils.h"
#include "ip_utils.h"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace sapcast {

static constexpr uint8_t VERSION_SHIFT {5};
static constexpr uint8_t RESERVED_MASK {0x1f};

const char*
toString(MessageType type)
{
    switch (type) {
    case MessageType::Announce:
        return "announce";
    case MessageType::Withdraw:
        return "withdraw";
    }
    return "unknown";
}

uint16_t
messageHash(std::string_view payload)
{
    auto h = sha1(payload);
    return static_cast<uint16_t>((h[0] << 8) | h[1]);
}

SapFrame
SapFrame::announce(const SessionDescriptor& desc)
{
    SapFrame f;
    f.type = MessageType::Announce;
    f.origin = desc.origin;
    f.version = desc.version;
    f.payload = desc.payload;
    return f;
}

SapFrame
SapFrame::withdraw(const SessionDescriptor& desc)
{
    auto f = announce(desc);
    f.type = MessageType::Withdraw;
    return f;
}

namespace {

inline void
put16(uint8_t* p, uint16_t v)
{
    p[0] = v >> 8;
    p[1] = v & 0xff;
}

inline void
put32(uint8_t* p, uint32_t v)
{
    p[0] = v >> 24;
    p[1] = (v >> 16) & 0xff;
    p[2] = (v >> 8) & 0xff;
    p[3] = v & 0xff;
}

inline uint16_t
get16(const uint8_t* p)
{
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t
get32(const uint8_t* p)
{
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

} // namespace

std::vector<uint8_t>
SapFrame::encode(std::size_t maxDatagram) const
{
    if (maxDatagram <= HEADER_SIZE)
        throw EncodingError(fmt::format("Transport unit of {} bytes can't hold a header", maxDatagram));
    auto maxPayload = std::min(maxDatagram - HEADER_SIZE, MAX_PAYLOAD);
    if (payload.size() > maxPayload)
        throw EncodingError(fmt::format("Payload of {} bytes exceeds the {} bytes limit",
                                        payload.size(), maxPayload));
    auto addr = ip_utils::parseIpv4(origin.address);
    if (not addr)
        throw EncodingError(fmt::format("Origin address '{}' is not IPv4", origin.address));

    std::vector<uint8_t> buf(HEADER_SIZE + payload.size());
    auto p = buf.data();
    p[0] = PROTOCOL_VERSION << VERSION_SHIFT;
    p[1] = static_cast<uint8_t>(type);
    put16(p + 2, messageHash(payload));
    std::memcpy(p + 4, &addr->s_addr, 4); // already in network order
    put32(p + 8, origin.id);
    put32(p + 12, version);
    put16(p + 16, static_cast<uint16_t>(payload.size()));
    if (not payload.empty())
        std::memcpy(p + HEADER_SIZE, payload.data(), payload.size());
    return buf;
}

SapFrame
SapFrame::decode(const uint8_t* buf, std::size_t len)
{
    if (buf == nullptr or len < HEADER_SIZE)
        throw MalformedFrameError(fmt::format("Truncated frame ({} bytes)", len));

    auto flags = buf[0];
    if ((flags >> VERSION_SHIFT) != PROTOCOL_VERSION)
        throw MalformedFrameError(fmt::format("Unsupported protocol version {}", flags >> VERSION_SHIFT));
    if (flags & RESERVED_MASK)
        throw MalformedFrameError(fmt::format("Reserved flags set (0x{:02x})", flags));

    SapFrame f;
    switch (buf[1]) {
    case static_cast<uint8_t>(MessageType::Announce):
        f.type = MessageType::Announce;
        break;
    case static_cast<uint8_t>(MessageType::Withdraw):
        f.type = MessageType::Withdraw;
        break;
    default:
        throw MalformedFrameError(fmt::format("Unknown message type {}", buf[1]));
    }

    auto length = get16(buf + 16);
    if (length != len - HEADER_SIZE)
        throw MalformedFrameError(fmt::format("Declared payload length {} but {} bytes follow",
                                              length, len - HEADER_SIZE));

    in_addr addr;
    std::memcpy(&addr.s_addr, buf + 4, 4);
    f.hash = get16(buf + 2);
    f.origin.address = ip_utils::toString(addr);
    f.origin.id = get32(buf + 8);
    f.version = get32(buf + 12);
    f.payload.assign(reinterpret_cast<const char*>(buf + HEADER_SIZE), length);
    return f;
}

} // namespace sapcast
