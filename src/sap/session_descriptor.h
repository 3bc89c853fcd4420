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

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

namespace sapcast {

/**
 * Identifies one announcing process: its IPv4 address and a random id
 * drawn at startup. A restarted sender gets a new id.
 */
struct OriginIdentity
{
    std::string address;
    uint32_t id {0};

    static OriginIdentity generate(const std::string& address);

    std::string toString() const;

    bool operator==(const OriginIdentity& o) const { return id == o.id and address == o.address; }
    bool operator!=(const OriginIdentity& o) const { return not(*this == o); }
    bool operator<(const OriginIdentity& o) const
    {
        return std::tie(address, id) < std::tie(o.address, o.id);
    }
};

/**
 * Transport parameters of one advertised stream.
 */
struct SessionParams
{
    std::string name;
    std::string group; // empty: derived from name
    uint16_t port {5004};
    unsigned payloadType {96};
    std::string encoding {"H264"};
    unsigned clockRate {90000};
    std::string profileLevelId {"42e01f"};
    std::string source; // SSM source, empty for any-source multicast
    unsigned ttl {1};
    std::string username {"sender"};

    /** The multicast group the stream is sent to. */
    std::string effectiveGroup() const;

    bool operator==(const SessionParams& o) const;
    bool operator!=(const SessionParams& o) const { return not(*this == o); }
};

struct SessionDescriptor
{
    OriginIdentity origin;
    uint32_t version {0};
    std::string payload;

    std::string sessionKey() const;
};

class DescriptorBuilder
{
public:
    /**
     * First descriptor of an origin (version 1).
     * @throw std::invalid_argument if params are unusable (no name, bad group)
     */
    static SessionDescriptor build(const OriginIdentity& origin, const SessionParams& params);

    /**
     * Descriptor for changed params: same origin, version of previous + 1.
     */
    static SessionDescriptor rebuild(const SessionDescriptor& previous, const SessionParams& params);

    /**
     * SDP text for origin, version and params.
     */
    static std::string makePayload(const OriginIdentity& origin,
                                   uint32_t version,
                                   const SessionParams& params);
};

/**
 * Derive a stable 239.255.X.Y group from a session name.
 */
std::string groupFromName(std::string_view name);

/**
 * Stable key of a session description, safe to use as a file name.
 */
std::string sessionKeyOf(std::string_view payload);

/**
 * File name of a session in the directory output.
 */
inline std::string
sessionFileName(std::string_view key)
{
    return std::string(key) + ".sdp";
}

} // namespace sapcast
