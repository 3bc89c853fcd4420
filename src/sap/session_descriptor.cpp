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

#include "session_descriptor.h"
#include "hash_utils.h"
#include "ip_utils.h"
#include "string_utils.h"

#include <fmt/format.h>

#include <random>
#include <stdexcept>
#include <cctype>

namespace sapcast {

static std::mt19937_64&
getRandomEngine() noexcept
{
    static std::random_device rdev;
    static std::seed_seq seed {rdev(), rdev()};
    static std::mt19937_64 randengine {seed};
    return randengine;
}

OriginIdentity
OriginIdentity::generate(const std::string& address)
{
    // 0 is kept for "unset"
    std::uniform_int_distribution<uint32_t> dist(1);
    return {address, dist(getRandomEngine())};
}

std::string
OriginIdentity::toString() const
{
    return fmt::format("{}@{}", id, address);
}

std::string
SessionParams::effectiveGroup() const
{
    return group.empty() ? groupFromName(name) : group;
}

bool
SessionParams::operator==(const SessionParams& o) const
{
    return std::tie(name, group, port, payloadType, encoding, clockRate, profileLevelId, source, ttl, username)
           == std::tie(o.name, o.group, o.port, o.payloadType, o.encoding, o.clockRate,
                       o.profileLevelId, o.source, o.ttl, o.username);
}

std::string
SessionDescriptor::sessionKey() const
{
    return sessionKeyOf(payload);
}

std::string
DescriptorBuilder::makePayload(const OriginIdentity& origin, uint32_t version, const SessionParams& params)
{
    if (trim(params.name).empty())
        throw std::invalid_argument("Session name is empty");
    if (params.name.find_first_of("\r\n") != std::string::npos)
        throw std::invalid_argument("Session name spans several lines");
    auto group = params.effectiveGroup();
    if (not ip_utils::isMulticast(group))
        throw std::invalid_argument("Not an IPv4 multicast group: " + group);
    if (not params.source.empty() and not ip_utils::parseIpv4(params.source))
        throw std::invalid_argument("Invalid source address: " + params.source);

    auto pt = params.payloadType;
    std::string sdp;
    sdp.reserve(512);
    sdp += "v=0\r\n";
    sdp += fmt::format("o={} {} {} IN IP4 {}\r\n", params.username, origin.id, version, origin.address);
    sdp += fmt::format("s={}\r\n", params.name);
    sdp += fmt::format("i={} RTP\r\n", params.encoding);
    sdp += "t=0 0\r\n";
    sdp += fmt::format("c=IN IP4 {}/{}\r\n", group, params.ttl);
    sdp += fmt::format("m=video {} RTP/AVP {}\r\n", params.port, pt);
    sdp += fmt::format("a=rtpmap:{} {}/{}\r\n", pt, params.encoding, params.clockRate);
    sdp += fmt::format("a=fmtp:{} packetization-mode=1;profile-level-id={}\r\n", pt, params.profileLevelId);
    if (not params.source.empty())
        sdp += fmt::format("a=source-filter: incl IN IP4 {} {}\r\n", group, params.source);
    return sdp;
}

SessionDescriptor
DescriptorBuilder::build(const OriginIdentity& origin, const SessionParams& params)
{
    return {origin, 1, makePayload(origin, 1, params)};
}

SessionDescriptor
DescriptorBuilder::rebuild(const SessionDescriptor& previous, const SessionParams& params)
{
    auto version = previous.version + 1;
    return {previous.origin, version, makePayload(previous.origin, version, params)};
}

std::string
groupFromName(std::string_view name)
{
    auto h = sha1(name);
    return fmt::format("239.255.{}.{}", h[0], h[1]);
}

static std::string
sanitizeKey(std::string_view value)
{
    std::string key(value);
    for (auto& c : key) {
        if (std::isspace(static_cast<unsigned char>(c)) or c == '/' or c == '\\' or c == '\0')
            c = '_';
    }
    return key;
}

std::string
sessionKeyOf(std::string_view payload)
{
    std::string_view sessionId;
    std::string_view sdp = payload;
    std::string_view line;
    while (getline(sdp, line)) {
        line = trim(line);
        if (line.size() < 2 or line[1] != '=')
            continue;
        if (line[0] == 's') {
            auto title = trim(line.substr(2));
            if (not title.empty() and title != "-")
                return sanitizeKey(title);
        } else if (line[0] == 'o' and sessionId.empty()) {
            // o=<username> <sess-id> <sess-version> <nettype> <addrtype> <address>
            auto fields = split_string(line.substr(2), ' ');
            if (fields.size() >= 2)
                sessionId = fields[1];
        }
    }
    if (not sessionId.empty())
        return "session_" + sanitizeKey(sessionId);

    auto h = sha1(payload);
    return fmt::format("session_{:02x}{:02x}", h[0], h[1]);
}

} // namespace sapcast
