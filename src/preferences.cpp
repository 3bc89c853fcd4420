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

#include "preferences.h"
#include "config/yamlparser.h"
#include "sap/multicast_socket.h"

#include <yaml-cpp/yaml.h>

namespace sapcast {

using yaml_utils::parseValueOptional;

// shared multicast keys
static constexpr const char* GROUP_KEY {"group"};
static constexpr const char* PORT_KEY {"port"};
static constexpr const char* TTL_KEY {"ttl"};
static constexpr const char* INTERFACE_KEY {"interface"};

// announce preferences
static constexpr const char* LOOPBACK_KEY {"loopback"};
static constexpr const char* BURST_COUNT_KEY {"burstCount"};
static constexpr const char* BURST_SPACING_KEY {"burstSpacingMs"};
static constexpr const char* INTERVAL_KEY {"intervalSec"};

// stream preferences
static constexpr const char* NAME_KEY {"name"};
static constexpr const char* PAYLOAD_TYPE_KEY {"payloadType"};
static constexpr const char* ENCODING_KEY {"encoding"};
static constexpr const char* CLOCK_RATE_KEY {"clockRate"};
static constexpr const char* PROFILE_LEVEL_ID_KEY {"profileLevelId"};
static constexpr const char* SOURCE_KEY {"source"};
static constexpr const char* PATTERN_KEY {"pattern"};
static constexpr const char* BITRATE_KEY {"bitrateKbps"};
static constexpr const char* ORIGIN_ADDRESS_KEY {"originAddress"};
static constexpr const char* USERNAME_KEY {"username"};

// directory preferences
static constexpr const char* OUTPUT_DIR_KEY {"outputDir"};
static constexpr const char* EXPIRY_KEY {"expirySec"};
static constexpr const char* SWEEP_KEY {"sweepSec"};
static constexpr const char* RECEIVE_TIMEOUT_KEY {"receiveTimeoutMs"};
static constexpr const char* CLEANUP_ON_EXIT_KEY {"cleanupOnExit"};
static constexpr const char* PURGE_ON_START_KEY {"purgeOnStart"};

// pipeline preferences
static constexpr const char* PROGRAM_KEY {"program"};
static constexpr const char* RESTART_DELAY_KEY {"restartDelayMs"};
static constexpr const char* MAX_RESTARTS_KEY {"maxRestarts"};
static constexpr const char* STOP_TIMEOUT_KEY {"stopTimeoutMs"};

void
AnnouncePreference::serialize(YAML::Emitter& out) const
{
    out << YAML::Key << CONFIG_LABEL << YAML::Value << YAML::BeginMap;
    out << YAML::Key << GROUP_KEY << YAML::Value << group_;
    out << YAML::Key << PORT_KEY << YAML::Value << port_;
    out << YAML::Key << TTL_KEY << YAML::Value << ttl_;
    out << YAML::Key << INTERFACE_KEY << YAML::Value << interface_;
    out << YAML::Key << LOOPBACK_KEY << YAML::Value << loopback_;
    out << YAML::Key << BURST_COUNT_KEY << YAML::Value << burstCount_;
    out << YAML::Key << BURST_SPACING_KEY << YAML::Value << burstSpacingMs_;
    out << YAML::Key << INTERVAL_KEY << YAML::Value << intervalSec_;
    out << YAML::EndMap;
}

void
AnnouncePreference::unserialize(const YAML::Node& in)
{
    const auto& node = in[CONFIG_LABEL];
    if (not node)
        return;
    parseValueOptional(node, GROUP_KEY, group_);
    parseValueOptional(node, PORT_KEY, port_);
    parseValueOptional(node, TTL_KEY, ttl_);
    parseValueOptional(node, INTERFACE_KEY, interface_);
    parseValueOptional(node, LOOPBACK_KEY, loopback_);
    parseValueOptional(node, BURST_COUNT_KEY, burstCount_);
    parseValueOptional(node, BURST_SPACING_KEY, burstSpacingMs_);
    parseValueOptional(node, INTERVAL_KEY, intervalSec_);
}

MulticastOptions
AnnouncePreference::senderOptions() const
{
    MulticastOptions opts;
    opts.group = group_;
    opts.port = port_;
    opts.ttl = ttl_;
    opts.interface = interface_;
    opts.loopback = loopback_;
    return opts;
}

MulticastOptions
AnnouncePreference::listenerOptions() const
{
    auto opts = senderOptions();
    opts.ttl = 0;
    return opts;
}

void
StreamPreference::serialize(YAML::Emitter& out) const
{
    out << YAML::Key << CONFIG_LABEL << YAML::Value << YAML::BeginMap;
    out << YAML::Key << NAME_KEY << YAML::Value << params_.name;
    out << YAML::Key << GROUP_KEY << YAML::Value << params_.group;
    out << YAML::Key << PORT_KEY << YAML::Value << params_.port;
    out << YAML::Key << PAYLOAD_TYPE_KEY << YAML::Value << params_.payloadType;
    out << YAML::Key << ENCODING_KEY << YAML::Value << params_.encoding;
    out << YAML::Key << CLOCK_RATE_KEY << YAML::Value << params_.clockRate;
    out << YAML::Key << PROFILE_LEVEL_ID_KEY << YAML::Value << params_.profileLevelId;
    out << YAML::Key << SOURCE_KEY << YAML::Value << params_.source;
    out << YAML::Key << TTL_KEY << YAML::Value << params_.ttl;
    out << YAML::Key << USERNAME_KEY << YAML::Value << params_.username;
    out << YAML::Key << PATTERN_KEY << YAML::Value << pattern_;
    out << YAML::Key << BITRATE_KEY << YAML::Value << bitrateKbps_;
    out << YAML::Key << ORIGIN_ADDRESS_KEY << YAML::Value << originAddress_;
    out << YAML::EndMap;
}

void
StreamPreference::unserialize(const YAML::Node& in)
{
    const auto& node = in[CONFIG_LABEL];
    if (not node)
        return;
    parseValueOptional(node, NAME_KEY, params_.name);
    parseValueOptional(node, GROUP_KEY, params_.group);
    parseValueOptional(node, PORT_KEY, params_.port);
    parseValueOptional(node, PAYLOAD_TYPE_KEY, params_.payloadType);
    parseValueOptional(node, ENCODING_KEY, params_.encoding);
    parseValueOptional(node, CLOCK_RATE_KEY, params_.clockRate);
    parseValueOptional(node, PROFILE_LEVEL_ID_KEY, params_.profileLevelId);
    parseValueOptional(node, SOURCE_KEY, params_.source);
    parseValueOptional(node, TTL_KEY, params_.ttl);
    parseValueOptional(node, USERNAME_KEY, params_.username);
    parseValueOptional(node, PATTERN_KEY, pattern_);
    parseValueOptional(node, BITRATE_KEY, bitrateKbps_);
    parseValueOptional(node, ORIGIN_ADDRESS_KEY, originAddress_);
}

void
DirectoryPreference::serialize(YAML::Emitter& out) const
{
    out << YAML::Key << CONFIG_LABEL << YAML::Value << YAML::BeginMap;
    out << YAML::Key << GROUP_KEY << YAML::Value << group_;
    out << YAML::Key << PORT_KEY << YAML::Value << port_;
    out << YAML::Key << INTERFACE_KEY << YAML::Value << interface_;
    out << YAML::Key << OUTPUT_DIR_KEY << YAML::Value << outputDir_;
    out << YAML::Key << EXPIRY_KEY << YAML::Value << expirySec_;
    out << YAML::Key << SWEEP_KEY << YAML::Value << sweepSec_;
    out << YAML::Key << RECEIVE_TIMEOUT_KEY << YAML::Value << receiveTimeoutMs_;
    out << YAML::Key << CLEANUP_ON_EXIT_KEY << YAML::Value << cleanupOnExit_;
    out << YAML::Key << PURGE_ON_START_KEY << YAML::Value << purgeOnStart_;
    out << YAML::EndMap;
}

void
DirectoryPreference::unserialize(const YAML::Node& in)
{
    const auto& node = in[CONFIG_LABEL];
    if (not node)
        return;
    parseValueOptional(node, GROUP_KEY, group_);
    parseValueOptional(node, PORT_KEY, port_);
    parseValueOptional(node, INTERFACE_KEY, interface_);
    yaml_utils::parsePathOptional(node, OUTPUT_DIR_KEY, outputDir_);
    parseValueOptional(node, EXPIRY_KEY, expirySec_);
    parseValueOptional(node, SWEEP_KEY, sweepSec_);
    parseValueOptional(node, RECEIVE_TIMEOUT_KEY, receiveTimeoutMs_);
    parseValueOptional(node, CLEANUP_ON_EXIT_KEY, cleanupOnExit_);
    parseValueOptional(node, PURGE_ON_START_KEY, purgeOnStart_);
}

MulticastOptions
DirectoryPreference::listenerOptions() const
{
    MulticastOptions opts;
    opts.group = group_;
    opts.port = port_;
    opts.interface = interface_;
    return opts;
}

void
PipelinePreference::serialize(YAML::Emitter& out) const
{
    out << YAML::Key << CONFIG_LABEL << YAML::Value << YAML::BeginMap;
    out << YAML::Key << PROGRAM_KEY << YAML::Value << program_;
    out << YAML::Key << RESTART_DELAY_KEY << YAML::Value << restartDelayMs_;
    out << YAML::Key << MAX_RESTARTS_KEY << YAML::Value << maxRestarts_;
    out << YAML::Key << STOP_TIMEOUT_KEY << YAML::Value << stopTimeoutMs_;
    out << YAML::EndMap;
}

void
PipelinePreference::unserialize(const YAML::Node& in)
{
    const auto& node = in[CONFIG_LABEL];
    if (not node)
        return;
    parseValueOptional(node, PROGRAM_KEY, program_);
    parseValueOptional(node, RESTART_DELAY_KEY, restartDelayMs_);
    parseValueOptional(node, MAX_RESTARTS_KEY, maxRestarts_);
    parseValueOptional(node, STOP_TIMEOUT_KEY, stopTimeoutMs_);
}

} // namespace sapcast
