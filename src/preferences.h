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

#include "config/serializable.h"
#include "sap/session_descriptor.h"

#include <chrono>
#include <string>

namespace YAML {
class Emitter;
class Node;
} // namespace YAML

namespace sapcast {

struct MulticastOptions;

/**
 * Where and how often announcements are sent.
 */
class AnnouncePreference : public Serializable
{
public:
    constexpr static const char* const CONFIG_LABEL = "announce";
    constexpr static const char* const DEFAULT_GROUP = "224.2.127.254";
    constexpr static uint16_t DEFAULT_PORT = 9875;

    void serialize(YAML::Emitter& out) const override;
    void unserialize(const YAML::Node& in) override;

    const std::string& getGroup() const { return group_; }
    void setGroup(const std::string& group) { group_ = group; }

    uint16_t getPort() const { return port_; }
    void setPort(uint16_t port) { port_ = port; }

    unsigned getTtl() const { return ttl_; }
    void setTtl(unsigned ttl) { ttl_ = ttl; }

    const std::string& getInterface() const { return interface_; }
    void setInterface(const std::string& iface) { interface_ = iface; }

    bool getLoopback() const { return loopback_; }
    void setLoopback(bool loop) { loopback_ = loop; }

    unsigned getBurstCount() const { return burstCount_; }
    void setBurstCount(unsigned count) { burstCount_ = count; }

    std::chrono::milliseconds getBurstSpacing() const { return std::chrono::milliseconds(burstSpacingMs_); }
    void setBurstSpacing(std::chrono::milliseconds spacing) { burstSpacingMs_ = spacing.count(); }

    std::chrono::milliseconds getInterval() const { return std::chrono::seconds(intervalSec_); }
    void setIntervalSec(unsigned sec) { intervalSec_ = sec; }

    MulticastOptions senderOptions() const;
    MulticastOptions listenerOptions() const;

private:
    std::string group_ {DEFAULT_GROUP};
    uint16_t port_ {DEFAULT_PORT};
    unsigned ttl_ {1};
    std::string interface_ {};
    bool loopback_ {true};
    unsigned burstCount_ {3};
    unsigned burstSpacingMs_ {1000};
    unsigned intervalSec_ {20};
};

/**
 * The advertised media stream.
 */
class StreamPreference : public Serializable
{
public:
    constexpr static const char* const CONFIG_LABEL = "stream";

    void serialize(YAML::Emitter& out) const override;
    void unserialize(const YAML::Node& in) override;

    const SessionParams& getParams() const { return params_; }
    SessionParams& params() { return params_; }

    const std::string& getPattern() const { return pattern_; }
    void setPattern(const std::string& pattern) { pattern_ = pattern; }

    unsigned getBitrateKbps() const { return bitrateKbps_; }
    void setBitrateKbps(unsigned kbps) { bitrateKbps_ = kbps; }

    const std::string& getOriginAddress() const { return originAddress_; }
    void setOriginAddress(const std::string& addr) { originAddress_ = addr; }

private:
    SessionParams params_ {};
    std::string pattern_ {"smpte"};
    unsigned bitrateKbps_ {2000};
    std::string originAddress_ {};
};

/**
 * Directory listener, output and expiry policy.
 * Inherits the announcement group, port and interface keys.
 */
class DirectoryPreference : public Serializable
{
public:
    constexpr static const char* const CONFIG_LABEL = "directory";

    void serialize(YAML::Emitter& out) const override;
    void unserialize(const YAML::Node& in) override;

    const std::string& getGroup() const { return group_; }
    void setGroup(const std::string& group) { group_ = group; }

    uint16_t getPort() const { return port_; }
    void setPort(uint16_t port) { port_ = port; }

    const std::string& getInterface() const { return interface_; }
    void setInterface(const std::string& iface) { interface_ = iface; }

    const std::string& getOutputDir() const { return outputDir_; }
    void setOutputDir(const std::string& dir) { outputDir_ = dir; }

    std::chrono::seconds getExpiry() const { return std::chrono::seconds(expirySec_); }
    void setExpirySec(unsigned sec) { expirySec_ = sec; }

    std::chrono::seconds getSweepPeriod() const { return std::chrono::seconds(sweepSec_); }
    void setSweepSec(unsigned sec) { sweepSec_ = sec; }

    std::chrono::milliseconds getReceiveTimeout() const { return std::chrono::milliseconds(receiveTimeoutMs_); }
    void setReceiveTimeoutMs(unsigned ms) { receiveTimeoutMs_ = ms; }

    bool getCleanupOnExit() const { return cleanupOnExit_; }
    void setCleanupOnExit(bool cleanup) { cleanupOnExit_ = cleanup; }

    bool getPurgeOnStart() const { return purgeOnStart_; }
    void setPurgeOnStart(bool purge) { purgeOnStart_ = purge; }

    MulticastOptions listenerOptions() const;

private:
    std::string group_ {AnnouncePreference::DEFAULT_GROUP};
    uint16_t port_ {AnnouncePreference::DEFAULT_PORT};
    std::string interface_ {};
    std::string outputDir_ {"."};
    unsigned expirySec_ {300};
    unsigned sweepSec_ {30};
    unsigned receiveTimeoutMs_ {500};
    bool cleanupOnExit_ {false};
    bool purgeOnStart_ {false};
};

/**
 * External media engine supervision.
 */
class PipelinePreference : public Serializable
{
public:
    constexpr static const char* const CONFIG_LABEL = "pipeline";

    void serialize(YAML::Emitter& out) const override;
    void unserialize(const YAML::Node& in) override;

    const std::string& getProgram() const { return program_; }
    void setProgram(const std::string& program) { program_ = program; }

    std::chrono::milliseconds getRestartDelay() const { return std::chrono::milliseconds(restartDelayMs_); }
    void setRestartDelayMs(unsigned ms) { restartDelayMs_ = ms; }

    /** Negative for unlimited */
    int getMaxRestarts() const { return maxRestarts_; }
    void setMaxRestarts(int max) { maxRestarts_ = max; }

    std::chrono::milliseconds getStopTimeout() const { return std::chrono::milliseconds(stopTimeoutMs_); }
    void setStopTimeoutMs(unsigned ms) { stopTimeoutMs_ = ms; }

private:
    std::string program_ {"gst-launch-1.0"};
    unsigned restartDelayMs_ {1000};
    int maxRestarts_ {-1};
    unsigned stopTimeoutMs_ {3000};
};

} // namespace sapcast
