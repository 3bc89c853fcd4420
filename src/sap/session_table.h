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
#include "sap_frame.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sapcast {

struct SessionEntry
{
    std::string key;
    OriginIdentity origin;
    uint32_t version {0};
    std::string payload;
    std::chrono::steady_clock::time_point lastSeen {};
};

/**
 * Live sessions indexed by session key. Not thread safe.
 */
class SessionTable
{
public:
    using clock = std::chrono::steady_clock;

    enum class Outcome {
        Inserted,  // new key
        Updated,   // same origin, newer version
        Refreshed, // same origin and version, only lastSeen moved
        Replaced,  // key taken over by another origin
        Stale,     // older version, ignored
        Removed,   // withdrawn
        Unknown,   // withdraw matching nothing
    };

    struct Result
    {
        Outcome outcome;
        /** Keys whose content changed (written) or that were removed */
        std::vector<std::string> keys;
    };

    /**
     * Apply an Announce or a Withdraw received at now.
     *
     * Versions are ordered per origin. An Announce that is not newer than
     * the stored entry never changes its payload, with one deliberate
     * exception to "ignore versions not newer": an equal version still
     * moves lastSeen (Refreshed), so a sender repeating the same
     * descriptor every interval does not expire. Only older versions are
     * fully ignored (Stale). A Withdraw ignores versions.
     */
    Result apply(const SapFrame& frame, clock::time_point now);

    /**
     * Remove entries not seen for strictly more than threshold.
     */
    std::vector<SessionEntry> expire(clock::time_point now, clock::duration threshold);

    /**
     * Remove every entry.
     */
    std::vector<SessionEntry> clear();

    std::optional<SessionEntry> find(const std::string& key) const;
    std::vector<SessionEntry> entries() const;
    std::size_t size() const { return sessions_.size(); }
    bool empty() const { return sessions_.empty(); }

private:
    Result announce(const SapFrame& frame, clock::time_point now);
    Result withdraw(const SapFrame& frame);

    std::map<std::string, SessionEntry> sessions_;
};

const char* toString(SessionTable::Outcome outcome);

} // namespace sapcast
