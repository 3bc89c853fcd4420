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

#include "session_table.h"

namespace sapcast {

const char*
toString(SessionTable::Outcome outcome)
{
    switch (outcome) {
    case SessionTable::Outcome::Inserted:
        return "inserted";
    case SessionTable::Outcome::Updated:
        return "updated";
    case SessionTable::Outcome::Refreshed:
        return "refreshed";
    case SessionTable::Outcome::Replaced:
        return "replaced";
    case SessionTable::Outcome::Stale:
        return "stale";
    case SessionTable::Outcome::Removed:
        return "removed";
    case SessionTable::Outcome::Unknown:
        return "unknown";
    }
    return "?";
}

SessionTable::Result
SessionTable::apply(const SapFrame& frame, clock::time_point now)
{
    if (frame.type == MessageType::Withdraw)
        return withdraw(frame);
    return announce(frame, now);
}

SessionTable::Result
SessionTable::announce(const SapFrame& frame, clock::time_point now)
{
    auto key = sessionKeyOf(frame.payload);
    auto it = sessions_.find(key);
    if (it == sessions_.end()) {
        sessions_.emplace(key, SessionEntry {key, frame.origin, frame.version, frame.payload, now});
        return {Outcome::Inserted, {std::move(key)}};
    }

    auto& entry = it->second;
    if (entry.origin != frame.origin) {
        entry = SessionEntry {key, frame.origin, frame.version, frame.payload, now};
        return {Outcome::Replaced, {std::move(key)}};
    }
    if (frame.version > entry.version) {
        entry.version = frame.version;
        entry.payload = frame.payload;
        entry.lastSeen = now;
        return {Outcome::Updated, {std::move(key)}};
    }
    if (frame.version == entry.version) {
        // periodic re-announce of the stored descriptor
        entry.lastSeen = now;
        return {Outcome::Refreshed, {}};
    }
    return {Outcome::Stale, {}};
}

SessionTable::Result
SessionTable::withdraw(const SapFrame& frame)
{
    Result res {Outcome::Unknown, {}};
    if (not frame.payload.empty()) {
        auto key = sessionKeyOf(frame.payload);
        auto it = sessions_.find(key);
        if (it != sessions_.end() and it->second.origin == frame.origin) {
            sessions_.erase(it);
            res.outcome = Outcome::Removed;
            res.keys.emplace_back(std::move(key));
        }
        return res;
    }

    // No description: withdraw everything announced by this origin
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.origin == frame.origin) {
            res.keys.emplace_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    if (not res.keys.empty())
        res.outcome = Outcome::Removed;
    return res;
}

std::vector<SessionEntry>
SessionTable::expire(clock::time_point now, clock::duration threshold)
{
    std::vector<SessionEntry> expired;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second.lastSeen > threshold) {
            expired.emplace_back(std::move(it->second));
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::vector<SessionEntry>
SessionTable::clear()
{
    auto ret = entries();
    sessions_.clear();
    return ret;
}

std::optional<SessionEntry>
SessionTable::find(const std::string& key) const
{
    auto it = sessions_.find(key);
    if (it == sessions_.end())
        return {};
    return it->second;
}

std::vector<SessionEntry>
SessionTable::entries() const
{
    std::vector<SessionEntry> ret;
    ret.reserve(sessions_.size());
    for (const auto& s : sessions_)
        ret.emplace_back(s.second);
    return ret;
}

} // namespace sapcast
