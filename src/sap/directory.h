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

#include "session_table.h"
#include "session_store.h"
#include "sap_error.h"
#include "generic_io.h"
#include "preferences.h"
#include "threadloop.h"
#include "noncopyable.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace sapcast {

class ScheduledExecutor;
class RepeatedTask;

/**
 * Listens for announcements and keeps one file per live session in the
 * output directory.
 *
 * The receive loop and the expiry sweep run on their own threads; table
 * changes and the matching file operations happen under one lock.
 */
class Directory
{
public:
    using clock = std::chrono::steady_clock;
    using FatalErrorCb = std::function<void(const ResourceFatalError&)>;

    Directory(std::unique_ptr<DatagramSocket> socket,
              const DirectoryPreference& prefs,
              std::shared_ptr<ScheduledExecutor> executor = {});
    ~Directory();

    void start();

    /**
     * Stop the sweep and the receive loop, then remove the session files
     * if cleanupOnExit is set. Idempotent.
     */
    void stop();

    /** False once stopped or after a fatal receive error */
    bool isRunning() const { return running_.load() and loop_.isRunning(); }

    /**
     * Decode and apply one datagram received at now.
     * Malformed datagrams are logged and counted.
     */
    void handlePacket(const uint8_t* buf, std::size_t len, clock::time_point now);

    /**
     * Remove the sessions expired at now.
     * @return number of sessions removed
     */
    std::size_t sweep(clock::time_point now);

    std::size_t size() const;
    std::optional<SessionEntry> find(const std::string& key) const;
    std::vector<SessionEntry> sessions() const;

    std::filesystem::path pathOf(const std::string& key) const { return store_.pathOf(key); }

    uint64_t malformedFrames() const { return malformedFrames_.load(); }

    void onFatalError(FatalErrorCb&& cb);

private:
    NON_COPYABLE(Directory);

    void process();
    void persistLocked(const SessionTable::Result& res);
    void removeFilesLocked(const std::vector<SessionEntry>& removed, const char* why);
    void fail(const ResourceFatalError& err);

    std::unique_ptr<DatagramSocket> socket_;
    std::shared_ptr<ScheduledExecutor> executor_;

    const clock::duration expiry_;
    const clock::duration sweepPeriod_;
    const unsigned receiveTimeoutMs_;
    const bool cleanupOnExit_;
    const bool purgeOnStart_;

    mutable std::mutex mutex_;
    SessionTable table_;
    SessionStore store_;

    std::mutex cbMutex_;
    FatalErrorCb fatalCb_;

    std::vector<uint8_t> rxBuf_;
    std::shared_ptr<RepeatedTask> sweepTask_;
    std::atomic_bool running_ {false};
    std::atomic_bool failed_ {false};
    std::atomic<uint64_t> malformedFrames_ {0};

    ThreadLoop loop_;
};

} // namespace sapcast
