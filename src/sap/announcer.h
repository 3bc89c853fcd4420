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
#include "sap_error.h"
#include "generic_io.h"
#include "preferences.h"
#include "noncopyable.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace sapcast {

class ScheduledExecutor;
class Task;

/**
 * Periodically multicasts the Announce frame of one session and
 * withdraws it when stopped.
 *
 * Sends form a single chain of tasks on the executor: a burst of
 * burstCount frames spaced by burstSpacing, then one frame every
 * interval. Must be owned by a std::shared_ptr before start().
 */
class Announcer : public std::enable_shared_from_this<Announcer>
{
public:
    enum class State { Idle, Running, Stopped };

    using clock = std::chrono::steady_clock;
    using FatalErrorCb = std::function<void(const ResourceFatalError&)>;

    Announcer(std::unique_ptr<DatagramSocket> socket,
              const AnnouncePreference& prefs,
              std::shared_ptr<ScheduledExecutor> executor = {});
    ~Announcer();

    /**
     * Send the first Announce and schedule the following ones.
     * @throw EncodingError if the descriptor can't be sent
     * @throw std::logic_error if already started or stopped, or if not
     * owned by a std::shared_ptr
     */
    void start(const SessionDescriptor& descriptor);

    /**
     * Replace the announced descriptor. Takes effect on the next send,
     * the schedule is not restarted.
     * @throw std::invalid_argument if origin differs or version is not newer
     * @throw std::logic_error if not running
     * @throw EncodingError
     */
    void update(const SessionDescriptor& descriptor);

    /**
     * Send one Announce now, outside of the schedule.
     * No-op unless running.
     */
    void announceNow();

    /**
     * Cancel the schedule, send one Withdraw, release the socket.
     * Idempotent. Once stop() returns, the fatal error callback is not
     * running and will not be called.
     */
    void stop();

    State state() const { return state_.load(); }
    SessionDescriptor descriptor() const;

    uint64_t sentAnnounces() const { return sentAnnounces_.load(); }
    uint64_t failedSends() const { return failedSends_.load(); }

    /**
     * Called once, outside of the send lock, when the socket becomes
     * unusable. The callback must not call stop().
     */
    void onFatalError(FatalErrorCb&& cb);

private:
    NON_COPYABLE(Announcer);

    void tick(unsigned sent);
    void scheduleNext(unsigned sent);

    /**
     * Send frame, mutex_ held.
     * @return the error if the socket became unusable
     */
    std::unique_ptr<ResourceFatalError> sendLocked(const SapFrame& frame);
    void failLocked();
    void notifyFatal(std::unique_ptr<ResourceFatalError> err);

    std::unique_ptr<DatagramSocket> socket_;
    std::shared_ptr<ScheduledExecutor> executor_;

    const unsigned burstCount_;
    const clock::duration burstSpacing_;
    const clock::duration interval_;

    mutable std::mutex mutex_;
    SessionDescriptor descriptor_;
    std::shared_ptr<Task> nextTick_;

    std::mutex cbMutex_;
    FatalErrorCb fatalCb_;
    bool stopRequested_ {false};

    std::atomic<State> state_ {State::Idle};
    std::atomic<uint64_t> sentAnnounces_ {0};
    std::atomic<uint64_t> failedSends_ {0};
};

const char* toString(Announcer::State state);

} // namespace sapcast
