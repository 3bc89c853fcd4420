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

#include "preferences.h"
#include "threadloop.h"
#include "noncopyable.h"

#include <sys/types.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace sapcast {

/**
 * Runs an external program and keeps it alive.
 *
 * A supervisor thread reaps the child. An abnormal exit (non-zero status
 * or signal) is followed by a restart after restartDelay, up to
 * maxRestarts times; a clean exit ends supervision.
 */
class PipelineProcess
{
public:
    /** status as returned by waitpid() */
    using ExitCb = std::function<void(int status)>;

    PipelineProcess(std::vector<std::string> argv, const PipelinePreference& prefs);
    ~PipelineProcess();

    /**
     * Spawn the child and start supervising it.
     * @throw std::system_error if the child can't be created
     */
    void start();

    /**
     * SIGINT, then SIGKILL after stopTimeout. Idempotent.
     */
    void stop();

    bool isRunning() const { return pid_.load() > 0; }
    /** False once the child exited cleanly, restarts ran out, or after stop() */
    bool isSupervising() const { return loop_.isRunning(); }
    pid_t pid() const { return pid_.load(); }
    unsigned restarts() const { return restarts_.load(); }

    /** Called from the supervisor thread after each child exit. */
    void onExit(ExitCb&& cb);

    const std::vector<std::string>& args() const { return argv_; }

private:
    NON_COPYABLE(PipelineProcess);

    pid_t spawn();
    void process();
    void notifyExit(int status);

    const std::vector<std::string> argv_;
    const PipelinePreference prefs_;

    std::atomic<pid_t> pid_ {-1};
    std::atomic<unsigned> restarts_ {0};
    std::atomic_bool stopping_ {false};

    std::mutex cbMutex_;
    ExitCb exitCb_;

    InterruptedThreadLoop loop_;
};

std::string describeExitStatus(int status);

} // namespace sapcast
