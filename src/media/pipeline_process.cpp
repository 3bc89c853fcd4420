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

#include "pipeline_process.h"
#include "gst_pipeline.h"
#include "logger.h"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sapcast {

static constexpr std::chrono::milliseconds REAP_PERIOD {100};

std::string
describeExitStatus(int status)
{
    if (WIFEXITED(status))
        return fmt::format("exit code {}", WEXITSTATUS(status));
    if (WIFSIGNALED(status))
        return fmt::format("signal {} ({})", WTERMSIG(status), strsignal(WTERMSIG(status)));
    return fmt::format("status {}", status);
}

PipelineProcess::PipelineProcess(std::vector<std::string> argv, const PipelinePreference& prefs)
    : argv_(std::move(argv))
    , prefs_(prefs)
    , loop_([] { return true; }, [this] { process(); }, [] {})
{
    if (argv_.empty() or argv_.front().empty())
        throw std::invalid_argument("No program to run");
}

PipelineProcess::~PipelineProcess()
{
    stop();
}

void
PipelineProcess::onExit(ExitCb&& cb)
{
    std::lock_guard<std::mutex> lk(cbMutex_);
    exitCb_ = std::move(cb);
}

pid_t
PipelineProcess::spawn()
{
    // Prepared before fork(): the child only calls async-signal-safe functions
    std::vector<char*> cargs;
    cargs.reserve(argv_.size() + 1);
    for (const auto& a : argv_)
        cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
        throw std::system_error(errno, std::generic_category(), "fork() failed for " + argv_.front());
    if (pid == 0) {
        execvp(cargs[0], cargs.data());
        // If exec fails
        _exit(127);
    }
    SAPCAST_LOG("[pipeline] started {} (PID {})", argv_.front(), pid);
    SAPCAST_DEBUG("[pipeline] {}", gst::toCommandLine(argv_));
    return pid;
}

void
PipelineProcess::start()
{
    if (loop_.isRunning())
        return;
    stopping_ = false;
    pid_ = spawn();
    loop_.start();
}

void
PipelineProcess::notifyExit(int status)
{
    ExitCb cb;
    {
        std::lock_guard<std::mutex> lk(cbMutex_);
        cb = exitCb_;
    }
    if (cb)
        cb(status);
}

void
PipelineProcess::process()
{
    pid_t pid = pid_.load();
    if (pid <= 0) {
        loop_.stop();
        return;
    }

    int status = 0;
    auto r = waitpid(pid, &status, WNOHANG);
    if (r == 0) {
        loop_.wait_for(REAP_PERIOD);
        return;
    }
    if (r < 0) {
        if (errno == EINTR)
            return;
        SAPCAST_ERROR("[pipeline] waitpid({}) failed: {}", pid, strerror(errno));
        pid_ = -1;
        loop_.stop();
        return;
    }

    pid_ = -1;
    bool clean = WIFEXITED(status) and WEXITSTATUS(status) == 0;
    if (clean)
        SAPCAST_LOG("[pipeline] {} (PID {}) exited", argv_.front(), pid);
    else
        SAPCAST_WARNING("[pipeline] {} (PID {}) died: {}", argv_.front(), pid, describeExitStatus(status));
    notifyExit(status);

    if (clean or stopping_) {
        loop_.stop();
        return;
    }

    auto maxRestarts = prefs_.getMaxRestarts();
    if (maxRestarts >= 0 and restarts_ >= static_cast<unsigned>(maxRestarts)) {
        SAPCAST_ERROR("[pipeline] giving up after {} restart(s)", restarts_.load());
        loop_.stop();
        return;
    }

    loop_.wait_for(prefs_.getRestartDelay());
    if (loop_.isStopping() or stopping_)
        return;

    ++restarts_;
    SAPCAST_LOG("[pipeline] restarting {} ({})", argv_.front(), restarts_.load());
    try {
        pid_ = spawn();
    } catch (const std::system_error& e) {
        SAPCAST_ERROR("[pipeline] {}", e.what());
        loop_.stop();
    }
}

void
PipelineProcess::stop()
{
    if (stopping_.exchange(true))
        return;

    // Reaping is done here from now on
    loop_.join();

    pid_t pid = pid_.exchange(-1);
    if (pid <= 0)
        return;

    SAPCAST_LOG("[pipeline] stopping {} (PID {})", argv_.front(), pid);
    kill(pid, SIGINT);

    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + prefs_.getStopTimeout();
    while (std::chrono::steady_clock::now() < deadline) {
        auto r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            SAPCAST_DEBUG("[pipeline] PID {} stopped: {}", pid, describeExitStatus(status));
            return;
        }
        if (r < 0 and errno != EINTR) {
            SAPCAST_ERROR("[pipeline] waitpid({}) failed: {}", pid, strerror(errno));
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    SAPCAST_WARNING("[pipeline] PID {} ignored SIGINT, killing it", pid);
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 and errno == EINTR) {}
}

} // namespace sapcast
