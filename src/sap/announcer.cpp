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

#include "announcer.h"
#include "scheduled_executor.h"
#include "logger.h"

#include <algorithm>
#include <stdexcept>

namespace sapcast {

const char*
toString(Announcer::State state)
{
    switch (state) {
    case Announcer::State::Idle:
        return "idle";
    case Announcer::State::Running:
        return "running";
    case Announcer::State::Stopped:
        return "stopped";
    }
    return "unknown";
}

Announcer::Announcer(std::unique_ptr<DatagramSocket> socket,
                     const AnnouncePreference& prefs,
                     std::shared_ptr<ScheduledExecutor> executor)
    : socket_(std::move(socket))
    , executor_(executor ? std::move(executor) : std::make_shared<ScheduledExecutor>("announcer"))
    , burstCount_(std::max(prefs.getBurstCount(), 1u))
    , burstSpacing_(prefs.getBurstSpacing())
    , interval_(prefs.getInterval())
{
    if (not socket_)
        throw std::invalid_argument("Announcer needs a socket");
}

Announcer::~Announcer()
{
    stop();
}

SessionDescriptor
Announcer::descriptor() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return descriptor_;
}

void
Announcer::onFatalError(FatalErrorCb&& cb)
{
    std::lock_guard<std::mutex> lk(cbMutex_);
    fatalCb_ = std::move(cb);
}

void
Announcer::start(const SessionDescriptor& descriptor)
{
    std::unique_ptr<ResourceFatalError> err;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (state_ != State::Idle)
            throw std::logic_error(fmt::format("Announcer can't start when {}", toString(state_)));
        // scheduled sends only hold a weak reference
        if (weak_from_this().expired())
            throw std::logic_error("Announcer must be owned by a std::shared_ptr");

        // Fail early: a descriptor that can't be encoded is never scheduled
        SapFrame::announce(descriptor).encode(socket_->maxPayload());

        descriptor_ = descriptor;
        state_ = State::Running;
        SAPCAST_LOG("[announcer {}] start {} v{}, burst {} then every {} s",
                    fmt::ptr(this),
                    descriptor_.sessionKey(),
                    descriptor_.version,
                    burstCount_,
                    std::chrono::duration_cast<std::chrono::seconds>(interval_).count());

        err = sendLocked(SapFrame::announce(descriptor_));
        if (not err)
            scheduleNext(1);
    }
    notifyFatal(std::move(err));
}

void
Announcer::update(const SessionDescriptor& descriptor)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ != State::Running)
        throw std::logic_error(fmt::format("Announcer can't update when {}", toString(state_)));
    if (descriptor.origin != descriptor_.origin)
        throw std::invalid_argument("Descriptor update from another origin");
    if (descriptor.version <= descriptor_.version)
        throw std::invalid_argument(fmt::format("Descriptor version {} is not newer than {}",
                                                descriptor.version,
                                                descriptor_.version));
    SapFrame::announce(descriptor).encode(socket_->maxPayload());
    SAPCAST_LOG("[announcer {}] update {} v{} -> v{}",
                fmt::ptr(this),
                descriptor.sessionKey(),
                descriptor_.version,
                descriptor.version);
    descriptor_ = descriptor;
}

void
Announcer::announceNow()
{
    std::unique_ptr<ResourceFatalError> err;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (state_ != State::Running)
            return;
        err = sendLocked(SapFrame::announce(descriptor_));
    }
    notifyFatal(std::move(err));
}

void
Announcer::scheduleNext(unsigned sent)
{
    auto delay = sent < burstCount_ ? burstSpacing_ : interval_;
    nextTick_ = executor_->scheduleIn([w = weak_from_this(), sent] {
        if (auto self = w.lock())
            self->tick(sent);
    }, delay);
}

void
Announcer::tick(unsigned sent)
{
    std::unique_ptr<ResourceFatalError> err;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (state_ != State::Running)
            return;
        err = sendLocked(SapFrame::announce(descriptor_));
        if (not err)
            scheduleNext(sent < burstCount_ ? sent + 1 : sent);
    }
    notifyFatal(std::move(err));
}

std::unique_ptr<ResourceFatalError>
Announcer::sendLocked(const SapFrame& frame)
{
    auto buf = frame.encode(socket_->maxPayload());
    std::error_code ec;
    socket_->write(buf, ec);
    if (not ec) {
        if (frame.type == MessageType::Announce)
            ++sentAnnounces_;
        SAPCAST_DEBUG("[announcer {}] sent {} v{} ({} bytes)",
                      fmt::ptr(this), toString(frame.type), frame.version, buf.size());
        return {};
    }

    ++failedSends_;
    if (isTransientNetworkError(ec)) {
        NetworkTransientError err(ec, std::string("Unable to send ") + toString(frame.type));
        SAPCAST_WARNING("[announcer {}] {}, retrying on next tick", fmt::ptr(this), err.what());
        return {};
    }

    auto err = std::make_unique<ResourceFatalError>(ec, std::string("Unable to send ") + toString(frame.type));
    SAPCAST_ERROR("[announcer {}] {}, stopping", fmt::ptr(this), err->what());
    if (state_ == State::Running)
        failLocked();
    return err;
}

void
Announcer::failLocked()
{
    state_ = State::Stopped;
    if (nextTick_) {
        nextTick_->cancel();
        nextTick_.reset();
    }
    socket_->shutdown();
}

void
Announcer::notifyFatal(std::unique_ptr<ResourceFatalError> err)
{
    if (not err)
        return;
    std::lock_guard<std::mutex> lk(cbMutex_);
    if (stopRequested_) {
        SAPCAST_DEBUG("[announcer {}] stopped by owner, fatal error not reported", fmt::ptr(this));
        return;
    }
    if (fatalCb_)
        fatalCb_(*err);
}

void
Announcer::stop()
{
    {
        // waits for a fatal error callback in progress
        std::lock_guard<std::mutex> lk(cbMutex_);
        stopRequested_ = true;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    auto previous = state_.exchange(State::Stopped);
    if (previous == State::Stopped)
        return;

    if (nextTick_) {
        nextTick_->cancel();
        nextTick_.reset();
    }

    if (previous == State::Running) {
        SAPCAST_LOG("[announcer {}] withdraw {} v{}",
                    fmt::ptr(this), descriptor_.sessionKey(), descriptor_.version);
        // Errors are logged, the socket is released in any case
        sendLocked(SapFrame::withdraw(descriptor_));
    }
    socket_->shutdown();
}

} // namespace sapcast
