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

#include "directory.h"
#include "sap_frame.h"
#include "scheduled_executor.h"
#include "logger.h"

#include <stdexcept>

namespace sapcast {

Directory::Directory(std::unique_ptr<DatagramSocket> socket,
                     const DirectoryPreference& prefs,
                     std::shared_ptr<ScheduledExecutor> executor)
    : socket_(std::move(socket))
    , executor_(executor ? std::move(executor) : std::make_shared<ScheduledExecutor>("directory"))
    , expiry_(prefs.getExpiry())
    , sweepPeriod_(prefs.getSweepPeriod())
    , receiveTimeoutMs_(prefs.getReceiveTimeout().count())
    , cleanupOnExit_(prefs.getCleanupOnExit())
    , purgeOnStart_(prefs.getPurgeOnStart())
    , store_(prefs.getOutputDir())
    , rxBuf_(SapFrame::MAX_DATAGRAM + 1)
    , loop_([] { return true; }, [this] { process(); }, [] {})
{
    if (not socket_)
        throw std::invalid_argument("Directory needs a socket");
    if (sweepPeriod_ <= clock::duration::zero())
        throw std::invalid_argument("Sweep period must be positive");
}

Directory::~Directory()
{
    stop();
}

void
Directory::onFatalError(FatalErrorCb&& cb)
{
    std::lock_guard<std::mutex> lk(cbMutex_);
    fatalCb_ = std::move(cb);
}

void
Directory::start()
{
    if (running_.exchange(true))
        return;

    if (purgeOnStart_) {
        std::lock_guard<std::mutex> lk(mutex_);
        auto n = store_.purge();
        SAPCAST_LOG("[directory] purged {} session file(s) from {}", n, store_.directory().string());
    }

    SAPCAST_LOG("[directory] writing sessions to {}, expiry {} s",
                store_.directory().string(),
                std::chrono::duration_cast<std::chrono::seconds>(expiry_).count());

    failed_ = false;
    sweepTask_ = executor_->scheduleAtFixedRate([this] {
        if (failed_)
            return false;
        sweep(clock::now());
        return true;
    }, sweepPeriod_);
    loop_.start();
}

void
Directory::stop()
{
    if (not running_.exchange(false))
        return;

    loop_.join();
    if (sweepTask_) {
        sweepTask_->destroy();
        sweepTask_.reset();
    }
    socket_->shutdown();

    std::lock_guard<std::mutex> lk(mutex_);
    if (cleanupOnExit_)
        removeFilesLocked(table_.clear(), "shutdown");
    SAPCAST_LOG("[directory] stopped with {} live session(s)", table_.size());
}

void
Directory::process()
{
    std::error_code ec;
    auto ready = socket_->waitForData(receiveTimeoutMs_, ec);
    if (not ec and ready > 0) {
        auto len = socket_->read(rxBuf_.data(), rxBuf_.size(), ec);
        if (not ec) {
            handlePacket(rxBuf_.data(), len, clock::now());
            return;
        }
        if (ec == std::errc::message_size) {
            ++malformedFrames_;
            SAPCAST_WARNING("[directory] dropping oversized datagram");
            return;
        }
        if (ec == std::errc::resource_unavailable_try_again or ec == std::errc::operation_would_block)
            return;
    }
    if (not ec)
        return;

    if (isTransientNetworkError(ec)) {
        NetworkTransientError err(ec, "receive failed");
        SAPCAST_WARNING("[directory] {}", err.what());
        return;
    }
    fail(ResourceFatalError(ec, "receive failed"));
}

void
Directory::fail(const ResourceFatalError& err)
{
    SAPCAST_ERROR("[directory] {}, stopping", err.what());
    // the sweep task ends on its next run
    failed_ = true;
    loop_.stop();
    FatalErrorCb cb;
    {
        std::lock_guard<std::mutex> lk(cbMutex_);
        cb = fatalCb_;
    }
    if (cb)
        cb(err);
}

void
Directory::handlePacket(const uint8_t* buf, std::size_t len, clock::time_point now)
{
    SapFrame frame;
    try {
        frame = SapFrame::decode(buf, len);
    } catch (const MalformedFrameError& e) {
        ++malformedFrames_;
        SAPCAST_WARNING("[directory] malformed frame: {}", e.what());
        return;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    auto res = table_.apply(frame, now);
    switch (res.outcome) {
    case SessionTable::Outcome::Inserted:
    case SessionTable::Outcome::Replaced:
    case SessionTable::Outcome::Updated:
        SAPCAST_LOG("[directory] {} {} v{} from {}",
                    toString(res.outcome), res.keys.front(), frame.version, frame.origin.toString());
        break;
    case SessionTable::Outcome::Removed:
        SAPCAST_LOG("[directory] withdrawn by {}: {} session(s)", frame.origin.toString(), res.keys.size());
        break;
    case SessionTable::Outcome::Stale:
    case SessionTable::Outcome::Refreshed:
    case SessionTable::Outcome::Unknown:
        SAPCAST_DEBUG("[directory] {} {} v{} from {}",
                      toString(res.outcome), toString(frame.type), frame.version, frame.origin.toString());
        break;
    }
    persistLocked(res);
}

void
Directory::persistLocked(const SessionTable::Result& res)
{
    switch (res.outcome) {
    case SessionTable::Outcome::Inserted:
    case SessionTable::Outcome::Replaced:
    case SessionTable::Outcome::Updated:
        for (const auto& key : res.keys) {
            auto entry = table_.find(key);
            if (not entry)
                continue;
            try {
                store_.write(key, entry->payload);
            } catch (const std::system_error& e) {
                SAPCAST_ERROR("[directory] unable to write {}: {}", store_.pathOf(key).string(), e.what());
            }
        }
        break;
    case SessionTable::Outcome::Removed:
        for (const auto& key : res.keys)
            store_.remove(key);
        break;
    default:
        break;
    }
}

void
Directory::removeFilesLocked(const std::vector<SessionEntry>& removed, const char* why)
{
    for (const auto& entry : removed) {
        SAPCAST_LOG("[directory] - {} ({})", entry.key, why);
        store_.remove(entry.key);
    }
}

std::size_t
Directory::sweep(clock::time_point now)
{
    std::lock_guard<std::mutex> lk(mutex_);
    auto expired = table_.expire(now, expiry_);
    removeFilesLocked(expired, "expired");
    return expired.size();
}

std::size_t
Directory::size() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return table_.size();
}

std::optional<SessionEntry>
Directory::find(const std::string& key) const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return table_.find(key);
}

std::vector<SessionEntry>
Directory::sessions() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return table_.entries();
}

} // namespace sapcast
