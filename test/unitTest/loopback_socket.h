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

#include "generic_io.h"
#include "sap/sap_frame.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <system_error>
#include <vector>

namespace sapcast {
namespace test {

class LoopbackSocket;

/**
 * In-process multicast group: a datagram written by one member is queued
 * on every other member.
 */
class LoopbackNetwork : public std::enable_shared_from_this<LoopbackNetwork>
{
public:
    static std::shared_ptr<LoopbackNetwork> create() { return std::make_shared<LoopbackNetwork>(); }

    std::unique_ptr<LoopbackSocket> socket();

    /** Every datagram successfully written, in order */
    std::vector<std::vector<uint8_t>> history() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return history_;
    }

    std::size_t sentCount() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return history_.size();
    }

    /** Frames of history() of the given type */
    std::vector<SapFrame> frames(MessageType type) const
    {
        std::vector<SapFrame> ret;
        for (const auto& pkt : history()) {
            auto f = SapFrame::decode(pkt);
            if (f.type == type)
                ret.emplace_back(std::move(f));
        }
        return ret;
    }

    /** Block until sentCount() >= n or timeout */
    bool waitForSent(std::size_t n, std::chrono::milliseconds timeout) const
    {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, timeout, [&] { return history_.size() >= n; });
    }

private:
    friend class LoopbackSocket;

    void join(LoopbackSocket* s)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        members_.push_back(s);
    }

    void leave(LoopbackSocket* s)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        members_.erase(std::remove(members_.begin(), members_.end(), s), members_.end());
    }

    void deliver(const LoopbackSocket* from, const uint8_t* buf, std::size_t len);

    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::vector<LoopbackSocket*> members_;
    std::vector<std::vector<uint8_t>> history_;
};

class LoopbackSocket : public DatagramSocket
{
public:
    explicit LoopbackSocket(std::shared_ptr<LoopbackNetwork> net)
        : net_(std::move(net))
    {
        net_->join(this);
    }

    ~LoopbackSocket() { shutdown(); }

    void shutdown() override
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_)
                return;
            closed_ = true;
            cv_.notify_all();
        }
        net_->leave(this);
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    int maxPayload() const override { return maxPayload_; }
    void setMaxPayload(int max) { maxPayload_ = max; }

    int waitForData(unsigned ms_timeout, std::error_code& ec) const override
    {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, std::chrono::milliseconds(ms_timeout), [&] {
            return closed_ or not rx_.empty() or readError_;
        });
        if (closed_) {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return -1;
        }
        if (readError_) {
            ec = readError_;
            return -1;
        }
        return rx_.empty() ? 0 : 1;
    }

    std::size_t write(const ValueType* buf, std::size_t len, std::error_code& ec) override
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) {
                ec = std::make_error_code(std::errc::bad_file_descriptor);
                return 0;
            }
            if (failWrites_ > 0) {
                --failWrites_;
                ec = writeError_;
                return 0;
            }
        }
        ec.clear();
        net_->deliver(this, buf, len);
        return len;
    }

    std::size_t read(ValueType* buf, std::size_t len, std::error_code& ec) override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_) {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return 0;
        }
        if (rx_.empty()) {
            ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return 0;
        }
        auto pkt = std::move(rx_.front());
        rx_.pop_front();
        ec.clear();
        auto n = std::min(len, pkt.size());
        std::copy_n(pkt.begin(), n, buf);
        return n;
    }

    using DatagramSocket::read;
    using DatagramSocket::write;

    /** Make the next count writes fail with ec */
    void failWrites(std::error_code ec, unsigned count)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        writeError_ = ec;
        failWrites_ = count;
    }

    /** Make waitForData() report ec */
    void failReads(std::error_code ec)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        readError_ = ec;
        cv_.notify_all();
    }

    /** Queue a datagram as if received from the network */
    void inject(std::vector<uint8_t> pkt)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        rx_.emplace_back(std::move(pkt));
        cv_.notify_all();
    }

private:
    std::shared_ptr<LoopbackNetwork> net_;
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::deque<std::vector<uint8_t>> rx_;
    bool closed_ {false};
    int maxPayload_ {static_cast<int>(SapFrame::MAX_DATAGRAM)};
    unsigned failWrites_ {0};
    std::error_code writeError_;
    std::error_code readError_;
};

inline std::unique_ptr<LoopbackSocket>
LoopbackNetwork::socket()
{
    return std::make_unique<LoopbackSocket>(shared_from_this());
}

inline void
LoopbackNetwork::deliver(const LoopbackSocket* from, const uint8_t* buf, std::size_t len)
{
    std::lock_guard<std::mutex> lk(mtx_);
    history_.emplace_back(buf, buf + len);
    for (auto* m : members_)
        if (m != from)
            m->inject(history_.back());
    cv_.notify_all();
}

} // namespace test
} // namespace sapcast
