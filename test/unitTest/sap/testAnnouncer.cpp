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


#include <cppunit/TestAssert.h>
#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include "../../test_runner.h"
#include "../loopback_socket.h"
#include "sap/announcer.h"
#include "scheduled_executor.h"

#include <condition_variable>
#include <string>
#include <thread>

using namespace std::literals;

namespace sapcast { namespace test {

class AnnouncerTest : public CppUnit::TestFixture {
public:
    static std::string name() { return "announcer"; }

    void setUp();
    void tearDown();

private:
    void testBurstThenInterval();
    void testUpdateKeepsSchedule();
    void testUpdateRejected();
    void testTransientErrors();
    void testFatalError();
    void testStopSendsOneWithdraw();
    void testStopBeforeStart();
    void testOversizedDescriptor();
    void testAnnounceNow();
    void testStartRequiresSharedOwner();
    void testStopWaitsForFatalCallback();

    CPPUNIT_TEST_SUITE(AnnouncerTest);
    CPPUNIT_TEST(testBurstThenInterval);
    CPPUNIT_TEST(testUpdateKeepsSchedule);
    CPPUNIT_TEST(testUpdateRejected);
    CPPUNIT_TEST(testTransientErrors);
    CPPUNIT_TEST(testFatalError);
    CPPUNIT_TEST(testStopSendsOneWithdraw);
    CPPUNIT_TEST(testStopBeforeStart);
    CPPUNIT_TEST(testOversizedDescriptor);
    CPPUNIT_TEST(testAnnounceNow);
    CPPUNIT_TEST(testStartRequiresSharedOwner);
    CPPUNIT_TEST(testStopWaitsForFatalCallback);
    CPPUNIT_TEST_SUITE_END();

    std::shared_ptr<Announcer> makeAnnouncer();

    std::shared_ptr<LoopbackNetwork> net_;
    LoopbackSocket* socket_ {nullptr};
    AnnouncePreference prefs_;
    SessionDescriptor desc_;
};

CPPUNIT_TEST_SUITE_NAMED_REGISTRATION(AnnouncerTest, AnnouncerTest::name());

void
AnnouncerTest::setUp()
{
    net_ = LoopbackNetwork::create();
    prefs_ = {};
    prefs_.setBurstCount(3);
    prefs_.setBurstSpacing(20ms);
    prefs_.setIntervalSec(1);

    SessionParams params;
    params.name = "lobby";
    params.group = "239.10.0.1";
    desc_ = DescriptorBuilder::build({"10.0.0.1", 42}, params);
}

void
AnnouncerTest::tearDown()
{
    socket_ = nullptr;
    net_.reset();
}

std::shared_ptr<Announcer>
AnnouncerTest::makeAnnouncer()
{
    auto sock = net_->socket();
    socket_ = sock.get();
    return std::make_shared<Announcer>(std::move(sock), prefs_);
}

void
AnnouncerTest::testBurstThenInterval()
{
    auto announcer = makeAnnouncer();
    CPPUNIT_ASSERT(announcer->state() == Announcer::State::Idle);

    auto begin = std::chrono::steady_clock::now();
    announcer->start(desc_);
    CPPUNIT_ASSERT(announcer->state() == Announcer::State::Running);
    // first frame is sent before start() returns
    CPPUNIT_ASSERT_EQUAL((size_t)1, net_->sentCount());

    CPPUNIT_ASSERT(net_->waitForSent(3, 2s));
    std::this_thread::sleep_for(300ms);
    // burst done, steady interval not elapsed yet
    CPPUNIT_ASSERT_EQUAL((size_t)3, net_->sentCount());

    CPPUNIT_ASSERT(net_->waitForSent(4, 3s));
    CPPUNIT_ASSERT(std::chrono::steady_clock::now() - begin >= 1s);
    std::this_thread::sleep_for(50ms);
    CPPUNIT_ASSERT_EQUAL((uint64_t)4, announcer->sentAnnounces());

    for (const auto& f : net_->frames(MessageType::Announce)) {
        CPPUNIT_ASSERT(f.origin == desc_.origin);
        CPPUNIT_ASSERT_EQUAL(1u, f.version);
        CPPUNIT_ASSERT_EQUAL(desc_.payload, f.payload);
    }
    announcer->stop();
}

void
AnnouncerTest::testUpdateKeepsSchedule()
{
    auto announcer = makeAnnouncer();
    announcer->start(desc_);
    CPPUNIT_ASSERT(net_->waitForSent(3, 2s));

    SessionParams params;
    params.name = "lobby";
    params.group = "239.10.0.1";
    params.port = 6000;
    auto v2 = DescriptorBuilder::rebuild(desc_, params);
    announcer->update(v2);
    CPPUNIT_ASSERT_EQUAL(2u, announcer->descriptor().version);

    // no new burst: nothing more until the steady interval
    std::this_thread::sleep_for(300ms);
    CPPUNIT_ASSERT_EQUAL((size_t)3, net_->sentCount());

    CPPUNIT_ASSERT(net_->waitForSent(4, 3s));
    auto frames = net_->frames(MessageType::Announce);
    CPPUNIT_ASSERT_EQUAL(2u, frames.back().version);
    CPPUNIT_ASSERT_EQUAL(v2.payload, frames.back().payload);

    announcer->stop();
    auto withdraws = net_->frames(MessageType::Withdraw);
    CPPUNIT_ASSERT_EQUAL((size_t)1, withdraws.size());
    CPPUNIT_ASSERT_EQUAL(2u, withdraws[0].version);
}

void
AnnouncerTest::testUpdateRejected()
{
    auto announcer = makeAnnouncer();
    // not started
    CPPUNIT_ASSERT_THROW(announcer->update(desc_), std::logic_error);

    announcer->start(desc_);
    auto same = desc_;
    CPPUNIT_ASSERT_THROW(announcer->update(same), std::invalid_argument);

    auto other = desc_;
    other.origin.id = 43;
    other.version = 5;
    CPPUNIT_ASSERT_THROW(announcer->update(other), std::invalid_argument);

    auto huge = desc_;
    huge.version = 2;
    huge.payload.assign(SapFrame::MAX_PAYLOAD + 1, 'x');
    CPPUNIT_ASSERT_THROW(announcer->update(huge), EncodingError);

    CPPUNIT_ASSERT_EQUAL(1u, announcer->descriptor().version);
    CPPUNIT_ASSERT(announcer->state() == Announcer::State::Running);
    announcer->stop();
    CPPUNIT_ASSERT_THROW(announcer->update(desc_), std::logic_error);
}

void
AnnouncerTest::testTransientErrors()
{
    auto announcer = makeAnnouncer();
    socket_->failWrites(std::make_error_code(std::errc::network_unreachable), 2);

    announcer->start(desc_);
    CPPUNIT_ASSERT(announcer->state() == Announcer::State::Running);

    // the third burst send goes through
    CPPUNIT_ASSERT(net_->waitForSent(1, 2s));
    std::this_thread::sleep_for(50ms);
    CPPUNIT_ASSERT_EQUAL((uint64_t)2, announcer->failedSends());
    CPPUNIT_ASSERT_EQUAL((uint64_t)1, announcer->sentAnnounces());
    CPPUNIT_ASSERT(announcer->state() == Announcer::State::Running);

    // retried on the next tick
    CPPUNIT_ASSERT(net_->waitForSent(2, 3s));
    announcer->stop();
}

void
AnnouncerTest::testFatalError()
{
    auto announcer = makeAnnouncer();
    std::mutex mtx;
    std::condition_variable cv;
    std::error_code reported;
    announcer->onFatalError([&](const ResourceFatalError& err) {
        std::lock_guard<std::mutex> lk(mtx);
        reported = err.code();
        cv.notify_all();
    });

    announcer->start(desc_);
    CPPUNIT_ASSERT(net_->waitForSent(2, 2s));
    socket_->failWrites(std::make_error_code(std::errc::bad_file_descriptor), 1);

    {
        std::unique_lock<std::mutex> lk(mtx);
        CPPUNIT_ASSERT(cv.wait_for(lk, 3s, [&] { return bool(reported); }));
    }
    CPPUNIT_ASSERT(reported == std::errc::bad_file_descriptor);
    CPPUNIT_ASSERT(announcer->state() == Announcer::State::Stopped);
    CPPUNIT_ASSERT(socket_->isClosed());

    auto sent = net_->sentCount();
    std::this_thread::sleep_for(100ms);
    CPPUNIT_ASSERT_EQUAL(sent, net_->sentCount());

    // already stopped: no withdraw
    announcer->stop();
    CPPUNIT_ASSERT(net_->frames(MessageType::Withdraw).empty());
}

void
AnnouncerTest::testStopSendsOneWithdraw()
{
    auto listener = net_->socket();
    auto announcer = makeAnnouncer();
    announcer->start(desc_);
    CPPUNIT_ASSERT(net_->waitForSent(3, 2s));

    announcer->stop();
    CPPUNIT_ASSERT(announcer->state() == Announcer::State::Stopped);
    CPPUNIT_ASSERT(socket_->isClosed());

    auto withdraws = net_->frames(MessageType::Withdraw);
    CPPUNIT_ASSERT_EQUAL((size_t)1, withdraws.size());
    CPPUNIT_ASSERT(withdraws[0].origin == desc_.origin);
    CPPUNIT_ASSERT_EQUAL(desc_.version, withdraws[0].version);
    CPPUNIT_ASSERT_EQUAL(desc_.payload, withdraws[0].payload);
    // the withdraw is the last frame the listener got
    auto history = net_->history();
    CPPUNIT_ASSERT(SapFrame::decode(history.back()).type == MessageType::Withdraw);

    auto sent = net_->sentCount();
    announcer->stop();
    std::this_thread::sleep_for(100ms);
    CPPUNIT_ASSERT_EQUAL(sent, net_->sentCount());
    CPPUNIT_ASSERT_THROW(announcer->start(desc_), std::logic_error);
}

void
AnnouncerTest::testStopBeforeStart()
{
    auto announcer = makeAnnouncer();
    announcer->stop();
    CPPUNIT_ASSERT(announcer->state() == Announcer::State::Stopped);
    CPPUNIT_ASSERT_EQUAL((size_t)0, net_->sentCount());
    CPPUNIT_ASSERT_THROW(announcer->start(desc_), std::logic_error);
}

void
AnnouncerTest::testOversizedDescriptor()
{
    auto announcer = makeAnnouncer();
    socket_->setMaxPayload(200);
    auto big = desc_;
    big.payload.append(std::string(200, 'x'));
    CPPUNIT_ASSERT_THROW(announcer->start(big), EncodingError);
    CPPUNIT_ASSERT(announcer->state() == Announcer::State::Idle);
    CPPUNIT_ASSERT_EQUAL((size_t)0, net_->sentCount());

    socket_->setMaxPayload(SapFrame::MAX_DATAGRAM);
    announcer->start(desc_);
    CPPUNIT_ASSERT(announcer->state() == Announcer::State::Running);
    announcer->stop();
}

void
AnnouncerTest::testAnnounceNow()
{
    prefs_.setBurstCount(1);
    prefs_.setIntervalSec(60);
    auto announcer = makeAnnouncer();
    announcer->announceNow();
    CPPUNIT_ASSERT_EQUAL((size_t)0, net_->sentCount());

    announcer->start(desc_);
    announcer->announceNow();
    announcer->announceNow();
    CPPUNIT_ASSERT_EQUAL((size_t)3, net_->sentCount());
    CPPUNIT_ASSERT_EQUAL((uint64_t)3, announcer->sentAnnounces());
    announcer->stop();
    CPPUNIT_ASSERT_EQUAL((size_t)4, net_->sentCount());
}

void
AnnouncerTest::testStartRequiresSharedOwner()
{
    Announcer announcer(net_->socket(), prefs_);
    CPPUNIT_ASSERT_THROW(announcer.start(desc_), std::logic_error);
    CPPUNIT_ASSERT(announcer.state() == Announcer::State::Idle);
    CPPUNIT_ASSERT_EQUAL((size_t)0, net_->sentCount());
}

void
AnnouncerTest::testStopWaitsForFatalCallback()
{
    std::atomic_bool entered {false};
    std::atomic_bool done {false};
    auto announcer = makeAnnouncer();
    announcer->onFatalError([&](const ResourceFatalError&) {
        entered = true;
        std::this_thread::sleep_for(300ms);
        done = true;
    });

    announcer->start(desc_);
    socket_->failWrites(std::make_error_code(std::errc::bad_file_descriptor), 1);
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (not entered and std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);
    CPPUNIT_ASSERT(entered);

    // the callback may use state owned by the caller of stop()
    announcer->stop();
    CPPUNIT_ASSERT(done);
}

}} // namespace sapcast::test

SAPCAST_TEST_RUNNER(sapcast::test::AnnouncerTest::name());
