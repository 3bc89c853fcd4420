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
#include "sap/session_table.h"

#include <string>

using namespace std::literals;

namespace sapcast { namespace test {

class SessionTableTest : public CppUnit::TestFixture {
public:
    static std::string name() { return "session_table"; }

private:
    void testInsert();
    void testIncreasingVersions();
    void testOlderVersionIgnored();
    void testSameVersionRefreshes();
    void testReplacedByNewOrigin();
    void testWithdraw();
    void testWithdrawUnknown();
    void testWithdrawOrigin();
    void testExpiry();
    void testClear();

    CPPUNIT_TEST_SUITE(SessionTableTest);
    CPPUNIT_TEST(testInsert);
    CPPUNIT_TEST(testIncreasingVersions);
    CPPUNIT_TEST(testOlderVersionIgnored);
    CPPUNIT_TEST(testSameVersionRefreshes);
    CPPUNIT_TEST(testReplacedByNewOrigin);
    CPPUNIT_TEST(testWithdraw);
    CPPUNIT_TEST(testWithdrawUnknown);
    CPPUNIT_TEST(testWithdrawOrigin);
    CPPUNIT_TEST(testExpiry);
    CPPUNIT_TEST(testClear);
    CPPUNIT_TEST_SUITE_END();

    using clock = SessionTable::clock;

    static SapFrame frame(MessageType type, const OriginIdentity& origin, uint32_t version, std::string payload)
    {
        SapFrame f;
        f.type = type;
        f.origin = origin;
        f.version = version;
        f.payload = std::move(payload);
        return f;
    }

    static SapFrame announce(const OriginIdentity& o, uint32_t v, const std::string& name, const std::string& body = {})
    {
        return frame(MessageType::Announce, o, v, "v=0\r\ns=" + name + "\r\n" + body);
    }

    static SapFrame withdraw(const OriginIdentity& o, uint32_t v, const std::string& name)
    {
        return frame(MessageType::Withdraw, o, v, "v=0\r\ns=" + name + "\r\n");
    }

    OriginIdentity o1_ {"10.0.0.1", 1};
    OriginIdentity o2_ {"10.0.0.2", 2};
    clock::time_point t0_ {clock::now()};
};

CPPUNIT_TEST_SUITE_NAMED_REGISTRATION(SessionTableTest, SessionTableTest::name());

void
SessionTableTest::testInsert()
{
    SessionTable table;
    CPPUNIT_ASSERT(table.empty());
    auto res = table.apply(announce(o1_, 1, "cam"), t0_);
    CPPUNIT_ASSERT(res.outcome == SessionTable::Outcome::Inserted);
    CPPUNIT_ASSERT_EQUAL((size_t)1, res.keys.size());
    CPPUNIT_ASSERT_EQUAL("cam"s, res.keys[0]);

    auto entry = table.find("cam");
    CPPUNIT_ASSERT(entry);
    CPPUNIT_ASSERT(entry->origin == o1_);
    CPPUNIT_ASSERT_EQUAL(1u, entry->version);
    CPPUNIT_ASSERT(entry->lastSeen == t0_);
    CPPUNIT_ASSERT_EQUAL("inserted"s, std::string(toString(res.outcome)));
}

void
SessionTableTest::testIncreasingVersions()
{
    SessionTable table;
    for (uint32_t v = 1; v <= 10; v++) {
        auto res = table.apply(announce(o1_, v, "cam", "i=" + std::to_string(v) + "\r\n"), t0_);
        CPPUNIT_ASSERT(res.outcome == (v == 1 ? SessionTable::Outcome::Inserted : SessionTable::Outcome::Updated));
    }
    CPPUNIT_ASSERT_EQUAL((size_t)1, table.size());
    auto entry = table.find("cam");
    CPPUNIT_ASSERT_EQUAL(10u, entry->version);
    CPPUNIT_ASSERT(entry->payload.find("i=10\r\n") != std::string::npos);
}

void
SessionTableTest::testOlderVersionIgnored()
{
    SessionTable table;
    table.apply(announce(o1_, 5, "cam", "i=five\r\n"), t0_);
    auto later = t0_ + std::chrono::seconds(10);
    auto res = table.apply(announce(o1_, 4, "cam", "i=four\r\n"), later);
    CPPUNIT_ASSERT(res.outcome == SessionTable::Outcome::Stale);
    CPPUNIT_ASSERT(res.keys.empty());

    auto entry = table.find("cam");
    CPPUNIT_ASSERT_EQUAL(5u, entry->version);
    CPPUNIT_ASSERT(entry->payload.find("i=five") != std::string::npos);
    CPPUNIT_ASSERT(entry->lastSeen == t0_);
}

void
SessionTableTest::testSameVersionRefreshes()
{
    SessionTable table;
    table.apply(announce(o1_, 3, "cam", "i=a\r\n"), t0_);
    auto later = t0_ + std::chrono::seconds(20);
    auto res = table.apply(announce(o1_, 3, "cam", "i=b\r\n"), later);
    CPPUNIT_ASSERT(res.outcome == SessionTable::Outcome::Refreshed);
    CPPUNIT_ASSERT(res.keys.empty());

    auto entry = table.find("cam");
    CPPUNIT_ASSERT(entry->payload.find("i=a") != std::string::npos);
    CPPUNIT_ASSERT(entry->lastSeen == later);
}

void
SessionTableTest::testReplacedByNewOrigin()
{
    SessionTable table;
    table.apply(announce(o1_, 8, "cam"), t0_);
    // restarted sender: new origin id, version back to 1
    auto res = table.apply(announce(o2_, 1, "cam"), t0_);
    CPPUNIT_ASSERT(res.outcome == SessionTable::Outcome::Replaced);
    CPPUNIT_ASSERT_EQUAL((size_t)1, res.keys.size());
    auto entry = table.find("cam");
    CPPUNIT_ASSERT(entry->origin == o2_);
    CPPUNIT_ASSERT_EQUAL(1u, entry->version);
}

void
SessionTableTest::testWithdraw()
{
    SessionTable table;
    table.apply(announce(o1_, 2, "cam"), t0_);
    table.apply(announce(o2_, 1, "other"), t0_);

    // version is irrelevant for a withdrawal
    auto res = table.apply(withdraw(o1_, 1, "cam"), t0_);
    CPPUNIT_ASSERT(res.outcome == SessionTable::Outcome::Removed);
    CPPUNIT_ASSERT_EQUAL((size_t)1, res.keys.size());
    CPPUNIT_ASSERT_EQUAL("cam"s, res.keys[0]);
    CPPUNIT_ASSERT(not table.find("cam"));
    CPPUNIT_ASSERT(table.find("other"));
}

void
SessionTableTest::testWithdrawUnknown()
{
    SessionTable table;
    table.apply(announce(o1_, 1, "cam"), t0_);

    auto res = table.apply(withdraw(o2_, 1, "cam"), t0_);
    CPPUNIT_ASSERT(res.outcome == SessionTable::Outcome::Unknown);
    CPPUNIT_ASSERT(res.keys.empty());
    res = table.apply(withdraw(o1_, 1, "nothing"), t0_);
    CPPUNIT_ASSERT(res.outcome == SessionTable::Outcome::Unknown);
    res = table.apply(frame(MessageType::Withdraw, o2_, 1, {}), t0_);
    CPPUNIT_ASSERT(res.outcome == SessionTable::Outcome::Unknown);

    CPPUNIT_ASSERT_EQUAL((size_t)1, table.size());
    CPPUNIT_ASSERT(table.find("cam")->origin == o1_);
}

void
SessionTableTest::testWithdrawOrigin()
{
    SessionTable table;
    table.apply(announce(o1_, 1, "a"), t0_);
    table.apply(announce(o1_, 1, "b"), t0_);
    table.apply(announce(o2_, 1, "c"), t0_);

    auto res = table.apply(frame(MessageType::Withdraw, o1_, 0, {}), t0_);
    CPPUNIT_ASSERT(res.outcome == SessionTable::Outcome::Removed);
    CPPUNIT_ASSERT_EQUAL((size_t)2, res.keys.size());
    CPPUNIT_ASSERT_EQUAL((size_t)1, table.size());
    CPPUNIT_ASSERT(table.find("c"));
}

void
SessionTableTest::testExpiry()
{
    using namespace std::chrono;
    SessionTable table;
    table.apply(announce(o1_, 1, "old"), t0_);
    table.apply(announce(o2_, 1, "fresh"), t0_ + seconds(100));

    CPPUNIT_ASSERT(table.expire(t0_ + seconds(299), seconds(300)).empty());
    CPPUNIT_ASSERT(table.expire(t0_ + seconds(300), seconds(300)).empty());
    CPPUNIT_ASSERT_EQUAL((size_t)2, table.size());

    auto expired = table.expire(t0_ + seconds(301), seconds(300));
    CPPUNIT_ASSERT_EQUAL((size_t)1, expired.size());
    CPPUNIT_ASSERT_EQUAL("old"s, expired[0].key);
    CPPUNIT_ASSERT(table.find("fresh"));

    // a refresh pushes expiry back
    table.apply(announce(o2_, 1, "fresh"), t0_ + seconds(350));
    CPPUNIT_ASSERT(table.expire(t0_ + seconds(500), seconds(300)).empty());
    CPPUNIT_ASSERT_EQUAL((size_t)1, table.expire(t0_ + seconds(651), seconds(300)).size());
    CPPUNIT_ASSERT(table.empty());
}

void
SessionTableTest::testClear()
{
    SessionTable table;
    table.apply(announce(o1_, 1, "a"), t0_);
    table.apply(announce(o2_, 1, "b"), t0_);
    auto entries = table.entries();
    CPPUNIT_ASSERT_EQUAL((size_t)2, entries.size());
    auto removed = table.clear();
    CPPUNIT_ASSERT_EQUAL((size_t)2, removed.size());
    CPPUNIT_ASSERT(table.empty());
}

}} // namespace sapcast::test

SAPCAST_TEST_RUNNER(sapcast::test::SessionTableTest::name());
