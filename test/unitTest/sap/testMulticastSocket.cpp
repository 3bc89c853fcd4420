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
#include "sap/multicast_socket.h"
#include "sap/sap_error.h"
#include "sap/sap_frame.h"
#include "logger.h"

#include <iostream>
#include <string>

namespace sapcast { namespace test {

class MulticastSocketTest : public CppUnit::TestFixture {
public:
    static std::string name() { return "multicast_socket"; }

private:
    void testInvalidGroup();
    void testShutdown();
    void testLoopback();
    void testErrorClassification();

    CPPUNIT_TEST_SUITE(MulticastSocketTest);
    CPPUNIT_TEST(testInvalidGroup);
    CPPUNIT_TEST(testShutdown);
    CPPUNIT_TEST(testLoopback);
    CPPUNIT_TEST(testErrorClassification);
    CPPUNIT_TEST_SUITE_END();

    static MulticastOptions options()
    {
        MulticastOptions opts;
        opts.group = "239.255.77.77";
        opts.port = 19875;
        opts.loopback = true;
        return opts;
    }
};

CPPUNIT_TEST_SUITE_NAMED_REGISTRATION(MulticastSocketTest, MulticastSocketTest::name());

void
MulticastSocketTest::testInvalidGroup()
{
    auto opts = options();
    opts.group = "192.168.1.1";
    CPPUNIT_ASSERT_THROW(MulticastSocket::sender(opts), ResourceFatalError);
    CPPUNIT_ASSERT_THROW(MulticastSocket::listener(opts), ResourceFatalError);
    opts.group = "not an address";
    CPPUNIT_ASSERT_THROW(MulticastSocket::sender(opts), ResourceFatalError);
}

void
MulticastSocketTest::testShutdown()
{
    auto sock = MulticastSocket::sender(options());
    CPPUNIT_ASSERT_EQUAL((int)SapFrame::MAX_DATAGRAM, sock->maxPayload());
    CPPUNIT_ASSERT(not sock->localAddr().empty());

    sock->shutdown();
    sock->shutdown();

    std::error_code ec;
    std::vector<uint8_t> buf(16);
    sock->write(buf, ec);
    CPPUNIT_ASSERT(ec == std::errc::bad_file_descriptor);
    CPPUNIT_ASSERT(not isTransientNetworkError(ec));
    ec.clear();
    CPPUNIT_ASSERT_EQUAL(-1, sock->waitForData(10, ec));
    CPPUNIT_ASSERT(ec == std::errc::bad_file_descriptor);
    ec.clear();
    sock->read(buf, ec);
    CPPUNIT_ASSERT(ec == std::errc::bad_file_descriptor);
    CPPUNIT_ASSERT(sock->localAddr().empty());
}

void
MulticastSocketTest::testLoopback()
{
    std::unique_ptr<MulticastSocket> listener;
    try {
        listener = MulticastSocket::listener(options());
    } catch (const ResourceFatalError& e) {
        // hosts without a multicast route can't join a group
        std::cout << "skipping multicast loopback: " << e.what() << std::endl;
        return;
    }
    auto sender = MulticastSocket::sender(options());

    std::error_code ec;
    CPPUNIT_ASSERT_EQUAL(0, listener->waitForData(10, ec));
    CPPUNIT_ASSERT(not ec);

    SessionDescriptor desc {{"10.0.0.1", 5}, 1, "v=0\r\ns=loop\r\n"};
    auto out = SapFrame::announce(desc).encode();
    sender->write(out, ec);
    if (ec) {
        std::cout << "skipping multicast loopback: " << ec.message() << std::endl;
        return;
    }

    CPPUNIT_ASSERT(listener->waitForData(2000, ec) > 0);
    CPPUNIT_ASSERT(not ec);
    std::vector<uint8_t> in(SapFrame::MAX_DATAGRAM + 1);
    listener->read(in, ec);
    CPPUNIT_ASSERT(not ec);
    CPPUNIT_ASSERT(SapFrame::decode(in) == SapFrame::announce(desc));

    // nothing pending on a non-blocking socket
    listener->read(in.data(), in.size(), ec);
    CPPUNIT_ASSERT(ec == std::errc::resource_unavailable_try_again
                   or ec == std::errc::operation_would_block);
}

void
MulticastSocketTest::testErrorClassification()
{
    CPPUNIT_ASSERT(isTransientNetworkError(std::make_error_code(std::errc::network_unreachable)));
    CPPUNIT_ASSERT(isTransientNetworkError(std::make_error_code(std::errc::host_unreachable)));
    CPPUNIT_ASSERT(isTransientNetworkError(std::make_error_code(std::errc::network_down)));
    CPPUNIT_ASSERT(isTransientNetworkError(std::make_error_code(std::errc::no_buffer_space)));
    CPPUNIT_ASSERT(isTransientNetworkError(std::error_code(EINTR, std::system_category())));
    CPPUNIT_ASSERT(not isTransientNetworkError(std::make_error_code(std::errc::bad_file_descriptor)));
    CPPUNIT_ASSERT(not isTransientNetworkError(std::make_error_code(std::errc::not_a_socket)));
    CPPUNIT_ASSERT(not isTransientNetworkError(std::make_error_code(std::io_errc::stream)));

    CPPUNIT_ASSERT_THROW(throwNetworkError(std::make_error_code(std::errc::network_unreachable), "send"),
                         NetworkTransientError);
    CPPUNIT_ASSERT_THROW(throwNetworkError(std::make_error_code(std::errc::bad_file_descriptor), "send"),
                         ResourceFatalError);
}

}} // namespace sapcast::test

SAPCAST_TEST_RUNNER(sapcast::test::MulticastSocketTest::name());
