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
#include "../common.h"
#include "fileutils.h"

#include <algorithm>
#include <fstream>
#include <string>
#include <cstdlib>
#include <unistd.h>

namespace sapcast { namespace fileutils { namespace test {

class FileutilsTest : public CppUnit::TestFixture {
public:
    static std::string name() { return "fileutils"; }

    void setUp();
    void tearDown();

private:
    void testCheckDir();
    void testPath();
    void testLoadFile();
    void testSaveFileAtomic();
    void testRemove();
    void testListFiles();
    void testExpandPath();

    CPPUNIT_TEST_SUITE(FileutilsTest);
    CPPUNIT_TEST(testCheckDir);
    CPPUNIT_TEST(testPath);
    CPPUNIT_TEST(testLoadFile);
    CPPUNIT_TEST(testSaveFileAtomic);
    CPPUNIT_TEST(testRemove);
    CPPUNIT_TEST(testListFiles);
    CPPUNIT_TEST(testExpandPath);
    CPPUNIT_TEST_SUITE_END();

    static constexpr auto tmpFileName = "temp_file";

    std::unique_ptr<sapcast::test::TempDir> dir_;
    std::string TEST_PATH;
    std::string NON_EXISTANT_PATH_BASE;
    std::string NON_EXISTANT_PATH;
    std::string EXISTANT_FILE;
};

CPPUNIT_TEST_SUITE_NAMED_REGISTRATION(FileutilsTest, FileutilsTest::name());

void
FileutilsTest::setUp()
{
    dir_ = std::make_unique<sapcast::test::TempDir>();

    TEST_PATH = dir_->str();
    EXISTANT_FILE = TEST_PATH + "/" + tmpFileName;
    NON_EXISTANT_PATH_BASE = TEST_PATH + "/" + "not_existing_path";
    NON_EXISTANT_PATH = NON_EXISTANT_PATH_BASE + "/" + "test";

    std::ofstream(EXISTANT_FILE) << "SAP!";
}

void
FileutilsTest::tearDown()
{
    dir_.reset();
}

void
FileutilsTest::testCheckDir()
{
    // check existed directory
    CPPUNIT_ASSERT(check_dir(TEST_PATH));
    CPPUNIT_ASSERT(std::filesystem::is_directory(TEST_PATH));
    // check non-existent directory, parents are created too
    CPPUNIT_ASSERT(!std::filesystem::exists(NON_EXISTANT_PATH));
    CPPUNIT_ASSERT(check_dir(NON_EXISTANT_PATH));
    CPPUNIT_ASSERT(std::filesystem::is_directory(NON_EXISTANT_PATH));
}

void
FileutilsTest::testPath()
{
    CPPUNIT_ASSERT(isFile(EXISTANT_FILE));
    CPPUNIT_ASSERT(!isFile(TEST_PATH));
    CPPUNIT_ASSERT(!isFile(NON_EXISTANT_PATH));

    unsetenv("XDG_CONFIG_HOME");
    CPPUNIT_ASSERT_EQUAL(get_home_dir() / ".config" / "sapcast", get_config_dir());
    setenv("XDG_CONFIG_HOME", TEST_PATH.c_str(), 1);
    CPPUNIT_ASSERT_EQUAL(std::filesystem::path(TEST_PATH) / "sapcast", get_config_dir());
    unsetenv("XDG_CONFIG_HOME");
}

void
FileutilsTest::testLoadFile()
{
    auto file = loadTextFile(EXISTANT_FILE);
    CPPUNIT_ASSERT_EQUAL(std::string("SAP!"), file);
    CPPUNIT_ASSERT_THROW(loadTextFile(NON_EXISTANT_PATH), std::runtime_error);
}

void
FileutilsTest::testSaveFileAtomic()
{
    auto path = TEST_PATH + "/" + "a.sdp";
    saveFileAtomic(path, "v=0\r\n");
    CPPUNIT_ASSERT_EQUAL(std::string("v=0\r\n"), loadTextFile(path));

    // overwrite
    saveFileAtomic(path, "v=0\r\ns=new\r\n");
    CPPUNIT_ASSERT_EQUAL(std::string("v=0\r\ns=new\r\n"), loadTextFile(path));

    struct stat st;
    CPPUNIT_ASSERT(stat(path.c_str(), &st) == 0);
    CPPUNIT_ASSERT_EQUAL((mode_t)0644, (mode_t)(st.st_mode & 0777));

    // no temporary file left behind
    size_t count = std::distance(std::filesystem::directory_iterator(TEST_PATH),
                                 std::filesystem::directory_iterator());
    CPPUNIT_ASSERT_EQUAL((size_t)2, count);

    // missing parent directory
    CPPUNIT_ASSERT_THROW(saveFileAtomic(NON_EXISTANT_PATH, "x"), std::system_error);
}

void
FileutilsTest::testRemove()
{
    CPPUNIT_ASSERT_EQUAL(0, remove(EXISTANT_FILE));
    CPPUNIT_ASSERT(!isFile(EXISTANT_FILE));
    // already gone
    CPPUNIT_ASSERT_EQUAL(0, remove(EXISTANT_FILE));
}

void
FileutilsTest::testListFiles()
{
    saveFileAtomic(TEST_PATH + "/one.sdp", "1");
    saveFileAtomic(TEST_PATH + "/two.sdp", "2");
    saveFileAtomic(TEST_PATH + "/notes.txt", "3");
    CPPUNIT_ASSERT(check_dir(TEST_PATH + "/sub.sdp"));

    auto files = listFiles(TEST_PATH, ".sdp");
    CPPUNIT_ASSERT_EQUAL((size_t)2, files.size());
    std::sort(files.begin(), files.end());
    CPPUNIT_ASSERT_EQUAL(std::string("one.sdp"), files[0].filename().string());
    CPPUNIT_ASSERT_EQUAL(std::string("two.sdp"), files[1].filename().string());

    CPPUNIT_ASSERT(listFiles(NON_EXISTANT_PATH, ".sdp").empty());
}

void
FileutilsTest::testExpandPath()
{
    setenv("SAPCAST_TEST_DIR", TEST_PATH.c_str(), 1);
    CPPUNIT_ASSERT_EQUAL(TEST_PATH + "/x", expand_path("$SAPCAST_TEST_DIR/x"));
    CPPUNIT_ASSERT_EQUAL(get_home_dir().string() + "/y", expand_path("~/y"));
    CPPUNIT_ASSERT_EQUAL(std::string("plain"), expand_path("plain"));

    // shell metacharacters are rejected
    CPPUNIT_ASSERT(expand_path("a|b").empty());
    CPPUNIT_ASSERT(expand_path("{x}").empty());
}

}}} // namespace sapcast::fileutils::test

SAPCAST_TEST_RUNNER(sapcast::fileutils::test::FileutilsTest::name());
