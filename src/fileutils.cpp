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

#include "fileutils.h"
#include "logger.h"

#include <fstream>
#include <limits>
#include <system_error>
#include <cstdlib>
#include <cstring>
#include <cerrno>

#include <fcntl.h>
#include <pwd.h>
#include <unistd.h>
#include <wordexp.h>

namespace sapcast {
namespace fileutils {

std::filesystem::path
get_home_dir()
{
    // 1) try getting user's home directory from the environment
    if (const char* home = getenv("HOME"))
        if (*home)
            return home;

    // 2) try getting it from getpwuid_r (i.e. /etc/passwd)
    const long max = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (max != -1) {
        std::vector<char> buf(max);
        struct passwd pwbuf, *pw;
        if (getpwuid_r(getuid(), &pwbuf, buf.data(), buf.size(), &pw) == 0 and pw != nullptr)
            return pw->pw_dir;
    }

    return {};
}

std::filesystem::path
get_config_dir(const char* pkg)
{
    const char* xdg_env = getenv("XDG_CONFIG_HOME");
    if (xdg_env and *xdg_env)
        return std::filesystem::path(xdg_env) / pkg;
    return get_home_dir() / ".config" / pkg;
}

std::string
expand_path(const std::string& path)
{
    std::string result;

    wordexp_t p;
    int ret = wordexp(path.c_str(), &p, WRDE_NOCMD);

    switch (ret) {
    case WRDE_BADCHAR:
        SAPCAST_ERROR("Illegal occurrence of newline or one of |, &, ;, <, >, "
                      "(, ), {{, }} in {}", path);
        return result;
    case WRDE_BADVAL:
        SAPCAST_ERROR("An undefined shell variable was referenced");
        return result;
    case WRDE_CMDSUB:
        SAPCAST_ERROR("Command substitution occurred");
        return result;
    case WRDE_SYNTAX:
        SAPCAST_ERROR("Shell syntax error");
        return result;
    case WRDE_NOSPACE:
        SAPCAST_ERROR("Out of memory.");
        // This is the only error where we must call wordfree
        break;
    default:
        if (p.we_wordc > 0)
            result = std::string(p.we_wordv[0]);
        break;
    }

    wordfree(&p);

    return result;
}

bool
check_dir(const std::filesystem::path& path, mode_t dirmode)
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
        return true;
    if (not std::filesystem::create_directories(path, ec) and ec) {
        SAPCAST_ERROR("Unable to create directory {}: {}", path.string(), ec.message());
        return false;
    }
    if (chmod(path.c_str(), dirmode) < 0)
        SAPCAST_WARNING("chmod() failed on {}, {}", path.string(), strerror(errno));
    return true;
}

bool
isFile(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::string
loadTextFile(const std::filesystem::path& path)
{
    std::string buffer;
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw std::runtime_error("Can't read file: " + path.string());
    file.seekg(0, std::ios::end);
    auto size = file.tellg();
    if (size < 0 or size > std::numeric_limits<unsigned>::max())
        throw std::runtime_error("File is too big: " + path.string());
    buffer.resize(size);
    file.seekg(0, std::ios::beg);
    if (!file.read((char*) buffer.data(), size))
        throw std::runtime_error("Can't load file: " + path.string());
    return buffer;
}

void
saveFileAtomic(const std::filesystem::path& path, std::string_view data, mode_t mode)
{
    auto dir = path.parent_path();
    if (dir.empty())
        dir = ".";
    std::string tmpl = (dir / ("." + path.filename().string() + ".XXXXXX")).string();

    int fd = mkstemp(tmpl.data());
    if (fd < 0)
        throw std::system_error(errno, std::generic_category(), "mkstemp " + tmpl);

    auto fail = [&](const char* what) {
        int err = errno;
        close(fd);
        unlink(tmpl.c_str());
        throw std::system_error(err, std::generic_category(), std::string(what) + " " + tmpl);
    };

    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        auto n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            fail("write");
        }
        p += n;
        left -= n;
    }
    if (fchmod(fd, mode) < 0)
        fail("fchmod");
    if (fsync(fd) < 0)
        fail("fsync");
    if (close(fd) < 0) {
        int err = errno;
        unlink(tmpl.c_str());
        throw std::system_error(err, std::generic_category(), "close " + tmpl);
    }
    if (rename(tmpl.c_str(), path.c_str()) < 0) {
        int err = errno;
        unlink(tmpl.c_str());
        throw std::system_error(err, std::generic_category(), "rename " + path.string());
    }
}

int
remove(const std::filesystem::path& path)
{
    if (std::remove(path.c_str()) < 0) {
        if (errno == ENOENT)
            return 0;
        return -1;
    }
    return 0;
}

std::vector<std::filesystem::path>
listFiles(const std::filesystem::path& dir, std::string_view ext)
{
    std::vector<std::filesystem::path> ret;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (not entry.is_regular_file(ec))
            continue;
        auto name = entry.path().filename().string();
        if (name.size() >= ext.size() and name.compare(name.size() - ext.size(), ext.size(), ext) == 0)
            ret.emplace_back(entry.path());
    }
    if (ec)
        SAPCAST_WARNING("Unable to list {}: {}", dir.string(), ec.message());
    return ret;
}

} // namespace fileutils
} // namespace sapcast
