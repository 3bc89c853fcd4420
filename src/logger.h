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

#include "sapcast/def.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <string>
#include <utility>

#include <syslog.h> // Defines LOG_XXXX

namespace sapcast {

///
/// Level-driven logging class, messages are formatted with fmt.
///
class Logger
{
public:
    class Handler;
    struct Msg;

    Logger() = delete;

    SAPCAST_PUBLIC
    static void write(int level, const char* file, int line, std::string&& message);

    static void setConsoleLog(bool enable);
    static void setSysLog(bool enable);
    static void setFileLog(const std::string& path);

    static void setDebugMode(bool enable);
    static bool debugEnabled();

    static void fini();
};

namespace log {

template<typename S, typename... Args>
void
info(const char* file, int line, S&& format, Args&&... args)
{
    Logger::write(LOG_INFO, file, line, fmt::format(std::forward<S>(format), std::forward<Args>(args)...));
}

template<typename S, typename... Args>
void
dbg(const char* file, int line, S&& format, Args&&... args)
{
    Logger::write(LOG_DEBUG, file, line, fmt::format(std::forward<S>(format), std::forward<Args>(args)...));
}

template<typename S, typename... Args>
void
warn(const char* file, int line, S&& format, Args&&... args)
{
    Logger::write(LOG_WARNING, file, line, fmt::format(std::forward<S>(format), std::forward<Args>(args)...));
}

template<typename S, typename... Args>
void
error(const char* file, int line, S&& format, Args&&... args)
{
    Logger::write(LOG_ERR, file, line, fmt::format(std::forward<S>(format), std::forward<Args>(args)...));
}

} // namespace log

// We need to use macros for contextual information
#define SAPCAST_LOG(formatstr, ...) ::sapcast::log::info(__FILE__, __LINE__, FMT_STRING(formatstr), ##__VA_ARGS__)
#define SAPCAST_DEBUG(formatstr, ...) if(::sapcast::Logger::debugEnabled()) { ::sapcast::log::dbg(__FILE__, __LINE__, FMT_STRING(formatstr), ##__VA_ARGS__); }
#define SAPCAST_WARNING(formatstr, ...) ::sapcast::log::warn(__FILE__, __LINE__, FMT_STRING(formatstr), ##__VA_ARGS__)
#define SAPCAST_ERROR(formatstr, ...) ::sapcast::log::error(__FILE__, __LINE__, FMT_STRING(formatstr), ##__VA_ARGS__)

} // namespace sapcast
