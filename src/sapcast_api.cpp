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

#include <atomic>
#include <cstdlib>
#include <string>

#include <gnutls/gnutls.h>

#include "logger.h"
#include "sapcast/sapcast.h"

namespace libsapcast {

static std::atomic_bool initialized_ {false};

bool
init(enum InitFlag flags) noexcept
{
    sapcast::Logger::setDebugMode(SAPCAST_FLAG_DEBUG == (flags & SAPCAST_FLAG_DEBUG));
    sapcast::Logger::setSysLog(SAPCAST_FLAG_SYSLOG == (flags & SAPCAST_FLAG_SYSLOG));
    sapcast::Logger::setConsoleLog(SAPCAST_FLAG_CONSOLE_LOG == (flags & SAPCAST_FLAG_CONSOLE_LOG));

    const char* log_file = getenv("SAPCAST_LOG_FILE");

    if (log_file) {
        sapcast::Logger::setFileLog(log_file);
    }

    if (not initialized_) {
        int err = gnutls_global_init();
        if (err < 0) {
            SAPCAST_ERROR("Failed to initialize gnutls: {}", gnutls_strerror(err));
            return false;
        }
        initialized_ = true;
    }

    SAPCAST_DEBUG("sapcast {} on {}", version(), platform());
    return true;
}

bool
initialized() noexcept
{
    return initialized_;
}

void
fini() noexcept
{
    if (initialized_.exchange(false))
        gnutls_global_deinit();
    sapcast::Logger::fini();
}

void
logging(const std::string& whom, const std::string& action) noexcept
{
    if ("syslog" == whom) {
        sapcast::Logger::setSysLog(not action.empty());
    } else if ("console" == whom) {
        sapcast::Logger::setConsoleLog(not action.empty());
    } else if ("file" == whom) {
        sapcast::Logger::setFileLog(action);
    } else {
        SAPCAST_ERROR("Bad log handler {}", whom);
    }
}

} // namespace libsapcast
