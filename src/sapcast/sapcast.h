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
#ifndef LIBSAPCAST_H
#define LIBSAPCAST_H

#include "def.h"

#include <string>

namespace libsapcast {

/* flags for initialization */
enum InitFlag {
    SAPCAST_FLAG_DEBUG = 1 << 0,
    SAPCAST_FLAG_CONSOLE_LOG = 1 << 1,
    SAPCAST_FLAG_SYSLOG = 1 << 2,
};

/**
 * Return the library version as string.
 */
SAPCAST_PUBLIC const char* version() noexcept;

/**
 * Return the target platform (OS) as a string.
 */
SAPCAST_PUBLIC const char* platform() noexcept;

/**
 * Initialize globals (logging handlers).
 *
 * @param flags  Flags to customize this initialization
 * @returns      true if initialization succeed else false.
 */
SAPCAST_PUBLIC bool init(enum InitFlag flags) noexcept;

/**
 * Flush and release any resource allocated by init()
 */
SAPCAST_PUBLIC void fini() noexcept;

SAPCAST_PUBLIC bool initialized() noexcept;

/**
 * Enable or disable a log handler at runtime.
 * @param whom    "console", "syslog" or "file"
 * @param action  empty to disable, any value to enable ("file" takes a path)
 */
SAPCAST_PUBLIC void logging(const std::string& whom, const std::string& action) noexcept;

} // namespace libsapcast

#endif /* LIBSAPCAST_H */
