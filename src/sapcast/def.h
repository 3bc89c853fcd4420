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

// Generic helper definitions for shared library support
#if defined _WIN32 || defined __CYGWIN__
#define SAPCAST_IMPORT __declspec(dllimport)
#define SAPCAST_EXPORT __declspec(dllexport)
#define SAPCAST_HIDDEN
#else
#define SAPCAST_IMPORT __attribute__((visibility("default")))
#define SAPCAST_EXPORT __attribute__((visibility("default")))
#define SAPCAST_HIDDEN __attribute__((visibility("hidden")))
#endif

// SAPCAST_PUBLIC is used for the public API symbols. It is either DLL imports or DLL exports
// (or does nothing for static build). SAPCAST_LOCAL is used for non-api symbols.

#ifdef sapcast_EXPORTS // defined if sapcast is compiled as a shared library
#ifdef LIBSAPCAST_BUILD // defined if we are building the shared library (instead of using it)
#define SAPCAST_PUBLIC SAPCAST_EXPORT
#else
#define SAPCAST_PUBLIC SAPCAST_IMPORT
#endif // LIBSAPCAST_BUILD
#define SAPCAST_LOCAL SAPCAST_HIDDEN
#else // sapcast_EXPORTS is not defined: this means sapcast is a static lib.
#define SAPCAST_PUBLIC
#define SAPCAST_LOCAL
#endif // sapcast_EXPORTS
