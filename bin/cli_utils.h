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

#include "config/yamlparser.h"
#include "config/serializable.h"
#include "fileutils.h"
#include "logger.h"

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <charconv>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>

namespace sapcast {
namespace cli {

// Set from signal handlers, polled by the main loops
inline std::atomic_int quitRequested {0};
inline std::atomic_int reloadRequested {0};

static_assert(std::atomic_int::is_always_lock_free, "signal handlers need lock-free atomics");

inline void
signal_handler(int code)
{
    if (code == SIGHUP) {
        reloadRequested = 1;
        return;
    }
    quitRequested = code;
}

inline void
install_signal_handlers(bool reloadOnHup)
{
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    if (reloadOnHup)
        sigaction(SIGHUP, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

/**
 * Configuration of a program: the given file, or <config dir>/<name>.yml
 * if it exists, or an empty document.
 * @throw std::runtime_error if an explicitly given file can't be parsed
 */
inline YAML::Node
load_config(const std::string& path, const char* name)
{
    if (not path.empty())
        return yaml_utils::loadFile(path);
    auto dft = fileutils::get_config_dir() / (std::string(name) + ".yml");
    if (fileutils::isFile(dft))
        return yaml_utils::loadFile(dft);
    return YAML::Node(YAML::NodeType::Map);
}

template<typename... Prefs>
void
dump_config(const Prefs&... prefs)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    (prefs.serialize(out), ...);
    out << YAML::EndMap;
    std::cout << out.c_str() << std::endl;
}

template<typename T>
bool
parse_number(const char* arg, const char* option, T& value)
{
    auto str = std::string_view(arg ? arg : "");
    T result;
    auto [p, ec] = std::from_chars(str.data(), str.data() + str.size(), result);
    if (ec != std::errc() or p != str.data() + str.size()) {
        std::cerr << "Invalid value for --" << option << ": " << str << std::endl;
        return false;
    }
    value = result;
    return true;
}

} // namespace cli
} // namespace sapcast
