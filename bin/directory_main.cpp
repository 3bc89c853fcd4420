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

#include "sapcast/sapcast.h"
#include "cli_utils.h"

#include "preferences.h"
#include "sap/directory.h"
#include "sap/multicast_socket.h"

#include <getopt.h>

#include <chrono>
#include <iostream>
#include <optional>
#include <thread>

using namespace sapcast;

static int sapcastFlags = 0;

struct Options
{
    std::string configFile;
    std::optional<std::string> outputDir;
    std::optional<unsigned> expirySec;
    std::optional<unsigned> sweepSec;
    bool cleanupOnExit {false};
    bool dumpConfig {false};
};

static void
print_title()
{
    std::cout << "sapcast directory " << libsapcast::version() << std::endl << std::endl;
}

static void
print_usage()
{
    std::cout << std::endl <<
    "Usage: sapcast-directory [options]" << std::endl <<
    "-c, --console \t\t- Log in console (instead of syslog)" << std::endl <<
    "-d, --debug \t\t- Debug mode (more verbose)" << std::endl <<
    "-f, --config FILE \t- Configuration file" << std::endl <<
    "--output-dir DIR \t- Where session files are written" << std::endl <<
    "--expire-sec SEC \t- Remove sessions silent for longer than SEC" << std::endl <<
    "--sweep-sec SEC \t- Seconds between expiry checks" << std::endl <<
    "--cleanup-on-exit \t- Remove session files when stopping" << std::endl <<
    "--dump-config \t\t- Print the effective configuration and exit" << std::endl <<
    "-h, --help \t\t- Print help" << std::endl;
}

// returns true if we should quit (i.e. help was printed), false otherwise
static bool
parse_args(int argc, char* argv[], Options& opts, bool& error)
{
    int consoleFlag = false;
    int debugFlag = false;
    int helpFlag = false;
    int versionFlag = false;
    int cleanupOnExit = false;
    int dumpConfig = false;

    enum { OPT_OUTPUT_DIR = 256, OPT_EXPIRE, OPT_SWEEP };

    const struct option long_options[] = {
        {"debug",           no_argument,        nullptr,        'd'},
        {"console",         no_argument,        nullptr,        'c'},
        {"config",          required_argument,  nullptr,        'f'},
        {"help",            no_argument,        nullptr,        'h'},
        {"version",         no_argument,        nullptr,        'v'},
        {"output-dir",      required_argument,  nullptr,        OPT_OUTPUT_DIR},
        {"expire-sec",      required_argument,  nullptr,        OPT_EXPIRE},
        {"sweep-sec",       required_argument,  nullptr,        OPT_SWEEP},
        {"cleanup-on-exit", no_argument,        &cleanupOnExit, true},
        {"dump-config",     no_argument,        &dumpConfig,    true},
        {nullptr,           0,                  nullptr,        0} /* Sentinel */
    };

    while (true) {
        int option_index = 0;
        auto c = getopt_long(argc, argv, "dcf:hv", long_options, &option_index);
        if (c == -1)
            break;

        switch (c) {
        case 'd':
            debugFlag = true;
            break;
        case 'c':
            consoleFlag = true;
            break;
        case 'f':
            opts.configFile = optarg;
            break;
        case 'h':
        case '?':
            helpFlag = true;
            break;
        case 'v':
            versionFlag = true;
            break;
        case OPT_OUTPUT_DIR:
            opts.outputDir = optarg;
            break;
        case OPT_EXPIRE: {
            unsigned sec;
            if (not cli::parse_number(optarg, "expire-sec", sec)) {
                error = true;
                return true;
            }
            opts.expirySec = sec;
            break;
        }
        case OPT_SWEEP: {
            unsigned sec;
            if (not cli::parse_number(optarg, "sweep-sec", sec) or sec == 0) {
                error = true;
                return true;
            }
            opts.sweepSec = sec;
            break;
        }
        default:
            break;
        }
    }

    if (helpFlag) {
        print_usage();
        return true;
    }

    if (versionFlag)
        return true;

    opts.cleanupOnExit = cleanupOnExit;
    opts.dumpConfig = dumpConfig;

    if (consoleFlag)
        sapcastFlags |= libsapcast::SAPCAST_FLAG_CONSOLE_LOG;
    else
        sapcastFlags |= libsapcast::SAPCAST_FLAG_SYSLOG;

    if (debugFlag)
        sapcastFlags |= libsapcast::SAPCAST_FLAG_DEBUG;

    return false;
}

int
main(int argc, char* argv[])
{
    print_title();

    Options opts;
    bool error = false;
    if (parse_args(argc, argv, opts, error))
        return error ? 1 : 0;

    DirectoryPreference prefs;
    try {
        prefs.unserialize(cli::load_config(opts.configFile, "directory"));
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (opts.outputDir)
        prefs.setOutputDir(*opts.outputDir);
    if (opts.expirySec)
        prefs.setExpirySec(*opts.expirySec);
    if (opts.sweepSec)
        prefs.setSweepSec(*opts.sweepSec);
    if (opts.cleanupOnExit)
        prefs.setCleanupOnExit(true);

    if (opts.dumpConfig) {
        cli::dump_config(prefs);
        return 0;
    }

    if (not libsapcast::init(static_cast<libsapcast::InitFlag>(sapcastFlags)))
        return 1;

    cli::install_signal_handlers(false);

    int ret = 0;
    try {
        std::atomic_bool fatal {false};
        Directory directory(MulticastSocket::listener(prefs.listenerOptions()), prefs);
        directory.onFatalError([&fatal](const ResourceFatalError&) { fatal = true; });
        directory.start();

        while (not cli::quitRequested and not fatal)
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (cli::quitRequested)
            SAPCAST_LOG("Caught signal {}, terminating...", strsignal(cli::quitRequested));

        directory.stop();
        ret = fatal ? 1 : 0;
    } catch (const std::exception& e) {
        SAPCAST_ERROR("{}", e.what());
        ret = 1;
    }

    libsapcast::fini();
    return ret;
}
