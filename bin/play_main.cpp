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
#include "sap/session_descriptor.h"
#include "media/gst_pipeline.h"
#include "media/pipeline_process.h"

#include <getopt.h>
#include <sys/wait.h>

#include <chrono>
#include <iostream>
#include <thread>

using namespace sapcast;

static int sapcastFlags = 0;

struct Options
{
    std::string configFile;
    std::string sdpFile;
    bool follow {false};
};

static void
print_usage()
{
    std::cout << std::endl <<
    "Usage: sapcast-play [options] FILE.sdp" << std::endl <<
    "-c, --console \t\t- Log in console (instead of syslog)" << std::endl <<
    "-d, --debug \t\t- Debug mode (more verbose)" << std::endl <<
    "-f, --config FILE \t- Configuration file" << std::endl <<
    "--follow \t\t- Stop when the session file is removed" << std::endl <<
    "-h, --help \t\t- Print help" << std::endl;
}

// returns true if we should quit (i.e. help was printed), false otherwise
static bool
parse_args(int argc, char* argv[], Options& opts)
{
    int consoleFlag = false;
    int debugFlag = false;
    int helpFlag = false;
    int follow = false;

    const struct option long_options[] = {
        {"debug",   no_argument,        nullptr,    'd'},
        {"console", no_argument,        nullptr,    'c'},
        {"config",  required_argument,  nullptr,    'f'},
        {"help",    no_argument,        nullptr,    'h'},
        {"follow",  no_argument,        &follow,    true},
        {nullptr,   0,                  nullptr,    0} /* Sentinel */
    };

    while (true) {
        int option_index = 0;
        auto c = getopt_long(argc, argv, "dcf:h", long_options, &option_index);
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
        default:
            break;
        }
    }

    if (helpFlag or optind != argc - 1) {
        print_usage();
        return true;
    }

    opts.sdpFile = argv[optind];
    opts.follow = follow;

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
    Options opts;
    if (parse_args(argc, argv, opts))
        return 1;

    std::string sessionKey;
    try {
        sessionKey = sessionKeyOf(fileutils::loadTextFile(opts.sdpFile));
    } catch (const std::exception& e) {
        std::cerr << "Unable to read session file: " << e.what() << std::endl;
        return 1;
    }

    PipelinePreference prefs;
    try {
        prefs.unserialize(cli::load_config(opts.configFile, "play"));
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (not libsapcast::init(static_cast<libsapcast::InitFlag>(sapcastFlags)))
        return 1;

    cli::install_signal_handlers(false);
    SAPCAST_LOG("Playing session {} from {}", sessionKey, opts.sdpFile);

    int ret = 0;
    try {
        std::atomic_bool finished {false};
        PipelineProcess player(gst::playerArgs(opts.sdpFile, prefs), prefs);
        player.onExit([&finished](int status) {
            if (WIFEXITED(status) and WEXITSTATUS(status) == 0)
                finished = true;
        });
        player.start();

        while (not cli::quitRequested and not finished) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            if (opts.follow and not fileutils::isFile(opts.sdpFile)) {
                SAPCAST_LOG("{} was removed, session is over", opts.sdpFile);
                break;
            }
            if (not player.isSupervising() and not finished) {
                // restarts exhausted
                ret = 1;
                break;
            }
        }

        player.stop();
    } catch (const std::exception& e) {
        SAPCAST_ERROR("{}", e.what());
        ret = 1;
    }

    libsapcast::fini();
    return ret;
}
