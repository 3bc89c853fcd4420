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
#include "ip_utils.h"
#include "sap/announcer.h"
#include "sap/multicast_socket.h"
#include "sap/session_descriptor.h"
#include "media/gst_pipeline.h"
#include "media/pipeline_process.h"

#include <getopt.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

using namespace sapcast;

static int sapcastFlags = 0;

struct Options
{
    std::string configFile;
    std::optional<std::string> name;
    std::optional<std::string> group;
    std::optional<uint16_t> port;
    std::optional<std::string> source;
    std::optional<unsigned> interval;
    bool noPipeline {false};
    bool dumpConfig {false};
};

struct SenderConfig
{
    AnnouncePreference announce;
    StreamPreference stream;
    PipelinePreference pipeline;
};

static void
print_title()
{
    std::cout << "sapcast sender " << libsapcast::version() << std::endl << std::endl;
}

static void
print_usage()
{
    std::cout << std::endl <<
    "Usage: sapcast-sender [options]" << std::endl <<
    "-c, --console \t\t- Log in console (instead of syslog)" << std::endl <<
    "-d, --debug \t\t- Debug mode (more verbose)" << std::endl <<
    "-f, --config FILE \t- Configuration file" << std::endl <<
    "--name NAME \t\t- Session name" << std::endl <<
    "--group ADDR \t\t- Media multicast group (default: derived from name)" << std::endl <<
    "--port PORT \t\t- Media port" << std::endl <<
    "--source ADDR \t\t- Source address for source-specific multicast" << std::endl <<
    "--interval SEC \t\t- Seconds between announcements" << std::endl <<
    "--no-pipeline \t\t- Only announce, do not start the media pipeline" << std::endl <<
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
    int noPipeline = false;
    int dumpConfig = false;

    enum { OPT_NAME = 256, OPT_GROUP, OPT_PORT, OPT_SOURCE, OPT_INTERVAL };

    const struct option long_options[] = {
        {"debug",       no_argument,        nullptr,     'd'},
        {"console",     no_argument,        nullptr,     'c'},
        {"config",      required_argument,  nullptr,     'f'},
        {"help",        no_argument,        nullptr,     'h'},
        {"version",     no_argument,        nullptr,     'v'},
        {"name",        required_argument,  nullptr,     OPT_NAME},
        {"group",       required_argument,  nullptr,     OPT_GROUP},
        {"port",        required_argument,  nullptr,     OPT_PORT},
        {"source",      required_argument,  nullptr,     OPT_SOURCE},
        {"interval",    required_argument,  nullptr,     OPT_INTERVAL},
        {"no-pipeline", no_argument,        &noPipeline, true},
        {"dump-config", no_argument,        &dumpConfig, true},
        {nullptr,       0,                  nullptr,     0} /* Sentinel */
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
        case OPT_NAME:
            opts.name = optarg;
            break;
        case OPT_GROUP:
            opts.group = optarg;
            break;
        case OPT_PORT: {
            uint16_t port;
            if (not cli::parse_number(optarg, "port", port)) {
                error = true;
                return true;
            }
            opts.port = port;
            break;
        }
        case OPT_SOURCE:
            opts.source = optarg;
            break;
        case OPT_INTERVAL: {
            unsigned interval;
            if (not cli::parse_number(optarg, "interval", interval) or interval == 0) {
                error = true;
                return true;
            }
            opts.interval = interval;
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

    opts.noPipeline = noPipeline;
    opts.dumpConfig = dumpConfig;

    if (consoleFlag)
        sapcastFlags |= libsapcast::SAPCAST_FLAG_CONSOLE_LOG;
    else
        sapcastFlags |= libsapcast::SAPCAST_FLAG_SYSLOG;

    if (debugFlag)
        sapcastFlags |= libsapcast::SAPCAST_FLAG_DEBUG;

    return false;
}

// Configuration file first, then command line
static SenderConfig
load(const Options& opts)
{
    SenderConfig cfg;
    auto node = cli::load_config(opts.configFile, "sender");
    cfg.announce.unserialize(node);
    cfg.stream.unserialize(node);
    cfg.pipeline.unserialize(node);

    auto& params = cfg.stream.params();
    if (opts.name)
        params.name = *opts.name;
    if (opts.group)
        params.group = *opts.group;
    if (opts.port)
        params.port = *opts.port;
    if (opts.source)
        params.source = *opts.source;
    if (opts.interval)
        cfg.announce.setIntervalSec(*opts.interval);
    return cfg;
}

static std::unique_ptr<PipelineProcess>
start_pipeline(const SenderConfig& cfg)
{
    auto pipeline = std::make_unique<PipelineProcess>(gst::senderArgs(cfg.stream, cfg.pipeline), cfg.pipeline);
    pipeline->start();
    return pipeline;
}

static void
reload(const Options& opts,
       SenderConfig& cfg,
       Announcer& announcer,
       std::unique_ptr<PipelineProcess>& pipeline)
{
    SAPCAST_LOG("Reloading configuration");
    SenderConfig next;
    try {
        next = load(opts);
    } catch (const std::exception& e) {
        SAPCAST_ERROR("Keeping current configuration: {}", e.what());
        return;
    }

    auto mediaChanged = next.stream.getParams() != cfg.stream.getParams()
                        or next.stream.getPattern() != cfg.stream.getPattern()
                        or next.stream.getBitrateKbps() != cfg.stream.getBitrateKbps();
    if (next.stream.getParams() != cfg.stream.getParams()) {
        try {
            auto desc = DescriptorBuilder::rebuild(announcer.descriptor(), next.stream.getParams());
            announcer.update(desc);
        } catch (const std::exception& e) {
            SAPCAST_ERROR("Unable to announce the new stream parameters: {}", e.what());
            return;
        }
    }
    if (mediaChanged and pipeline) {
        pipeline->stop();
        pipeline = start_pipeline(next);
    }
    if (next.announce.getInterval() != cfg.announce.getInterval())
        SAPCAST_WARNING("Announce schedule changes need a restart");
    cfg = std::move(next);
}

int
main(int argc, char* argv[])
{
    print_title();

    Options opts;
    bool error = false;
    if (parse_args(argc, argv, opts, error))
        return error ? 1 : 0;

    SenderConfig cfg;
    try {
        cfg = load(opts);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (opts.dumpConfig) {
        cli::dump_config(cfg.announce, cfg.stream, cfg.pipeline);
        return 0;
    }

    if (not libsapcast::init(static_cast<libsapcast::InitFlag>(sapcastFlags)))
        return 1;

    cli::install_signal_handlers(true);

    int ret = 0;
    try {
        auto address = cfg.stream.getOriginAddress();
        if (address.empty())
            address = ip_utils::getInterfaceAddr(cfg.announce.getInterface());
        auto origin = OriginIdentity::generate(address);
        auto descriptor = DescriptorBuilder::build(origin, cfg.stream.getParams());

        SAPCAST_LOG("Session '{}' on {}:{}, origin {}",
                    cfg.stream.getParams().name,
                    cfg.stream.getParams().effectiveGroup(),
                    cfg.stream.getParams().port,
                    origin.toString());

        std::unique_ptr<PipelineProcess> pipeline;
        if (not opts.noPipeline)
            pipeline = start_pipeline(cfg);

        // outlives the announcer, its callback runs on the executor thread
        std::atomic_bool fatal {false};
        auto announcer = std::make_shared<Announcer>(MulticastSocket::sender(cfg.announce.senderOptions()),
                                                     cfg.announce);
        announcer->onFatalError([&fatal](const ResourceFatalError& e) {
            SAPCAST_ERROR("Announcer stopped: {}", e.what());
            fatal = true;
        });
        announcer->start(descriptor);

        while (not cli::quitRequested and not fatal) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (cli::reloadRequested.exchange(0))
                reload(opts, cfg, *announcer, pipeline);
        }
        if (cli::quitRequested)
            SAPCAST_LOG("Caught signal {}, terminating...", strsignal(cli::quitRequested));

        announcer->stop();
        if (pipeline)
            pipeline->stop();
        ret = fatal ? 1 : 0;
    } catch (const std::exception& e) {
        SAPCAST_ERROR("{}", e.what());
        ret = 1;
    }

    libsapcast::fini();
    return ret;
}
