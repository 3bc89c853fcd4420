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

#include "gst_pipeline.h"
#include "preferences.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace sapcast {
namespace gst {

std::vector<std::string>
senderArgs(const StreamPreference& stream, const PipelinePreference& pipeline)
{
    const auto& params = stream.getParams();
    return {
        pipeline.getProgram(),
        "-v",
        "videotestsrc", "is-live=true", fmt::format("pattern={}", stream.getPattern()),
        "!", "video/x-raw,framerate=30/1",
        "!", "x264enc", "tune=zerolatency", fmt::format("bitrate={}", stream.getBitrateKbps()),
        "speed-preset=ultrafast", "key-int-max=30", "rc-lookahead=0",
        "!", "rtph264pay", fmt::format("pt={}", params.payloadType), "config-interval=1",
        "!", "udpsink", fmt::format("host={}", params.effectiveGroup()), fmt::format("port={}", params.port),
        "auto-multicast=true", fmt::format("ttl-mc={}", params.ttl), "sync=false",
    };
}

std::vector<std::string>
playerArgs(const std::string& sdpPath, const PipelinePreference& pipeline)
{
    return {
        pipeline.getProgram(),
        "-v",
        "filesrc", fmt::format("location={}", sdpPath),
        "!", "sdpdemux", "name=demux",
        "demux.", "!", "rtpjitterbuffer",
        "!", "rtph264depay",
        "!", "h264parse",
        "!", "avdec_h264",
        "!", "videoconvert",
        "!", "autovideosink", "sync=false",
    };
}

std::string
toCommandLine(const std::vector<std::string>& args)
{
    return fmt::format("{}", fmt::join(args, " "));
}

} // namespace gst
} // namespace sapcast
