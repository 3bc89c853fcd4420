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

#include <string>
#include <vector>

namespace sapcast {

class StreamPreference;
class PipelinePreference;

namespace gst {

/**
 * Command line of the test pattern H.264/RTP multicast sender.
 */
std::vector<std::string> senderArgs(const StreamPreference& stream, const PipelinePreference& pipeline);

/**
 * Command line of a player for a session description file.
 */
std::vector<std::string> playerArgs(const std::string& sdpPath, const PipelinePreference& pipeline);

std::string toCommandLine(const std::vector<std::string>& args);

} // namespace gst
} // namespace sapcast
