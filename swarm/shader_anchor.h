// Copyright (C) 2020-2024 Sami Väisänen
// Copyright (C) 2020-2024 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include "config.h"

#include <string>
#include <vector>

namespace swarm
{
    // A block of text to be inserted at the anchor with the given name.
    struct AnchorSubstitution {
        std::string anchor;
        std::string text;
    };

    // Check whether the line is an anchor line, i.e. after trimming
    // the white space the line reads "// $NAME" where NAME consists of
    // upper case letters, digits and underscores. If it is an anchor
    // the anchor name is returned in name.
    bool IsAnchorLine(const std::string& line, std::string* name = nullptr);

    // Find the names of all the anchors in the skeleton source in the
    // order in which they appear.
    std::vector<std::string> FindAnchors(const std::string& skeleton);

    // Replace every anchor line in the skeleton with the text of the
    // matching substitution. Every anchor must appear exactly once in the
    // skeleton and every anchor must have exactly one substitution.
    // The inserted text is not scanned for anchors again.
    // Any violation throws std::runtime_error naming the source and
    // the offending anchor.
    std::string SubstituteAnchors(const std::string& skeleton,
                                  const std::vector<AnchorSubstitution>& substitutions,
                                  const std::string& source_name);

} // namespace
