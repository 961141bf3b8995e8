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

#include "config.h"

#include <stdexcept>
#include <sstream>
#include <unordered_map>

#include "base/format.h"
#include "base/utility.h"
#include "base/logging.h"
#include "swarm/shader_anchor.h"

namespace {
bool IsAnchorChar(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}
} // namespace

namespace swarm
{

bool IsAnchorLine(const std::string& line, std::string* name)
{
    const auto& trimmed = base::TrimString(line);
    if (!base::StartsWith(trimmed, "// $"))
        return false;

    const auto& anchor = trimmed.substr(4);
    if (anchor.empty())
        return false;
    for (char c : anchor)
    {
        if (!IsAnchorChar(c))
            return false;
    }
    if (name)
        *name = anchor;
    return true;
}

std::vector<std::string> FindAnchors(const std::string& skeleton)
{
    std::vector<std::string> ret;
    std::stringstream ss(skeleton);
    std::string line;
    while (std::getline(ss, line))
    {
        std::string name;
        if (IsAnchorLine(line, &name))
            ret.push_back(std::move(name));
    }
    return ret;
}

std::string SubstituteAnchors(const std::string& skeleton,
                              const std::vector<AnchorSubstitution>& substitutions,
                              const std::string& source_name)
{
    std::unordered_map<std::string, const AnchorSubstitution*> table;
    for (const auto& sub : substitutions)
    {
        if (base::Contains(table, sub.anchor))
            throw std::runtime_error(base::FormatString("Duplicate substitution for anchor '%1' in '%2'.",
                                                        sub.anchor, source_name));
        table[sub.anchor] = &sub;
    }

    std::unordered_map<std::string, unsigned> seen;
    for (const auto& anchor : FindAnchors(skeleton))
    {
        if (++seen[anchor] > 1)
            throw std::runtime_error(base::FormatString("Duplicate anchor '%1' in '%2'.", anchor, source_name));
        if (!base::Contains(table, anchor))
            throw std::runtime_error(base::FormatString("Unresolved anchor '%1' in '%2'.", anchor, source_name));
    }
    for (const auto& sub : substitutions)
    {
        if (!base::Contains(seen, sub.anchor))
            throw std::runtime_error(base::FormatString("Missing anchor '%1' in '%2'.", sub.anchor, source_name));
    }

    std::string out;
    std::stringstream ss(skeleton);
    std::string line;
    while (std::getline(ss, line))
    {
        std::string name;
        if (IsAnchorLine(line, &name))
        {
            const auto* sub = table[name];
            out.append(sub->text);
            if (!sub->text.empty() && sub->text.back() != '\n')
                out.push_back('\n');
            continue;
        }
        out.append(line);
        out.push_back('\n');
    }
    VERBOSE("Substituted shader anchors. [source='%1', anchors=%2]", source_name, substitutions.size());
    return out;
}

} // namespace
