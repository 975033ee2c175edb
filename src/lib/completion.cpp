/*
Copyright (c) 2025, 2026 acrion innovations GmbH
Authors: Stefan Zipproth, s.zipproth@acrion.ch

This file is part of nlterm.

nlterm is offered under a commercial and under the AGPL license.
For commercial licensing, contact us at https://acrion.ch/sales. For AGPL licensing, see below.

AGPL licensing:

nlterm is free software: you can redistribute it and/or modify
it under the terms of the GNU Affero General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

nlterm is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU Affero General Public License for more details.

You should have received a copy of the GNU Affero General Public License
along with nlterm. If not, see <https://www.gnu.org/licenses/>.
*/

#include "completion.hpp"
#include "string_utils.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <array>
#include <system_error>

using namespace nlterm::console;

namespace
{
    // Common programs offered next to the builtins.
    const std::array<const char*, 7> external_commands{"python", "git", "npm", "pip", "node", "java", "gcc"};
}

Completer::Completer(std::vector<std::string> command_names, size_t limit)
    : _commands(std::move(command_names))
    , _limit(limit)
{
    _commands.insert(_commands.end(), external_commands.begin(), external_commands.end());
}

std::vector<std::string> Completer::complete(const Session& session, const std::string& text, const std::string& line) const
{
    const std::vector<std::string> parts         = nlterm::string::split_whitespace(line);
    const bool                     completes_cmd = parts.empty() || (parts.size() == 1 && !boost::algorithm::ends_with(line, " "));

    std::vector<std::string> candidates = completes_cmd ? complete_command(text) : complete_path(session, text);
    if (candidates.size() > _limit) candidates.resize(_limit);
    return candidates;
}

std::vector<std::string> Completer::complete_command(const std::string& text) const
{
    std::vector<std::string> result;
    for (const std::string& command : _commands)
    {
        if (boost::algorithm::starts_with(command, text)) result.push_back(command);
    }
    return result;
}

std::vector<std::string> Completer::complete_path(const Session& session, const std::string& text) const
{
    fs::path    directory;
    std::string prefix;

    if (boost::algorithm::starts_with(text, "/") || boost::algorithm::starts_with(text, "~"))
    {
        const fs::path expanded = session.resolve(text);
        directory               = expanded.parent_path();
        prefix                  = expanded.filename().string();
        if (directory.empty()) directory = session.home();
    }
    else
    {
        const size_t slash = text.rfind('/');
        directory          = session.working_directory();
        if (slash == std::string::npos)
        {
            prefix = text;
        }
        else
        {
            directory /= text.substr(0, slash);
            prefix = text.substr(slash + 1);
        }
    }

    std::vector<std::string> result;
    std::error_code          ec;
    if (!fs::is_directory(directory, ec)) return result;

    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
    {
        const std::string name = it->path().filename().string();
        if (!boost::algorithm::starts_with(name, prefix)) continue;

        std::error_code entry_ec;
        result.push_back(it->is_directory(entry_ec) ? name + "/" : name);
    }
    if (ec) return {};

    std::sort(result.begin(), result.end());
    return result;
}
