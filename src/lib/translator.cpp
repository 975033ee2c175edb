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

#include "translator.hpp"
#include "keyword_fallback.hpp"
#include "string_utils.hpp"

#include <boost/algorithm/string.hpp>

#include <array>

using namespace nlterm::language;

namespace
{
    const std::array<const char*, 13> starters{
        "create a file named",
        "create a folder named",
        "list all files",
        "show me the files",
        "delete the file",
        "copy the file",
        "move the file",
        "go to the directory",
        "show me system info",
        "find files named",
        "where am I",
        "clear the screen",
        "help me"};

    constexpr size_t max_suggestions = 5;
}

Translator::Translator()
    : _patterns(PatternTable::standard())
{
}

Interpretation Translator::interpret(const std::string& phrase) const
{
    const std::string lowered = nlterm::string::to_lower(nlterm::string::trim(phrase));

    if (auto m = _synthesizer.synthesize(lowered))
    {
        return {m->command_line, "AI interpreted multi-step command", Stage::MultiStep, m->rule->category};
    }

    if (auto m = _patterns.match(lowered))
    {
        const std::string explanation = "AI interpreted '" + phrase + "' as '" + m->command_line + "'";
        return {m->command_line, explanation, Stage::Pattern, m->rule->category};
    }

    if (auto command = interpret_keywords(lowered))
    {
        return {*command, "AI interpreted using keywords", Stage::Keyword, ""};
    }

    return {phrase, "No AI interpretation found, executing as-is", Stage::Passthrough, ""};
}

std::vector<std::string> Translator::suggest(const std::string& partial) const
{
    const std::string        lowered = nlterm::string::to_lower(partial);
    std::vector<std::string> result;
    for (const char* starter : starters)
    {
        const std::string s(starter);
        if (boost::algorithm::starts_with(s, lowered) || boost::algorithm::contains(s, lowered)) result.push_back(s);
        if (result.size() == max_suggestions) break;
    }
    return result;
}

const std::string& Translator::help_text()
{
    static const std::string text = boost::algorithm::trim_copy(std::string(R"(
AI-Powered Terminal - Natural Language Commands

You can use natural language to interact with the terminal. Here are some examples:

File Operations:
  "create a file named test.txt"
  "make a new folder called documents"
  "delete the file oldfile.txt"
  "copy file1.txt to backup/"
  "move document.pdf to archive/"
  "show me the contents of readme.txt"

Navigation:
  "list all files"
  "go to the documents folder"
  "where am I"
  "show me what's in this directory"

System Information:
  "show me system info"
  "list running processes"
  "check disk usage"
  "show memory usage"

Complex Operations:
  "create a folder called test and move file1.txt into it"
  "find all .txt files"
  "copy all .py files to backup/"
  "find and delete files named temp"

You can also use traditional terminal commands if preferred.
The AI will interpret your natural language and convert it to appropriate commands.
)"));
    return text;
}
