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

#include "pattern_table.hpp"
#include "string_utils.hpp"

#include <initializer_list>

using namespace nlterm::language;

namespace
{
    struct Category
    {
        const char*              name;
        std::vector<const char*> patterns;
        const char*              command;
    };

    std::vector<PatternRule> expand(std::initializer_list<Category> categories)
    {
        std::vector<PatternRule> rules;
        for (const Category& category : categories)
        {
            for (const char* pattern : category.patterns)
            {
                rules.emplace_back(category.name, pattern, category.command);
            }
        }
        return rules;
    }
}

PatternRule::PatternRule(std::string category_, const std::string& pattern_, std::string command_)
    : category(std::move(category_))
    , pattern(pattern_)
    , regex(pattern_, std::regex::ECMAScript | std::regex::icase)
    , command(std::move(command_))
{
}

PatternTable::PatternTable(std::vector<PatternRule> rules)
    : _rules(std::move(rules))
{
}

std::optional<PatternMatch> PatternTable::match(const std::string& phrase) const
{
    for (const PatternRule& rule : _rules)
    {
        std::smatch m;
        if (!std::regex_search(phrase, m, rule.regex)) continue;

        std::vector<std::string> groups;
        for (size_t i = 1; i < m.size(); ++i)
        {
            groups.push_back(m[i].str());
        }
        return PatternMatch{&rule, string::format_template(rule.command, groups)};
    }
    return std::nullopt;
}

const PatternTable& PatternTable::standard()
{
    // clang-format off
    static const PatternTable table(expand({
        {"create_file", {
            R"(create.*?file.*?(?:named|called)\s+(\S+))",
            R"(make.*?file.*?(\S+))",
            R"(touch.*?(\S+))",
            R"(new file.*?(\S+))"}, "touch {0}"},
        {"create_directory", {
            R"(create.*?(?:directory|folder|dir).*?(?:named|called)\s+(\S+))",
            R"(make.*?(?:directory|folder|dir).*?(\S+))",
            R"(mkdir.*?(\S+))",
            R"(new (?:directory|folder).*?(\S+))"}, "mkdir {0}"},
        {"list_files", {
            R"(list.*?files?)",
            R"(show.*?files?)",
            R"(what.*?files?.*?here)",
            R"(ls)",
            R"(dir)"}, "ls"},
        {"delete_file", {
            R"(delete.*?file.*?(\S+))",
            R"(remove.*?file.*?(\S+))",
            R"(rm.*?(\S+))",
            R"(del.*?(\S+))"}, "rm {0}"},
        {"copy_file", {
            R"(copy.*?(\S+).*?to.*?(\S+))",
            R"(cp.*?(\S+).*?(\S+))",
            R"(duplicate.*?(\S+).*?as.*?(\S+))"}, "cp {0} {1}"},
        {"move_file", {
            R"(move.*?(\S+).*?to.*?(\S+))",
            R"(mv.*?(\S+).*?(\S+))",
            R"(relocate.*?(\S+).*?to.*?(\S+))"}, "mv {0} {1}"},
        {"change_directory", {
            R"(go.*?to.*?(?:directory|folder).*?(\S+))",
            R"(change.*?(?:directory|folder).*?to.*?(\S+))",
            R"(cd.*?(\S+))",
            R"(navigate.*?to.*?(\S+))"}, "cd {0}"},
        {"show_content", {
            R"(show.*?content.*?(?:of|in).*?(\S+))",
            R"(display.*?(\S+))",
            R"(cat.*?(\S+))",
            R"(read.*?(\S+))",
            R"(view.*?(\S+))"}, "cat {0}"},
        {"find_files", {
            R"(find.*?files?.*?(?:named|called).*?(\S+))",
            R"(search.*?for.*?(\S+))",
            R"(locate.*?(\S+))"}, R"(find . -name "{0}")"},
        {"system_info", {
            R"(show.*?system.*?info)",
            R"(system.*?status)",
            R"(resource.*?usage)",
            R"(top)"}, "top"},
        {"list_processes", {
            R"(list.*?processes?)",
            R"(show.*?processes?)",
            R"(running.*?programs?)",
            R"(ps)"}, "ps"},
        {"current_directory", {
            R"(where.*?am.*?i)",
            R"(current.*?(?:directory|folder|location))",
            R"(pwd)",
            R"(show.*?(?:directory|folder))"}, "pwd"},
        {"disk_usage", {
            R"(disk.*?usage)",
            R"(disk.*?space)",
            R"(storage.*?info)",
            R"(df)"}, "df"},
        {"memory_usage", {
            R"(memory.*?usage)",
            R"(ram.*?usage)",
            R"(memory.*?info)",
            R"(free.*?memory)",
            R"(free)"}, "free"},
        {"clear_screen", {
            R"(clear.*?screen)",
            R"(clear.*?terminal)",
            R"(cls)",
            R"(clear)"}, "clear"},
        {"help", {
            R"(help)",
            R"(what.*?can.*?do)",
            R"(available.*?commands?)",
            R"(show.*?commands?)"}, "help"},
        {"echo", {
            R"re(say.*?"([^"]+)")re",
            R"re(echo.*?"([^"]+)")re",
            R"re(print.*?"([^"]+)")re",
            R"re(display.*?"([^"]+)")re"}, R"(echo "{0}")"},
    }));
    // clang-format on
    return table;
}
