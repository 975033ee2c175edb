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

#include "keyword_fallback.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <initializer_list>
#include <vector>

namespace
{
    using Words = std::vector<std::string>;

    bool contains(const Words& words, const std::string& word)
    {
        return std::find(words.begin(), words.end(), word) != words.end();
    }

    bool contains_any(const Words& words, std::initializer_list<const char*> candidates)
    {
        return std::any_of(candidates.begin(), candidates.end(), [&](const char* c)
                           { return contains(words, c); });
    }

    // The word following the first occurrence of one of `markers`.
    std::optional<std::string> word_after(const Words& words, std::initializer_list<const char*> markers)
    {
        for (size_t i = 0; i + 1 < words.size(); ++i)
        {
            if (std::find(markers.begin(), markers.end(), words[i]) != markers.end()) return words[i + 1];
        }
        return std::nullopt;
    }
}

std::optional<std::string> nlterm::language::interpret_keywords(const std::string& phrase)
{
    const Words words = string::split_whitespace(phrase);

    const bool creates = contains_any(words, {"create", "make", "new"});

    if (creates && contains(words, "file"))
    {
        const auto name = word_after(words, {"file"});
        return name ? "touch " + *name : "touch newfile.txt";
    }

    if (creates && contains_any(words, {"folder", "directory", "dir"}))
    {
        const auto name = word_after(words, {"folder", "directory", "dir"});
        return name ? "mkdir " + *name : "mkdir newfolder";
    }

    if (contains_any(words, {"go", "navigate", "change"}) && contains_any(words, {"directory", "folder", "to"}))
    {
        if (const auto target = word_after(words, {"to"})) return "cd " + *target;
    }

    if (contains_any(words, {"list", "show"}) && contains_any(words, {"files", "contents"}))
    {
        return std::string("ls");
    }

    if (contains_any(words, {"delete", "remove", "rm"}))
    {
        for (const std::string& word : words)
        {
            if (!contains(Words{"delete", "remove", "rm", "file", "the"}, word)) return "rm " + word;
        }
    }

    return std::nullopt;
}
