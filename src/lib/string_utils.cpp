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

#include "string_utils.hpp"

#include <boost/algorithm/string.hpp>

#include <fnmatch.h>

#include <algorithm>
#include <cctype>

namespace nlterm
{
    namespace string
    {
        std::vector<Word> split_words(const std::string& line)
        {
            WordTokenizer     tok(line, ShellSeparator());
            std::vector<Word> words;
            for (const Word& word : tok)
            {
                words.push_back(word);
            }
            return words;
        }

        std::vector<std::string> texts(const std::vector<Word>& words)
        {
            std::vector<std::string> result;
            result.reserve(words.size());
            for (const Word& word : words)
            {
                result.push_back(word.text);
            }
            return result;
        }

        std::vector<std::string> split_whitespace(const std::string& str)
        {
            std::vector<std::string> parts;
            const std::string        trimmed = boost::algorithm::trim_copy(str);
            if (trimmed.empty()) return parts;

            boost::algorithm::split(parts, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
            return parts;
        }

        std::string to_lower(const std::string& str)
        {
            return boost::algorithm::to_lower_copy(str);
        }

        std::string trim(const std::string& str)
        {
            return boost::algorithm::trim_copy(str);
        }

        std::string format_template(const std::string& format, const std::vector<std::string>& args)
        {
            // Single pass over `format`, substituted text is never scanned again.
            std::string result;
            for (size_t pos = 0; pos < format.size();)
            {
                if (format[pos] == '{')
                {
                    const size_t close = format.find('}', pos + 1);
                    if (close != std::string::npos && close > pos + 1
                        && std::all_of(format.begin() + pos + 1, format.begin() + close, [](unsigned char c)
                                       { return std::isdigit(c); }))
                    {
                        const size_t index = std::stoul(format.substr(pos + 1, close - pos - 1));
                        if (index < args.size())
                        {
                            result += args[index];
                            pos = close + 1;
                            continue;
                        }
                    }
                }
                result += format[pos++];
            }
            return result;
        }

        bool matches_glob(const std::string& name, const std::string& pattern)
        {
            return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
        }

        bool is_valid_utf8(std::string_view s)
        {
            try
            {
                for (size_t pos = 0; pos < s.size();)
                {
                    utf8::read(s, pos);
                }
                return true;
            }
            catch (const std::invalid_argument&)
            {
                return false;
            }
        }

        std::optional<long long> parse_integer(const std::string& str)
        {
            if (str.empty()) return std::nullopt;

            try
            {
                size_t    pos   = 0;
                long long value = std::stoll(str, &pos);
                if (pos != str.length() || std::isspace(static_cast<unsigned char>(str[0])))
                    return std::nullopt;
                return value;
            }
            catch (const std::logic_error&)
            {
                return std::nullopt;
            }
        }
    }
}
