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

#pragma once

#include <nlterm_export.h>

#include <boost/tokenizer.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace nlterm
{
    namespace string
    {
        class parse_error : public std::runtime_error
        {
        public:
            explicit parse_error(const std::string& what)
                : std::runtime_error(what)
            {
            }
        };

        // One shell word. `quoted` is set if any part of it was quoted or escaped,
        // `glob` if it contains a wildcard character outside of quotes. `pattern` is the
        // word as an fnmatch pattern, wildcard characters from quoted parts are escaped.
        struct Word
        {
            std::string text;
            std::string pattern;
            bool        quoted{false};
            bool        glob{false};
        };

        // TokenizerFunction for boost::tokenizer that splits a line into shell words
        // following POSIX shlex rules: '...' is literal, "..." honours \" and \\,
        // a backslash outside quotes escapes the next character and adjacent
        // quoted and unquoted parts form a single word.
        class ShellSeparator
        {
        public:
            void reset() {}

            template <typename InputIterator, typename Token>
            bool operator()(InputIterator& next, InputIterator end, Token& tok)
            {
                tok = Token();

                while (next != end && is_blank(*next))
                    ++next;

                if (next == end) return false;

                enum class Quote
                {
                    None,
                    Single,
                    Double
                } quote = Quote::None;

                while (next != end)
                {
                    const char c = *next;

                    if (quote == Quote::Single)
                    {
                        if (c == '\'')
                            quote = Quote::None;
                        else
                            append_literal(tok, c);
                    }
                    else if (quote == Quote::Double)
                    {
                        if (c == '"')
                        {
                            quote = Quote::None;
                        }
                        else if (c == '\\')
                        {
                            if (++next == end) throw parse_error("No escaped character");
                            if (*next != '"' && *next != '\\') append_literal(tok, '\\');
                            append_literal(tok, *next);
                        }
                        else
                        {
                            append_literal(tok, c);
                        }
                    }
                    else if (is_blank(c))
                    {
                        break;
                    }
                    else if (c == '\'')
                    {
                        quote      = Quote::Single;
                        tok.quoted = true;
                    }
                    else if (c == '"')
                    {
                        quote      = Quote::Double;
                        tok.quoted = true;
                    }
                    else if (c == '\\')
                    {
                        if (++next == end) throw parse_error("No escaped character");
                        append_literal(tok, *next);
                        tok.quoted = true;
                    }
                    else
                    {
                        if (c == '*' || c == '?' || c == '[') tok.glob = true;
                        tok.text += c;
                        tok.pattern += c;
                    }
                    ++next;
                }

                if (quote != Quote::None) throw parse_error("No closing quotation");

                return true;
            }

        private:
            template <typename Token>
            static void append_literal(Token& tok, char c)
            {
                if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') tok.pattern += '\\';
                tok.text += c;
                tok.pattern += c;
            }

            static bool is_blank(char c)
            {
                return c == ' ' || c == '\t' || c == '\n' || c == '\r';
            }
        };

        using WordTokenizer = boost::tokenizer<ShellSeparator, std::string::const_iterator, Word>;

        // Splits `line` into shell words, throws parse_error on unbalanced quotes or a trailing backslash.
        std::vector<Word> NLTERM_EXPORT split_words(const std::string& line);
        std::vector<std::string> NLTERM_EXPORT texts(const std::vector<Word>& words);

        std::vector<std::string> NLTERM_EXPORT split_whitespace(const std::string& str);
        std::string NLTERM_EXPORT              to_lower(const std::string& str);
        std::string NLTERM_EXPORT              trim(const std::string& str);

        // Replaces the positional placeholders {0}, {1}, ... in `format` by `args`.
        std::string NLTERM_EXPORT format_template(const std::string& format, const std::vector<std::string>& args);

        // Shell glob match (fnmatch semantics, not regex).
        bool NLTERM_EXPORT matches_glob(const std::string& name, const std::string& pattern);

        bool NLTERM_EXPORT is_valid_utf8(std::string_view s);

        // Parses a complete decimal integer, nothing else may follow the digits.
        std::optional<long long> NLTERM_EXPORT parse_integer(const std::string& str);

        namespace utf8
        {
            inline char32_t read(std::string_view s, size_t& pos)
            {
                if (pos >= s.size())
                    throw std::invalid_argument("Truncated UTF-8");

                unsigned char c = s[pos++];
                if (c < 0x80) return c;

                char32_t cp;
                size_t   extra;
                if ((c & 0xE0) == 0xC0)
                {
                    cp    = c & 0x1F;
                    extra = 1;
                }
                else if ((c & 0xF0) == 0xE0)
                {
                    cp    = c & 0x0F;
                    extra = 2;
                }
                else if ((c & 0xF8) == 0xF0)
                {
                    cp    = c & 0x07;
                    extra = 3;
                }
                else
                    throw std::invalid_argument("Invalid UTF-8 sequence");

                for (size_t j = 0; j < extra; ++j)
                {
                    if (pos >= s.size())
                        throw std::invalid_argument("Truncated UTF-8");
                    unsigned char next = s[pos++];
                    if ((next & 0xC0) != 0x80)
                        throw std::invalid_argument("Invalid UTF-8 continuation byte");
                    cp = (cp << 6) | (next & 0x3F);
                }
                return cp;
            }
        }

        template <typename T>
        static std::basic_string<T> concatenate(const std::vector<std::basic_string<T>>& list, const std::basic_string<T>& separator)
        {
            std::basic_string<T> connected;
            for (const std::basic_string<T>& t : list)
            {
                if (!connected.empty()) connected += separator;
                connected += t;
            }
            return connected;
        }
    }
}
