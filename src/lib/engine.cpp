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

#include "engine.hpp"

#include "builtin_registry.hpp"
#include "completion.hpp"
#include "external_executor.hpp"
#include "outcome.hpp"
#include "stopwatch.hpp"
#include "string_utils.hpp"
#include "system_info.hpp"

#include <algorithm>
#include <system_error>

using namespace nlterm;

namespace
{
    using string::Word;

    const std::string chain_operator = "&&";

    // Splits the words of a line at unquoted `&&` words.
    std::vector<std::vector<Word>> split_chain(const std::vector<Word>& words)
    {
        std::vector<std::vector<Word>> segments(1);
        for (const Word& word : words)
        {
            if (!word.quoted && word.text == chain_operator)
            {
                segments.emplace_back();
            }
            else
            {
                segments.back().push_back(word);
            }
        }

        if (segments.size() > 1)
        {
            for (const auto& segment : segments)
            {
                if (segment.empty()) throw string::parse_error("Empty command in '&&' chain");
            }
        }
        return segments;
    }

    // True if `pattern` holds a wildcard character that is not escaped by a backslash.
    bool has_wildcard(const std::string& pattern)
    {
        for (size_t i = 0; i < pattern.size(); ++i)
        {
            if (pattern[i] == '\\')
                ++i;
            else if (pattern[i] == '*' || pattern[i] == '?' || pattern[i] == '[')
                return true;
        }
        return false;
    }
}

class console::Engine::Impl
{
public:
    Impl(const Config& config, std::shared_ptr<platform::SystemInfo> system_info, Print print)
        : _config(config)
        , _print(print ? std::move(print) : Print([](const std::string&, bool) {}))
        , _session(config.start_directory, config.history_capacity)
        , _registry(config, std::move(system_info))
        , _executor(config.external_timeout, _print)
        , _completer(_registry.names(), config.completion_limit)
    {
        _print("Session started in " + _session.working_directory().string(), false);
    }

    CommandResult execute(const std::string& line)
    {
        if (string::trim(line).empty()) return {"", 0};

        _session.history().add(line);

        std::vector<std::vector<Word>> segments;
        try
        {
            segments = split_chain(string::split_words(line));
        }
        catch (const string::parse_error& error)
        {
            return {"Command parsing error: " + std::string(error.what()), 1};
        }

        CommandResult result;
        for (size_t i = 0; i < segments.size(); ++i)
        {
            CommandResult step = run(segments[i]);
            if (step.output == exit_sentinel) return step;

            if (i > 0) result.output += '\n';
            result.output += step.output;
            result.exit_code = step.exit_code;

            if (step.exit_code != 0) break;
        }
        return result;
    }

    std::string prompt() const
    {
        const std::string user = _session.variable("USER", _session.variable("USERNAME", "user"));
        const std::string host = _session.variable("HOSTNAME", _session.variable("COMPUTERNAME", "localhost"));

        const fs::path&   wd  = _session.working_directory();
        const std::string dir = wd == wd.root_path() ? "/" : wd.filename().string();
        return user + "@" + host + ":" + dir + "$ ";
    }

    Config           _config;
    Print            _print;
    Session          _session;
    BuiltinRegistry  _registry;
    ExternalExecutor _executor;
    Completer        _completer;

private:
    CommandResult run(std::vector<Word> words)
    {
        if (words.empty()) return {"", 0};

        if (const std::string* alias = _session.find_alias(words[0].text))
        {
            std::vector<Word> replacement;
            try
            {
                replacement = string::split_words(*alias);
            }
            catch (const string::parse_error& error)
            {
                return {"Command parsing error: " + std::string(error.what()), 1};
            }
            replacement.insert(replacement.end(), words.begin() + 1, words.end());
            words = std::move(replacement);
            if (words.empty()) return {"", 0};
        }

        const std::string        name = words[0].text;
        std::vector<std::string> args;
        for (auto it = words.begin() + 1; it != words.end(); ++it)
        {
            expand(*it, args);
        }

        if (const auto builtin = _registry.find(name))
        {
            try
            {
                const Outcome outcome = _registry.invoke(*builtin, _session, args);
                return {outcome.text(), exit_code_for(outcome, _config.strict_exit_codes)};
            }
            catch (const std::exception& ex)
            {
                _print("Builtin '" + name + "' failed: " + ex.what(), false);
                return {"Error executing " + name + ": " + ex.what(), 1};
            }
        }

        return _executor.run(name, args, _session.working_directory(), _session.environment());
    }

    // Appends `word` to `args`, replaced by the sorted matching entries if its last path
    // component holds an unquoted wildcard. Without any match the word is kept as it is.
    void expand(const Word& word, std::vector<std::string>& args) const
    {
        // '/' is never escaped, so text and pattern split at corresponding positions.
        const size_t      slash         = word.text.rfind('/');
        const size_t      pattern_slash = word.pattern.rfind('/');
        const std::string dir           = slash == std::string::npos ? "" : word.text.substr(0, slash + 1);
        const std::string dir_pattern   = pattern_slash == std::string::npos ? "" : word.pattern.substr(0, pattern_slash + 1);
        const std::string pattern       = pattern_slash == std::string::npos ? word.pattern : word.pattern.substr(pattern_slash + 1);

        if (!word.glob || !has_wildcard(pattern) || has_wildcard(dir_pattern))
        {
            args.push_back(word.text);
            return;
        }

        const fs::path           directory = _session.resolve(dir.empty() ? "." : dir);
        std::vector<std::string> matches;
        std::error_code          ec;
        for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
        {
            const std::string name = it->path().filename().string();
            if (name[0] == '.' && pattern[0] != '.') continue;
            if (string::matches_glob(name, pattern)) matches.push_back(dir + name);
        }

        if (ec || matches.empty())
        {
            args.push_back(word.text);
            return;
        }

        std::sort(matches.begin(), matches.end());
        args.insert(args.end(), matches.begin(), matches.end());
    }
};

console::Engine::Engine(const Config& config, std::shared_ptr<platform::SystemInfo> system_info, Print print)
    : _pImpl(new Impl(config, std::move(system_info), std::move(print)))
{
}

console::Engine::~Engine()
{
    delete _pImpl;
}

console::CommandResult console::Engine::execute(const std::string& line)
{
    StopWatch           watch;
    const CommandResult result = _pImpl->execute(line);
    watch.stop();
    _pImpl->_print("'" + line + "' finished with exit code " + std::to_string(result.exit_code) + " in " + watch.format(), false);
    return result;
}

std::string console::Engine::prompt() const
{
    return _pImpl->prompt();
}

std::vector<std::string> console::Engine::history(size_t count) const
{
    return _pImpl->_session.history().last(count);
}

std::vector<std::string> console::Engine::complete(const std::string& text, const std::string& line) const
{
    return _pImpl->_completer.complete(_pImpl->_session, text, line);
}

const console::Session& console::Engine::session() const
{
    return _pImpl->_session;
}

console::Session& console::Engine::session()
{
    return _pImpl->_session;
}

const console::Config& console::Engine::config() const
{
    return _pImpl->_config;
}
