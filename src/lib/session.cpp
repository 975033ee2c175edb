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

#include "session.hpp"
#include "command_error.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <unistd.h>

#include <cstdlib>
#include <mutex>
#include <stdexcept>

extern char** environ;

using namespace nlterm::console;

namespace
{
    // Guards every access to the process environment, sessions of a SessionStore run on several threads.
    std::mutex& environment_mutex()
    {
        static std::mutex mutex;
        return mutex;
    }
}

History::History(size_t capacity)
    : _capacity(capacity)
{
}

void History::add(std::string line)
{
    if (_capacity == 0) return;

    _entries.push_back(std::move(line));
    while (_entries.size() > _capacity)
    {
        _entries.pop_front();
    }
}

std::vector<std::string> History::last(size_t count) const
{
    const size_t start = _entries.size() > count ? _entries.size() - count : 0;
    return std::vector<std::string>(_entries.begin() + static_cast<long>(start), _entries.end());
}

Session::Session(const fs::path& start_directory, size_t history_capacity)
    : _history(history_capacity)
{
    std::unique_lock<std::mutex> lock(environment_mutex());
    for (char** env = environ; env && *env; ++env)
    {
        const std::string entry(*env);
        const size_t      eq = entry.find('=');
        if (eq != std::string::npos)
        {
            _environment[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    lock.unlock();

    fs::path start = start_directory.empty() ? fs::current_path() : fs::absolute(start_directory);
    start          = start.lexically_normal();
    if (!start.has_filename() && start != start.root_path()) start = start.parent_path();

    if (!fs::is_directory(start))
        throw std::runtime_error("Start directory does not exist: " + start.string());

    _working_directory = start;
}

fs::path Session::home() const
{
    std::string home = variable("HOME");
    if (home.empty())
    {
        std::lock_guard<std::mutex> lock(environment_mutex());
        const char*                 env = std::getenv("HOME");
        home                            = env ? env : "/";
    }
    return fs::path(home);
}

fs::path Session::resolve(const std::string& operand) const
{
    if (operand == "~") return home();
    if (boost::algorithm::starts_with(operand, "~/")) return home() / operand.substr(2);

    fs::path path(operand);
    if (path.is_absolute()) return path;
    return _working_directory / path;
}

const fs::path& Session::change_directory(const std::string& target)
{
    fs::path path = resolve(target).lexically_normal();
    if (!path.has_filename() && path != path.root_path()) path = path.parent_path();

    std::error_code ec;
    if (!fs::is_directory(path, ec))
    {
        if (ec == std::errc::permission_denied)
            throw command_error(ErrorKind::PermissionDenied, "Permission denied: " + path.string());
        throw command_error(ErrorKind::NotFound, "Directory not found: " + path.string());
    }

    if (::access(path.c_str(), X_OK) != 0)
        throw command_error(ErrorKind::PermissionDenied, "Permission denied: " + path.string());

    _working_directory = path;
    return _working_directory;
}

void Session::set_alias(const std::string& name, const std::string& value)
{
    _aliases[name] = value;
}

const std::string* Session::find_alias(const std::string& name) const
{
    auto it = _aliases.find(name);
    return it == _aliases.end() ? nullptr : &it->second;
}

void Session::set_variable(const std::string& name, const std::string& value)
{
    _environment[name] = value;
}

bool Session::export_variable(const std::string& name, const std::string& value)
{
    {
        std::lock_guard<std::mutex> lock(environment_mutex());
        if (::setenv(name.c_str(), value.c_str(), 1) != 0) return false;
    }
    set_variable(name, value);
    return true;
}

std::string Session::variable(const std::string& name, const std::string& fallback) const
{
    auto it = _environment.find(name);
    return it == _environment.end() ? fallback : it->second;
}
