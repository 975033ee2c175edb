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

#include "outcome.hpp"

#include <utility>

using namespace nlterm::console;

Outcome::Outcome(State state, ErrorKind kind, std::string text)
    : _state(state)
    , _kind(kind)
    , _text(std::move(text))
    , _parts(_text.empty() ? 0 : 1)
{
}

Outcome Outcome::success(std::string text)
{
    return Outcome(State::Success, ErrorKind::Io, std::move(text));
}

Outcome Outcome::failure(ErrorKind kind, std::string text)
{
    return Outcome(State::Failure, kind, std::move(text));
}

Outcome Outcome::from(const command_error& error)
{
    return failure(error.get_kind(), error.what());
}

bool Outcome::is_success() const
{
    return _state == State::Success;
}

ErrorKind Outcome::kind() const
{
    return _kind;
}

const std::string& Outcome::text() const
{
    return _text;
}

void Outcome::append(const Outcome& other)
{
    if (_parts++ > 0) _text += '\n';
    _text += other._text;

    if (_state == State::Success && other._state == State::Failure)
    {
        _state = State::Failure;
        _kind  = other._kind;
    }
}

int nlterm::console::exit_code_for(const Outcome& outcome, const bool strict_exit_codes)
{
    if (outcome.is_success() || !strict_exit_codes) return 0;

    switch (outcome.kind())
    {
    case ErrorKind::Usage:
        return 2;
    case ErrorKind::PermissionDenied:
        return 126;
    case ErrorKind::NotFound:
    case ErrorKind::Timeout:
    case ErrorKind::Parse:
    case ErrorKind::Launch:
    case ErrorKind::Io:
        return 1;
    }
    return 1;
}
