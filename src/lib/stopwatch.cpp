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

#include "stopwatch.hpp"

#include <iomanip>
#include <sstream>

using namespace nlterm;
namespace chrono = std::chrono;

StopWatch::StopWatch()
    : _start(clock::now())
{
}

void StopWatch::stop()
{
    if (!_running) return;
    _stop    = clock::now();
    _running = false;
}

chrono::milliseconds StopWatch::elapsed() const
{
    const clock::time_point end = _running ? clock::now() : _stop;
    return chrono::duration_cast<chrono::milliseconds>(end - _start);
}

chrono::milliseconds StopWatch::remaining(chrono::milliseconds budget) const
{
    const chrono::milliseconds used = elapsed();
    return used >= budget ? chrono::milliseconds(0) : budget - used;
}

std::string StopWatch::format() const
{
    const auto ms = elapsed().count();

    std::ostringstream oss;
    oss << ms / 1000 << '.' << std::setw(3) << std::setfill('0') << ms % 1000 << 's';
    return oss.str();
}
