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

#include "interactive.hpp"
#include "natural_terminal.hpp"
#include "string_utils.hpp"

#include <boost/algorithm/string.hpp>

#include <fstream>
#include <iostream>

using namespace nlterm;

class console::Interactive::Impl
{
public:
    Impl(const Config& config, std::shared_ptr<ReplState> state, Print print)
        : _config(config)
        , _state(std::move(state))
        , _print(print ? std::move(print) : Print([](const std::string&, bool) {}))
        , _terminal(config, nullptr, _print)
        , _ai_interface(_state->mode == InputMode::NaturalLanguage)
    {
    }

    void load_history() const
    {
        if (!_config.persist_history || _config.history_file.empty()) return;

        std::ifstream stream(_config.history_file);
        if (stream.fail())
        {
            _print("No history file " + _config.history_file.string(), false);
            return;
        }

        History& history = _terminal.engine().session().history();
        for (std::string line; std::getline(stream, line);)
        {
            if (!string::trim(line).empty()) history.add(line);
        }
        _print("Loaded " + std::to_string(history.size()) + " history entries from " + _config.history_file.string(), false);
    }

    void save_history() const
    {
        if (!_config.persist_history || _config.history_file.empty()) return;

        std::ofstream stream(_config.history_file, std::ios::trunc);
        for (const std::string& line : _terminal.engine().history(_config.history_capacity))
        {
            stream << line << '\n';
        }
        if (stream.fail()) _print("Could not write history file " + _config.history_file.string(), true);
    }

    void print_banner(std::ostream& out) const
    {
        if (_ai_interface)
        {
            out << "AI-Powered Terminal " << get_version() << std::endl;
            out << "Type natural language commands or traditional terminal commands" << std::endl;
            out << "Type 'help' for examples, 'toggle ai' to switch modes, 'exit' to quit" << std::endl;
        }
        else
        {
            out << "Natural Language Terminal " << get_version() << " - Type 'help' for available commands" << std::endl;
            out << "Use 'exit' or 'quit' to exit" << std::endl;
        }
        out << std::endl;
    }

    // Handles one input line, returns false if the session ends.
    bool process(const std::string& line, std::ostream& out) const
    {
        const std::string lowered = boost::algorithm::to_lower_copy(line);

        if (_ai_interface)
        {
            if (lowered == "toggle ai")
            {
                const bool enable = _state->mode != InputMode::NaturalLanguage;
                _state->mode      = enable ? InputMode::NaturalLanguage : InputMode::Shell;
                out << "AI interpretation " << (enable ? "enabled" : "disabled") << std::endl;
                return true;
            }
            if (lowered == "exit" || lowered == "quit") return false;
            if (lowered == "ai help")
            {
                out << language::Translator::help_text() << std::endl;
                return true;
            }
        }

        CommandResult result;
        if (_state->mode == InputMode::NaturalLanguage)
        {
            language::NaturalResult natural = _terminal.execute_natural_language(line);
            if (!natural.interpretation.is_passthrough())
            {
                out << "✓ " << natural.interpretation.explanation << std::endl;
            }
            result = std::move(natural.result);
        }
        else
        {
            result = _terminal.engine().execute(line);
        }

        if (result.output == exit_sentinel) return false;
        if (!result.output.empty()) out << result.output << std::endl;
        return true;
    }

    Config                            _config;
    std::shared_ptr<ReplState>        _state;
    Print                             _print;
    mutable language::NaturalTerminal _terminal;
    const bool                        _ai_interface;

    Impl(const Impl&)            = delete;
    Impl& operator=(const Impl&) = delete;
};

console::Interactive::Interactive(const Config& config, std::shared_ptr<ReplState> state, Print print)
    : _pImpl(new Impl(config, std::move(state), std::move(print)))
{
    _pImpl->load_history();
}

console::Interactive::~Interactive()
{
    delete _pImpl;
}

void console::Interactive::run(std::istream& in, std::ostream& out) const
{
    _pImpl->print_banner(out);

    for (;;)
    {
        std::string prompt = _pImpl->_terminal.engine().prompt();
        if (_pImpl->_state->mode == InputMode::NaturalLanguage) prompt = "AI " + prompt;
        out << prompt << std::flush;

        std::string line;
        if (!std::getline(in, line))
        {
            out << std::endl
                << "Goodbye!" << std::endl;
            break;
        }

        line = string::trim(line);
        if (line.empty()) continue;

        try
        {
            if (!_pImpl->process(line, out)) break;
        }
        catch (const std::exception& ex)
        {
            _pImpl->_print(ex.what(), true);
        }
    }

    _pImpl->save_history();
}

language::NaturalTerminal& console::Interactive::terminal() const
{
    return _pImpl->_terminal;
}

std::string console::Interactive::get_version()
{
    return "1.0";
}
