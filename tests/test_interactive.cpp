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

#include "test_harness.hpp"

#include <sstream>

using namespace nlterm::console;

namespace
{
    struct Run
    {
        std::string output;
        std::string diagnostics;
    };

    Run run_lines(const TempDirectory& dir, InputMode mode, const std::string& input)
    {
        Config config;
        config.start_directory = dir.path();
        config.history_file    = dir.path() / ".terminal_history";

        Run  run;
        auto state  = std::make_shared<ReplState>();
        state->mode = mode;

        Interactive interactive(config, state, [&run](const std::string& message, bool important)
                                {
                                    if (important) run.diagnostics += message + "\n"; });

        std::istringstream in(input);
        std::ostringstream out;
        interactive.run(in, out);
        run.output = out.str();
        return run;
    }
}

TEST(cli_runs_until_exit)
{
    TempDirectory dir;
    const Run     run = run_lines(dir, InputMode::Shell, "echo first\n\nexit\necho never\n");

    ASSERT_CONTAINS(run.output, "Natural Language Terminal 1.0");
    ASSERT_CONTAINS(run.output, "first\n");
    ASSERT(run.output.find("never") == std::string::npos);
    ASSERT(run.output.find("Goodbye!") == std::string::npos);
}

TEST(end_of_input_says_goodbye)
{
    TempDirectory dir;
    const Run     run = run_lines(dir, InputMode::Shell, "pwd\n");

    ASSERT_CONTAINS(run.output, dir.path().string());
    ASSERT_CONTAINS(run.output, "\nGoodbye!\n");
}

TEST(cli_does_not_know_toggle)
{
    TempDirectory dir;
    const Run     run = run_lines(dir, InputMode::Shell, "toggle ai\n");

    ASSERT_CONTAINS(run.output, "Command not found: toggle");
}

TEST(ai_mode_reports_interpretation)
{
    TempDirectory dir;
    const Run     run = run_lines(dir, InputMode::NaturalLanguage, "create a file named notes.txt\n");

    ASSERT_CONTAINS(run.output, "AI-Powered Terminal 1.0");
    ASSERT_CONTAINS(run.output, "AI ");
    ASSERT_CONTAINS(run.output, "✓ AI interpreted 'create a file named notes.txt' as 'touch notes.txt'");
    ASSERT_CONTAINS(run.output, "Touched: notes.txt");
    ASSERT(fs::exists(dir.path() / "notes.txt"));
}

TEST(toggle_switches_interpretation)
{
    TempDirectory dir;
    const Run     run = run_lines(dir, InputMode::NaturalLanguage, "toggle ai\nlist all files\ntoggle ai\nquit\n");

    ASSERT_CONTAINS(run.output, "AI interpretation disabled");
    ASSERT_CONTAINS(run.output, "Command not found: list");
    ASSERT_CONTAINS(run.output, "AI interpretation enabled");
}

TEST(ai_help)
{
    TempDirectory dir;
    const Run     run = run_lines(dir, InputMode::NaturalLanguage, "AI help\n");

    ASSERT_CONTAINS(run.output, "copy all .py files to backup/");
}

TEST(history_is_persisted)
{
    TempDirectory dir;
    run_lines(dir, InputMode::Shell, "echo one\necho two\n");

    const Run run = run_lines(dir, InputMode::Shell, "history\n");
    ASSERT_CONTAINS(run.output, "  1  echo one");
    ASSERT_CONTAINS(run.output, "  2  echo two");
    ASSERT_CONTAINS(run.output, "  3  history");
}

int main()
{
    run_test_cli_runs_until_exit();
    run_test_end_of_input_says_goodbye();
    run_test_cli_does_not_know_toggle();
    run_test_ai_mode_reports_interpretation();
    run_test_toggle_switches_interpretation();
    run_test_ai_help();
    run_test_history_is_persisted();
    return report_results();
}
