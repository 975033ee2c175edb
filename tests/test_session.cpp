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

#include "command_error.hpp"
#include "outcome.hpp"
#include "session.hpp"

#include "test_harness.hpp"

using namespace nlterm::console;

TEST(history_is_bounded)
{
    History history(3);
    for (const char* line : {"a", "b", "c", "d", "e"})
        history.add(line);

    ASSERT_EQ(history.size(), 3u);
    ASSERT_EQ(history.last(10), (std::vector<std::string>{"c", "d", "e"}));
    ASSERT_EQ(history.last(1), (std::vector<std::string>{"e"}));
}

TEST(history_with_zero_capacity_stays_empty)
{
    History history(0);
    history.add("ls");
    ASSERT(history.empty());
}

TEST(session_starts_in_given_directory)
{
    TempDirectory dir;
    Session       session(dir.path(), 10);
    ASSERT_EQ(session.working_directory(), dir.path());
}

TEST(session_rejects_missing_start_directory)
{
    TempDirectory dir;
    bool          thrown = false;
    try
    {
        Session session(dir.path() / "missing", 10);
    }
    catch (const std::runtime_error&)
    {
        thrown = true;
    }
    ASSERT(thrown);
}

TEST(change_directory_normalizes)
{
    TempDirectory dir;
    fs::create_directories(dir.path() / "a" / "b");
    Session session(dir.path(), 10);

    ASSERT_EQ(session.change_directory("a/b/../b/"), dir.path() / "a" / "b");
    ASSERT_EQ(session.change_directory(".."), dir.path() / "a");
}

TEST(change_directory_to_missing_path_keeps_state)
{
    TempDirectory dir;
    Session       session(dir.path(), 10);

    bool thrown = false;
    try
    {
        session.change_directory("nope");
    }
    catch (const command_error& e)
    {
        thrown = e.get_kind() == ErrorKind::NotFound && std::string(e.what()) == "Directory not found: " + (dir.path() / "nope").string();
    }
    ASSERT(thrown);
    ASSERT_EQ(session.working_directory(), dir.path());
}

TEST(resolve_expands_home)
{
    TempDirectory dir;
    Session       session(dir.path(), 10);
    session.set_variable("HOME", "/home/tester");

    ASSERT_EQ(session.resolve("~"), fs::path("/home/tester"));
    ASSERT_EQ(session.resolve("~/docs"), fs::path("/home/tester/docs"));
    ASSERT_EQ(session.resolve("/etc"), fs::path("/etc"));
    ASSERT_EQ(session.resolve("x"), dir.path() / "x");
}

TEST(aliases_and_variables)
{
    TempDirectory dir;
    Session       session(dir.path(), 10);

    ASSERT(session.find_alias("ll") == nullptr);
    session.set_alias("ll", "ls -l");
    ASSERT(session.find_alias("ll") != nullptr);
    ASSERT_EQ(*session.find_alias("ll"), "ls -l");

    ASSERT_EQ(session.variable("NLTERM_TEST_UNSET", "fallback"), "fallback");
    session.set_variable("NLTERM_TEST_UNSET", "1");
    ASSERT_EQ(session.variable("NLTERM_TEST_UNSET"), "1");
}

TEST(outcome_append_joins_lines)
{
    Outcome result = Outcome::success("");
    result.append(Outcome::success("Created directory: a"));
    result.append(Outcome::failure(ErrorKind::NotFound, "Directory not found: b"));
    result.append(Outcome::success("Created directory: c"));

    ASSERT_EQ(result.text(), "Created directory: a\nDirectory not found: b\nCreated directory: c");
    ASSERT(!result.is_success());
    ASSERT(result.kind() == ErrorKind::NotFound);
}

TEST(exit_codes_follow_policy)
{
    const Outcome usage = Outcome::failure(ErrorKind::Usage, "Usage: kill <pid>");
    ASSERT_EQ(exit_code_for(usage, false), 0);
    ASSERT_EQ(exit_code_for(usage, true), 2);
    ASSERT_EQ(exit_code_for(Outcome::failure(ErrorKind::PermissionDenied, "x"), true), 126);
    ASSERT_EQ(exit_code_for(Outcome::failure(ErrorKind::NotFound, "x"), true), 1);
    ASSERT_EQ(exit_code_for(Outcome::success("ok"), true), 0);
}

int main()
{
    run_test_history_is_bounded();
    run_test_history_with_zero_capacity_stays_empty();
    run_test_session_starts_in_given_directory();
    run_test_session_rejects_missing_start_directory();
    run_test_change_directory_normalizes();
    run_test_change_directory_to_missing_path_keeps_state();
    run_test_resolve_expands_home();
    run_test_aliases_and_variables();
    run_test_outcome_append_joins_lines();
    run_test_exit_codes_follow_policy();
    return report_results();
}
