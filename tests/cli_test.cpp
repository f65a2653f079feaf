#include "flowforge/cli/commands.hpp"

#include "test_utils.hpp"

#include <cstdio>
#include <string>

#include "gtest/gtest.h"

using namespace flowforge;

namespace {

constexpr std::string_view kShellWorkflow = R"(
name = "shell_chain"

[[tasks]]
name = "hello"
command = "echo hello"

[[tasks]]
name = "greet"
command = "test \"$FLOWFORGE_PARAM_WHO\" = world"
dependencies = ["hello"]
)";

constexpr std::string_view kCyclicWorkflow = R"(
name = "loop"

[[tasks]]
name = "a"
command = "true"
dependencies = ["b"]

[[tasks]]
name = "b"
command = "true"
dependencies = ["a"]
)";

// Removes the temp file when the test ends.
class TempFile {
public:
  explicit TempFile(std::string_view contents)
      : path_(test::write_temp_file(contents, "flowforge_cli_")) {}
  ~TempFile() { std::remove(path_.c_str()); }
  TempFile(const TempFile &) = delete;
  auto operator=(const TempFile &) -> TempFile & = delete;

  [[nodiscard]] auto path() const -> const std::string & { return path_; }

private:
  std::string path_;
};

} // namespace

TEST(CliParamTest, SplitsOnFirstEquals) {
  auto kv = cli::parse_param("date=2024-01-01");
  ASSERT_TRUE(kv);
  EXPECT_EQ(kv->first, "date");
  EXPECT_EQ(kv->second, "2024-01-01");

  auto nested = cli::parse_param("expr=a=b");
  ASSERT_TRUE(nested);
  EXPECT_EQ(nested->first, "expr");
  EXPECT_EQ(nested->second, "a=b");

  auto empty_value = cli::parse_param("flag=");
  ASSERT_TRUE(empty_value);
  EXPECT_EQ(empty_value->second, "");
}

TEST(CliParamTest, RejectsMissingKeyOrSeparator) {
  auto no_eq = cli::parse_param("date");
  ASSERT_FALSE(no_eq);
  EXPECT_EQ(no_eq.error(), Error::InvalidArgument);
  EXPECT_FALSE(cli::parse_param("=value"));
}

TEST(CliValidateTest, ValidWorkflowExitsZero) {
  TempFile file(kShellWorkflow);
  testing::internal::CaptureStdout();
  auto code = cli::cmd_validate({.file = file.path()});
  auto out = testing::internal::GetCapturedStdout();
  EXPECT_EQ(code, 0);
  EXPECT_NE(out.find("Valid: shell_chain (2 task(s), 1 edge(s))"),
            std::string::npos)
      << out;
}

TEST(CliValidateTest, CyclicWorkflowExitsOneWithJsonError) {
  TempFile file(kCyclicWorkflow);
  testing::internal::CaptureStdout();
  auto code = cli::cmd_validate({.file = file.path(), .json = true});
  auto out = testing::internal::GetCapturedStdout();
  EXPECT_EQ(code, 1);
  EXPECT_NE(out.find("\"valid\":false"), std::string::npos) << out;
  EXPECT_NE(out.find("cycle detected"), std::string::npos) << out;
}

TEST(CliValidateTest, ValidWorkflowJsonListsOrderWithoutError) {
  TempFile file(kShellWorkflow);
  testing::internal::CaptureStdout();
  auto code = cli::cmd_validate({.file = file.path(), .json = true});
  auto out = testing::internal::GetCapturedStdout();
  EXPECT_EQ(code, 0);
  EXPECT_NE(out.find("\"valid\":true"), std::string::npos) << out;
  EXPECT_NE(out.find("\"workflow\":\"shell_chain\""), std::string::npos)
      << out;
  EXPECT_NE(out.find("\"order\":["), std::string::npos) << out;
  EXPECT_EQ(out.find("\"error\""), std::string::npos) << out;
}

TEST(CliValidateTest, MissingFileExitsOne) {
  EXPECT_EQ(cli::cmd_validate({.file = "/nonexistent/workflow.toml"}), 1);
}

TEST(CliRunTest, ShellWorkflowSucceedsWithParams) {
  TempFile file(kShellWorkflow);
  testing::internal::CaptureStdout();
  auto code = cli::cmd_run({.file = file.path(),
                            .params = {"who=world"},
                            .json = true,
                            .timeout_sec = 30});
  auto out = testing::internal::GetCapturedStdout();
  EXPECT_EQ(code, 0) << out;
  EXPECT_NE(out.find("\"status\": \"succeeded\""), std::string::npos) << out;
  EXPECT_NE(out.find("\"result\": \"hello\""), std::string::npos) << out;
}

TEST(CliRunTest, FailingTaskExitsOne) {
  TempFile file(kShellWorkflow);
  testing::internal::CaptureStdout();
  auto code = cli::cmd_run({.file = file.path(),
                            .params = {"who=nobody"},
                            .timeout_sec = 30});
  auto out = testing::internal::GetCapturedStdout();
  EXPECT_EQ(code, 1) << out;
}

TEST(CliRunTest, BadParamExitsOne) {
  TempFile file(kShellWorkflow);
  EXPECT_EQ(cli::cmd_run({.file = file.path(), .params = {"noequals"}}), 1);
}
