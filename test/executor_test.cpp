#include <gtest/gtest.h>
#include <gmock/gmock-matchers.h>
#include <runbox/languages.h>
#include "executor.h"
#include "utils.h"

using ::testing::ElementsAre;
using ::testing::SizeIs;
using ::testing::HasSubstr;

class ExecutorTest : public SandboxRootTest {
 protected:
  ExecutionOutcome Run(const std::string& language, const std::string& code,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5),
                       size_t max_output = 1024) {
    const LanguageProfile& profile = *registry.Resolve(language);
    auto workspace = Stage(code, profile, sandbox_root);
    EXPECT_TRUE(workspace);
    if (!workspace) return {};
    ExecutionError error = ExecutionError::NONE;
    std::string message;
    auto handle = Acquire(engine, *workspace, profile, 512L << 20, false, error, message);
    EXPECT_TRUE(handle) << message;
    if (!handle) return {};
    container_id = handle->Id();
    ExecutionOutcome outcome = RunInContainer(engine, *handle, profile, timeout, max_output);
    released_after_run = handle->Released();
    return outcome;
  }

  FakeEngine engine;
  LanguageRegistry registry = LanguageRegistry::Default();
  std::string container_id;
  bool released_after_run = false;
};

TEST_F(ExecutorTest, Completed) {
  ExecutionOutcome outcome = Run("python", "hi\n");
  EXPECT_EQ(outcome.completion_kind, CompletionKind::COMPLETED);
  EXPECT_EQ(outcome.stdout_text, "hi\n");
  EXPECT_EQ(outcome.stderr_text, "");
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_FALSE(outcome.truncated);
  EXPECT_FALSE(released_after_run);
  EXPECT_THAT(engine.Commands(), ElementsAre(ElementsAre("python", "main.py")));
  EXPECT_EQ(engine.scrubbed, 1);
}

TEST_F(ExecutorTest, ScrubCommand) {
  const auto& command = ScrubCommand();
  ASSERT_THAT(command, SizeIs(3));
  EXPECT_EQ(command[0], "sh");
  EXPECT_THAT(command[2], HasSubstr("kill -9 -1"));
  EXPECT_THAT(command[2], HasSubstr("chmod -R a+rwX /app"));
}

TEST_F(ExecutorTest, ScrubFailureIsNotFatal) {
  // the program ran; only the scrub afterwards fails
  engine.script = [this](const ContainerSpec&, const std::vector<std::string>&) {
    engine.fail_exec_create = true;
    FakeEngine::Behavior ret;
    ret.out = "ok\n";
    return ret;
  };
  ExecutionOutcome outcome = Run("python", "print('ok')");
  EXPECT_EQ(outcome.completion_kind, CompletionKind::COMPLETED);
  EXPECT_EQ(outcome.stdout_text, "ok\n");
  EXPECT_EQ(engine.scrubbed, 0);
}

TEST_F(ExecutorTest, NonZeroExitIsCompleted) {
  engine.script = [](const ContainerSpec&, const std::vector<std::string>&) {
    FakeEngine::Behavior ret;
    ret.out = "before\n";
    ret.err = "Traceback (most recent call last):\nZeroDivisionError\n";
    ret.exit_code = 1;
    return ret;
  };
  ExecutionOutcome outcome = Run("python", "print('before'); 1/0");
  EXPECT_EQ(outcome.completion_kind, CompletionKind::COMPLETED);
  EXPECT_EQ(outcome.exit_code, 1);
  EXPECT_EQ(outcome.stdout_text, "before\n");
  EXPECT_EQ(outcome.stderr_text, "Traceback (most recent call last):\nZeroDivisionError\n");
}

TEST_F(ExecutorTest, CompileThenRun) {
  engine.script = [](const ContainerSpec&, const std::vector<std::string>& command) {
    FakeEngine::Behavior ret;
    if (command[0] == "./main") ret.out = "Hello from C\n";
    return ret;
  };
  ExecutionOutcome outcome = Run("c", "int main() {}");
  EXPECT_EQ(outcome.completion_kind, CompletionKind::COMPLETED);
  EXPECT_EQ(outcome.stdout_text, "Hello from C\n");
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_THAT(engine.Commands(), ElementsAre(
      ElementsAre("gcc", "-o", "main", "main.c"), ElementsAre("./main")));
}

TEST_F(ExecutorTest, CompileFailureSkipsRun) {
  engine.script = [](const ContainerSpec&, const std::vector<std::string>& command) {
    FakeEngine::Behavior ret;
    if (command[0] == "javac") {
      ret.err = "Main.java:1: error: ';' expected\n";
      ret.exit_code = 1;
    } else {
      ret.out = "should not run\n";
    }
    return ret;
  };
  ExecutionOutcome outcome = Run("java", "class Main {");
  EXPECT_EQ(outcome.completion_kind, CompletionKind::COMPLETED);
  EXPECT_EQ(outcome.exit_code, 1);
  EXPECT_EQ(outcome.stdout_text, "");
  EXPECT_EQ(outcome.stderr_text, "Main.java:1: error: ';' expected\n");
  EXPECT_THAT(engine.Commands(), SizeIs(1));
  EXPECT_EQ(engine.scrubbed, 1);
}

TEST_F(ExecutorTest, Timeout) {
  engine.script = [](const ContainerSpec&, const std::vector<std::string>&) {
    FakeEngine::Behavior ret;
    ret.out = "partial";
    ret.hang = true;
    return ret;
  };
  ExecutionOutcome outcome = Run("python", "while True: pass", std::chrono::milliseconds(300));
  EXPECT_EQ(outcome.completion_kind, CompletionKind::TIMED_OUT);
  EXPECT_EQ(outcome.stdout_text, "partial");
  EXPECT_EQ(outcome.exit_code, -1);
  EXPECT_GE(outcome.elapsed, std::chrono::milliseconds(300));
  EXPECT_LT(outcome.elapsed, std::chrono::milliseconds(3000));
  EXPECT_TRUE(released_after_run);
  EXPECT_FALSE(engine.IsLive(container_id));
  // the program was killed by the scrub, before the container went away
  EXPECT_EQ(engine.scrubbed, 1);
}

TEST_F(ExecutorTest, DeadlineCoversBothPhases) {
  engine.script = [](const ContainerSpec&, const std::vector<std::string>& command) {
    FakeEngine::Behavior ret;
    // compilation succeeds, the program never ends
    ret.hang = command[0] == "./main";
    return ret;
  };
  ExecutionOutcome outcome = Run("rust", "fn main() { loop {} }", std::chrono::milliseconds(200));
  EXPECT_EQ(outcome.completion_kind, CompletionKind::TIMED_OUT);
  EXPECT_THAT(engine.Commands(), SizeIs(2));
  EXPECT_FALSE(engine.IsLive(container_id));
}

TEST_F(ExecutorTest, ExecCreateFailure) {
  engine.fail_exec_create = true;
  ExecutionOutcome outcome = Run("python", "print(1)");
  EXPECT_EQ(outcome.completion_kind, CompletionKind::FAILED_TO_START);
  EXPECT_EQ(outcome.exit_code, -1);
}

TEST_F(ExecutorTest, ExecStartFailure) {
  engine.fail_exec_start = true;
  ExecutionOutcome outcome = Run("python", "print(1)");
  EXPECT_EQ(outcome.completion_kind, CompletionKind::FAILED_TO_START);
  EXPECT_EQ(outcome.stdout_text, "");
}

TEST_F(ExecutorTest, OutputTruncated) {
  engine.script = [](const ContainerSpec&, const std::vector<std::string>&) {
    FakeEngine::Behavior ret;
    ret.out = std::string(100, 'x');
    ret.err = "tail";
    ret.chunk = 7;
    return ret;
  };
  ExecutionOutcome outcome = Run("python", "print('x' * 100)", std::chrono::seconds(5), 10);
  EXPECT_EQ(outcome.completion_kind, CompletionKind::COMPLETED);
  EXPECT_EQ(outcome.stdout_text, std::string(10, 'x'));
  EXPECT_EQ(outcome.stderr_text, "tail");
  EXPECT_TRUE(outcome.truncated);
}
