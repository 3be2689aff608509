#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <memory>
#include <string>
#include <filesystem>

#include <gtest/gtest.h>
#include <runbox/sandbox.h>
#include "fake_engine.h"

namespace fs = std::filesystem;

// Fresh sandbox root per test, removed afterwards
class SandboxRootTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // entries directly under the sandbox root
  size_t CountWorkspaces() const;

  fs::path sandbox_root;
};

// SandboxRootTest with a FakeEngine-backed Sandbox
class FakeSandboxTest : public SandboxRootTest {
 protected:
  void SetUp() override;
  Sandbox MakeSandbox() const;

  std::shared_ptr<FakeEngine> engine;
  SandboxConfig config;
};

ExecutionRequest MakeRequest(
    const std::string& code, const std::string& language, long timeout_ms = 0);

#endif  // TEST_UTILS_H_
