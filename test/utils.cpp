#include "utils.h"

#include <cstdlib>
#include <stdexcept>

void SandboxRootTest::SetUp() {
  char path_tmp[] = "/tmp/runbox_test_XXXXXX";
  if (!mkdtemp(path_tmp)) throw std::runtime_error("Failed to create");
  sandbox_root = fs::path(path_tmp) / "sandbox";
}

void SandboxRootTest::TearDown() {
  fs::remove_all(sandbox_root.parent_path());
}

size_t SandboxRootTest::CountWorkspaces() const {
  std::error_code ec;
  if (!fs::exists(sandbox_root, ec)) return 0;
  size_t ret = 0;
  for (auto& entry : fs::directory_iterator(sandbox_root)) {
    (void)entry;
    ret++;
  }
  return ret;
}

void FakeSandboxTest::SetUp() {
  SandboxRootTest::SetUp();
  engine = std::make_shared<FakeEngine>();
  config.sandbox_root = sandbox_root;
  config.timeout = std::chrono::milliseconds(5000);
  config.max_output = 1024;
}

Sandbox FakeSandboxTest::MakeSandbox() const {
  return Sandbox(engine, config);
}

ExecutionRequest MakeRequest(const std::string& code, const std::string& language, long timeout_ms) {
  ExecutionRequest req;
  req.code = code;
  req.language = language;
  if (timeout_ms > 0) req.timeout = std::chrono::milliseconds(timeout_ms);
  return req;
}
