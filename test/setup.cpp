#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <runbox/logger.h>

int verbosity;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    InitLogger(verbosity);
    spdlog::set_pattern("[%P:%t] %+");
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  verbosity = 0;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) verbosity = 1;
    if (std::string("-vv") == argv[1]) verbosity = 2;
  }
  return RUN_ALL_TESTS();
}
