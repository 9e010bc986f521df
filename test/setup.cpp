#include <stdlib.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <autojudge/paths.h>

spdlog::level::level_enum log_level;
fs::path test_root;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
  }
  void TearDown() override {
    fs::remove_all(test_root);
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  if (argc) internal::kDataDir = fs::path(argv[0]).parent_path();
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  char templ[] = "/tmp/autojudge_test.XXXXXX";
  if (!mkdtemp(templ)) return 1;
  test_root = templ;
  kStorageRoot = test_root / "storage";
  kBoxRoot = test_root / "box";
  fs::create_directories(kStorageRoot);
  return RUN_ALL_TESTS();
}
