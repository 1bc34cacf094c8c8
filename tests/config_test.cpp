// Config tests for canon_cli
// Tests: flag parsing, config file loading, merge order, validation

#include <gtest/gtest.h>

#include <canon/cli/config.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace canon::cli {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

std::string RandomSuffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

class TempDir {
 public:
  TempDir() {
    path_ = std::filesystem::temp_directory_path() / ("canon_config_test_" + RandomSuffix());
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::filesystem::path path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// =============================================================================
// Config Tests
// =============================================================================

class ConfigTest : public ::testing::Test {
 protected:
  std::string WriteFile(const std::string& contents) {
    auto path = temp_dir_.path() / "canon.yaml";
    std::ofstream out(path);
    out << contents;
    return path.string();
  }

  TempDir temp_dir_;
};

TEST_F(ConfigTest, DefaultValues) {
  Config config;
  EXPECT_EQ(config.log_level, "info");
  EXPECT_FALSE(config.hex);
  EXPECT_FALSE(config.help);
  EXPECT_TRUE(config.compare.ToOptions().empty());
  EXPECT_DOUBLE_EQ(config.normalizer.capacity_estimate_ratio, 1.5);
  EXPECT_TRUE(config.command.empty());
}

TEST_F(ConfigTest, LoadFromArgs_Normalize) {
  const char* argv[] = {"canon_cli", "normalize", "NFC", "abc"};
  auto config = Config::LoadFromArgs(4, const_cast<char**>(argv));
  EXPECT_EQ(config.command, "normalize");
  ASSERT_EQ(config.args.size(), 2u);
  EXPECT_EQ(config.args[1], "abc");
  EXPECT_NO_THROW(config.Validate());
  EXPECT_EQ(config.Mode(), NormalizationMode::kNFC);
}

TEST_F(ConfigTest, LoadFromArgs_OptionsAnywhere) {
  const char* argv[] = {"canon_cli", "compare", "--ignore-case", "A", "a",
                        "--hex", "--log-level", "debug"};
  auto config = Config::LoadFromArgs(8, const_cast<char**>(argv));
  EXPECT_EQ(config.command, "compare");
  EXPECT_EQ(config.args, (std::vector<std::string>{"A", "a"}));
  EXPECT_TRUE(config.compare.ignore_case);
  EXPECT_TRUE(config.hex);
  EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigTest, LoadFromArgs_CompareFlags) {
  const char* argv[] = {"canon_cli", "--code-point-order", "--input-fcd",
                        "--exclude-special-i", "--ignore-case"};
  auto config = Config::LoadFromArgs(5, const_cast<char**>(argv));
  auto opts = config.compare.ToOptions();
  EXPECT_TRUE(opts.Has(CompareOption::kCodePointOrder));
  EXPECT_TRUE(opts.Has(CompareOption::kInputIsFCD));
  EXPECT_TRUE(opts.Has(CompareOption::kFoldCaseExcludeSpecialI));
  EXPECT_TRUE(opts.Has(CompareOption::kIgnoreCase));
}

TEST_F(ConfigTest, LoadFromArgs_DoubleDashEndsOptions) {
  const char* argv[] = {"canon_cli", "compare", "--", "--hex", "-"};
  auto config = Config::LoadFromArgs(5, const_cast<char**>(argv));
  EXPECT_FALSE(config.hex);
  EXPECT_EQ(config.args, (std::vector<std::string>{"--hex", "-"}));
}

TEST_F(ConfigTest, LoadFromArgs_Help) {
  const char* argv[] = {"canon_cli", "-h"};
  auto config = Config::LoadFromArgs(2, const_cast<char**>(argv));
  EXPECT_TRUE(config.help);
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, LoadFromArgs_UnknownOption) {
  const char* argv[] = {"canon_cli", "--unknown-option"};
  EXPECT_THROW(Config::LoadFromArgs(2, const_cast<char**>(argv)), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_MissingLogLevelArg) {
  const char* argv[] = {"canon_cli", "--log-level"};
  EXPECT_THROW(Config::LoadFromArgs(2, const_cast<char**>(argv)), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile_Basic) {
  auto path = WriteFile(
      "# canon settings\n"
      "log_level: warn\n"
      "hex: yes\n"
      "compare:\n"
      "  ignore_case: true\n"
      "  code_point_order: 1\n"
      "normalizer:\n"
      "  capacity_estimate_ratio: 2.5\n"
      "  min_buffer_capacity: \"64\"\n");

  auto config = Config::LoadFromFile(path);
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_TRUE(config.hex);
  EXPECT_TRUE(config.compare.ignore_case);
  EXPECT_TRUE(config.compare.code_point_order);
  EXPECT_FALSE(config.compare.input_fcd);
  EXPECT_DOUBLE_EQ(config.normalizer.capacity_estimate_ratio, 2.5);
  EXPECT_EQ(config.normalizer.min_buffer_capacity, 64u);
}

TEST_F(ConfigTest, LoadFromFile_Missing) {
  EXPECT_THROW(Config::LoadFromFile((temp_dir_.path() / "nope.yaml").string()),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile_BadValues) {
  EXPECT_THROW(Config::LoadFromFile(WriteFile("hex: maybe\n")), std::runtime_error);
  EXPECT_THROW(Config::LoadFromFile(WriteFile("normalizer:\n  capacity_estimate_ratio: x\n")),
               std::runtime_error);
  EXPECT_THROW(Config::LoadFromFile(WriteFile("normalizer:\n  min_buffer_capacity: -1\n")),
               std::runtime_error);
  EXPECT_THROW(Config::LoadFromFile(WriteFile("just some text\n")), std::runtime_error);
}

TEST_F(ConfigTest, FlagsOverrideFile) {
  auto path = WriteFile(
      "log_level: error\n"
      "compare:\n"
      "  input_fcd: true\n"
      "normalizer:\n"
      "  capacity_estimate_ratio: 3\n");
  std::string path_arg = path;
  const char* argv[] = {"canon_cli", "--config", path_arg.c_str(), "--log-level", "debug",
                        "version"};
  auto config = Config::LoadFromArgs(6, const_cast<char**>(argv));
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_TRUE(config.compare.input_fcd);
  EXPECT_DOUBLE_EQ(config.normalizer.capacity_estimate_ratio, 3.0);
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, FileLogLevelUsedWhenNotOnCommandLine) {
  auto path = WriteFile("log_level: error\n");
  const char* argv[] = {"canon_cli", "-c", path.c_str(), "version"};
  auto config = Config::LoadFromArgs(4, const_cast<char**>(argv));
  EXPECT_EQ(config.log_level, "error");
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST_F(ConfigTest, Validate_RequiresCommand) {
  Config config;
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST_F(ConfigTest, Validate_UnknownCommand) {
  Config config;
  config.command = "frobnicate";
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST_F(ConfigTest, Validate_Arity) {
  Config config;
  config.command = "compare";
  config.args = {"a"};
  EXPECT_THROW(config.Validate(), std::runtime_error);
  config.args = {"a", "b"};
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, Validate_UnknownForm) {
  Config config;
  config.command = "check";
  config.args = {"NFX", "a"};
  EXPECT_THROW(config.Validate(), std::runtime_error);
  config.args = {"nfkd", "a"};
  EXPECT_NO_THROW(config.Validate());
}

TEST_F(ConfigTest, Validate_LogLevel) {
  Config config;
  config.command = "version";
  config.log_level = "verbose";
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST_F(ConfigTest, Validate_NegativeRatio) {
  Config config;
  config.command = "version";
  config.normalizer.capacity_estimate_ratio = -1.0;
  EXPECT_THROW(config.Validate(), std::runtime_error);
}

TEST_F(ConfigTest, Validate_OversizedMinBufferCapacity) {
  Config config = Config::LoadFromFile(
      WriteFile("normalizer:\n  min_buffer_capacity: 18446744073709551615\n"));
  config.command = "version";
  EXPECT_THROW(config.Validate(), std::runtime_error);

  config.normalizer.min_buffer_capacity = kMaxMinBufferCapacity;
  EXPECT_NO_THROW(config.Validate());
}

}  // namespace
}  // namespace canon::cli
