#include <canon/cli/config.hpp>
#include <canon/normalize.hpp>
#include <canon/utf8.hpp>
#include <canon/version.hpp>

#include <trantor/utils/Logger.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

trantor::Logger::LogLevel ToLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

// stdout carries results only; logs go to stderr.
void SetupLogging(const std::string& level) {
  trantor::Logger::setOutputFunction(
      [](const char* msg, const uint64_t len) { std::fwrite(msg, 1, len, stderr); },
      []() { std::fflush(stderr); });
  trantor::Logger::setLogLevel(ToLogLevel(level));
}

rocksdb::Status ReadText(const canon::cli::Config& config,
                         const std::string& arg,
                         canon::Sequence* out) {
  return config.hex ? canon::ParseCodePoints(arg, out) : canon::Utf8ToSequence(arg, out);
}

rocksdb::Status WriteText(const canon::cli::Config& config,
                          const canon::Sequence& seq,
                          std::string* out) {
  if (config.hex) {
    *out = canon::FormatCodePoints(seq);
    return rocksdb::Status::OK();
  }
  return canon::SequenceToUtf8(seq, out);
}

}  // namespace

int main(int argc, char** argv) {
  canon::cli::Config config;
  try {
    config = canon::cli::Config::LoadFromArgs(argc, argv);
    config.Validate();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    canon::cli::PrintUsage(argv[0]);
    return 2;
  }

  if (config.help) {
    canon::cli::PrintUsage(argv[0]);
    return 0;
  }

  SetupLogging(config.log_level);

  std::unique_ptr<canon::Normalizer> normalizer;
  auto s = canon::Normalizer::Create(&normalizer, config.normalizer);
  if (!s.ok()) {
    LOG_ERROR << "Create failed: " << s.ToString();
    return 1;
  }
  LOG_DEBUG << "Unicode " << normalizer->database().UnicodeVersion()
            << ", capacity_estimate_ratio=" << config.normalizer.capacity_estimate_ratio;

  const std::string& cmd = config.command;

  if (cmd == "version") {
    std::cout << "canon " << canon::Version() << " (Unicode "
              << normalizer->database().UnicodeVersion() << ")\n";
    return 0;
  } else if (cmd == "normalize") {
    const canon::NormalizationMode mode = config.Mode();
    canon::Sequence text;
    s = ReadText(config, config.args[1], &text);
    if (!s.ok()) {
      LOG_ERROR << "Bad input: " << s.ToString();
      return 2;
    }
    canon::Sequence out;
    s = normalizer->Normalize(mode, text, &out);
    if (!s.ok()) {
      LOG_ERROR << "Normalize failed: " << s.ToString();
      return 1;
    }
    LOG_DEBUG << canon::ToString(mode) << ": " << text.size() << " -> " << out.size()
              << " code points";
    std::string printed;
    s = WriteText(config, out, &printed);
    if (!s.ok()) {
      LOG_ERROR << "Cannot print result: " << s.ToString();
      return 1;
    }
    std::cout << printed << "\n";
    return 0;
  } else if (cmd == "check") {
    const canon::NormalizationMode mode = config.Mode();
    canon::Sequence text;
    s = ReadText(config, config.args[1], &text);
    if (!s.ok()) {
      LOG_ERROR << "Bad input: " << s.ToString();
      return 2;
    }
    const canon::CheckResult quick = normalizer->QuickCheck(mode, text);
    bool normalized = false;
    s = normalizer->IsNormalized(mode, text, &normalized);
    if (!s.ok()) {
      LOG_ERROR << "IsNormalized failed: " << s.ToString();
      return 1;
    }
    std::cout << "quick_check=" << canon::ToString(quick)
              << " normalized=" << (normalized ? "true" : "false") << "\n";
    return 0;
  } else if (cmd == "compare") {
    canon::Sequence a;
    canon::Sequence b;
    s = ReadText(config, config.args[0], &a);
    if (s.ok()) s = ReadText(config, config.args[1], &b);
    if (!s.ok()) {
      LOG_ERROR << "Bad input: " << s.ToString();
      return 2;
    }
    if (config.compare.exclude_special_i && !config.compare.ignore_case) {
      LOG_WARN << "--exclude-special-i has no effect without --ignore-case";
    }
    canon::Ordering order = canon::Ordering::kEqual;
    s = normalizer->Compare(config.compare.ToOptions(), a, b, &order);
    if (!s.ok()) {
      LOG_ERROR << "Compare failed: " << s.ToString();
      return 1;
    }
    std::cout << canon::ToString(order) << "\n";
    return 0;
  }

  canon::cli::PrintUsage(argv[0]);
  return 2;
}
