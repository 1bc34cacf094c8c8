#include <canon/cli/config.hpp>

#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace canon::cli {

namespace {

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

double ParseDouble(const std::string& key, const std::string& value) {
  size_t pos = 0;
  double d = 0.0;
  try {
    d = std::stod(value, &pos);
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid number for " + key + ": " + value);
  }
  if (pos != value.size()) throw std::runtime_error("Invalid number for " + key + ": " + value);
  return d;
}

size_t ParseSize(const std::string& key, const std::string& value) {
  size_t pos = 0;
  unsigned long long n = 0;
  try {
    n = std::stoull(value, &pos);
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid size for " + key + ": " + value);
  }
  if (pos != value.size() || value[0] == '-') {
    throw std::runtime_error("Invalid size for " + key + ": " + value);
  }
  return static_cast<size_t>(n);
}

// Number of operands each command takes.
int Arity(const std::string& command) {
  if (command == "normalize" || command == "check" || command == "compare") return 2;
  if (command == "version") return 0;
  return -1;
}

}  // namespace

CompareOptions CompareConfig::ToOptions() const {
  CompareOptions opts;
  if (ignore_case) opts.Set(CompareOption::kIgnoreCase);
  if (code_point_order) opts.Set(CompareOption::kCodePointOrder);
  if (input_fcd) opts.Set(CompareOption::kInputIsFCD);
  if (exclude_special_i) opts.Set(CompareOption::kFoldCaseExcludeSpecialI);
  return opts;
}

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options] <command> [args]\n"
            << "\nCommands:\n"
            << "  normalize <form> <text>   Print text in NFD, NFKD, NFC, NFKC, FCD or None\n"
            << "  check <form> <text>       Quick check and exact check\n"
            << "  compare <a> <b>           Compare by canonical equivalence\n"
            << "  version                   Library and Unicode versions\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --hex                     Text is a code point list (\"U+0041 U+0301\")\n"
            << "  --ignore-case             compare: full case folding\n"
            << "  --exclude-special-i       compare: Turkic folding of I and dotted I\n"
            << "  --code-point-order        compare: code point order instead of UTF-16\n"
            << "  --input-fcd               compare: inputs are known to be FCD\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --help, -h                Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " normalize NFC $'A\\u0301'\n"
            << "  " << argv0 << " --hex normalize NFKD \"U+FB03\"\n"
            << "  " << argv0 << " --ignore-case compare STRASSE strasse\n";
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;
  int line_no = 0;

  while (std::getline(file, line)) {
    ++line_no;
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected 'key: value'");
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "compare") {
      if (key == "ignore_case") {
        config.compare.ignore_case = ParseBool(key, value);
      } else if (key == "code_point_order") {
        config.compare.code_point_order = ParseBool(key, value);
      } else if (key == "input_fcd") {
        config.compare.input_fcd = ParseBool(key, value);
      } else if (key == "exclude_special_i") {
        config.compare.exclude_special_i = ParseBool(key, value);
      }
    } else if (current_section == "normalizer") {
      if (key == "capacity_estimate_ratio") {
        config.normalizer.capacity_estimate_ratio = ParseDouble(key, value);
      } else if (key == "min_buffer_capacity") {
        config.normalizer.min_buffer_capacity = ParseSize(key, value);
      }
    } else if (current_section.empty()) {
      // Top-level keys
      if (key == "log_level") {
        config.log_level = value;
      } else if (key == "hex") {
        config.hex = ParseBool(key, value);
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  Config config;
  std::string config_file;
  bool log_level_set = false;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.help = true;
    } else if (arg == "--config" || arg == "-c") {
      if (++i >= argc) {
        throw std::runtime_error("--config requires a path argument");
      }
      config_file = argv[i];
    } else if (arg == "--hex") {
      config.hex = true;
    } else if (arg == "--ignore-case") {
      config.compare.ignore_case = true;
    } else if (arg == "--exclude-special-i") {
      config.compare.exclude_special_i = true;
    } else if (arg == "--code-point-order") {
      config.compare.code_point_order = true;
    } else if (arg == "--input-fcd") {
      config.compare.input_fcd = true;
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        throw std::runtime_error("--log-level requires a level");
      }
      config.log_level = argv[i];
      log_level_set = true;
    } else if (arg == "--") {
      for (++i; i < argc; ++i) positional.emplace_back(argv[i]);
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (!positional.empty()) {
    config.command = positional.front();
    config.args.assign(positional.begin() + 1, positional.end());
  }

  // If a config file was specified, load it first then override with CLI args
  if (!config_file.empty()) {
    Config file_config = LoadFromFile(config_file);

    if (!log_level_set) config.log_level = file_config.log_level;
    config.hex = config.hex || file_config.hex;
    config.compare.ignore_case = config.compare.ignore_case || file_config.compare.ignore_case;
    config.compare.code_point_order =
        config.compare.code_point_order || file_config.compare.code_point_order;
    config.compare.input_fcd = config.compare.input_fcd || file_config.compare.input_fcd;
    config.compare.exclude_special_i =
        config.compare.exclude_special_i || file_config.compare.exclude_special_i;

    // Normalizer tuning only comes from the file
    config.normalizer = file_config.normalizer;
  }

  return config;
}

void Config::Validate() const {
  if (log_level != "debug" && log_level != "info" &&
      log_level != "warn" && log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + log_level +
                             " (must be debug, info, warn, or error)");
  }

  if (!std::isfinite(normalizer.capacity_estimate_ratio) ||
      normalizer.capacity_estimate_ratio < 0.0) {
    throw std::runtime_error("normalizer.capacity_estimate_ratio must be >= 0");
  }

  if (normalizer.min_buffer_capacity > kMaxMinBufferCapacity) {
    throw std::runtime_error("normalizer.min_buffer_capacity must be <= " +
                             std::to_string(kMaxMinBufferCapacity));
  }

  if (help) return;

  if (command.empty()) {
    throw std::runtime_error("A command is required (normalize, check, compare, version)");
  }
  const int arity = Arity(command);
  if (arity < 0) {
    throw std::runtime_error("Unknown command: " + command);
  }
  if (static_cast<int>(args.size()) != arity) {
    throw std::runtime_error(command + " takes " + std::to_string(arity) + " argument(s), got " +
                             std::to_string(args.size()));
  }

  if (command == "normalize" || command == "check") {
    NormalizationMode mode;
    if (!ParseNormalizationMode(args[0], &mode)) {
      throw std::runtime_error("Unknown normalization form: " + args[0] +
                               " (must be None, NFD, NFKD, NFC, NFKC, or FCD)");
    }
  }
}

NormalizationMode Config::Mode() const {
  NormalizationMode mode = NormalizationMode::kNone;
  if (args.empty() || !ParseNormalizationMode(args[0], &mode)) {
    throw std::runtime_error("No normalization form given");
  }
  return mode;
}

}  // namespace canon::cli
