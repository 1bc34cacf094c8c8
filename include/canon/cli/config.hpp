#pragma once

#include <canon/options.hpp>
#include <canon/types.hpp>

#include <string>
#include <vector>

namespace canon::cli {

/**
 * Flags that shape Compare.
 */
struct CompareConfig {
  bool ignore_case = false;
  bool code_point_order = false;
  bool input_fcd = false;
  bool exclude_special_i = false;

  CompareOptions ToOptions() const;
};

/**
 * Complete canon_cli configuration.
 */
struct Config {
  std::string log_level = "info";
  bool hex = false;   // Text arguments and output are code point lists
  bool help = false;

  CompareConfig compare;
  canon::Options normalizer;

  // Positional arguments: command, then its operands.
  std::string command;
  std::vector<std::string> args;

  /**
   * Load configuration from a YAML-like file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * Options may appear anywhere; everything else is positional.
   * @param argc Argument count
   * @param argv Argument values
   * @return Parsed configuration
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  // Form named by args[0] for normalize/check. Call after Validate().
  NormalizationMode Mode() const;
};

void PrintUsage(const char* argv0);

}  // namespace canon::cli
