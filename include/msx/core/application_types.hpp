#pragma once
#include <string>

namespace msx::core {

// Application-level error handling
struct ApplicationError {
  std::string message;
  int exit_code;
};

// Command line arguments structure
struct CommandLineArgs {
  std::string model_file;
  bool numeric = false; // force the numeric expression backend
  bool dump = false;    // print the model back as YAML
  bool help_requested = false;
};

// Application result for clean exit handling
struct ApplicationResult {
  bool success;
  int exit_code;
  std::string message;
};

} // namespace msx::core
