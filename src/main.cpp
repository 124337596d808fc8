#include "msx/core/application_runner.hpp"

int main(int argc, char* argv[]) {
  msx::core::ApplicationRunner runner;
  const auto result = runner.run(argc, argv);
  return result.exit_code;
}
