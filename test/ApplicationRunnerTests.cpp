#include <catch2/catch.hpp>

#include "msx/core/application_runner.hpp"
#include "msx/core/constants.hpp"
#include "msx/io/yaml_writer.hpp"

#include <filesystem>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace {

// Owns mutable copies of the arguments for the char* argv[] interface
class Arguments {
private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;

public:
  explicit Arguments(std::vector<std::string> args) : storage_(std::move(args)) {
    for (auto& arg : storage_) {
      pointers_.push_back(arg.data());
    }
    pointers_.push_back(nullptr);
  }
  Arguments(std::initializer_list<std::string> args) : Arguments(std::vector<std::string>(args)) {}
  Arguments(const Arguments&) = delete;
  auto operator=(const Arguments&) -> Arguments& = delete;

  [[nodiscard]] auto argc() const -> int { return static_cast<int>(storage_.size()); }
  [[nodiscard]] auto argv() -> char** { return pointers_.data(); }
};

} // namespace

TEST_CASE("Command line parsing", "[ApplicationRunner]") {
  const msx::core::ApplicationRunner runner;

  SECTION("Model file and flags") {
    Arguments args{"msx_check", "--numeric", "model.yaml", "--dump"};
    auto parsed = runner.parse_command_line(args.argc(), args.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->model_file == "model.yaml");
    CHECK(parsed->numeric);
    CHECK(parsed->dump);
    CHECK_FALSE(parsed->help_requested);
  }

  SECTION("Help needs no model file") {
    Arguments args{"msx_check", "-h"};
    auto parsed = runner.parse_command_line(args.argc(), args.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->help_requested);
  }

  SECTION("Usage errors") {
    const std::vector<std::vector<std::string>> command_lines{
        {"msx_check"}, {"msx_check", "--fast", "model.yaml"}, {"msx_check", "a.yaml", "b.yaml"}};
    for (const auto& command_line : command_lines) {
      Arguments args(command_line);
      auto parsed = runner.parse_command_line(args.argc(), args.argv());
      REQUIRE_FALSE(parsed.has_value());
      CHECK(parsed.error().exit_code == msx::constants::application::exit_usage);
    }
  }
}

TEST_CASE("Checking a model file", "[ApplicationRunner]") {
  const auto path = std::filesystem::temp_directory_path() / "msx_runner_test.yaml";

  msx::model::ReactionModel model;
  model.add_bulk_species("CL2", "MG");
  model.add_constant("kb", 0.3);
  model.add_pipe_reaction("CL2", msx::model::DynamicsType::Rate, "-kb*CL2");
  REQUIRE(msx::io::write_model(model, path).has_value());

  SECTION("A valid model") {
    msx::core::ApplicationRunner runner;
    Arguments args{"msx_check", path.string()};
    const auto result = runner.run(args.argc(), args.argv());
    CHECK(result.success);
    CHECK(result.exit_code == msx::constants::application::exit_success);
  }

  SECTION("A model that does not compile") {
    model.add_tank_reaction("CL2", msx::model::DynamicsType::Rate, "-kt*CL2");
    REQUIRE(msx::io::write_model(model, path).has_value());
    msx::core::ApplicationRunner runner;
    Arguments args{"msx_check", path.string()};
    const auto result = runner.run(args.argc(), args.argv());
    CHECK_FALSE(result.success);
    CHECK(result.exit_code == msx::constants::application::exit_failure);
  }

  SECTION("A missing file") {
    msx::core::ApplicationRunner runner;
    Arguments args{"msx_check", (path.parent_path() / "msx_no_such_file.yaml").string()};
    CHECK_FALSE(runner.run(args.argc(), args.argv()).success);
  }

  std::filesystem::remove(path);
}
