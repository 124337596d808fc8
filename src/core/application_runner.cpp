#include "msx/core/application_runner.hpp"
#include "msx/core/constants.hpp"
#include "msx/expression/expression_compiler.hpp"
#include "msx/expression/reaction_evaluator.hpp"
#include "msx/io/model_file_manager.hpp"
#include "msx/io/yaml_writer.hpp"
#include <fmt/format.h>
#include <iostream>
#include <string>
#include <string_view>

namespace msx::core {

namespace {

auto join(const std::vector<std::string>& names) -> std::string {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out.empty() ? "-" : out;
}

} // namespace

ApplicationRunner::ApplicationRunner() : environment_manager_(std::make_unique<EnvironmentManager>()) {}

ApplicationRunner::~ApplicationRunner() = default;

auto ApplicationRunner::run(int argc, char* argv[]) -> ApplicationResult {
  try {
    auto args_result = parse_command_line(argc, argv);
    if (!args_result) {
      display_usage(argc > 0 ? argv[constants::indexing::first] : "msx_check");
      return handle_error(args_result.error());
    }
    auto args = args_result.value();

    if (args.help_requested) {
      display_usage(argv[constants::indexing::first]);
      return {true, constants::application::exit_success, "Help displayed"};
    }

    display_header();

    if (auto env_result = environment_manager_->configure_environment(); !env_result) {
      return handle_error(env_result.error());
    }
    const auto kind = args.numeric ? expression::BackendKind::Numeric : environment_manager_->backend_kind();

    auto model_result = load_model(args.model_file);
    if (!model_result) {
      return handle_error(model_result.error());
    }
    const auto model = std::move(model_result.value());

    display_model_summary(*model);

    if (auto check_result = check_model(*model, kind); !check_result) {
      return handle_error(check_result.error());
    }

    if (args.dump) {
      std::cout << "\n" << io::emit_model(*model) << std::endl;
    }

    std::cout << "\n=== MODEL CHECK COMPLETED SUCCESSFULLY ===" << std::endl;
    return {true, constants::application::exit_success, "Success"};

  } catch (const std::exception& e) {
    return handle_error(
        ApplicationError{"Unexpected error: " + std::string(e.what()), constants::application::exit_failure});
  }
}

auto ApplicationRunner::parse_command_line(int argc, char* argv[]) const
    -> std::expected<CommandLineArgs, ApplicationError> {
  CommandLineArgs args;

  for (int i = static_cast<int>(constants::indexing::second); i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.help_requested = true;
    } else if (arg == "--numeric") {
      args.numeric = true;
    } else if (arg == "--dump") {
      args.dump = true;
    } else if (arg.starts_with("-")) {
      return std::unexpected(
          ApplicationError{fmt::format("Unknown option '{}'", arg), constants::application::exit_usage});
    } else if (args.model_file.empty()) {
      args.model_file = std::string(arg);
    } else {
      return std::unexpected(
          ApplicationError{fmt::format("Unexpected argument '{}'", arg), constants::application::exit_usage});
    }
  }

  if (args.model_file.empty() && !args.help_requested) {
    return std::unexpected(ApplicationError{"Insufficient arguments provided", constants::application::exit_usage});
  }
  return args;
}

auto ApplicationRunner::load_model(const std::string& model_file) const
    -> std::expected<std::unique_ptr<model::ReactionModel>, ApplicationError> {
  std::cout << "Loading model from: " << model_file << std::endl;

  io::ModelFileManager manager;
  auto model_result = manager.load(model_file);
  if (!model_result) {
    return std::unexpected(ApplicationError{"Failed to load model: " + model_result.error().message(),
                                            constants::application::exit_failure});
  }

  std::cout << "✓ Model loaded successfully" << std::endl;
  return std::move(model_result.value());
}

auto ApplicationRunner::check_model(const model::ReactionModel& model, expression::BackendKind kind) const
    -> std::expected<void, ApplicationError> {
  const auto backend = expression::create_backend(kind);
  expression::ExpressionCompiler compiler(model, *backend);

  if (auto compiled = compiler.compile_all(); !compiled) {
    return std::unexpected(ApplicationError{compiled.error().message(), constants::application::exit_failure});
  }
  std::cout << fmt::format("✓ {} terms and {} reactions compiled ({} backend)", model.term_names().size(),
                           model.reactions().size(), expression::backend_name(kind))
            << std::endl;

  for (const auto location : {model::LocationType::Pipe, model::LocationType::Tank}) {
    auto evaluator = expression::ReactionSystemEvaluator::create(compiler, location);
    if (!evaluator) {
      return std::unexpected(ApplicationError{evaluator.error().message(), constants::application::exit_failure});
    }
    std::cout << fmt::format("✓ {} system: {} species, Jacobian {}", core::enum_key(location), evaluator->size(),
                             evaluator->has_jacobian() ? "available" : "unavailable")
              << std::endl;
  }
  return {};
}

auto ApplicationRunner::display_usage(const std::string& program_name) const -> void {
  std::cerr << "Usage: " << program_name << " <model.yaml> [--numeric] [--dump]\n";
  std::cerr << "  --numeric  evaluate expressions with the numeric backend (no Jacobian)\n";
  std::cerr << "  --dump     print the model back as YAML\n";
}

auto ApplicationRunner::display_header() const -> void {
  std::cout << "=== MSX Reaction Model Checker " << constants::application::version << " ===" << std::endl;
}

auto ApplicationRunner::display_model_summary(const model::ReactionModel& model) const -> void {
  std::cout << "\nModel: " << (model.name().empty() ? "(unnamed)" : model.name()) << std::endl;
  if (!model.title().empty()) {
    std::cout << "  Title      : " << model.title() << std::endl;
  }
  std::cout << "  Species    : " << join(model.species_names()) << std::endl;
  std::cout << "  Constants  : " << join(model.constant_names()) << std::endl;
  std::cout << "  Parameters : " << join(model.parameter_names()) << std::endl;
  std::cout << "  Terms      : " << join(model.term_names()) << std::endl;

  for (const auto location : {model::LocationType::Pipe, model::LocationType::Tank}) {
    std::cout << fmt::format("\n{} reactions:", location == model::LocationType::Pipe ? "Pipe" : "Tank") << std::endl;
    for (const auto& reaction : model.reactions(location)) {
      std::cout << fmt::format("  [{:>7}] d{}/dt = {}", core::enum_key(reaction.dynamics()), reaction.species(),
                               reaction.expression())
                << std::endl;
    }
  }

  const auto& options = model.options();
  std::cout << fmt::format("\nOptions: timestep {} s, solver {}, coupling {}, atol {}, rtol {}", options.timestep(),
                           core::enum_name(options.solver()), core::enum_name(options.coupling()), options.atol(),
                           options.rtol())
            << std::endl;
}

auto ApplicationRunner::handle_error(const ApplicationError& error) const -> ApplicationResult {
  std::cerr << "Error: " << error.message << std::endl;
  return {false, error.exit_code, error.message};
}

} // namespace msx::core
