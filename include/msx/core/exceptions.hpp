#pragma once
#include <fmt/format.h>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace msx::core {

class MsxException : public std::exception {
private:
  std::string message_;
  std::source_location location_;
  std::vector<std::string> call_stack_;

public:
  explicit MsxException(std::string message, std::source_location location = std::source_location::current())
      : message_(std::move(message)), location_(location) {}

  [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }

  [[nodiscard]] auto location() const noexcept -> const std::source_location& { return location_; }

  [[nodiscard]] auto message() const noexcept -> const std::string& { return message_; }

  void add_context(std::string context) { call_stack_.push_back(std::move(context)); }

  [[nodiscard]] auto call_stack() const noexcept -> const std::vector<std::string>& { return call_stack_; }

  [[nodiscard]] auto full_message() const -> std::string {
    std::string ctx;
    if (!call_stack_.empty()) {
      ctx.append(" | context: ");
      for (std::size_t i = 0; i < call_stack_.size(); ++i) {
        ctx.append(call_stack_[i]);
        if (i + 1 < call_stack_.size()) {
          ctx.append(" -> ");
        }
      }
    }
    return fmt::format("{} [{}:{}:{}]{}", message_, location_.file_name(), location_.line(),
                       location_.function_name(), ctx);
  }
};

// ---------------------------------------------------------------------------
// Model building errors
// ---------------------------------------------------------------------------

class NameCollisionError : public MsxException {
private:
  std::string name_;

public:
  explicit NameCollisionError(std::string_view name, std::source_location location = std::source_location::current())
      : MsxException(fmt::format("Name Collision: '{}' is already defined in this model", name), location),
        name_(name) {}

  [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
};

// Raised by the registry itself; the model surfaces it unchanged.
using KeyExistsError = NameCollisionError;

class InvalidNameError : public MsxException {
private:
  std::string name_;

public:
  explicit InvalidNameError(std::string_view name, std::string_view reason,
                            std::source_location location = std::source_location::current())
      : MsxException(fmt::format("Invalid Name '{}': {}", name, reason), location), name_(name) {}

  [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
};

class UnknownReferenceError : public MsxException {
public:
  explicit UnknownReferenceError(std::string_view message,
                                 std::source_location location = std::source_location::current())
      : MsxException(fmt::format("Unknown Reference: {}", message), location) {}
};

class DuplicateReactionError : public MsxException {
public:
  DuplicateReactionError(std::string_view species, std::string_view location_name,
                         std::source_location location = std::source_location::current())
      : MsxException(fmt::format("Duplicate Reaction: species '{}' already has a {} reaction", species,
                                 location_name),
                     location) {}
};

class InvalidArgumentError : public MsxException {
public:
  explicit InvalidArgumentError(std::string_view message,
                                std::source_location location = std::source_location::current())
      : MsxException(fmt::format("Invalid Argument: {}", message), location) {}
};

// A value of the right kind that is out of range or does not name anything.
class InvalidValueError : public InvalidArgumentError {
public:
  explicit InvalidValueError(std::string_view message, std::source_location location = std::source_location::current())
      : InvalidArgumentError(fmt::format("bad value: {}", message), location) {}
};

// Arguments that are mismatched, ambiguous, or of an unsupported kind.
class InvalidTypeError : public InvalidArgumentError {
public:
  explicit InvalidTypeError(std::string_view message, std::source_location location = std::source_location::current())
      : InvalidArgumentError(fmt::format("bad type: {}", message), location) {}
};

class ExpressionCompileError : public MsxException {
private:
  std::string expression_;

public:
  explicit ExpressionCompileError(std::string_view message, std::string expression = {},
                                  std::source_location location = std::source_location::current())
      : MsxException(expression.empty()
                         ? fmt::format("Expression Error: {}", message)
                         : fmt::format("Expression Error: {} in '{}'", message, expression),
                     location),
        expression_(std::move(expression)) {}

  [[nodiscard]] auto expression() const noexcept -> const std::string& { return expression_; }
};

// ---------------------------------------------------------------------------
// Configuration and file errors
// ---------------------------------------------------------------------------

class ConfigurationError : public MsxException {
public:
  explicit ConfigurationError(std::string_view message, std::source_location location = std::source_location::current())
      : MsxException(fmt::format("Configuration Error: {}", message), location) {}
};

class FileError : public MsxException {
private:
  std::string filename_;

public:
  explicit FileError(std::string_view message, std::string filename,
                     std::source_location location = std::source_location::current())
      : MsxException(fmt::format("File Error ({}): {}", filename, message), location),
        filename_(std::move(filename)) {}

  [[nodiscard]] auto filename() const noexcept -> const std::string& { return filename_; }
};

class ValidationError : public ConfigurationError {
private:
  std::string field_name_;

public:
  explicit ValidationError(std::string_view field_name, std::string_view message,
                           std::source_location location = std::source_location::current())
      : ConfigurationError(fmt::format("Field '{}': {}", field_name, message), location), field_name_(field_name) {}

  [[nodiscard]] auto field_name() const noexcept -> const std::string& { return field_name_; }
};

} // namespace msx::core
