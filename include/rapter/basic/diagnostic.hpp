// rapter/basic/diagnostic.hpp - Diagnostics, error kinds and the fail-fast error
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "rapter/basic/source_manager.hpp"

namespace rapter
{

// ============================================================================
// Error taxonomy
// ============================================================================

/**
 * Closed set of compiler error kinds.
 *
 * Each kind maps to a stable code (`E001`...`E500`) grouped by phase:
 * 0xx lexical, 1xx parse, 2xx semantic, 3xx module, 4xx lowering, 5xx internal.
 */
enum class ErrorKind : uint8_t {
  // Lexical
  UnexpectedCharacter,
  UnterminatedString,
  InvalidNumber,
  InvalidEscapeSequence,
  // Parse
  UnexpectedToken,
  ExpectedToken,
  MissingSemicolon,
  UnclosedDelimiter,
  InvalidSyntax,
  // Semantic
  UndefinedVariable,
  UndefinedFunction,
  UndefinedType,
  UndefinedModule,
  DuplicateDefinition,
  TypeMismatch,
  InvalidOperation,
  WrongArgumentCount,
  ImmutableAssignment,
  MissingReturnType,
  // Module
  ModuleNotFound,
  ModuleLoadError,
  ModuleExportError,
  CircularImport,
  ExportNotFound,
  ImportConflict,
  // Lowering
  UnsupportedFeature,
  // Internal
  InternalError,
};

[[nodiscard]] std::string_view error_code(ErrorKind kind) noexcept;
[[nodiscard]] std::string_view error_title(ErrorKind kind) noexcept;

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

enum class LabelStyle : uint8_t {
  Primary,    // the offending construct
  Secondary,  // related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct FixIt
{
  SourceRange range;
  std::string replacement_text;
};

/// A remediation hint, optionally with a code sample.
struct Suggestion
{
  std::string message;
  std::optional<std::string> example;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::optional<ErrorKind> kind;
  std::string code;     // e.g. "E206"; derived from kind when set
  std::string message;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;
  std::vector<Suggestion> suggestions;
  std::vector<Diagnostic> related;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;

  /// Build an error diagnostic of the given kind with one primary label.
  [[nodiscard]] static Diagnostic error(
    ErrorKind kind, SourceRange range, std::string message, std::string label_message = "");
};

// ============================================================================
// CompileError
// ============================================================================

/**
 * Exception carrying a single diagnostic.
 *
 * Type checking and C generation stop at the first violation by throwing this;
 * the driver catches it and moves the diagnostic into its DiagnosticBag.
 */
class CompileError : public std::runtime_error
{
public:
  explicit CompileError(Diagnostic diag);
  CompileError(ErrorKind kind, SourceRange range, std::string message);

  [[nodiscard]] const Diagnostic & diagnostic() const noexcept { return diagnostic_; }
  [[nodiscard]] ErrorKind kind() const noexcept { return *diagnostic_.kind; }

  CompileError & with_help(std::string help);
  CompileError & with_suggestion(std::string message, std::optional<std::string> example = {});
  CompileError & with_secondary_label(SourceRange range, std::string message);
  CompileError & with_related(Diagnostic related);

private:
  Diagnostic diagnostic_;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that registers its diagnostic with the bag on destruction.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_fixit(SourceRange range, std::string replacement);

  DiagnosticBuilder & with_help(std::string help_msg);

  DiagnosticBuilder & with_suggestion(
    std::string message, std::optional<std::string> example = std::nullopt);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder starters
  DiagnosticBuilder report_error(
    ErrorKind kind, SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;
  /// True if any error diagnostic carries the given kind.
  [[nodiscard]] bool has_error(ErrorKind kind) const;

  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace rapter
