// rapter/basic/diagnostic.cpp - Diagnostic implementation
#include "rapter/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace rapter
{

// ============================================================================
// Error taxonomy
// ============================================================================

std::string_view error_code(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::UnexpectedCharacter:
      return "E001";
    case ErrorKind::UnterminatedString:
      return "E002";
    case ErrorKind::InvalidNumber:
      return "E003";
    case ErrorKind::InvalidEscapeSequence:
      return "E004";
    case ErrorKind::UnexpectedToken:
      return "E101";
    case ErrorKind::ExpectedToken:
      return "E102";
    case ErrorKind::MissingSemicolon:
      return "E103";
    case ErrorKind::UnclosedDelimiter:
      return "E104";
    case ErrorKind::InvalidSyntax:
      return "E105";
    case ErrorKind::UndefinedVariable:
      return "E201";
    case ErrorKind::UndefinedFunction:
      return "E202";
    case ErrorKind::UndefinedType:
      return "E203";
    case ErrorKind::UndefinedModule:
      return "E204";
    case ErrorKind::DuplicateDefinition:
      return "E205";
    case ErrorKind::TypeMismatch:
      return "E206";
    case ErrorKind::InvalidOperation:
      return "E207";
    case ErrorKind::WrongArgumentCount:
      return "E208";
    case ErrorKind::ImmutableAssignment:
      return "E209";
    case ErrorKind::MissingReturnType:
      return "E210";
    case ErrorKind::ModuleNotFound:
      return "E301";
    case ErrorKind::ModuleLoadError:
      return "E302";
    case ErrorKind::ModuleExportError:
      return "E303";
    case ErrorKind::CircularImport:
      return "E304";
    case ErrorKind::ExportNotFound:
      return "E305";
    case ErrorKind::ImportConflict:
      return "E306";
    case ErrorKind::UnsupportedFeature:
      return "E401";
    case ErrorKind::InternalError:
      return "E500";
  }
  return "E500";
}

std::string_view error_title(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::UnexpectedCharacter:
      return "unexpected character";
    case ErrorKind::UnterminatedString:
      return "unterminated string literal";
    case ErrorKind::InvalidNumber:
      return "invalid number literal";
    case ErrorKind::InvalidEscapeSequence:
      return "invalid escape sequence";
    case ErrorKind::UnexpectedToken:
      return "unexpected token";
    case ErrorKind::ExpectedToken:
      return "expected token";
    case ErrorKind::MissingSemicolon:
      return "missing semicolon";
    case ErrorKind::UnclosedDelimiter:
      return "unclosed delimiter";
    case ErrorKind::InvalidSyntax:
      return "invalid syntax";
    case ErrorKind::UndefinedVariable:
      return "undefined variable";
    case ErrorKind::UndefinedFunction:
      return "undefined function";
    case ErrorKind::UndefinedType:
      return "undefined type";
    case ErrorKind::UndefinedModule:
      return "undefined module";
    case ErrorKind::DuplicateDefinition:
      return "duplicate definition";
    case ErrorKind::TypeMismatch:
      return "type mismatch";
    case ErrorKind::InvalidOperation:
      return "invalid operation";
    case ErrorKind::WrongArgumentCount:
      return "wrong number of arguments";
    case ErrorKind::ImmutableAssignment:
      return "cannot assign to immutable variable";
    case ErrorKind::MissingReturnType:
      return "missing return type";
    case ErrorKind::ModuleNotFound:
      return "module not found";
    case ErrorKind::ModuleLoadError:
      return "module load error";
    case ErrorKind::ModuleExportError:
      return "module export error";
    case ErrorKind::CircularImport:
      return "circular import detected";
    case ErrorKind::ExportNotFound:
      return "export not found";
    case ErrorKind::ImportConflict:
      return "import conflict";
    case ErrorKind::UnsupportedFeature:
      return "unsupported feature";
    case ErrorKind::InternalError:
      return "internal compiler error";
  }
  return "internal compiler error";
}

// ============================================================================
// Diagnostic
// ============================================================================

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l != nullptr ? l->range : SourceRange{};
}

Diagnostic Diagnostic::error(
  ErrorKind kind, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.kind = kind;
  d.code = std::string(error_code(kind));
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return d;
}

// ============================================================================
// CompileError
// ============================================================================

CompileError::CompileError(Diagnostic diag)
: std::runtime_error(diag.code + ": " + diag.message), diagnostic_(std::move(diag))
{
  if (!diagnostic_.kind) {
    diagnostic_.kind = ErrorKind::InternalError;
    diagnostic_.code = std::string(error_code(ErrorKind::InternalError));
  }
}

CompileError::CompileError(ErrorKind kind, SourceRange range, std::string message)
: CompileError(Diagnostic::error(kind, range, std::move(message)))
{
}

CompileError & CompileError::with_help(std::string help)
{
  diagnostic_.help_message = std::move(help);
  return *this;
}

CompileError & CompileError::with_suggestion(std::string message, std::optional<std::string> example)
{
  diagnostic_.suggestions.push_back(Suggestion{std::move(message), std::move(example)});
  return *this;
}

CompileError & CompileError::with_secondary_label(SourceRange range, std::string message)
{
  diagnostic_.labels.push_back(Label{range, std::move(message), LabelStyle::Secondary});
  return *this;
}

CompileError & CompileError::with_related(Diagnostic related)
{
  diagnostic_.related.push_back(std::move(related));
  return *this;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  SourceRange range, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  return with_label(range, std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_fixit(SourceRange range, std::string replacement)
{
  diagnostic_.fixits.push_back(FixIt{range, std::move(replacement)});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_suggestion(
  std::string message, std::optional<std::string> example)
{
  diagnostic_.suggestions.push_back(Suggestion{std::move(message), std::move(example)});
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(
  ErrorKind kind, SourceRange range, std::string message, std::string label_message)
{
  return {*this, Diagnostic::error(kind, range, std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return {*this, std::move(d)};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_error(ErrorKind kind) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [kind](const Diagnostic & d) {
    return d.severity == Severity::Error && d.kind == kind;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace rapter
