// rapter/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "rapter/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <nlohmann/json.hpp>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace rapter
{

namespace
{

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "note";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

nlohmann::json range_to_json(SourceRange range, const SourceRegistry & sources)
{
  const FullSourceRange fr = sources.get_full_range(range);
  if (!fr.is_valid()) {
    return nullptr;
  }
  return {
    {"file", sources.get_path(range.file_id()).string()},
    {"start", {{"line", fr.start_line}, {"column", fr.start_column}}},
    {"end", {{"line", fr.end_line}, {"column", fr.end_column}}},
  };
}

nlohmann::json diagnostic_to_json(const Diagnostic & diag, const SourceRegistry & sources)
{
  nlohmann::json j;
  j["severity"] = std::string(severity_name(diag.severity));
  j["code"] = diag.code;
  j["message"] = diag.message;
  if (diag.kind) {
    j["title"] = std::string(error_title(*diag.kind));
  }
  j["range"] = range_to_json(diag.primary_range(), sources);

  auto labels = nlohmann::json::array();
  for (const auto & l : diag.labels) {
    labels.push_back(
      {{"range", range_to_json(l.range, sources)},
       {"message", l.message},
       {"primary", l.style == LabelStyle::Primary}});
  }
  j["labels"] = std::move(labels);

  if (diag.help_message) {
    j["help"] = *diag.help_message;
  }

  auto suggestions = nlohmann::json::array();
  for (const auto & s : diag.suggestions) {
    nlohmann::json sj{{"message", s.message}};
    if (s.example) {
      sj["example"] = *s.example;
    }
    suggestions.push_back(std::move(sj));
  }
  j["suggestions"] = std::move(suggestions);

  auto related = nlohmann::json::array();
  for (const auto & r : diag.related) {
    related.push_back(diagnostic_to_json(r, sources));
  }
  j["related"] = std::move(related);
  return j;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange primary_range = diag.primary_range();
  const std::string filename = display_path(primary_range.file_id(), sources);
  const FullSourceRange primary_fr = sources.get_full_range(primary_range);

  print_severity_header(diag);

  if (primary_fr.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary_fr.start_line,
      primary_fr.start_column);
  } else if (primary_range.file_id().is_valid()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }

  for (const auto & f : diag.fixits) {
    print_fixit(f, sources);
  }

  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  for (const auto & s : diag.suggestions) {
    print_suggestion(s);
  }

  // Related diagnostics are rendered as notes with their own location.
  for (const auto & r : diag.related) {
    const FullSourceRange fr = sources.get_full_range(r.primary_range());
    if (fr.is_valid()) {
      print_trailer(
        "note", fmt::format(
                  "{} ({}:{}:{})", r.message, display_path(r.primary_range().file_id(), sources),
                  fr.start_line, fr.start_column));
    } else {
      print_trailer("note", r.message);
    }
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_range().get_begin() < b.primary_range().get_begin();
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

void DiagnosticPrinter::print_json(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  auto out = nlohmann::json::array();
  for (const auto & d : diags) {
    out.push_back(diagnostic_to_json(d, sources));
  }
  os_ << out.dump(2) << "\n";
}

// =============================================================================
// Private helpers
// =============================================================================

std::string DiagnosticPrinter::display_path(FileId file, const SourceRegistry & sources) const
{
  if (!file.is_valid()) {
    return "<unknown>";
  }
  const auto & abs_path = sources.get_path(file);
  std::error_code ec;
  auto rel_path = std::filesystem::relative(abs_path, std::filesystem::current_path(), ec);
  return (ec || rel_path.empty()) ? abs_path.string() : rel_path.string();
}

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  if (!use_color_) {
    if (diag.code.empty()) {
      fmt::print(os_, "{}: {}\n", name, diag.message);
    } else {
      fmt::print(os_, "{}[{}]: {}\n", name, diag.code, diag.message);
    }
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
    case Severity::Hint:
      os_ << rang::fg::green;
      break;
  }
  os_ << name;
  if (!diag.code.empty()) {
    os_ << "[" << diag.code << "]";
  }
  os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceRegistry & sources)
{
  if (!label.range.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const SourceFile * source = sources.get_file(label.range.file_id());
  const FullSourceRange fr = sources.get_full_range(label.range);
  if (source == nullptr || !fr.is_valid()) {
    return;
  }

  // Multi-line spans only underline their first character.
  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);

  print_source_line(
    *source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  fmt::print(os_, "      {} ", gutter_pipe_only());

  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t i = 0; visual_col < start_col && i < line.size(); ++i, ++visual_col) {
    marker_prefix += (line[i] == '\t') ? "    " : " ";
  }
  fmt::print(os_, "{}", marker_prefix);

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const std::string markers(marker_len, style == LabelStyle::Primary ? '^' : '-');

  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", markers);
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit, const SourceRegistry & sources)
{
  const FullSourceRange fr = sources.get_full_range(fixit.range);
  const SourceFile * source = sources.get_file(fixit.range.file_id());
  if (!fr.is_valid() || source == nullptr) {
    print_trailer("help", fmt::format("insert `{}`", fixit.replacement_text));
    return;
  }

  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "help" << rang::style::reset << rang::fg::reset;
    fmt::print(os_, ": add `{}` here\n", fixit.replacement_text);
  } else {
    fmt::print(os_, "help: add `{}` here\n", fixit.replacement_text);
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  const std::string cleaned_line = expand_tabs(source->get_line(fr.start_line - 1));
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", fr.start_line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", fr.start_line);
  }
  fmt::print(os_, "{}{}\n", cleaned_line, fixit.replacement_text);

  fmt::print(os_, "      {} {}", gutter_pipe_only(), std::string(cleaned_line.size(), ' '));
  if (use_color_) {
    os_ << rang::fg::green << rang::style::bold << "+" << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "+");
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view tag, std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", tag, message);
  } else {
    fmt::print(os_, "   = {}: {}\n", tag, message);
  }
}

void DiagnosticPrinter::print_suggestion(const Suggestion & suggestion)
{
  print_trailer("suggestion", suggestion.message);
  if (!suggestion.example) {
    return;
  }
  std::string_view rest = *suggestion.example;
  while (!rest.empty()) {
    const size_t nl = rest.find('\n');
    fmt::print(os_, "       {}\n", rest.substr(0, nl));
    if (nl == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(nl + 1);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? "\033[1;36m  -->\033[0m" : "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? "\033[1;36m      |\033[0m" : "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  return use_color_ ? "\033[1;36m|\033[0m" : "|";
}

}  // namespace rapter
