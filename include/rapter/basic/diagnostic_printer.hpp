// rapter/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format. Also offers a JSON rendering
// for tooling.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "rapter/basic/diagnostic.hpp"
#include "rapter/basic/source_manager.hpp"

namespace rapter
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E206]: type mismatch in let statement: expected `int`, found `string`
 *     --> src/main.rapt:5:12
 *      |
 *    5 |     let x: int = "hello";
 *      |                  ^^^^^^^ expected `int`
 *      |
 *      = suggestion: convert the value or change the annotation
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print all diagnostics sorted by primary location.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// Print all diagnostics as a single JSON array.
  void print_json(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_fixit(const FixIt & fixit, const SourceRegistry & sources);
  void print_trailer(std::string_view tag, std::string_view message);
  void print_suggestion(const Suggestion & suggestion);

  [[nodiscard]] std::string display_path(FileId file, const SourceRegistry & sources) const;

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace rapter
