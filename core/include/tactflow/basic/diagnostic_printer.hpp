// tactflow/basic/diagnostic_printer.hpp
//
// Prints findings with source context and position markers in Rust-style
// format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "tactflow/basic/diagnostic.hpp"
#include "tactflow/basic/source_manager.hpp"

namespace tactflow
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   info[TimestampDependence]: Tainted timestamp used in a condition
 *     --> contracts/vault.tact:12:9
 *      |
 *   12 |     if (deadline > now()) {
 *      |         ^^^^^^^^^^^^^^^^
 *      |
 *      = help: Block timestamps are predictable; do not use them for randomness or control flow
 *
 * Diagnostics without a valid location print the header and notes only.
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

  /**
   * Print every diagnostic of the bag ordered by location, followed by a
   * one-line summary when the bag is not empty.
   */
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);
  void print_summary(const DiagnosticBag & diags);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace tactflow
