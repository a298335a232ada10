// tests/unit/basic/test_diagnostic.cpp - Unit tests for diagnostics and the printer
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "tactflow/basic/diagnostic.hpp"
#include "tactflow/basic/diagnostic_printer.hpp"
#include "tactflow/basic/source_manager.hpp"

using namespace tactflow;

TEST(DiagnosticBagTest, BuilderAddsOnDestruction)
{
  DiagnosticBag diags;
  {
    auto builder = diags.report_warning(SourceRange{}, "loop sends");
    builder.with_code("SendInLoop").with_note("inside repeat").with_help("refactor");
    EXPECT_TRUE(diags.empty());
  }
  ASSERT_EQ(diags.size(), 1u);

  const Diagnostic & d = diags.all().front();
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, "SendInLoop");
  EXPECT_EQ(d.message, "loop sends");
  ASSERT_EQ(d.notes.size(), 1u);
  EXPECT_EQ(d.notes.front(), "inside repeat");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "refactor");
}

TEST(DiagnosticBagTest, MovedBuilderReportsOnce)
{
  DiagnosticBag diags;
  {
    auto first = diags.report_error(SourceRange{}, "boom");
    auto second = std::move(first);
    second.with_code("ExitCodeUsage");
  }
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags.all().front().code, "ExitCodeUsage");
}

TEST(DiagnosticBagTest, FiltersBySeverityAndCode)
{
  DiagnosticBag diags;
  diags.report_error(SourceRange{}, "e").with_code("A");
  diags.report_warning(SourceRange{}, "w").with_code("B");
  diags.report_info(SourceRange{}, "i").with_code("A");

  EXPECT_TRUE(diags.has_errors());
  EXPECT_TRUE(diags.has_warnings());
  EXPECT_EQ(diags.errors().size(), 1u);
  EXPECT_EQ(diags.warnings().size(), 1u);
  EXPECT_EQ(diags.with_code("A").size(), 2u);
  EXPECT_TRUE(diags.with_code("C").empty());
}

TEST(DiagnosticBagTest, MergeAppends)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_info(SourceRange{}, "one");
  b.report_info(SourceRange{}, "two");
  b.report_info(SourceRange{}, "three");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 3u);
  EXPECT_EQ(a.all()[2].message, "three");
}

TEST(DiagnosticBagTest, SortByLocationKeepsUnlocatedLast)
{
  SourceRegistry sources;
  const FileId f = sources.add_file("s.tact", "0123456789");

  DiagnosticBag diags;
  diags.report_info(SourceRange{}, "nowhere");
  diags.report_info(SourceRange(f, 7, 8), "late");
  diags.report_info(SourceRange(f, 2, 3), "early");

  diags.sort_by_location();
  ASSERT_EQ(diags.size(), 3u);
  EXPECT_EQ(diags.all()[0].message, "early");
  EXPECT_EQ(diags.all()[1].message, "late");
  EXPECT_EQ(diags.all()[2].message, "nowhere");
}

TEST(DiagnosticBagTest, PrimaryLabelPreferred)
{
  Diagnostic d;
  d.labels.push_back(Label{SourceRange(FileId(0), 5, 6), "origin", LabelStyle::Secondary});
  d.labels.push_back(Label{SourceRange(FileId(0), 1, 2), "use", LabelStyle::Primary});
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "use");
  EXPECT_EQ(d.primary_range().get_begin().offset(), 1u);
}

TEST(DiagnosticPrinterTest, PrintsHeaderLocationAndMarkers)
{
  SourceRegistry sources;
  const FileId f = sources.add_file("printer_case.tact", "let x = now();\n");

  DiagnosticBag diags;
  diags.report_info(SourceRange(f, 8, 13), "Time-dependent usage found", "call")
    .with_code("TimestampDependence")
    .with_help("avoid now()");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);
  const std::string text = out.str();

  EXPECT_NE(text.find("info[TimestampDependence]: Time-dependent usage found\n"), std::string::npos);
  EXPECT_NE(text.find("printer_case.tact:1:9"), std::string::npos);
  EXPECT_NE(text.find("    1 | let x = now();\n"), std::string::npos);
  EXPECT_NE(text.find("        ^^^^^ call\n"), std::string::npos);
  EXPECT_NE(text.find("   = help: avoid now()\n"), std::string::npos);
  EXPECT_NE(text.find("0 warnings, 0 errors, 1 other\n"), std::string::npos);
}

TEST(DiagnosticPrinterTest, UnlocatedDiagnosticPrintsHeaderAndNotes)
{
  const SourceRegistry sources;
  DiagnosticBag diags;
  diags.report_error(SourceRange{}, "detector crashed").with_code("analysis-failure").with_note(
    "in function f");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);
  const std::string text = out.str();

  EXPECT_EQ(text.find("-->"), std::string::npos);
  EXPECT_NE(text.find("error[analysis-failure]: detector crashed\n"), std::string::npos);
  EXPECT_NE(text.find("   = note: in function f\n"), std::string::npos);
  EXPECT_NE(text.find("0 warnings, 1 error\n"), std::string::npos);
}

TEST(DiagnosticPrinterTest, EmptyBagPrintsNothing)
{
  const SourceRegistry sources;
  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(DiagnosticBag{}, sources);
  EXPECT_TRUE(out.str().empty());
}
