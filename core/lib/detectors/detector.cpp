// tactflow/detectors/detector.cpp - Detector interface
#include "tactflow/detectors/detector.hpp"

#include <utility>

namespace tactflow
{

DiagnosticBuilder Detector::report(
  DiagnosticBag & diags, SourceRange range, std::string message, std::string label_message) const
{
  DiagnosticBuilder builder =
    diags.report(severity(), range, std::move(message), std::move(label_message));
  builder.with_code(std::string(id()));
  return builder;
}

}  // namespace tactflow
