// tactflow/detectors/send_in_loop.hpp - Messages sent from loop bodies
#pragma once

#include "tactflow/detectors/detector.hpp"

namespace tactflow
{

/**
 * Reports calls inside `while`, `do-until`, `repeat` and `foreach` loops
 * that send a message, either directly or through a callee whose call graph
 * summary contains Effect::Send.
 *
 * Each call is reported once, also when loops are nested.
 */
class SendInLoop final : public Detector
{
public:
  [[nodiscard]] std::string_view id() const noexcept override { return "SendInLoop"; }
  [[nodiscard]] std::string_view description() const noexcept override
  {
    return "Messages sent inside loops";
  }

  void check(const DetectorContext & ctx, const CompilationUnit & cu, DiagnosticBag & diags) override;
};

}  // namespace tactflow
