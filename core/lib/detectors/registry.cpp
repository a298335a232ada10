// tactflow/detectors/registry.cpp - Built-in detector lookup
#include "tactflow/detectors/registry.hpp"

#include <algorithm>

#include "tactflow/detectors/exit_code_usage.hpp"
#include "tactflow/detectors/send_in_loop.hpp"
#include "tactflow/detectors/timestamp_dependence.hpp"
#include "tactflow/detectors/unprotected_call.hpp"

namespace tactflow
{

const std::vector<std::string_view> & builtin_detector_ids()
{
  static const std::vector<std::string_view> ids = {
    "TimestampDependence",
    "ExitCodeUsage",
    "UnprotectedCall",
    "SendInLoop",
  };
  return ids;
}

bool is_builtin_detector(std::string_view id)
{
  const auto & ids = builtin_detector_ids();
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

std::unique_ptr<Detector> make_detector(std::string_view id)
{
  if (id == "TimestampDependence") return std::make_unique<TimestampDependence>();
  if (id == "ExitCodeUsage") return std::make_unique<ExitCodeUsage>();
  if (id == "UnprotectedCall") return std::make_unique<UnprotectedCall>();
  if (id == "SendInLoop") return std::make_unique<SendInLoop>();
  return nullptr;
}

std::vector<std::unique_ptr<Detector>> make_all_detectors()
{
  std::vector<std::unique_ptr<Detector>> out;
  for (const auto id : builtin_detector_ids()) {
    out.push_back(make_detector(id));
  }
  return out;
}

}  // namespace tactflow
