// tactflow/detectors/registry.hpp - Built-in detector lookup
#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "tactflow/detectors/detector.hpp"

namespace tactflow
{

/// Ids of every built-in detector, in the order they run by default
[[nodiscard]] const std::vector<std::string_view> & builtin_detector_ids();

/// Whether `id` names a built-in detector
[[nodiscard]] bool is_builtin_detector(std::string_view id);

/// New instance of detector `id`, nullptr for unknown ids
[[nodiscard]] std::unique_ptr<Detector> make_detector(std::string_view id);

/// One instance of every built-in detector
[[nodiscard]] std::vector<std::unique_ptr<Detector>> make_all_detectors();

}  // namespace tactflow
