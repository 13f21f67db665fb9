#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace quantpulse {
namespace storage {

// Absent optionals are written as null
nlohmann::json toJson(const AggregatedWindow& window);
nlohmann::json toJson(const MetricsSnapshot& metrics);
nlohmann::json toJson(const AlertEvent& event);
nlohmann::json toJson(const AlertRule& rule);

MetricsSnapshot metricsFromJson(const nlohmann::json& value);

} // namespace storage
} // namespace quantpulse
