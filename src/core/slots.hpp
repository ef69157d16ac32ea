#pragma once

#include <combopanel/content_item.hpp>
#include <combopanel/frame_config.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace combopanel
{

// "group{group}_{item}", both 1-based
std::string slot_name(size_t group, size_t item);

// Inverse of slot_name; rejects zero indices and trailing garbage
std::optional<std::pair<size_t, size_t>> parse_slot_name(std::string_view name);

// Every slot addressed by the layout, group-major
std::vector<std::string> generate_slot_names(const LayoutSettings& layout);

// Entries of `values` whose key starts with "{slot}_", with the prefix removed
MetricValues slot_values(const MetricValues& values, std::string_view slot);

// Reads the conventional keys for `slot`. Missing numerical value falls back
// to a numeric "_value"; missing limits default to 0 and 100.
SlotData slot_data(const MetricValues& values, std::string_view slot);

// Text form of a metric value
std::string metric_to_string(const MetricValue& value);

// Numeric form of a metric value (bools as 0/1, strings parsed when possible)
std::optional<double> metric_to_number(const MetricValue& value);

}   // namespace combopanel
