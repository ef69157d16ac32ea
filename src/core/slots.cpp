#include "slots.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>

namespace combopanel
{

namespace
{

constexpr std::string_view SLOT_PREFIX = "group";

std::optional<size_t> parse_index(std::string_view text)
{
    if (text.empty())
        return std::nullopt;
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0)
        return std::nullopt;
    return value;
}

const MetricValue* find_value(const MetricValues& values, std::string_view slot, const char* suffix)
{
    std::string key(slot);
    key += suffix;
    auto it = values.find(key);
    return it != values.end() ? &it->second : nullptr;
}

}   // namespace

double SlotData::percent() const
{
    double range = max_limit - min_limit;
    if (!(range > 0.0))
        return 0.0;
    return std::clamp((numerical_value - min_limit) / range, 0.0, 1.0);
}

std::string slot_name(size_t group, size_t item)
{
    return std::string(SLOT_PREFIX) + std::to_string(group) + "_" + std::to_string(item);
}

std::optional<std::pair<size_t, size_t>> parse_slot_name(std::string_view name)
{
    if (!name.starts_with(SLOT_PREFIX))
        return std::nullopt;
    name.remove_prefix(SLOT_PREFIX.size());

    auto sep = name.find('_');
    if (sep == std::string_view::npos)
        return std::nullopt;

    auto group = parse_index(name.substr(0, sep));
    auto item  = parse_index(name.substr(sep + 1));
    if (!group || !item)
        return std::nullopt;
    return std::make_pair(*group, *item);
}

std::vector<std::string> generate_slot_names(const LayoutSettings& layout)
{
    std::vector<std::string> names;
    auto                     counts = layout.effective_item_counts();
    for (size_t g = 0; g < counts.size(); ++g)
    {
        for (size_t i = 0; i < counts[g]; ++i)
            names.push_back(slot_name(g + 1, i + 1));
    }
    return names;
}

MetricValues slot_values(const MetricValues& values, std::string_view slot)
{
    std::string prefix(slot);
    prefix += '_';

    MetricValues out;
    for (const auto& [key, value] : values)
    {
        if (key.size() > prefix.size() && key.starts_with(prefix))
            out.emplace(key.substr(prefix.size()), value);
    }
    return out;
}

SlotData slot_data(const MetricValues& values, std::string_view slot)
{
    SlotData data;

    if (auto* v = find_value(values, slot, "_caption"))
        data.caption = metric_to_string(*v);
    if (auto* v = find_value(values, slot, "_value"))
        data.value = metric_to_string(*v);
    if (auto* v = find_value(values, slot, "_unit"))
        data.unit = metric_to_string(*v);

    std::optional<double> number;
    if (auto* v = find_value(values, slot, "_numerical_value"))
        number = metric_to_number(*v);
    if (!number)
    {
        if (auto* v = find_value(values, slot, "_value"))
            number = metric_to_number(*v);
    }
    data.numerical_value = number.value_or(0.0);

    if (auto* v = find_value(values, slot, "_min_limit"))
        data.min_limit = metric_to_number(*v).value_or(0.0);
    if (auto* v = find_value(values, slot, "_max_limit"))
        data.max_limit = metric_to_number(*v).value_or(100.0);

    return data;
}

std::string metric_to_string(const MetricValue& value)
{
    if (auto* d = std::get_if<double>(&value))
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.6g", *d);
        return buf;
    }
    if (auto* b = std::get_if<bool>(&value))
        return *b ? "true" : "false";
    return std::get<std::string>(value);
}

std::optional<double> metric_to_number(const MetricValue& value)
{
    if (auto* d = std::get_if<double>(&value))
        return *d;
    if (auto* b = std::get_if<bool>(&value))
        return *b ? 1.0 : 0.0;

    const auto& s = std::get<std::string>(value);
    double      parsed = 0.0;
    auto [ptr, ec]     = std::from_chars(s.data(), s.data() + s.size(), parsed);
    if (ec != std::errc() || ptr == s.data())
        return std::nullopt;
    return parsed;
}

}   // namespace combopanel
