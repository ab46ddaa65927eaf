#pragma once

#include <rowbridge/core/dataset.hpp>
#include <rowbridge/core/value.hpp>

#include <cstddef>
#include <iostream>
#include <string>

namespace rowbridge {

[[nodiscard]] auto format_value(const Value& value) -> std::string;
[[nodiscard]] auto format_raw(const RawValue& value) -> std::string;

/// Print the first `max_rows` rows of `dataset` as an aligned table.
void print(const Dataset& dataset, std::ostream& out = std::cout, std::size_t max_rows = 20);

}  // namespace rowbridge
