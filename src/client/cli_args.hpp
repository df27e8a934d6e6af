#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace cli {

std::optional<double> parse_double(std::string_view s);

// Comma separated list of doubles. An empty string is an empty vector; an
// empty element anywhere (",1", "1,,2", "1,") is rejected.
std::optional<std::vector<double>> parse_vector(std::string_view s);

std::optional<size_t> parse_size(std::string_view s);

} // namespace cli
