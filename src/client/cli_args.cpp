#include "cli_args.hpp"

#include <charconv>

namespace cli {

std::optional<double> parse_double(std::string_view s) {
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::optional<std::vector<double>> parse_vector(std::string_view s) {
    std::vector<double> out;
    if (s.empty()) return out;
    while (true) {
        auto comma = s.find(',');
        auto v = parse_double(s.substr(0, comma));
        if (!v) return std::nullopt;
        out.push_back(*v);
        if (comma == std::string_view::npos) break;
        s.remove_prefix(comma + 1);
    }
    return out;
}

std::optional<size_t> parse_size(std::string_view s) {
    size_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

} // namespace cli
