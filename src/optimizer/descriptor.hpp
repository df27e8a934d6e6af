#pragma once

#include "error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class BuildMode { Debug, Release };

std::optional<BuildMode> parse_build_mode(const std::string& s);
std::string_view to_string(BuildMode mode);

// Parsed `optimizer.yml`, written next to a generated optimizer.
struct OptimizerDescriptor {
    static constexpr const char* FILE_NAME = "optimizer.yml";

    struct Tcp {
        std::string ip;
        uint16_t port = 0;
    } tcp;

    struct Build {
        BuildMode build_mode = BuildMode::Debug;
        std::string opengen_version;
    } build;

    struct Meta {
        std::string optimizer_name;
        // Informational only.
        std::string version;
        std::vector<std::string> authors;
    } meta;

    // Loads <optimizer_dir>/optimizer.yml. There are no defaults: every
    // consumed field must be present.
    static Result<OptimizerDescriptor> load(const std::filesystem::path& optimizer_dir);
    static Result<OptimizerDescriptor> parse(const std::string& text);
};
