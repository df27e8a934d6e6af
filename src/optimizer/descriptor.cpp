#include "descriptor.hpp"

#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

std::optional<BuildMode> parse_build_mode(const std::string& s) {
    if (s == "debug") return BuildMode::Debug;
    if (s == "release") return BuildMode::Release;
    return std::nullopt;
}

std::string_view to_string(BuildMode mode) {
    return mode == BuildMode::Release ? "release" : "debug";
}

static Result<YAML::Node> section(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (!node.IsDefined() || !node.IsMap()) {
        return make_error(ErrorKind::Config, std::string("descriptor: missing section '") + name + "'");
    }
    return node;
}

static bool has(const YAML::Node& node, const char* key) {
    const YAML::Node child = node[key];
    return child.IsDefined() && !child.IsNull();
}

static Result<OptimizerDescriptor> from_yaml(const YAML::Node& root) {
    OptimizerDescriptor desc;

    if (!root.IsMap()) {
        return make_error(ErrorKind::Config, "descriptor: top level is not a mapping");
    }

    auto tcp = section(root, "tcp");
    if (!tcp) return std::unexpected(tcp.error());
    auto build = section(root, "build");
    if (!build) return std::unexpected(build.error());
    auto meta = section(root, "meta");
    if (!meta) return std::unexpected(meta.error());

    const YAML::Node& t = *tcp;
    if (!has(t, "ip") || !has(t, "port")) {
        return make_error(ErrorKind::Config, "descriptor: tcp.ip and tcp.port are required");
    }
    desc.tcp.ip = t["ip"].as<std::string>();
    auto port = t["port"].as<int64_t>();
    if (port < 1 || port > 65535) {
        return make_error(ErrorKind::Config,
                          "descriptor: tcp.port out of range: " + std::to_string(port));
    }
    desc.tcp.port = static_cast<uint16_t>(port);

    const YAML::Node& b = *build;
    if (!has(b, "build_mode") || !has(b, "opengen_version")) {
        return make_error(ErrorKind::Config,
                          "descriptor: build.build_mode and build.opengen_version are required");
    }
    auto mode_str = b["build_mode"].as<std::string>();
    auto mode = parse_build_mode(mode_str);
    if (!mode) {
        return make_error(ErrorKind::Config, "descriptor: unknown build_mode '" + mode_str + "'");
    }
    desc.build.build_mode = *mode;
    desc.build.opengen_version = b["opengen_version"].as<std::string>();

    const YAML::Node& m = *meta;
    if (!has(m, "optimizer_name")) {
        return make_error(ErrorKind::Config, "descriptor: meta.optimizer_name is required");
    }
    desc.meta.optimizer_name = m["optimizer_name"].as<std::string>();
    if (desc.meta.optimizer_name.empty()) {
        return make_error(ErrorKind::Config, "descriptor: meta.optimizer_name is empty");
    }
    if (has(m, "version")) desc.meta.version = m["version"].as<std::string>();
    if (has(m, "authors")) desc.meta.authors = m["authors"].as<std::vector<std::string>>();

    return desc;
}

Result<OptimizerDescriptor> OptimizerDescriptor::load(const fs::path& optimizer_dir) {
    auto path = optimizer_dir / FILE_NAME;
    if (!fs::exists(path)) {
        return make_error(ErrorKind::Config, "descriptor: could not open " + path.string());
    }

    try {
        auto desc = from_yaml(YAML::LoadFile(path.string()));
        if (!desc) {
            desc.error().message += " (" + path.string() + ")";
        }
        return desc;
    } catch (const YAML::Exception& e) {
        return make_error(ErrorKind::Config,
                          "descriptor: parse error in " + path.string() + ": " + e.what());
    }
}

Result<OptimizerDescriptor> OptimizerDescriptor::parse(const std::string& text) {
    try {
        return from_yaml(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        return make_error(ErrorKind::Config, std::string("descriptor: parse error: ") + e.what());
    }
}
