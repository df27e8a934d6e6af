#pragma once

#include "descriptor.hpp"
#include "error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

struct ServerBuildInfo {
    std::string component_name;
    BuildMode build_mode = BuildMode::Debug;
    std::string version_tag;
};

// Server generated on this machine; it can be launched from optimizer_path.
struct LocalSource {
    std::filesystem::path optimizer_path;
    ServerBuildInfo build;
};

// Server reachable only over the network; no launch configuration.
struct RemoteSource {};

struct ConnectionDetails {
    std::string host;
    uint16_t port = 0;
    std::variant<LocalSource, RemoteSource> source;

    bool is_local() const { return std::holds_alternative<LocalSource>(source); }
    const LocalSource* local() const { return std::get_if<LocalSource>(&source); }
};

// Exactly one of {optimizer_path} or {host, port} must be set.
struct ConnectionRequest {
    std::optional<std::filesystem::path> optimizer_path;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
};

struct Resolution {
    ConnectionDetails details;
    // Set when the server was generated by a different toolchain version.
    std::optional<std::string> version_warning;
};

// toolchain_version: version of the generator the caller runs; empty skips the check.
Result<Resolution> resolve_connection(const ConnectionRequest& request,
                                      const std::string& toolchain_version = {});

// <optimizer_path>/tcp_iface_<optimizer_name>
std::filesystem::path tcp_iface_directory(const LocalSource& local);
