#include "connection_details.hpp"

#include <format>

static constexpr const char* TCP_IFACE_PREFIX = "tcp_iface_";

Result<Resolution> resolve_connection(const ConnectionRequest& request,
                                      const std::string& toolchain_version) {
    bool has_endpoint = request.host.has_value() || request.port.has_value();

    if (request.optimizer_path && has_endpoint) {
        return make_error(ErrorKind::Config,
                          "give either an optimizer path or a host/port, not both");
    }

    if (request.optimizer_path) {
        auto desc = OptimizerDescriptor::load(*request.optimizer_path);
        if (!desc) return std::unexpected(desc.error());

        Resolution res{
            .details = ConnectionDetails{
                .host = desc->tcp.ip,
                .port = desc->tcp.port,
                .source = LocalSource{
                    .optimizer_path = *request.optimizer_path,
                    .build = ServerBuildInfo{
                        .component_name = desc->meta.optimizer_name,
                        .build_mode = desc->build.build_mode,
                        .version_tag = desc->build.opengen_version,
                    },
                },
            },
            .version_warning = std::nullopt,
        };

        if (!toolchain_version.empty() && toolchain_version != desc->build.opengen_version) {
            res.version_warning = std::format(
                "the target optimizer was built with a different version of opengen ({}); "
                "you are running opengen version {}",
                desc->build.opengen_version, toolchain_version);
        }
        return res;
    }

    if (request.host && request.port) {
        if (request.host->empty() || *request.port == 0) {
            return make_error(ErrorKind::Config, "host must be non-empty and port non-zero");
        }
        return Resolution{
            .details = ConnectionDetails{
                .host = *request.host,
                .port = *request.port,
                .source = RemoteSource{},
            },
            .version_warning = std::nullopt,
        };
    }

    if (has_endpoint) {
        return make_error(ErrorKind::Config, "host and port must be given together");
    }
    return make_error(ErrorKind::Config, "no optimizer path and no host/port given");
}

std::filesystem::path tcp_iface_directory(const LocalSource& local) {
    return local.optimizer_path / (TCP_IFACE_PREFIX + local.build.component_name);
}
