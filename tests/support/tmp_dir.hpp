#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <vector>

// RAII temp directory that is removed with its contents.
struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        auto tmpl_path = std::filesystem::temp_directory_path() / "optcp_test_XXXXXX";
        std::string tmpl = tmpl_path.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        path = ::mkdtemp(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream f(path / name);
        f << content;
    }
};

// Block-style optimizer.yml, laid out the way the code generator writes it.
inline std::string descriptor_yaml(const std::string& ip, uint16_t port,
                                   const std::string& build_mode = "debug",
                                   const std::string& name = "foo",
                                   const std::string& version = "0.9.4") {
    return std::format(
        "build:\n"
        "  build_mode: {}\n"
        "  opengen_version: {}\n"
        "meta:\n"
        "  authors:\n"
        "  - John Smith\n"
        "  optimizer_name: \"{}\"\n"
        "  version: 0.0.1\n"
        "tcp:\n"
        "  ip: {}\n"
        "  port: {}\n",
        build_mode, version, name, ip, port);
}
