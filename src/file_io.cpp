//
//  file_io.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "file_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "logging.hpp"

namespace tonieforge {

namespace {

TonieStatus io_error(const std::string &what, const std::string &path, int err) {
    const std::string reason = std::generic_category().message(err);
    TF_LOG("error", what << " " << path << " errno=" << err << " (" << reason << ")");
    return make_error(ErrorKind::Io, what + " " + path + ": " + reason);
}

std::filesystem::path temp_sibling(const std::filesystem::path &target) {
    auto tmp = target;
    tmp += ".tmp";
    return tmp;
}

}  // namespace

TonieResult<std::vector<uint8_t>> read_file(const std::string &path, size_t max_bytes) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return io_error("open failed for", path, errno);
    }
    f.seekg(0, std::ios::end);
    const auto end = f.tellg();
    if (end < 0) {
        return io_error("seek failed for", path, errno);
    }
    f.seekg(0, std::ios::beg);
    const size_t sz = std::min(static_cast<size_t>(end), max_bytes);
    std::vector<uint8_t> out(sz);
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(sz));
    if (static_cast<size_t>(f.gcount()) != sz) {
        return io_error("short read from", path, errno);
    }
    TF_LOG("debug", "read " << sz << " bytes from " << path);
    return out;
}

TonieResult<uint64_t> file_size(const std::string &path) {
    std::error_code ec;
    const auto sz = std::filesystem::file_size(path, ec);
    if (ec) {
        TF_LOG("error", "stat failed for " << path << " (" << ec.message() << ")");
        return make_error(ErrorKind::Io, "stat failed for " + path + ": " + ec.message());
    }
    return static_cast<uint64_t>(sz);
}

TonieStatus write_file_atomic(const std::string &path, const std::vector<uint8_t> &data) {
    const std::filesystem::path target(path);
    const auto tmp = temp_sibling(target);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return io_error("open failed for", tmp.string(), errno);
        }
        out.write(reinterpret_cast<const char *>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out.good()) {
            const int err = errno;
            out.close();
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return io_error("write failed for", tmp.string(), err);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        TF_LOG("error", "rename " << tmp.string() << " -> " << path << " failed ("
                                   << ec.message() << ")");
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return make_error(ErrorKind::Io, "rename to " + path + " failed: " + ec.message());
    }
    TF_LOG("info", "wrote " << data.size() << " bytes to " << path);
    return make_ok();
}

}  // namespace tonieforge
