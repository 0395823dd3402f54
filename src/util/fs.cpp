#include <cerrno>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <util/defer.h>
#include <util/expected.h>
#include <util/fs.h>

namespace util {

struct temp_dir_wrap {
    std::filesystem::path path;
    ~temp_dir_wrap() {
        if (std::filesystem::is_directory(path)) {
            // being unable to delete a temp path is not an error
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
            //  warning: this might be called after spdlog is deactivated, so no
            //  logging!
        }
    }
};

// temporary paths are deleted when tmp_dir_cache is destroyed at exit.
// a deque does not move its contents as it grows.
static std::deque<temp_dir_wrap> tmp_dir_cache;

std::filesystem::path make_temp_dir() {
    namespace fs = std::filesystem;
    auto tmp_template =
        fs::temp_directory_path().string() + "/rex-XXXXXXXXXXXX";
    std::vector<char> base(tmp_template.data(),
                           tmp_template.data() + tmp_template.size() + 1);

    fs::path tmp_path = mkdtemp(base.data());

    spdlog::debug("make_temp_dir: created {}", tmp_path.string());

    tmp_dir_cache.emplace_back(tmp_path);

    return tmp_path;
}

util::expected<std::string, std::string>
read_file(const std::filesystem::path& path) {
    std::ifstream fid(path, std::ios::binary);
    if (!fid.is_open()) {
        return util::unexpected(fmt::format("unable to open {}", path));
    }
    std::string contents{std::istreambuf_iterator<char>(fid),
                         std::istreambuf_iterator<char>()};
    if (fid.bad()) {
        return util::unexpected(fmt::format("error reading {}", path));
    }
    return contents;
}

util::expected<void, std::string>
write_file_atomic(const std::filesystem::path& path,
                  std::string_view contents) {
    namespace fs = std::filesystem;

    auto tmp_template = (path.parent_path() / ".tmp-XXXXXX").string();
    std::vector<char> name(tmp_template.data(),
                           tmp_template.data() + tmp_template.size() + 1);

    int fd = mkstemp(name.data());
    if (fd == -1) {
        return util::unexpected(
            fmt::format("unable to create temporary file in {}: {}",
                        path.parent_path(), std::strerror(errno)));
    }
    const fs::path tmp_path(name.data());
    // remove the temporary file on any error path
    auto cleanup = defer([&tmp_path]() {
        std::error_code ec;
        fs::remove(tmp_path, ec);
    });

    {
        auto _ = defer([fd]() { close(fd); });
        std::size_t written = 0;
        while (written < contents.size()) {
            auto n = ::write(fd, contents.data() + written,
                             contents.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return util::unexpected(fmt::format(
                    "error writing {}: {}", tmp_path, std::strerror(errno)));
            }
            written += static_cast<std::size_t>(n);
        }
        if (fsync(fd) != 0) {
            return util::unexpected(fmt::format(
                "error syncing {}: {}", tmp_path, std::strerror(errno)));
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        return util::unexpected(fmt::format("unable to rename {} to {}: {}",
                                            tmp_path, path, ec.message()));
    }
    cleanup.release();

    spdlog::trace("write_file_atomic: wrote {} bytes to {}", contents.size(),
                  path);
    return {};
}

file_level file_access_level(const std::filesystem::path& path) {
    namespace fs = std::filesystem;

    using enum file_level;
    std::error_code ec;
    auto status = fs::status(path, ec);

    if (ec) {
        spdlog::debug("file_access_level {} error '{}'", path, ec.message());
        return none;
    }

    auto p = status.permissions();

    file_level lvl = none;
    constexpr auto pnone = std::filesystem::perms::none;
    if ((p & fs::perms::owner_read) != pnone ||
        (p & fs::perms::group_read) != pnone ||
        (p & fs::perms::others_read) != pnone) {
        lvl = readonly;
    }
    if ((p & fs::perms::owner_write) != pnone ||
        (p & fs::perms::group_write) != pnone ||
        (p & fs::perms::others_write) != pnone) {
        lvl = readwrite;
    }
    return lvl;
}

} // namespace util
