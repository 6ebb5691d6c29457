#include "wgstore/storage/fs.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <regex>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <blake3.h>

#include "wgstore/core/filetime.hpp"

namespace wgstore::storage {
    using namespace wgstore::core;

    namespace {
        [[nodiscard]] Status io_error(int err) noexcept {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(err));
        }

        void diag_path(Diagnostic* diag, const std::filesystem::path& p) {
            if (diag != nullptr) {
                diag->path = p.string();
            }
        }

        [[nodiscard]] FileTime mtime_of(const struct stat& st) noexcept {
            const u64 secs = static_cast<u64>(st.st_mtim.tv_sec);
            const u64 sub = static_cast<u64>(st.st_mtim.tv_nsec) / 100u;
            return FileTime{secs * kFileTimeTicksPerSecond + sub + kFileTimeUnixEpochTicks};
        }

        [[nodiscard]] Status write_all_fd(int fd, const u8* data, std::size_t len) noexcept {
            std::size_t written = 0;
            while (written < len) {
                const ssize_t n = write(fd, data + written, len - written);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return io_error(errno);
                }
                written += static_cast<std::size_t>(n);
            }
            return ok_status();
        }
    } // namespace

    Status stat_path(const std::filesystem::path& path, FileStat* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        *out = FileStat{};

        struct stat st{};
        if (::stat(path.c_str(), &st) != 0) {
            if (errno == ENOENT || errno == ENOTDIR) {
                return make_status(StatusDomain::Storage, StatusCode::NotFound);
            }
            return io_error(errno);
        }
        out->exists = true;
        out->is_dir = S_ISDIR(st.st_mode);
        out->size_bytes = static_cast<u64>(st.st_size);
        out->mtime = mtime_of(st);
        return ok_status();
    }

    Status read_file_all(const std::filesystem::path& path, std::vector<u8>* out, Diagnostic* diag) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        int fd = open(path.c_str(), O_RDONLY);
        if (fd < 0) {
            const int err = errno;
            diag_path(diag, path);
            if (err == ENOENT) {
                return make_status(StatusDomain::Storage, StatusCode::NotFound);
            }
            return io_error(err);
        }

        struct stat st{};
        if (fstat(fd, &st) != 0) {
            const int err = errno;
            close(fd);
            diag_path(diag, path);
            return io_error(err);
        }

        std::vector<u8> buf(static_cast<std::size_t>(st.st_size));
        std::size_t bytes_read = 0;
        while (bytes_read < buf.size()) {
            const ssize_t n = read(fd, buf.data() + bytes_read, buf.size() - bytes_read);
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                close(fd);
                diag_path(diag, path);
                return io_error(err);
            }
            if (n == 0) break;  // file shrank underneath us
            bytes_read += static_cast<std::size_t>(n);
        }
        close(fd);

        buf.resize(bytes_read);
        *out = std::move(buf);
        return ok_status();
    }

    Status write_file_all(const std::filesystem::path& path, const u8* data, std::size_t len,
                          Diagnostic* diag) noexcept {
        if (data == nullptr && len > 0) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd < 0) {
            const int err = errno;
            diag_path(diag, path);
            return io_error(err);
        }

        Status s = write_all_fd(fd, data, len);
        if (is_ok(s) && fsync(fd) != 0) {
            s = io_error(errno);
        }
        if (close(fd) != 0 && is_ok(s)) {
            s = io_error(errno);
        }
        if (!is_ok(s)) {
            diag_path(diag, path);
        }
        return s;
    }

    Status copy_file_chunked(const std::filesystem::path& src, const std::filesystem::path& dst,
                             const CopyOptions& opts, CopyResult* result, Diagnostic* diag) noexcept {
        if (result == nullptr || opts.chunk_bytes == 0) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        *result = CopyResult{};

        int in = open(src.c_str(), O_RDONLY);
        if (in < 0) {
            const int err = errno;
            diag_path(diag, src);
            if (err == ENOENT) {
                return make_status(StatusDomain::Storage, StatusCode::NotFound);
            }
            return io_error(err);
        }

        int out = open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (out < 0) {
            const int err = errno;
            close(in);
            diag_path(diag, dst);
            return io_error(err);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        std::vector<u8> chunk(opts.chunk_bytes);
        Status s = ok_status();
        while (true) {
            if (opts.cancel != nullptr && *opts.cancel != 0) {
                s = make_status(StatusDomain::Storage, StatusCode::Cancelled);
                break;
            }
            const ssize_t n = read(in, chunk.data(), chunk.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                s = io_error(errno);
                diag_path(diag, src);
                break;
            }
            if (n == 0) break;

            s = write_all_fd(out, chunk.data(), static_cast<std::size_t>(n));
            if (!is_ok(s)) {
                diag_path(diag, dst);
                break;
            }
            blake3_hasher_update(&hasher, chunk.data(), static_cast<size_t>(n));
            result->bytes_copied += static_cast<u64>(n);
        }

        if (is_ok(s) && fsync(out) != 0) {
            s = io_error(errno);
            diag_path(diag, dst);
        }
        close(in);
        if (close(out) != 0 && is_ok(s)) {
            s = io_error(errno);
            diag_path(diag, dst);
        }

        if (!is_ok(s)) {
            // Never leave a half-written blob behind.
            unlink(dst.c_str());
            result->bytes_copied = 0;
            return s;
        }

        blake3_hasher_finalize(&hasher, result->digest.b.data(), result->digest.b.size());
        return ok_status();
    }

    Status make_dirs(const std::filesystem::path& path, Diagnostic* diag) noexcept {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            diag_path(diag, path);
            return io_error(ec.value());
        }
        return ok_status();
    }

    Status list_dir(const std::filesystem::path& dir, const std::string& pattern, std::vector<DirEntry>* out,
                    Diagnostic* diag) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        out->clear();

        std::regex re;
        if (!pattern.empty()) {
            try {
                re = std::regex(pattern, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                diag_set(diag, "pattern", e.what());
                return make_status(StatusDomain::Storage, StatusCode::Invalid);
            }
        }

        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            diag_path(diag, dir);
            if (ec == std::errc::no_such_file_or_directory) {
                return make_status(StatusDomain::Storage, StatusCode::NotFound);
            }
            return io_error(ec.value());
        }

        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const std::string name = it->path().filename().string();
            if (!pattern.empty() && !std::regex_match(name, re)) {
                continue;
            }
            FileStat st{};
            if (!is_ok(stat_path(it->path(), &st))) {
                continue;  // vanished between listing and stat
            }
            out->push_back(DirEntry{name, st.is_dir, st.mtime});
        }
        if (ec) {
            diag_path(diag, dir);
            return io_error(ec.value());
        }

        std::sort(out->begin(), out->end(), [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
        return ok_status();
    }

    Status copy_tree(const std::filesystem::path& src, const std::filesystem::path& dst, Diagnostic* diag) noexcept {
        std::error_code ec;
        if (std::filesystem::exists(dst, ec)) {
            diag_path(diag, dst);
            diag_set(diag, "backup", "destination already exists");
            return make_status(StatusDomain::Storage, StatusCode::Conflict);
        }
        std::filesystem::copy(src, dst, std::filesystem::copy_options::recursive, ec);
        if (ec) {
            diag_path(diag, src);
            return io_error(ec.value());
        }
        return ok_status();
    }
} // namespace wgstore::storage
