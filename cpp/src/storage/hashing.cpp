#include "wgstore/storage/hashing.hpp"

#include <cerrno>
#include <cstddef>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

#include <blake3.h>

namespace wgstore::storage {
    using namespace wgstore::core;

    namespace {
        constexpr std::size_t kHashChunkBytes = 1024 * 1024;
    } // namespace

    Status hash_compute(wgstore::codec::BufferView data, Hash256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        if (data.len > 0) {
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }
        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return ok_status();
    }

    Status hash_file(const char* path, Hash256* out) noexcept {
        if (path == nullptr || out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        int fd = open(path, O_RDONLY);
        if (fd < 0) {
            if (errno == ENOENT) {
                return make_status(StatusDomain::Storage, StatusCode::NotFound);
            }
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        std::vector<u8> chunk(kHashChunkBytes);
        while (true) {
            const ssize_t n = read(fd, chunk.data(), chunk.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                close(fd);
                return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(err));
            }
            if (n == 0) break;
            blake3_hasher_update(&hasher, chunk.data(), static_cast<size_t>(n));
        }
        close(fd);

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return ok_status();
    }

    std::string hash_to_hex(const Hash256& h) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(h.b.size() * 2);
        for (u8 v : h.b) {
            out.push_back(hex[(v >> 4) & 0xF]);
            out.push_back(hex[v & 0xF]);
        }
        return out;
    }
} // namespace wgstore::storage
