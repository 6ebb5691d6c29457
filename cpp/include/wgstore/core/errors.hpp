#pragma once
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace wgstore::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        PermissionDenied,
        Conflict,
        Busy,
        Corrupt,
        Io,
        Unsupported,
        Unavailable,
        Cancelled,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Codec,
        Storage,
        Merge,
        Import,
        Cli,
        External,
    };

    // Carried in Status::aux for Corrupt / Unsupported / NotFound results.
    // Io results carry errno in aux instead.
    enum class Reason : u32 {
        None = 0,
        UnsupportedVersion,
        NameMismatch,
        FlagCloudMismatch,
        ReservedNonZero,
        Truncated,
        MissingContentBlob,
        MissingIndex,
        MissingContainerDir,
        MissingManifest,
        BadManifestName,
        DigestMismatch,
        SizeMismatch,
        SeqMismatch,
        SizeLimit,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, Reason reason) noexcept {
        return Status{code, domain, static_cast<u32>(reason)};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] constexpr Reason status_reason(Status s) noexcept {
        if (s.code == StatusCode::Io || s.code == StatusCode::Ok) {
            return Reason::None;
        }
        return static_cast<Reason>(s.aux);
    }

    // Human-readable context for a failed operation: which file, which field,
    // and the expected/actual values where they are numeric.
    struct Diagnostic {
        std::string path;
        std::string field;
        std::string detail;
        u64 expected{0};
        u64 actual{0};
        bool has_values{false};
    };

    inline void diag_set(Diagnostic* d, const char* field, u64 expected, u64 actual) {
        if (d == nullptr) {
            return;
        }
        d->field = field;
        d->expected = expected;
        d->actual = actual;
        d->has_values = true;
    }

    inline void diag_set(Diagnostic* d, const char* field, std::string detail) {
        if (d == nullptr) {
            return;
        }
        d->field = field;
        d->detail = std::move(detail);
        d->has_values = false;
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;
    [[nodiscard]] const char* reason_name(Reason reason) noexcept;

    // One line, e.g. "Unsupported/UnsupportedVersion (Codec) in /x/containers.index:
    // field 'version' expected 14, got 13".
    [[nodiscard]] std::string describe(Status s, const Diagnostic& d);

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace wgstore::core
