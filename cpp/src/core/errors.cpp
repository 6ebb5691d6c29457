#include "wgstore/core/errors.hpp"

#include <cstring>

namespace wgstore::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::PermissionDenied: return "PermissionDenied";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Busy: return "Busy";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::Cancelled: return "Cancelled";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Codec: return "Codec";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Merge: return "Merge";
            case StatusDomain::Import: return "Import";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    const char* reason_name(Reason reason) noexcept {
        switch (reason) {
            case Reason::None: return "None";
            case Reason::UnsupportedVersion: return "UnsupportedVersion";
            case Reason::NameMismatch: return "NameMismatch";
            case Reason::FlagCloudMismatch: return "FlagCloudMismatch";
            case Reason::ReservedNonZero: return "ReservedNonZero";
            case Reason::Truncated: return "Truncated";
            case Reason::MissingContentBlob: return "MissingContentBlob";
            case Reason::MissingIndex: return "MissingIndex";
            case Reason::MissingContainerDir: return "MissingContainerDir";
            case Reason::MissingManifest: return "MissingManifest";
            case Reason::BadManifestName: return "BadManifestName";
            case Reason::DigestMismatch: return "DigestMismatch";
            case Reason::SizeMismatch: return "SizeMismatch";
            case Reason::SeqMismatch: return "SeqMismatch";
            case Reason::SizeLimit: return "SizeLimit";
        }
        return "Unknown";
    }

    std::string describe(Status s, const Diagnostic& d) {
        std::string out = status_code_name(s.code);
        const Reason reason = status_reason(s);
        if (reason != Reason::None) {
            out += '/';
            out += reason_name(reason);
        }
        out += " (";
        out += status_domain_name(s.domain);
        out += ')';

        if (!d.path.empty()) {
            out += " in ";
            out += d.path;
        }
        if (!d.field.empty()) {
            out += ": field '";
            out += d.field;
            out += '\'';
        }
        if (d.has_values) {
            out += " expected " + std::to_string(d.expected) + ", got " + std::to_string(d.actual);
        }
        if (!d.detail.empty()) {
            out += ": ";
            out += d.detail;
        }
        if (s.code == StatusCode::Io && s.aux != 0) {
            out += ": ";
            out += std::strerror(static_cast<int>(s.aux));
        }
        return out;
    }
} // namespace wgstore::core
