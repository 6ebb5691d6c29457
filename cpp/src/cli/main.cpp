#include <cinttypes>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include "wgstore/cli/commands.hpp"
#include "wgstore/cli/options.hpp"
#include "wgstore/codec/utf16.hpp"
#include "wgstore/core/errors.hpp"
#include "wgstore/core/events.hpp"
#include "wgstore/core/filetime.hpp"
#include "wgstore/core/guid.hpp"
#include "wgstore/import/importer.hpp"
#include "wgstore/storage/hashing.hpp"
#include "wgstore/storage/store.hpp"

namespace fs = std::filesystem;
using wgstore::core::Diagnostic;
using wgstore::core::Status;

// ========================================================================
// Global State
// ========================================================================

volatile std::sig_atomic_t g_cancel = 0;

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    std::string store_root;     // --store, or $WGSTORE_STORE
    std::string wgs_root;       // --wgs, or derived from $LOCALAPPDATA
    bool dry_run{false};
    bool backup{true};
    bool verify{true};
    wgstore::core::i64 seq{-1}; // --seq; -1 means "discover the manifest"
};

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// ========================================================================
// Signal Handler
// ========================================================================

void sigint_handler(int sig) {
    (void)sig;
    g_cancel = 1;
}

// ========================================================================
// Output
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, Status s, const Diagnostic& diag) {
    fprintf(stderr, "error: %s failed: %s\n", context, wgstore::core::describe(s, diag).c_str());
}

void stderr_event(void* ctx, const wgstore::core::Event& ev) {
    (void)ctx;
    const char* level = ev.level == wgstore::core::EventLevel::Warning ? "warning" : "info";
    fprintf(stderr, "%s: %s\n", level, ev.message.c_str());
}

std::string format_time(wgstore::core::FileTime t) {
    char buf[32];
    if (!wgstore::core::filetime_format_utc(t, buf, sizeof(buf))) {
        return std::to_string(t.ticks);
    }
    return std::string(buf) + "Z";
}

std::string utf8(const std::u16string& s) {
    return wgstore::codec::utf16_to_utf8(s);
}

// ========================================================================
// Command Tables
// ========================================================================

const wgstore::cli::CommandSpec kCommands[] = {
    {wgstore::cli::CommandId::Help, "help", "help"},
    {wgstore::cli::CommandId::Inspect, "inspect", "inspect --store <dir>"},
    {wgstore::cli::CommandId::Files, "files", "files --store <dir> [--seq <n>] <container-name>"},
    {wgstore::cli::CommandId::Verify, "verify", "verify --store <dir>"},
    {wgstore::cli::CommandId::Candidates, "candidates", "candidates [--wgs <dir>]"},
    {wgstore::cli::CommandId::Import, "import",
     "import <save-dir> [--store <dir>] [--wgs <dir>] [--dry-run] [--no-backup] [--no-verify]"},
};
constexpr wgstore::core::u32 kCommandCount = sizeof(kCommands) / sizeof(kCommands[0]);

const wgstore::cli::OptionSpec kOptions[] = {
    {wgstore::cli::OptionId::Store, wgstore::cli::OptionType::String, "store", 's'},
    {wgstore::cli::OptionId::Wgs, wgstore::cli::OptionType::String, "wgs", 'w'},
    {wgstore::cli::OptionId::DryRun, wgstore::cli::OptionType::Flag, "dry-run", 'n'},
    {wgstore::cli::OptionId::NoBackup, wgstore::cli::OptionType::Flag, "no-backup", '\0'},
    {wgstore::cli::OptionId::NoVerify, wgstore::cli::OptionType::Flag, "no-verify", '\0'},
    {wgstore::cli::OptionId::Seq, wgstore::cli::OptionType::I64, "seq", '\0'},
    {wgstore::cli::OptionId::Help, wgstore::cli::OptionType::Flag, "help", 'h'},
};
constexpr wgstore::core::u32 kOptionCount = sizeof(kOptions) / sizeof(kOptions[0]);

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("usage: wgstore <command> [options] [args]\n\n");
    printf("Commands:\n");
    for (const wgstore::cli::CommandSpec& c : kCommands) {
        printf("  %s\n", c.usage);
    }
    printf("\n");
    printf("Options:\n");
    printf("  -s, --store <dir>   store directory holding containers.index\n");
    printf("  -w, --wgs <dir>     directory of candidate stores (default: from LOCALAPPDATA)\n");
    printf("  -n, --dry-run       read and validate everything, write nothing\n");
    printf("      --no-backup     skip the <store>.backup.<timestamp> copy before importing\n");
    printf("      --no-verify     skip re-hashing written blobs\n");
    printf("      --seq <n>       read container.<n> instead of the discovered manifest\n");
    printf("\n");
    printf("Environment: WGSTORE_STORE sets the default --store.\n");
}

bool require_store(const CliConfig& cfg, const char* command) {
    if (cfg.store_root.empty()) {
        fprintf(stderr, "error: %s: --store is required\n", command);
        return false;
    }
    return true;
}

int handle_inspect(const CliConfig& cfg) {
    if (!require_store(cfg, "inspect")) {
        return kExitUsage;
    }

    wgstore::core::ContainerIndex index{};
    Diagnostic diag{};
    const Status s =
        wgstore::storage::decode_index(fs::path(cfg.store_root) / wgstore::storage::kIndexFileName, &index, &diag);
    if (!wgstore::core::is_ok(s)) {
        print_status_error("inspect", s, diag);
        return kExitFailure;
    }

    printf("version:      %u\n", index.version);
    printf("package:      %s\n", utf8(index.package_name).c_str());
    printf("index id:     %s\n", utf8(index.index_id).c_str());
    printf("modified:     %s\n", format_time(index.mtime).c_str());
    printf("flag1/flag2:  %u/%u\n", index.flag1, index.flag2);
    printf("containers:   %zu\n", index.containers.size());
    for (const wgstore::core::ContainerEntry& e : index.containers) {
        printf("\n  %s\n", utf8(e.name).c_str());
        printf("    directory: %s\n", wgstore::core::guid_to_dir_name(e.id).c_str());
        printf("    seq=%u flags=%u size=%" PRIu64 "\n", static_cast<unsigned>(e.seq), e.flags, e.size);
        printf("    modified:  %s\n", format_time(e.mtime).c_str());
        if (!e.cloud_id.empty()) {
            printf("    cloud id:  %s\n", utf8(e.cloud_id).c_str());
        }
    }
    return kExitOk;
}

int handle_files(const CliConfig& cfg, const wgstore::cli::CliArgs& positionals) {
    if (!require_store(cfg, "files")) {
        return kExitUsage;
    }
    if (positionals.argc != 1) {
        print_error("files: expected exactly one container name");
        return kExitUsage;
    }

    const fs::path root(cfg.store_root);
    wgstore::core::ContainerIndex index{};
    Diagnostic diag{};
    Status s = wgstore::storage::decode_index(root / wgstore::storage::kIndexFileName, &index, &diag);
    if (!wgstore::core::is_ok(s)) {
        print_status_error("files", s, diag);
        return kExitFailure;
    }

    const std::u16string wanted = wgstore::codec::utf8_to_utf16(positionals.argv[0]);
    const wgstore::core::ContainerEntry* entry = nullptr;
    for (const wgstore::core::ContainerEntry& e : index.containers) {
        if (e.name == wanted) {
            entry = &e;
        }
    }
    if (entry == nullptr) {
        fprintf(stderr, "error: files: no container named '%s'\n", positionals.argv[0]);
        return kExitFailure;
    }

    const fs::path dir = wgstore::storage::container_dir_path(root, entry->id);
    fs::path manifest;
    wgstore::core::u32 seq = 0;
    if (cfg.seq >= 0) {
        seq = static_cast<wgstore::core::u32>(cfg.seq);
        manifest = dir / (std::string(wgstore::storage::kManifestPrefix) + std::to_string(seq));
    } else {
        s = wgstore::storage::find_manifest(dir, &manifest, &seq, &diag);
        if (!wgstore::core::is_ok(s)) {
            print_status_error("files", s, diag);
            return kExitFailure;
        }
    }

    wgstore::core::ContainerFileList list{};
    s = wgstore::storage::decode_file_list(manifest, seq, &list, &diag);
    if (!wgstore::core::is_ok(s)) {
        print_status_error("files", s, diag);
        return kExitFailure;
    }

    printf("%s (%s, seq %u, %zu files)\n", utf8(entry->name).c_str(), manifest.string().c_str(), list.seq,
           list.files.size());
    for (const wgstore::core::ContentFileEntry& f : list.files) {
        const fs::path blob = dir / wgstore::core::guid_to_dir_name(f.id);
        wgstore::core::Hash256 digest{};
        s = wgstore::storage::hash_file(blob.c_str(), &digest);
        if (!wgstore::core::is_ok(s)) {
            diag = Diagnostic{};
            diag.path = blob.string();
            print_status_error("hashing", s, diag);
            return kExitFailure;
        }
        printf("  %-20s %s %10zu blake3:%s\n", utf8(f.name).c_str(), wgstore::core::guid_to_dir_name(f.id).c_str(),
               f.data.size(), wgstore::storage::hash_to_hex(digest).c_str());
    }
    return kExitOk;
}

int handle_verify(const CliConfig& cfg) {
    if (!require_store(cfg, "verify")) {
        return kExitUsage;
    }

    wgstore::storage::VerifyReport report{};
    Diagnostic diag{};
    const Status s = wgstore::storage::verify_store(cfg.store_root, &report, &diag);
    if (!wgstore::core::is_ok(s)) {
        print_status_error("verify", s, diag);
        return kExitFailure;
    }

    for (const wgstore::storage::VerifyProblem& p : report.problems) {
        printf("problem: %s: %s\n", p.container.c_str(), wgstore::core::describe(p.status, p.diag).c_str());
    }
    for (const std::string& d : report.orphan_dirs) {
        printf("orphan: %s\n", d.c_str());
    }
    printf("%u entries, %u blobs checked, %zu problems, %zu orphan directories\n", report.entries_checked,
           report.blobs_checked, report.problems.size(), report.orphan_dirs.size());
    return report.problems.empty() ? kExitOk : kExitFailure;
}

bool resolve_wgs_root(const CliConfig& cfg, const wgstore::import::GameProfile& profile, fs::path* out) {
    if (!cfg.wgs_root.empty()) {
        *out = cfg.wgs_root;
        return true;
    }
    Diagnostic diag{};
    const Status s = wgstore::import::default_wgs_root(profile, out, &diag);
    if (!wgstore::core::is_ok(s)) {
        print_status_error("locating the wgs directory", s, diag);
        return false;
    }
    return true;
}

int handle_candidates(const CliConfig& cfg) {
    const wgstore::import::GameProfile profile = wgstore::import::palworld_profile();
    fs::path wgs;
    if (!resolve_wgs_root(cfg, profile, &wgs)) {
        return kExitFailure;
    }

    std::vector<wgstore::import::CandidateStore> stores;
    Diagnostic diag{};
    const Status s = wgstore::import::find_candidate_stores(wgs, profile, &stores, &diag);
    if (!wgstore::core::is_ok(s)) {
        print_status_error("candidates", s, diag);
        return kExitFailure;
    }
    if (stores.empty()) {
        fprintf(stderr, "warning: no %s stores under %s; run the game at least once\n",
                profile.display_name.c_str(), wgs.string().c_str());
        return kExitFailure;
    }
    for (const wgstore::import::CandidateStore& c : stores) {
        printf("%s  %s\n", format_time(c.mtime).c_str(), c.path.string().c_str());
    }
    return kExitOk;
}

int handle_import(const CliConfig& cfg, const wgstore::cli::CliArgs& positionals) {
    if (positionals.argc != 1) {
        print_error("import: expected exactly one save directory");
        return kExitUsage;
    }

    wgstore::import::ImportConfig icfg{};
    icfg.dry_run = cfg.dry_run;
    icfg.backup = cfg.backup;
    icfg.verify_after_write = cfg.verify;
    icfg.cancel = &g_cancel;

    fs::path store = cfg.store_root;
    if (store.empty()) {
        fs::path wgs;
        if (!resolve_wgs_root(cfg, icfg.profile, &wgs)) {
            return kExitFailure;
        }
        std::vector<wgstore::import::CandidateStore> stores;
        Diagnostic diag{};
        const Status s = wgstore::import::find_candidate_stores(wgs, icfg.profile, &stores, &diag);
        if (!wgstore::core::is_ok(s)) {
            print_status_error("candidates", s, diag);
            return kExitFailure;
        }
        if (stores.empty()) {
            fprintf(stderr, "error: no %s store found under %s; run the game at least once\n",
                    icfg.profile.display_name.c_str(), wgs.string().c_str());
            return kExitFailure;
        }
        store = stores.front().path;
        if (stores.size() > 1) {
            fprintf(stderr, "warning: %zu stores found, using the newest; pass --store to choose\n",
                    stores.size());
        }
    }
    fprintf(stderr, "info: target store %s\n", store.string().c_str());

    const wgstore::core::EventSink sink{&stderr_event, nullptr};
    wgstore::import::ImportResult result{};
    Diagnostic diag{};
    const Status s = wgstore::import::import_save(positionals.argv[0], store, icfg, &result, &diag, &sink);
    if (!wgstore::core::is_ok(s)) {
        print_status_error("import", s, diag);
        if (!result.backup_path.empty()) {
            fprintf(stderr, "info: the store was backed up to %s before the failure\n",
                    result.backup_path.string().c_str());
        }
        return kExitFailure;
    }

    printf("%s '%s': %zu containers (%u replaced), index now holds %zu entries\n",
           result.dry_run ? "would import" : "imported", result.plan.save_name.c_str(), result.entries.size(),
           result.stats.replaced, result.index.containers.size());
    return kExitOk;
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    signal(SIGINT, sigint_handler);

    if (argc < 2) {
        handle_help();
        return kExitUsage;
    }

    const wgstore::cli::CliArgs args{argv + 1, static_cast<wgstore::core::u32>(argc - 1)};
    wgstore::cli::CommandInvocation cmd{};
    wgstore::core::u32 consumed = 0;
    Status s = wgstore::cli::parse_command(args, kCommands, kCommandCount, &cmd, &consumed);
    if (!wgstore::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s'\n", argv[1]);
        handle_help();
        return kExitUsage;
    }

    std::vector<wgstore::cli::ParsedOption> option_storage(cmd.args.argc);
    std::vector<const char*> positional_storage(cmd.args.argc);
    wgstore::cli::ParsedOptions opts{option_storage.data(), 0, cmd.args.argc};
    wgstore::cli::CliArgs positionals{};
    wgstore::core::u32 bad_index = 0;
    s = wgstore::cli::parse_options(cmd.args, kOptions, kOptionCount, &opts, &positionals,
                                    positional_storage.data(), cmd.args.argc, &bad_index);
    if (!wgstore::core::is_ok(s)) {
        const char* tok = bad_index < cmd.args.argc ? cmd.args.argv[bad_index] : "";
        fprintf(stderr, "error: invalid option or missing value near '%s'\n", tok != nullptr ? tok : "");
        return kExitUsage;
    }
    if (cmd.id == wgstore::cli::CommandId::Help || wgstore::cli::has_flag(opts, wgstore::cli::OptionId::Help)) {
        handle_help();
        return kExitOk;
    }

    // Configuration: defaults, then environment, then options.
    CliConfig cfg;
    const char* env_store = std::getenv("WGSTORE_STORE");
    if (env_store != nullptr && *env_store != '\0') {
        cfg.store_root = env_store;
    }
    if (const wgstore::cli::ParsedOption* o = wgstore::cli::find_option(opts, wgstore::cli::OptionId::Store)) {
        cfg.store_root = o->value.str;
    }
    if (const wgstore::cli::ParsedOption* o = wgstore::cli::find_option(opts, wgstore::cli::OptionId::Wgs)) {
        cfg.wgs_root = o->value.str;
    }
    if (const wgstore::cli::ParsedOption* o = wgstore::cli::find_option(opts, wgstore::cli::OptionId::Seq)) {
        if (o->value.i64v < 0 || o->value.i64v > 0xFFFFFFFFll) {
            print_error("--seq must be between 0 and 4294967295");
            return kExitUsage;
        }
        cfg.seq = o->value.i64v;
    }
    cfg.dry_run = wgstore::cli::has_flag(opts, wgstore::cli::OptionId::DryRun);
    cfg.backup = !wgstore::cli::has_flag(opts, wgstore::cli::OptionId::NoBackup);
    cfg.verify = !wgstore::cli::has_flag(opts, wgstore::cli::OptionId::NoVerify);

    switch (cmd.id) {
        case wgstore::cli::CommandId::Inspect:
            return handle_inspect(cfg);
        case wgstore::cli::CommandId::Files:
            return handle_files(cfg, positionals);
        case wgstore::cli::CommandId::Verify:
            return handle_verify(cfg);
        case wgstore::cli::CommandId::Candidates:
            return handle_candidates(cfg);
        case wgstore::cli::CommandId::Import:
            return handle_import(cfg, positionals);
        default:
            break;
    }
    handle_help();
    return kExitUsage;
}
