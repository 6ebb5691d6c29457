#include <csignal>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "wgstore/codec/buffer.hpp"
#include "wgstore/codec/file_list.hpp"
#include "wgstore/core/guid.hpp"
#include "wgstore/storage/hashing.hpp"
#include "wgstore/storage/store.hpp"
#include "test_support.hpp"

using namespace wgstore::storage;
using namespace wgstore::core;
namespace stdfs = std::filesystem;

namespace {
    ContentFileEntry blob_file(const std::u16string& name, const Guid& id, std::vector<u8> data) {
        ContentFileEntry f{};
        f.name = name;
        f.id = id;
        f.data = std::move(data);
        return f;
    }

    // Writes one container holding `data` as its single blob and returns the
    // matching index entry.
    ContainerEntry put_container(const stdfs::path& root, const std::u16string& name, u8 tag,
                                 const std::vector<u8>& data) {
        ContainerEntry e = wgstore::test::make_entry(name, wgstore::test::guid_with(0xC0, tag), data.size());
        ContainerFileList list{};
        list.seq = e.seq;
        list.files.push_back(blob_file(u"Data", wgstore::test::guid_with(0xB0, tag), data));
        const Status s = write_file_list(list, container_dir_path(root, e.id), WriteOptions{}, nullptr, nullptr,
                                         nullptr);
        EXPECT_EQ(s.code, StatusCode::Ok);
        return e;
    }

    void put_index(const stdfs::path& root, const std::vector<ContainerEntry>& entries) {
        ContainerIndex idx{};
        idx.package_name = u"Test.Package_123";
        idx.containers = entries;
        EXPECT_EQ(write_index(idx, root, nullptr, nullptr).code, StatusCode::Ok);
    }

    // Every regular file under root with its contents.
    std::map<std::string, std::vector<u8>> snapshot(const stdfs::path& root) {
        std::map<std::string, std::vector<u8>> out;
        for (const auto& de : stdfs::recursive_directory_iterator(root)) {
            if (de.is_regular_file()) {
                out[de.path().string()] = wgstore::test::read_bytes(de.path());
            }
        }
        return out;
    }
} // namespace

// ============================================================================
// Index files
// ============================================================================

TEST(Store, IndexWriteThenDecode) {
    wgstore::test::TempDir tmp;
    ContainerIndex idx{};
    idx.package_name = u"Pkg";
    idx.containers.push_back(wgstore::test::make_entry(u"A", wgstore::test::guid_with(1, 1), 10));

    wgstore::test::EventLog log;
    const EventSink sink = log.sink();
    ASSERT_EQ(write_index(idx, tmp.path(), nullptr, &sink).code, StatusCode::Ok);
    EXPECT_EQ(log.count(EventKind::IndexWritten), 1u);
    EXPECT_TRUE(stdfs::exists(tmp.path() / "containers.index"));

    ContainerIndex back{};
    ASSERT_EQ(decode_index(tmp.path() / kIndexFileName, &back, nullptr).code, StatusCode::Ok);
    EXPECT_EQ(back, idx);
}

TEST(Store, MissingIndex) {
    wgstore::test::TempDir tmp;
    ContainerIndex out{};
    Diagnostic diag{};
    const Status s = decode_index(tmp.path() / kIndexFileName, &out, &diag);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.domain, StatusDomain::Storage);
    EXPECT_EQ(status_reason(s), Reason::MissingIndex);
    EXPECT_EQ(diag.path, (tmp.path() / kIndexFileName).string());
}

TEST(Store, CorruptIndexCarriesPath) {
    wgstore::test::TempDir tmp;
    wgstore::test::write_bytes(tmp.path() / kIndexFileName, {13, 0, 0, 0});
    ContainerIndex out{};
    Diagnostic diag{};
    const Status s = decode_index(tmp.path() / kIndexFileName, &out, &diag);
    EXPECT_EQ(s.code, StatusCode::Unsupported);
    EXPECT_EQ(diag.path, (tmp.path() / kIndexFileName).string());
    EXPECT_EQ(diag.field, "version");
}

// ============================================================================
// Container directories
// ============================================================================

TEST(Store, FileListWriteThenDecode) {
    wgstore::test::TempDir tmp;
    const stdfs::path dir = tmp.path() / "33221100554477668899AABBCCDDEEFF";
    ContainerFileList list{};
    list.seq = 2;
    list.files.push_back(blob_file(u"Data", wgstore::test::guid_with(0x0A, 1), wgstore::test::pattern_bytes(700, 1)));
    list.files.push_back(blob_file(u"Thumb", wgstore::test::guid_with(0x0B, 2), {}));

    WriteReport report{};
    wgstore::test::EventLog log;
    const EventSink sink = log.sink();
    ASSERT_EQ(write_file_list(list, dir, WriteOptions{}, &report, nullptr, &sink).code, StatusCode::Ok);
    EXPECT_EQ(report.manifest_path.string(), (dir / "container.2").string());
    ASSERT_EQ(report.blobs.size(), 2u);
    EXPECT_EQ(report.blobs[0].size_bytes, 700u);
    EXPECT_EQ(report.blobs[1].size_bytes, 0u);
    EXPECT_EQ(log.count(EventKind::ContainerWritten), 1u);

    const stdfs::path blob0 = dir / guid_to_dir_name(list.files[0].id);
    EXPECT_EQ(wgstore::test::read_bytes(blob0), list.files[0].data);

    ContainerFileList back{};
    ASSERT_EQ(decode_file_list(report.manifest_path, 2, &back, nullptr).code, StatusCode::Ok);
    EXPECT_EQ(back.seq, 2u);
    ASSERT_EQ(back.files.size(), 2u);
    for (std::size_t i = 0; i < 2; ++i) {
        EXPECT_EQ(back.files[i].name, list.files[i].name);
        EXPECT_EQ(back.files[i].id, list.files[i].id);
        EXPECT_EQ(back.files[i].data, list.files[i].data);
    }
}

TEST(Store, StreamedBlobIsHashedAndVerified) {
    wgstore::test::TempDir tmp;
    const std::vector<u8> payload = wgstore::test::pattern_bytes(3000, 8);
    wgstore::test::write_bytes(tmp.path() / "src" / "Level.sav", payload);

    ContainerFileList list{};
    ContentFileEntry f{};
    f.name = u"Data";
    f.id = wgstore::test::guid_with(0x0C, 3);
    f.source_path = (tmp.path() / "src" / "Level.sav").string();
    list.files.push_back(f);

    WriteOptions opts{};
    opts.copy.chunk_bytes = 100;
    opts.verify_after_write = true;
    WriteReport report{};
    const stdfs::path dir = tmp.path() / "store" / "C";
    ASSERT_EQ(write_file_list(list, dir, opts, &report, nullptr, nullptr).code, StatusCode::Ok);

    ASSERT_EQ(report.blobs.size(), 1u);
    EXPECT_EQ(report.blobs[0].size_bytes, payload.size());
    Hash256 expected{};
    ASSERT_EQ(hash_compute({payload.data(), static_cast<u32>(payload.size())}, &expected).code, StatusCode::Ok);
    EXPECT_EQ(report.blobs[0].digest, expected);
    EXPECT_EQ(wgstore::test::read_bytes(dir / guid_to_dir_name(f.id)), payload);
}

TEST(Store, NilBlobIdentifierIsRejected) {
    wgstore::test::TempDir tmp;
    ContainerFileList list{};
    list.files.push_back(blob_file(u"Data", Guid{}, {1}));
    Diagnostic diag{};
    EXPECT_EQ(write_file_list(list, tmp.path() / "C", WriteOptions{}, nullptr, &diag, nullptr).code,
              StatusCode::Invalid);
    EXPECT_FALSE(stdfs::exists(tmp.path() / "C" / "container.1"));
}

TEST(Store, CancelledWriteLeavesNoManifest) {
    wgstore::test::TempDir tmp;
    ContainerFileList list{};
    list.files.push_back(blob_file(u"Data", wgstore::test::guid_with(1, 1), {1, 2, 3}));

    volatile std::sig_atomic_t cancel = 1;
    WriteOptions opts{};
    opts.copy.cancel = &cancel;
    const Status s = write_file_list(list, tmp.path() / "C", opts, nullptr, nullptr, nullptr);
    EXPECT_EQ(s.code, StatusCode::Cancelled);
    EXPECT_FALSE(stdfs::exists(tmp.path() / "C" / "container.1"));
}

TEST(Store, MissingBlobNamesItsPath) {
    wgstore::test::TempDir tmp;
    const stdfs::path dir = tmp.path() / "C";
    ContainerFileList list{};
    list.files.push_back(blob_file(u"Data", wgstore::test::guid_with(1, 1), {1}));
    list.files.push_back(blob_file(u"Other", wgstore::test::guid_with(2, 2), {2}));
    ASSERT_EQ(write_file_list(list, dir, WriteOptions{}, nullptr, nullptr, nullptr).code, StatusCode::Ok);

    const stdfs::path gone = dir / guid_to_dir_name(list.files[1].id);
    stdfs::remove(gone);

    ContainerFileList out{};
    Diagnostic diag{};
    const Status s = decode_file_list(dir / "container.1", 1, &out, &diag);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(status_reason(s), Reason::MissingContentBlob);
    EXPECT_EQ(diag.path, gone.string());
    EXPECT_EQ(diag.detail, "content blob does not exist");
}

TEST(Store, ReaderOverloadStopsAtMissingBlob) {
    wgstore::test::TempDir tmp;
    const stdfs::path dir = tmp.path() / "C";
    ContainerFileList list{};
    list.files.push_back(blob_file(u"Data", wgstore::test::guid_with(1, 1), {1}));
    list.files.push_back(blob_file(u"Other", wgstore::test::guid_with(2, 2), {2}));
    ASSERT_EQ(write_file_list(list, dir, WriteOptions{}, nullptr, nullptr, nullptr).code, StatusCode::Ok);
    stdfs::remove(dir / guid_to_dir_name(list.files[1].id));

    std::vector<u8> bytes = wgstore::test::read_bytes(dir / "container.1");
    bytes.insert(bytes.end(), {0xDE, 0xAD, 0xBE, 0xEF});

    wgstore::codec::ByteReader r{wgstore::codec::BufferView{bytes.data(), static_cast<u32>(bytes.size())}, 0};
    ContainerFileList out{};
    const Status s = decode_file_list(r, dir, 1, &out, nullptr);
    EXPECT_EQ(status_reason(s), Reason::MissingContentBlob);
    EXPECT_EQ(r.pos, wgstore::codec::kFileListHeaderBytes + 2 * wgstore::codec::kFileListEntryBytes);
}

TEST(Store, MissingManifestFile) {
    wgstore::test::TempDir tmp;
    ContainerFileList out{};
    Diagnostic diag{};
    const Status s = decode_file_list(tmp.path() / "container.1", 1, &out, &diag);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(status_reason(s), Reason::MissingManifest);
}

TEST(Store, ManifestNames) {
    u32 seq = 0;
    ASSERT_EQ(parse_manifest_name("container.1", &seq).code, StatusCode::Ok);
    EXPECT_EQ(seq, 1u);
    ASSERT_EQ(parse_manifest_name("container.05", &seq).code, StatusCode::Ok);
    EXPECT_EQ(seq, 5u);
    EXPECT_EQ(status_reason(parse_manifest_name("container.", &seq)), Reason::BadManifestName);
    EXPECT_EQ(status_reason(parse_manifest_name("container.1a", &seq)), Reason::BadManifestName);
    EXPECT_EQ(status_reason(parse_manifest_name("container.-1", &seq)), Reason::BadManifestName);
    EXPECT_EQ(status_reason(parse_manifest_name("containers.index", &seq)), Reason::BadManifestName);
}

TEST(Store, FindManifestPicksHighestSequence) {
    wgstore::test::TempDir tmp;
    wgstore::test::write_text(tmp.path() / "container.3", "");
    wgstore::test::write_text(tmp.path() / "container.12", "");
    wgstore::test::write_text(tmp.path() / "AAAA", "");

    stdfs::path path;
    u32 seq = 0;
    ASSERT_EQ(find_manifest(tmp.path(), &path, &seq, nullptr).code, StatusCode::Ok);
    EXPECT_EQ(seq, 12u);
    EXPECT_EQ(path.string(), (tmp.path() / "container.12").string());
}

TEST(Store, FindManifestKeepsTheActualFileName) {
    wgstore::test::TempDir tmp;
    wgstore::test::write_text(tmp.path() / "container.07", "");
    stdfs::path path;
    u32 seq = 0;
    ASSERT_EQ(find_manifest(tmp.path(), &path, &seq, nullptr).code, StatusCode::Ok);
    EXPECT_EQ(seq, 7u);
    EXPECT_EQ(path.string(), (tmp.path() / "container.07").string());
}

TEST(Store, FindManifestFailures) {
    wgstore::test::TempDir tmp;
    stdfs::path path;
    u32 seq = 0;

    EXPECT_EQ(status_reason(find_manifest(tmp.path() / "absent", &path, &seq, nullptr)), Reason::MissingContainerDir);
    EXPECT_EQ(status_reason(find_manifest(tmp.path(), &path, &seq, nullptr)), Reason::MissingManifest);

    wgstore::test::write_text(tmp.path() / "container.x", "");
    Diagnostic diag{};
    const Status s = find_manifest(tmp.path(), &path, &seq, &diag);
    EXPECT_EQ(s.code, StatusCode::Corrupt);
    EXPECT_EQ(status_reason(s), Reason::BadManifestName);
    EXPECT_EQ(diag.field, "seq");
    EXPECT_EQ(diag.path, (tmp.path() / "container.x").string());
}

TEST(Store, ReadContainerFollowsTheEntry) {
    wgstore::test::TempDir tmp;
    const std::vector<u8> data = wgstore::test::pattern_bytes(64, 2);
    const ContainerEntry e = put_container(tmp.path(), u"Save1-Level", 1, data);

    ContainerFileList list{};
    ASSERT_EQ(read_container(tmp.path(), e, &list, nullptr).code, StatusCode::Ok);
    ASSERT_EQ(list.files.size(), 1u);
    EXPECT_EQ(list.files[0].name, u"Data");
    EXPECT_EQ(list.files[0].data, data);
}

// ============================================================================
// Verification
// ============================================================================

TEST(StoreVerify, HealthyStore) {
    wgstore::test::TempDir tmp;
    const ContainerEntry a = put_container(tmp.path(), u"Save1-Level", 1, wgstore::test::pattern_bytes(100, 1));
    const ContainerEntry b = put_container(tmp.path(), u"Save1-LevelMeta", 2, {});
    put_index(tmp.path(), {a, b});
    stdfs::create_directory(tmp.path() / "notes");

    VerifyReport report{};
    ASSERT_EQ(verify_store(tmp.path(), &report, nullptr).code, StatusCode::Ok);
    EXPECT_EQ(report.entries_checked, 2u);
    EXPECT_EQ(report.blobs_checked, 2u);
    EXPECT_TRUE(report.problems.empty());
    EXPECT_TRUE(report.orphan_dirs.empty());
}

TEST(StoreVerify, ReportsOrphanDirectories) {
    wgstore::test::TempDir tmp;
    const ContainerEntry a = put_container(tmp.path(), u"Save1-Level", 1, {1});
    const ContainerEntry stale = put_container(tmp.path(), u"Save1-Old", 2, {2});
    put_index(tmp.path(), {a});

    VerifyReport report{};
    ASSERT_EQ(verify_store(tmp.path(), &report, nullptr).code, StatusCode::Ok);
    EXPECT_TRUE(report.problems.empty());
    ASSERT_EQ(report.orphan_dirs.size(), 1u);
    EXPECT_EQ(report.orphan_dirs[0], guid_to_dir_name(stale.id));
}

TEST(StoreVerify, ReportsMissingBlob) {
    wgstore::test::TempDir tmp;
    const ContainerEntry a = put_container(tmp.path(), u"Save1-Level", 1, {1, 2});
    put_index(tmp.path(), {a});
    const stdfs::path blob = container_dir_path(tmp.path(), a.id) / guid_to_dir_name(wgstore::test::guid_with(0xB0, 1));
    stdfs::remove(blob);

    VerifyReport report{};
    ASSERT_EQ(verify_store(tmp.path(), &report, nullptr).code, StatusCode::Ok);
    ASSERT_EQ(report.problems.size(), 1u);
    EXPECT_EQ(report.problems[0].container, "Save1-Level");
    EXPECT_EQ(status_reason(report.problems[0].status), Reason::MissingContentBlob);
    EXPECT_EQ(report.problems[0].diag.path, blob.string());
}

TEST(StoreVerify, ReportsSizeMismatch) {
    wgstore::test::TempDir tmp;
    ContainerEntry a = put_container(tmp.path(), u"Save1-Level", 1, {1, 2, 3});
    a.size = 99;
    put_index(tmp.path(), {a});

    VerifyReport report{};
    ASSERT_EQ(verify_store(tmp.path(), &report, nullptr).code, StatusCode::Ok);
    ASSERT_EQ(report.problems.size(), 1u);
    EXPECT_EQ(status_reason(report.problems[0].status), Reason::SizeMismatch);
    EXPECT_EQ(report.problems[0].diag.expected, 99u);
    EXPECT_EQ(report.problems[0].diag.actual, 3u);
}

TEST(StoreVerify, ReportsSequenceMismatch) {
    wgstore::test::TempDir tmp;
    ContainerEntry a = put_container(tmp.path(), u"Save1-Level", 1, {1});
    a.seq = 2;
    put_index(tmp.path(), {a});

    VerifyReport report{};
    ASSERT_EQ(verify_store(tmp.path(), &report, nullptr).code, StatusCode::Ok);
    ASSERT_EQ(report.problems.size(), 1u);
    EXPECT_EQ(status_reason(report.problems[0].status), Reason::SeqMismatch);
    EXPECT_EQ(report.problems[0].diag.expected, 2u);
    EXPECT_EQ(report.problems[0].diag.actual, 1u);
}

TEST(StoreVerify, ReportsMissingContainerDirectory) {
    wgstore::test::TempDir tmp;
    put_index(tmp.path(), {wgstore::test::make_entry(u"Ghost", wgstore::test::guid_with(0xEE, 1))});

    VerifyReport report{};
    ASSERT_EQ(verify_store(tmp.path(), &report, nullptr).code, StatusCode::Ok);
    ASSERT_EQ(report.problems.size(), 1u);
    EXPECT_EQ(report.problems[0].container, "Ghost");
    EXPECT_EQ(status_reason(report.problems[0].status), Reason::MissingContainerDir);
}

TEST(StoreVerify, FailsOnlyWithoutAnIndex) {
    wgstore::test::TempDir tmp;
    VerifyReport report{};
    const Status s = verify_store(tmp.path(), &report, nullptr);
    EXPECT_EQ(status_reason(s), Reason::MissingIndex);
}

TEST(StoreVerify, LeavesTheStoreUntouched) {
    wgstore::test::TempDir tmp;
    const ContainerEntry a = put_container(tmp.path(), u"Save1-Level", 1, {1});
    ContainerEntry b = put_container(tmp.path(), u"Save1-Other", 2, {2});
    b.size = 50;
    put_container(tmp.path(), u"Save1-Orphan", 3, {3});
    put_index(tmp.path(), {a, b});

    const auto before = snapshot(tmp.path());
    VerifyReport report{};
    ASSERT_EQ(verify_store(tmp.path(), &report, nullptr).code, StatusCode::Ok);
    EXPECT_EQ(report.problems.size(), 1u);
    EXPECT_EQ(report.orphan_dirs.size(), 1u);
    EXPECT_EQ(snapshot(tmp.path()), before);
}
