#include "extract/archive_extractor.hpp"

#include "extract/archive_path_policy.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace driverfetch {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "unknown libarchive error";
}

Result Fail(const std::string& what, archive* a) {
    return Result::Fail(kErrExtractionFailed, what + ": " + ArchiveErr(a));
}

} // namespace

Result ArchiveExtractor::ExtractFileToDir(const std::string& archive_path,
                                          const std::string& dst_dir,
                                          std::uint64_t* entries) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);
    if (entries) *entries = 0;

    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(kErrExtractionFailed, "Destination path is not a directory: " + dst_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(kErrExtractionFailed, "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (archive_read_open_filename(ar.get(), archive_path.c_str(), opt_.block_size) != ARCHIVE_OK) {
        return Fail("archive_read_open_filename", ar.get());
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(kErrExtractionFailed, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy(opt_.safe_paths_only);
    std::uint64_t written = 0;
    archive_entry* entry = nullptr;

    while (true) {
        if (CancelRequested()) return Result::Fail(kErrCancelled, "interrupted");

        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) return Fail("archive_read_next_header", ar.get());

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeHardlinkPath(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty() && rel_hl != ".") {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("entry: %s", target_path.c_str());

        if (archive_write_header(aw.get(), entry) != ARCHIVE_OK) {
            return Fail("archive_write_header", aw.get());
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Fail("archive_read_data_block", ar.get());

            if (archive_write_data_block(aw.get(), buff, size, offset) != ARCHIVE_OK) {
                return Fail("archive_write_data_block", aw.get());
            }
        }

        if (archive_write_finish_entry(aw.get()) != ARCHIVE_OK) {
            return Fail("archive_write_finish_entry", aw.get());
        }
        ++written;
    }

    if (entries) *entries = written;
    if (written == 0) {
        return Result::Fail(kErrExtractionFailed, "no entries in " + archive_path);
    }
    return Result::Ok();
}

} // namespace driverfetch
