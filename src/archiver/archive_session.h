#ifndef SKYVAULT_ARCHIVER_ARCHIVE_SESSION_H_
#define SKYVAULT_ARCHIVER_ARCHIVE_SESSION_H_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/event_sink.h"
#include "lineage/snapshot.h"
#include "remote/remote_store.h"
#include "transfer/transfer_pipeline.h"

namespace Skyvault {

namespace fs = std::filesystem;

struct SessionOptions {
    std::string container;
    fs::path destination_dir;
    std::optional<std::string> crypto_recipient;
    // Keep the local artifact after a successful upload.
    bool keep_artifacts = false;
    // Resolve and report only.
    bool dry_run = false;
};

struct SessionReport {
    size_t snapshots = 0;
    size_t already_archived = 0;
    size_t units_archived = 0;
    uint64_t bytes_uploaded = 0;
    std::vector<std::string> uploaded_objects;
    // Filled on dry runs only.
    std::vector<ArchivalUnit> planned;
};

/**
 * Archives one lineage: finds what the container already holds, resolves the
 * missing units, and prepares then uploads them one at a time, in order.
 *
 * Each unit depends on the previous one being archived, so the first failure
 * stops the run. Units archived before it stay valid.
 */
class ArchiveSession {
public:
    ArchiveSession(SessionOptions options, TransferPipeline& pipeline, RemoteStore& store, EventSink& sink);

    SessionReport Run(const std::vector<Snapshot>& lineage);

private:
    std::vector<Snapshot> LookForArchived(const std::vector<Snapshot>& lineage);
    uint64_t ArchiveUnit(const ArchivalUnit& unit, SessionReport& report);

    SessionOptions options_;
    TransferPipeline& pipeline_;
    RemoteStore& store_;
    EventSink& sink_;
};

} // namespace Skyvault

#endif // SKYVAULT_ARCHIVER_ARCHIVE_SESSION_H_
