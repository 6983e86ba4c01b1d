#include "archive_session.h"

#include <system_error>

#include "common/errors.h"
#include "common/interrupt.h"
#include "lineage/lineage_resolver.h"
#include "lineage/naming.h"

namespace Skyvault {

ArchiveSession::ArchiveSession(SessionOptions options, TransferPipeline& pipeline, RemoteStore& store,
                               EventSink& sink)
    : options_(std::move(options)), pipeline_(pipeline), store_(store), sink_(sink) {}

SessionReport ArchiveSession::Run(const std::vector<Snapshot>& lineage) {
    SessionReport report;
    report.snapshots = lineage.size();

    if (lineage.empty()) {
        sink_.Info("No read-only snapshots to archive");
        return report;
    }
    if (!store_.ContainerExists(options_.container)) {
        throw UploadFailure("Container '" + options_.container + "' does not exist");
    }

    std::vector<Snapshot> archived = LookForArchived(lineage);
    report.already_archived = archived.size();

    ArchivalChain chain = Resolve(lineage, archived);
    if (chain.Done()) {
        sink_.Info("Everything is already archived");
        return report;
    }

    if (options_.dry_run) {
        for (const auto& unit : chain) {
            sink_.Info("Would archive " + Describe(unit) + " as " + StorageName(unit));
            report.planned.push_back(unit);
        }
        return report;
    }

    while (auto unit = chain.Next()) {
        if (InterruptRequested()) {
            throw OperationCancelled("Interrupted before archiving " + Describe(*unit));
        }
        report.bytes_uploaded += ArchiveUnit(*unit, report);
        ++report.units_archived;
    }
    sink_.Info("Archived " + std::to_string(report.units_archived) + " unit(s), " +
               std::to_string(report.bytes_uploaded) + " bytes");
    return report;
}

std::vector<Snapshot> ArchiveSession::LookForArchived(const std::vector<Snapshot>& lineage) {
    std::vector<std::string> names;
    names.reserve(lineage.size());
    for (const auto& snapshot : lineage) {
        names.push_back(StorageName(snapshot));
    }
    const std::string prefix = CommonPrefix(names);
    sink_.Verbose("Search storage for objects with prefix \"" + prefix + "\"");

    auto identifiers = store_.List(options_.container, prefix);
    sink_.Verbose("Found " + std::to_string(identifiers.size()) + " objects");

    std::vector<Snapshot> archived = OnlyArchived(lineage, identifiers);
    for (size_t i = 0; i < lineage.size(); ++i) {
        bool stored = identifiers.contains(names[i]);
        sink_.Info(lineage[i].relative_path + "... " + (stored ? "in cloud" : "not in cloud"));
    }
    return archived;
}

uint64_t ArchiveSession::ArchiveUnit(const ArchivalUnit& unit, SessionReport& report) {
    auto prepared = pipeline_.Prepare(unit, options_.destination_dir, options_.crypto_recipient);
    const std::string object = prepared->TargetPath().filename().string();

    std::string line;
    while (prepared->NextProgress(&line)) {
        sink_.Info(object + ": " + line);
    }

    sink_.Info("Uploading " + object + " to " + options_.container);
    auto upload = store_.Upload(prepared->TargetPath(), options_.container);
    uint64_t bytes = 0;
    while (upload->Next(&bytes)) {
        sink_.Info(object + ": " + std::to_string(bytes) + " bytes uploaded");
        if (InterruptRequested()) {
            throw OperationCancelled("Upload of " + object + " was interrupted before assembly");
        }
    }
    report.uploaded_objects.push_back(object);

    if (!options_.keep_artifacts) {
        std::error_code ec;
        fs::remove(prepared->TargetPath(), ec);
        if (ec) {
            sink_.Warning("Cannot remove " + prepared->TargetPath().string() + ": " + ec.message());
        }
    }
    return bytes;
}

} // namespace Skyvault
