#ifndef SKYVAULT_REMOTE_REMOTE_STORE_H_
#define SKYVAULT_REMOTE_REMOTE_STORE_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <absl/container/flat_hash_set.h>

namespace Skyvault {

namespace fs = std::filesystem;

struct UploadEvent {
    enum class Kind {
        SEGMENT_DONE,    // bytes = cumulative bytes transferred so far
        OBJECT_ASSEMBLED // the store acknowledged the whole object
    };
    Kind kind;
    uint64_t bytes;
};

/**
 * Transport side of one segmented upload. Each NextEvent() call performs the
 * next unit of work and reports it; std::nullopt means the transport has
 * nothing more to report.
 */
class UploadSession {
public:
    virtual ~UploadSession() = default;
    virtual std::optional<UploadEvent> NextEvent() = 0;
};

/**
 * Pull-driven progress of an upload.
 *
 * Next() yields the cumulative byte count after each completed segment and
 * returns false once the store has acknowledged the assembled object. Running
 * out of events without that acknowledgment is a failure, never a partial
 * success.
 */
class UploadProgress {
public:
    UploadProgress(std::unique_ptr<UploadSession> session, std::string object_name);

    /**
     * @throws UploadFailure if the session ends unacknowledged or goes backwards
     */
    bool Next(uint64_t* cumulative_bytes);

    // Drains every segment; returns the total byte count.
    uint64_t Wait();

    bool Acknowledged() const { return acknowledged_; }
    const std::string& object_name() const { return object_name_; }

private:
    std::unique_ptr<UploadSession> session_;
    std::string object_name_;
    uint64_t last_bytes_ = 0;
    bool acknowledged_ = false;
};

/**
 * Remote object store as consumed by the archiver.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    // Names of the objects of container starting with prefix.
    virtual absl::flat_hash_set<std::string> List(const std::string& container,
                                                  const std::string& prefix) = 0;

    virtual bool ContainerExists(const std::string& container) = 0;

    /**
     * Uploads file as object file.filename() in fixed-size segments.
     * @throws UploadFailure if the container does not exist; checked before
     *         any data is transferred
     */
    virtual std::unique_ptr<UploadProgress> Upload(const fs::path& file, const std::string& container) = 0;
};

} // namespace Skyvault

#endif // SKYVAULT_REMOTE_REMOTE_STORE_H_
