#ifndef SKYVAULT_REMOTE_LOCAL_DIRECTORY_STORE_H_
#define SKYVAULT_REMOTE_LOCAL_DIRECTORY_STORE_H_

#include <cstddef>

#include "remote_store.h"

namespace Skyvault {

/**
 * RemoteStore kept in a directory tree, e.g. a mounted network share.
 *
 * Layout under root:
 *   <container>/<object>                     assembled objects
 *   <container>_segments/<object>/<%08u>     segments of an upload in flight
 *   <container>_segments/<object>/assembled  concatenated segments
 *
 * The assembled file is renamed into the container, so an object is either
 * absent or complete and the container never holds anything but objects.
 */
class LocalDirectoryStore : public RemoteStore {
public:
    LocalDirectoryStore(fs::path root, size_t segment_bytes);

    absl::flat_hash_set<std::string> List(const std::string& container, const std::string& prefix) override;
    bool ContainerExists(const std::string& container) override;
    std::unique_ptr<UploadProgress> Upload(const fs::path& file, const std::string& container) override;

    const fs::path& root() const { return root_; }
    size_t segment_bytes() const { return segment_bytes_; }

private:
    fs::path root_;
    size_t segment_bytes_;
};

} // namespace Skyvault

#endif // SKYVAULT_REMOTE_LOCAL_DIRECTORY_STORE_H_
