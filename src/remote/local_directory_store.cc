#include "local_directory_store.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <vector>

#include <glog/logging.h>

#include "common/errors.h"

namespace Skyvault {

namespace {

// Assembly target inside the segment directory, renamed into the container when complete.
constexpr char kAssembledName[] = "assembled";
constexpr size_t kCopyBufferBytes = 1UL << 20;

std::string SegmentFileName(uint32_t index) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%08u", index);
    return buf;
}

// Copies up to limit bytes from in to out; returns the count copied.
uint64_t CopyBytes(std::istream& in, std::ostream& out, uint64_t limit, std::vector<char>& buffer) {
    uint64_t copied = 0;
    while (copied < limit && in) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), limit - copied));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        out.write(buffer.data(), got);
        copied += static_cast<uint64_t>(got);
    }
    return copied;
}

/**
 * Writes one segment per NextEvent() call, then assembles the object.
 */
class LocalSegmentSession : public UploadSession {
public:
    LocalSegmentSession(fs::path source, fs::path segment_dir, fs::path object_path, size_t segment_bytes)
        : source_(std::move(source)),
          segment_dir_(std::move(segment_dir)),
          object_path_(std::move(object_path)),
          segment_bytes_(segment_bytes),
          buffer_(std::min(segment_bytes, kCopyBufferBytes)) {
        input_.open(source_, std::ios::binary);
        if (!input_) {
            throw UploadFailure("Cannot open " + source_.string() + " for upload");
        }
        total_ = fs::file_size(source_);
        std::error_code ec;
        fs::remove_all(segment_dir_, ec);
        fs::create_directories(segment_dir_, ec);
        if (ec) {
            throw UploadFailure("Cannot create segment directory " + segment_dir_.string() + ": " + ec.message());
        }
    }

    std::optional<UploadEvent> NextEvent() override {
        if (assembled_) {
            return std::nullopt;
        }
        if (sent_ < total_) {
            return UploadEvent{UploadEvent::Kind::SEGMENT_DONE, WriteSegment()};
        }
        Assemble();
        return UploadEvent{UploadEvent::Kind::OBJECT_ASSEMBLED, sent_};
    }

private:
    uint64_t WriteSegment() {
        fs::path segment = segment_dir_ / SegmentFileName(segment_count_);
        std::ofstream out(segment, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw UploadFailure("Cannot create segment " + segment.string());
        }
        uint64_t copied = CopyBytes(input_, out, segment_bytes_, buffer_);
        out.flush();
        if (!out || copied == 0) {
            throw UploadFailure("Failed writing segment " + segment.string());
        }
        ++segment_count_;
        sent_ += copied;
        VLOG(2) << "Segment " << segment.string() << " written (" << copied << " bytes)";
        return sent_;
    }

    void Assemble() {
        const fs::path part = segment_dir_ / kAssembledName;
        {
            std::ofstream out(part, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw UploadFailure("Cannot create " + part.string());
            }
            for (uint32_t i = 0; i < segment_count_; ++i) {
                std::ifstream in(segment_dir_ / SegmentFileName(i), std::ios::binary);
                if (!in) {
                    throw UploadFailure("Segment " + SegmentFileName(i) + " of " + object_path_.string() + " is missing");
                }
                CopyBytes(in, out, segment_bytes_, buffer_);
            }
            out.flush();
            if (!out) {
                throw UploadFailure("Failed assembling " + object_path_.string());
            }
        }
        if (fs::file_size(part) != total_) {
            throw UploadFailure("Assembled size of " + object_path_.string() + " does not match the source");
        }
        std::error_code ec;
        fs::rename(part, object_path_, ec);
        if (ec) {
            throw UploadFailure("Cannot publish " + object_path_.string() + ": " + ec.message());
        }
        fs::remove_all(segment_dir_, ec);
        if (ec) {
            LOG(WARNING) << "Leaving segments behind in " << segment_dir_ << ": " << ec.message();
        }
        assembled_ = true;
    }

    fs::path source_;
    fs::path segment_dir_;
    fs::path object_path_;
    size_t segment_bytes_;
    std::vector<char> buffer_;
    std::ifstream input_;
    uint64_t total_ = 0;
    uint64_t sent_ = 0;
    uint32_t segment_count_ = 0;
    bool assembled_ = false;
};

} // namespace

LocalDirectoryStore::LocalDirectoryStore(fs::path root, size_t segment_bytes)
    : root_(std::move(root)), segment_bytes_(segment_bytes) {
    if (segment_bytes_ == 0) {
        throw ConfigurationError("Segment size must be positive");
    }
}

absl::flat_hash_set<std::string> LocalDirectoryStore::List(const std::string& container,
                                                           const std::string& prefix) {
    absl::flat_hash_set<std::string> names;
    const fs::path dir = root_ / container;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw UploadFailure("Container " + container + " does not exist under " + root_.string());
    }
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) == 0) {
            names.insert(std::move(name));
        }
    }
    if (ec) {
        throw UploadFailure("Cannot list container " + container + ": " + ec.message());
    }
    VLOG(1) << "Listed " << names.size() << " objects with prefix \"" << prefix << "\" in " << container;
    return names;
}

bool LocalDirectoryStore::ContainerExists(const std::string& container) {
    std::error_code ec;
    return !container.empty() && fs::is_directory(root_ / container, ec);
}

std::unique_ptr<UploadProgress> LocalDirectoryStore::Upload(const fs::path& file, const std::string& container) {
    if (!ContainerExists(container)) {
        throw UploadFailure("Container '" + container + "' does not exist");
    }
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        throw UploadFailure(file.string() + " is not a regular file");
    }
    const std::string object = file.filename().string();
    auto session = std::make_unique<LocalSegmentSession>(
        file, root_ / (container + "_segments") / object, root_ / container / object, segment_bytes_);
    return std::make_unique<UploadProgress>(std::move(session), object);
}

} // namespace Skyvault
