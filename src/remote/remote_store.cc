#include "remote_store.h"

#include "common/errors.h"

namespace Skyvault {

UploadProgress::UploadProgress(std::unique_ptr<UploadSession> session, std::string object_name)
    : session_(std::move(session)), object_name_(std::move(object_name)) {}

bool UploadProgress::Next(uint64_t* cumulative_bytes) {
    if (acknowledged_) {
        return false;
    }
    std::optional<UploadEvent> event = session_->NextEvent();
    if (!event) {
        throw UploadFailure("Upload of " + object_name_ + " ended after " + std::to_string(last_bytes_) +
                            " bytes without the object being assembled");
    }
    switch (event->kind) {
        case UploadEvent::Kind::SEGMENT_DONE:
            if (event->bytes < last_bytes_) {
                throw UploadFailure("Upload of " + object_name_ + " reported progress going backwards");
            }
            last_bytes_ = event->bytes;
            *cumulative_bytes = last_bytes_;
            return true;
        case UploadEvent::Kind::OBJECT_ASSEMBLED:
            acknowledged_ = true;
            return false;
    }
    return false;
}

uint64_t UploadProgress::Wait() {
    uint64_t bytes = 0;
    while (Next(&bytes)) {
    }
    return last_bytes_;
}

} // namespace Skyvault
