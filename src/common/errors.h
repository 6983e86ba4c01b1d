#ifndef SKYVAULT_COMMON_ERRORS_H_
#define SKYVAULT_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Skyvault {

/**
 * Root of every error raised by Skyvault components.
 * The CLI catches the concrete classes to pick an exit code.
 */
class SkyvaultError : public std::runtime_error {
public:
    explicit SkyvaultError(const std::string& what) : std::runtime_error(what) {}
};

// Caller passed a lineage or archived list with duplicates or null snapshots.
class DuplicateOrNullInput : public SkyvaultError {
public:
    explicit DuplicateOrNullInput(const std::string& what) : SkyvaultError(what) {}
};

// Remote archive is not a prefix of the local lineage. Never auto-repaired.
class InconsistentLayout : public SkyvaultError {
public:
    explicit InconsistentLayout(const std::string& what) : SkyvaultError(what) {}
};

class InvalidNameError : public SkyvaultError {
public:
    explicit InvalidNameError(const std::string& what) : SkyvaultError(what) {}
};

// Missing directory or tool, or target already exists. Raised before any stage runs.
class PreconditionFailure : public SkyvaultError {
public:
    explicit PreconditionFailure(const std::string& what) : SkyvaultError(what) {}
};

// A stage exited non-zero. The partially written artifact must not be used.
class PipelineFailure : public SkyvaultError {
public:
    explicit PipelineFailure(const std::string& what) : SkyvaultError(what) {}
};

class UploadFailure : public SkyvaultError {
public:
    explicit UploadFailure(const std::string& what) : SkyvaultError(what) {}
};

class OperationCancelled : public SkyvaultError {
public:
    explicit OperationCancelled(const std::string& what) : SkyvaultError(what) {}
};

class ConfigurationError : public SkyvaultError {
public:
    explicit ConfigurationError(const std::string& what) : SkyvaultError(what) {}
};

} // namespace Skyvault

#endif // SKYVAULT_COMMON_ERRORS_H_
