#pragma once

#include <stdexcept>
#include <string>

namespace page_recorder {

// --------- Job error taxonomy ---------
enum class ErrorKind {
    Validation,
    AdmissionBusy,
    ShuttingDown,
    DisplayStart,
    RenderHostStart,
    RenderReadinessTimeout,
    Encoder,
    ArtifactMissing,
    Upload,
    MetadataUpdate
};

const char* errorKindName(ErrorKind kind);

class RecorderError : public std::runtime_error {
public:
    RecorderError(ErrorKind kind, const std::string& message, int exit_code = 0)
        : std::runtime_error(message), kind_(kind), exit_code_(exit_code) {}

    ErrorKind kind() const { return kind_; }
    // Only meaningful for ErrorKind::Encoder
    int exitCode() const { return exit_code_; }

private:
    ErrorKind kind_;
    int exit_code_;
};

// Raised by the process layer when fork/exec of a child fails.
class SpawnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised by the storage client on transport errors and non-2xx answers.
class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

} // namespace page_recorder
