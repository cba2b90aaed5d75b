#include "errors.hpp"

namespace page_recorder {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:             return "ValidationError";
        case ErrorKind::AdmissionBusy:          return "AdmissionBusyError";
        case ErrorKind::ShuttingDown:           return "ShuttingDown";
        case ErrorKind::DisplayStart:           return "DisplayStartFailure";
        case ErrorKind::RenderHostStart:        return "RenderHostStartFailure";
        case ErrorKind::RenderReadinessTimeout: return "RenderReadinessTimeout";
        case ErrorKind::Encoder:                return "EncoderFailure";
        case ErrorKind::ArtifactMissing:        return "ArtifactMissingError";
        case ErrorKind::Upload:                 return "UploadFailure";
        case ErrorKind::MetadataUpdate:         return "MetadataUpdateFailure";
    }
    return "UnknownError";
}

} // namespace page_recorder
