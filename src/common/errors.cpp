#include "common/errors.hpp"

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceUnavailable:       return "SourceUnavailable";
        case ErrorKind::InconsistentRemoteState: return "InconsistentRemoteState";
        case ErrorKind::ShardTransformFailure:   return "ShardTransformFailure";
        case ErrorKind::UploadFailure:           return "UploadFailure";
        case ErrorKind::DownloadFailure:         return "DownloadFailure";
        case ErrorKind::CorruptShard:            return "CorruptShard";
        case ErrorKind::MissingShard:            return "MissingShard";
        case ErrorKind::SinkFailure:             return "SinkFailure";
        case ErrorKind::Cancelled:               return "Cancelled";
        case ErrorKind::ConfigurationError:      return "ConfigurationError";
        case ErrorKind::ResourceBusy:            return "ResourceBusy";
        default:                                 return "Unknown";
    }
}
