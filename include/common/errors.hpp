#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

enum class ErrorKind {
    SourceUnavailable,
    InconsistentRemoteState,
    ShardTransformFailure,
    UploadFailure,
    DownloadFailure,
    CorruptShard,
    MissingShard,
    SinkFailure,
    Cancelled,
    ConfigurationError,
    ResourceBusy
};

std::string errorKindToString(ErrorKind kind);

// Base of every failure that crosses the invocation boundary.
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class SourceUnavailable : public PipelineError {
public:
    explicit SourceUnavailable(const std::string& message)
        : PipelineError(ErrorKind::SourceUnavailable, message) {}
};

class InconsistentRemoteState : public PipelineError {
public:
    explicit InconsistentRemoteState(const std::string& message)
        : PipelineError(ErrorKind::InconsistentRemoteState, message) {}
};

class ShardTransformFailure : public PipelineError {
public:
    explicit ShardTransformFailure(const std::string& message)
        : PipelineError(ErrorKind::ShardTransformFailure, message) {}
};

class UploadFailure : public PipelineError {
public:
    explicit UploadFailure(const std::string& message)
        : PipelineError(ErrorKind::UploadFailure, message) {}
};

class DownloadFailure : public PipelineError {
public:
    explicit DownloadFailure(const std::string& message)
        : PipelineError(ErrorKind::DownloadFailure, message) {}
};

class CorruptShard : public PipelineError {
public:
    CorruptShard(uint64_t index, const std::string& message)
        : PipelineError(ErrorKind::CorruptShard, message), index_(index) {}

    uint64_t index() const { return index_; }

private:
    uint64_t index_;
};

class MissingShard : public PipelineError {
public:
    MissingShard(uint64_t index, const std::string& message)
        : PipelineError(ErrorKind::MissingShard, message), index_(index) {}

    uint64_t index() const { return index_; }

private:
    uint64_t index_;
};

class SinkFailure : public PipelineError {
public:
    explicit SinkFailure(const std::string& message)
        : PipelineError(ErrorKind::SinkFailure, message) {}
};

class OperationCancelled : public PipelineError {
public:
    explicit OperationCancelled(const std::string& message)
        : PipelineError(ErrorKind::Cancelled, message) {}
};

class ConfigurationError : public PipelineError {
public:
    explicit ConfigurationError(const std::string& message)
        : PipelineError(ErrorKind::ConfigurationError, message) {}
};

// Another process holds the advisory lock for the same resource.
class ResourceBusy : public PipelineError {
public:
    explicit ResourceBusy(const std::string& message)
        : PipelineError(ErrorKind::ResourceBusy, message) {}
};

// Raised by RemoteStore backends; the pipelines translate it into
// UploadFailure or DownloadFailure depending on direction.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
