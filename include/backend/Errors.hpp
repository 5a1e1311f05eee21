#pragma once

#include <stdexcept>
#include <string>

namespace minstrel::backend {

enum class ErrorKind {
    CacheCorruption,
    CredentialsMissing,
    TokenAcquisitionFailure,
    UnsupportedModel,
    MalformedRemoteResult,
    RemoteCallFailure,
    InvalidRequest,
};

const char* to_string(ErrorKind kind);

/**
 * Base of every error raised by the core.
 *
 * Callers at the process or HTTP boundary switch on kind() to pick a
 * response (exit code, status code). Expected conditions such as a cache
 * miss or a missing token file never surface as a MinstrelError.
 */
class MinstrelError : public std::runtime_error {
public:
    MinstrelError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Stored cache blob could not be decoded. Never leaves CacheStore.
class CacheCorruption : public MinstrelError {
public:
    explicit CacheCorruption(const std::string& message)
        : MinstrelError(ErrorKind::CacheCorruption, message) {}
};

// No credentials file, or one without client_id/client_secret.
class CredentialsMissing : public MinstrelError {
public:
    explicit CredentialsMissing(const std::string& message)
        : MinstrelError(ErrorKind::CredentialsMissing, message) {}
};

class TokenAcquisitionFailure : public MinstrelError {
public:
    explicit TokenAcquisitionFailure(const std::string& message)
        : MinstrelError(ErrorKind::TokenAcquisitionFailure, message) {}
};

// Remote shape does not match what the views know how to reduce.
class UnsupportedModel : public MinstrelError {
public:
    explicit UnsupportedModel(const std::string& message)
        : MinstrelError(ErrorKind::UnsupportedModel, message) {}
};

class MalformedRemoteResult : public MinstrelError {
public:
    explicit MalformedRemoteResult(const std::string& message)
        : MinstrelError(ErrorKind::MalformedRemoteResult, message) {}
};

class RemoteCallFailure : public MinstrelError {
public:
    explicit RemoteCallFailure(const std::string& message)
        : MinstrelError(ErrorKind::RemoteCallFailure, message) {}
};

// Remote service refused the access token (expired or revoked).
class AuthorizationRejected : public RemoteCallFailure {
public:
    explicit AuthorizationRejected(const std::string& message)
        : RemoteCallFailure(message) {}
};

class InvalidRequest : public MinstrelError {
public:
    explicit InvalidRequest(const std::string& message)
        : MinstrelError(ErrorKind::InvalidRequest, message) {}
};

}  // namespace minstrel::backend
