#include "backend/Errors.hpp"

namespace minstrel::backend {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CacheCorruption: return "CacheCorruption";
        case ErrorKind::CredentialsMissing: return "CredentialsMissing";
        case ErrorKind::TokenAcquisitionFailure: return "TokenAcquisitionFailure";
        case ErrorKind::UnsupportedModel: return "UnsupportedModel";
        case ErrorKind::MalformedRemoteResult: return "MalformedRemoteResult";
        case ErrorKind::RemoteCallFailure: return "RemoteCallFailure";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
    }
    return "Unknown";
}

}  // namespace minstrel::backend
