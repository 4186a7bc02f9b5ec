#include "util/result.hpp"

namespace rbp {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                        return "None";
        case ErrorKind::Io:                          return "Io";
        case ErrorKind::FileNotFound:                return "FileNotFound";
        case ErrorKind::ManifestParse:               return "ManifestParse";
        case ErrorKind::UnsupportedPlatform:         return "UnsupportedPlatform";
        case ErrorKind::VariantNotFound:             return "VariantNotFound";
        case ErrorKind::ChecksumMismatch:            return "ChecksumMismatch";
        case ErrorKind::KeyFormat:                   return "KeyFormat";
        case ErrorKind::SignatureFormat:             return "SignatureFormat";
        case ErrorKind::SignatureVerificationFailed: return "SignatureVerificationFailed";
        case ErrorKind::DestinationConflict:         return "DestinationConflict";
        case ErrorKind::Config:                      return "Config";
    }
    return "Unknown";
}

} // namespace rbp
