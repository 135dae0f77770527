#include "util/result.hpp"

#include <cerrno>

namespace relay {

std::string_view ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::LinkInvalid:       return "LinkInvalid";
        case ErrorKind::UnsupportedSource: return "UnsupportedSource";
        case ErrorKind::DownloadFailure:   return "DownloadFailure";
        case ErrorKind::ArchiveCorrupt:    return "ArchiveCorrupt";
        case ErrorKind::ArchiveCollision:  return "ArchiveCollision";
        case ErrorKind::UploadFailure:     return "UploadFailure";
        case ErrorKind::DiskFull:          return "DiskFull";
        case ErrorKind::Timeout:           return "Timeout";
        case ErrorKind::Cancelled:         return "Cancelled";
        case ErrorKind::Io:                return "Io";
        case ErrorKind::Config:            return "Config";
    }
    return "Unknown";
}

ErrorKind KindFromErrno(int e, ErrorKind fallback) {
    if (e == ENOSPC || e == EDQUOT) return ErrorKind::DiskFull;
    return fallback;
}

} // namespace relay
