#include "Errors.h"

namespace gpgrab {

const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NotFound:         return "NotFound";
    case ErrorKind::AuthDesync:       return "AuthDesync";
    case ErrorKind::TransportFailure: return "TransportFailure";
    case ErrorKind::Timeout:          return "Timeout";
    case ErrorKind::Interrupted:      return "Interrupted";
    case ErrorKind::IOFailure:        return "IOFailure";
    case ErrorKind::ProtocolError:    return "ProtocolError";
    case ErrorKind::ConfigInvalid:    return "ConfigInvalid";
    }
    return "Unknown";
}

} // namespace gpgrab
