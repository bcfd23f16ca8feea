// Error taxonomy for the grab session.

#ifndef GPGRAB_ERRORS_H
#define GPGRAB_ERRORS_H

#include <stdexcept>
#include <string>

namespace gpgrab {

enum class ErrorKind {
    NotFound,          // discovery, network, saved profile
    AuthDesync,        // pairing mismatch between host and device
    TransportFailure,  // radio / socket level, retried once after reconnect
    Timeout,           // operation-scoped
    Interrupted,       // user or signal cancellation
    IOFailure,         // local filesystem
    ProtocolError,     // unexpected device response
    ConfigInvalid,
};

const char* errorKindName(ErrorKind kind);

class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const std::string& what, std::string remediation = {})
        : std::runtime_error(what), m_kind(kind), m_remediation(std::move(remediation)) {}

    ErrorKind kind() const { return m_kind; }
    const std::string& remediation() const { return m_remediation; }

private:
    ErrorKind m_kind;
    std::string m_remediation;
};

} // namespace gpgrab

#endif // GPGRAB_ERRORS_H
