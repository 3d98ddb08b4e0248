#ifndef CONVERSION_ERROR_HPP
#define CONVERSION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace conversion {

enum class ErrorKind {
    MalformedInputName,     // sequencing cannot establish an order
    InputDiscoveryFailed,   // input directory missing or unreadable
    CollectorSpawnFailed,
    EndpointBindFailed,
    CollectorFlushTimeout,  // collector still running after the stop timeout
    TraceReadFailed,
    ExportSendFailed,
    DumpToolFailed,
    OutputWriteFailed,
    ScratchIoFailed,
    Cancelled
};

const char* to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);
    ErrorKind kind() const { return kind_; }
private:
    ErrorKind kind_;
};

} // namespace conversion

#endif // CONVERSION_ERROR_HPP
