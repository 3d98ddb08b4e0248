#include "conversion_error.hpp"

namespace conversion {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedInputName:    return "MalformedInputName";
        case ErrorKind::InputDiscoveryFailed:  return "InputDiscoveryFailed";
        case ErrorKind::CollectorSpawnFailed:  return "CollectorSpawnFailed";
        case ErrorKind::EndpointBindFailed:    return "EndpointBindFailed";
        case ErrorKind::CollectorFlushTimeout: return "CollectorFlushTimeout";
        case ErrorKind::TraceReadFailed:       return "TraceReadFailed";
        case ErrorKind::ExportSendFailed:      return "ExportSendFailed";
        case ErrorKind::DumpToolFailed:        return "DumpToolFailed";
        case ErrorKind::OutputWriteFailed:     return "OutputWriteFailed";
        case ErrorKind::ScratchIoFailed:       return "ScratchIoFailed";
        case ErrorKind::Cancelled:             return "Cancelled";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace conversion
