#include "utils/Errors.hpp"

namespace NewsDeck {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network: return "network error";
        case ErrorKind::Timeout: return "timed out";
        case ErrorKind::Parse: return "parse error";
        case ErrorKind::Storage: return "storage error";
        case ErrorKind::Extraction: return "extraction error";
        case ErrorKind::Crashed: return "task crashed";
    }
    return "error";
}

std::string TaskError::describe() const {
    std::string text = errorKindName(kind);
    if (httpStatus != 0) text += " (HTTP " + std::to_string(httpStatus) + ")";
    if (!message.empty()) text += ": " + message;
    return text;
}

}
