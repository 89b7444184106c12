#pragma once
#include <stdexcept>
#include <string>

namespace NewsDeck {

enum class ErrorKind {
    Network,
    Timeout,
    Parse,
    Storage,
    Extraction,
    Crashed
};

const char* errorKindName(ErrorKind kind);

// Failure carried back from a background task. Never thrown.
struct TaskError {
    ErrorKind kind = ErrorKind::Network;
    std::string message;
    int httpStatus = 0;

    std::string describe() const;
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

class OpmlError : public std::runtime_error {
public:
    explicit OpmlError(const std::string& what) : std::runtime_error(what) {}
};

}
