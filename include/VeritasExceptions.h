#ifndef VERITAS_EXCEPTIONS_H
#define VERITAS_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Veritas {

class VeritasException : public std::runtime_error {
public:
    explicit VeritasException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public VeritasException {
public:
    explicit IOException(const std::string& message) : VeritasException("IO Error: " + message) {}
};

class DatasetException : public VeritasException {
public:
    explicit DatasetException(const std::string& message) : VeritasException("Dataset Error: " + message) {}
};

class UnsupportedFormatException : public DatasetException {
public:
    explicit UnsupportedFormatException(const std::string& extension)
        : DatasetException("Unsupported file format: " + (extension.empty() ? std::string("<none>") : extension)) {}
};

class ConfigurationException : public VeritasException {
public:
    explicit ConfigurationException(const std::string& message) : VeritasException("Config Error: " + message) {}
};

// Thrown inside a bounded worker once the pipeline has stopped waiting for it.
class CancelledException : public VeritasException {
public:
    explicit CancelledException(const std::string& step) : VeritasException("Cancelled: " + step) {}
};

} // namespace Veritas

#endif // VERITAS_EXCEPTIONS_H
