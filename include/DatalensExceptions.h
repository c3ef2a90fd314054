#ifndef DATALENS_EXCEPTIONS_H
#define DATALENS_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Datalens {

class DatalensException : public std::runtime_error {
public:
    explicit DatalensException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public DatalensException {
public:
    explicit IOException(const std::string& message) : DatalensException("IO Error: " + message) {}
};

class DatasetException : public DatalensException {
public:
    explicit DatasetException(const std::string& message) : DatalensException("Dataset Error: " + message) {}
};

class ConfigurationException : public DatalensException {
public:
    explicit ConfigurationException(const std::string& message) : DatalensException("Configuration Error: " + message) {}
};

} // namespace Datalens

#endif // DATALENS_EXCEPTIONS_H
