#ifndef DATAFLOW_EXCEPTIONS_H
#define DATAFLOW_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace DataFlow {

/**
 * @brief Root of every error raised by the processing core.
 * @details statusCode() is the HTTP-equivalent class of the failure so callers can
 * map it onto their own transport without a lookup table.
 */
class DataFlowException : public std::runtime_error {
public:
    explicit DataFlowException(const std::string& message, int statusCode = 500)
        : std::runtime_error(message), statusCode_(statusCode) {}

    int statusCode() const noexcept { return statusCode_; }

private:
    int statusCode_;
};

class IOException : public DataFlowException {
public:
    explicit IOException(const std::string& message) : DataFlowException("IO Error: " + message, 400) {}
};

class DatasetException : public DataFlowException {
public:
    explicit DatasetException(const std::string& message) : DataFlowException("Dataset Error: " + message, 400) {}
};

class ConfigurationException : public DataFlowException {
public:
    explicit ConfigurationException(const std::string& message) : DataFlowException("Configuration Error: " + message, 400) {}
};

class NoInputException : public DataFlowException {
public:
    explicit NoInputException(const std::string& message) : DataFlowException("No Input: " + message, 400) {}
};

class UnsupportedFormatException : public DataFlowException {
public:
    explicit UnsupportedFormatException(const std::string& message) : DataFlowException("Unsupported Format: " + message, 400) {}
};

class NoUsableColumnsException : public DataFlowException {
public:
    explicit NoUsableColumnsException(const std::string& message) : DataFlowException("No Usable Columns: " + message, 400) {}
};

// Raised by chart rasterizers; ChartRenderer recovers from it per chart.
class RenderBackendException : public DataFlowException {
public:
    explicit RenderBackendException(const std::string& message) : DataFlowException("Render Error: " + message, 500) {}
};

// Raised by callers that impose a deadline on a run; never thrown inside the core.
class ProcessingTimeoutException : public DataFlowException {
public:
    explicit ProcessingTimeoutException(const std::string& message) : DataFlowException("Processing Timeout: " + message, 504) {}
};

class WorkbookException : public DataFlowException {
public:
    explicit WorkbookException(const std::string& message) : DataFlowException("Workbook Error: " + message, 500) {}
};

} // namespace DataFlow

#endif // DATAFLOW_EXCEPTIONS_H
