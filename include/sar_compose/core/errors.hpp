#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace sar_compose {

class SarComposeError : public std::runtime_error {
public:
    explicit SarComposeError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public SarComposeError {
public:
    explicit ConfigError(const std::string& message)
        : SarComposeError("Config error: " + message) {}
};

class ValidationError : public SarComposeError {
public:
    explicit ValidationError(const std::string& message)
        : SarComposeError("Validation error: " + message) {}
};

class IOError : public SarComposeError {
public:
    explicit IOError(const std::string& message)
        : SarComposeError("I/O error: " + message) {}
};

class RasterError : public IOError {
public:
    explicit RasterError(const std::string& message)
        : IOError("Raster error: " + message) {}
};

class NetworkError : public SarComposeError {
public:
    explicit NetworkError(const std::string& message)
        : SarComposeError("Network error: " + message) {}
};

// Malformed catalog identifier or timestamp. Never retried.
class ParseError : public SarComposeError {
public:
    explicit ParseError(const std::string& message)
        : SarComposeError("Parse error: " + message) {}
};

// Empty catalog result set. Callers may retry with wider parameters.
class NoResultsError : public SarComposeError {
public:
    explicit NoResultsError(const std::string& message)
        : SarComposeError("No results: " + message) {}
};

class NoMatchError : public NoResultsError {
public:
    explicit NoMatchError(const std::string& message)
        : NoResultsError("No match: " + message) {}
};

class CRSError : public SarComposeError {
public:
    explicit CRSError(const std::string& message)
        : SarComposeError("CRS error: " + message) {}
};

class NoCRSError : public CRSError {
public:
    explicit NoCRSError(const std::string& message)
        : CRSError("No CRS: " + message) {}
};

class AlignmentError : public SarComposeError {
public:
    AlignmentError(const std::string& message, std::vector<std::string> fields)
        : SarComposeError("Alignment error: " + message),
          fields_(std::move(fields)) {}

    const std::vector<std::string>& fields() const { return fields_; }

private:
    std::vector<std::string> fields_;
};

class ExternalToolError : public SarComposeError {
public:
    explicit ExternalToolError(const std::string& message)
        : SarComposeError("External tool error: " + message) {}
};

// Downloaded product is missing an expected member (e.g. a polarization).
class ProductError : public ExternalToolError {
public:
    explicit ProductError(const std::string& message)
        : ExternalToolError("Product error: " + message) {}
};

class PipelineError : public SarComposeError {
public:
    explicit PipelineError(const std::string& message)
        : SarComposeError("Pipeline error: " + message) {}
};

} // namespace sar_compose
