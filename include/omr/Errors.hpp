#pragma once
#include <stdexcept>
#include <string>

namespace omr {

// Run-level errors. Anything thrown from these aborts the batch before a page is read.
class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigException : public Exception {
public:
    explicit ConfigException(const std::string& message)
        : Exception("Config error: " + message) {}
};

class LayoutException : public Exception {
public:
    explicit LayoutException(const std::string& message)
        : Exception("Bubble layout error: " + message), detail_(message) {}

    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

class TemplateException : public Exception {
public:
    explicit TemplateException(const std::string& message)
        : Exception("Marker template error: " + message) {}
};

// Page-scoped problems are values, never exceptions.
enum class FailureReason {
    AlignmentFailed,
    AmbiguousBubble,
    DuplicateNonReplacement,
    MissingLayoutEntry,
    UnreadableImage
};

const char* toString(FailureReason reason);

struct PageFailure {
    std::string studentId;
    int page = 0;
    FailureReason reason = FailureReason::AlignmentFailed;
    std::string detail;
    std::string source;
};

}
