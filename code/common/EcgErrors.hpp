#ifndef ECG_ERRORS_HPP
#define ECG_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

// Configuration rejected; the previous configuration stays active.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Sequence/timestamp contract broken by the caller of append(). Not recoverable.
class OutOfOrderError : public std::logic_error {
public:
    explicit OutOfOrderError(const std::string& what) : std::logic_error(what) {}
};

// Export failed for the sequence range [first, last]. The caller may retry.
class ExportError : public std::runtime_error {
public:
    ExportError(const std::string& what, uint64_t first, uint64_t last)
        : std::runtime_error(what), first_(first), last_(last) {}

    uint64_t first_sequence() const { return first_; }
    uint64_t last_sequence() const { return last_; }

private:
    uint64_t first_;
    uint64_t last_;
};

// Malformed CSV while reading an export back.
class CsvFormatError : public ExportError {
public:
    CsvFormatError(const std::string& what, size_t line)
        : ExportError(what + " (line " + std::to_string(line) + ")", 0, 0), line_(line) {}

    size_t line() const { return line_; }

private:
    size_t line_;
};

#endif // ECG_ERRORS_HPP
