/**
 * @file Errors.hpp
 * @brief Exception types for yedit errors
 *
 * Error taxonomy:
 * - YeditError: Base class
 * - InvalidPathError: Path string fails the path grammar
 * - PathConflictError: Path step runs into an incompatible node
 * - TypeMismatchError: Value type cannot be determined or does not fit
 * - DocumentParseError: YAML/JSON syntax errors
 * - FileNotFoundError: Input file not found
 * - IoError: Open/write/sync/lock/rename failures
 * - ParameterError: Invalid run parameters
 *
 * Missing keys and indices are not errors: they are reported as
 * "changed = false" results or null lookups.
 */

#ifndef YEDIT_ERRORS_HPP
#define YEDIT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>
#include <system_error>

namespace yedit {

/**
 * @brief Base class for all yedit exceptions
 */
class YeditError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Path string does not match the path grammar
 */
class InvalidPathError : public YeditError {
public:
    /**
     * @brief Construct with offending path and active separator
     * @param path The rejected path string
     * @param separator The separator in effect when parsing
     */
    InvalidPathError(std::string path, std::string separator)
        : YeditError("Invalid path '" + path + "' (separator '" + separator + "')")
        , path_(std::move(path))
        , separator_(std::move(separator))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& separator() const noexcept {
        return separator_;
    }

private:
    std::string path_;
    std::string separator_;
};

/**
 * @brief A path step expects a container but finds something else
 *
 * Raised by upsert when an intermediate node is a scalar, when an index
 * step is out of range for insertion, or when a removal is structurally
 * impossible.
 */
class PathConflictError : public YeditError {
public:
    /**
     * @brief Construct with path and description of the conflict
     * @param path Full path being written
     * @param detail What went wrong at which step
     */
    PathConflictError(std::string path, std::string detail)
        : YeditError("Path conflict at '" + path + "': " + detail)
        , path_(std::move(path))
        , detail_(std::move(detail))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& detail() const noexcept {
        return detail_;
    }

private:
    std::string path_;
    std::string detail_;
};

/**
 * @brief Value type cannot be determined or does not fit the target
 */
class TypeMismatchError : public YeditError {
public:
    explicit TypeMismatchError(const std::string& detail)
        : YeditError("Type mismatch: " + detail)
    {}
};

/**
 * @brief Document text could not be parsed (YAML/JSON/TOML syntax)
 */
class DocumentParseError : public YeditError {
public:
    /**
     * @brief Construct with source name and error details
     * @param source File path, or "<content>" for in-memory text
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string source, std::string details)
        : YeditError("Parse error in '" + source + "': " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string details_;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public YeditError {
public:
    explicit FileNotFoundError(std::string path)
        : YeditError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Filesystem operation failed
 *
 * Lock contention on the temporary file is reported here as well
 * (operation "lock", code EWOULDBLOCK).
 */
class IoError : public YeditError {
public:
    /**
     * @brief Construct with path, failed operation and OS error
     * @param path File the operation was applied to
     * @param operation Short name of the operation ("open", "fsync", ...)
     * @param code Error code reported by the OS
     */
    IoError(std::string path, std::string operation, std::error_code code)
        : YeditError("I/O error during " + operation + " of '" + path + "': " + code.message())
        , path_(std::move(path))
        , operation_(std::move(operation))
        , code_(code)
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& operation() const noexcept {
        return operation_;
    }

    std::error_code code() const noexcept {
        return code_;
    }

private:
    std::string path_;
    std::string operation_;
    std::error_code code_;
};

/**
 * @brief Run parameters failed validation
 *
 * Contains every validation message collected for the parameter set.
 */
class ParameterError : public YeditError {
public:
    explicit ParameterError(std::vector<std::string> messages)
        : YeditError(format_message(messages))
        , messages_(std::move(messages))
    {}

    explicit ParameterError(const std::string& message)
        : ParameterError(std::vector<std::string>{message})
    {}

    const std::vector<std::string>& messages() const noexcept {
        return messages_;
    }

private:
    std::vector<std::string> messages_;

    static std::string format_message(const std::vector<std::string>& messages) {
        std::ostringstream oss;
        for (size_t i = 0; i < messages.size(); ++i) {
            if (i > 0) oss << "; ";
            oss << messages[i];
        }
        return oss.str();
    }
};

} // namespace yedit

#endif // YEDIT_ERRORS_HPP
