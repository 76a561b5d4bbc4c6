/**
 * @file Errors.hpp
 * @brief Exception types for locsync
 *
 * Error taxonomy:
 * - SyncError: Base class
 * - MissingReferenceDocument: Reference document absent (fatal, whole run)
 * - MissingLocaleDocument: Named locale document absent
 * - MalformedDocument: Document is not a nested key-value tree
 * - PersistFailure: Writing a document back failed
 * - FileNotFoundError: Configuration file not found
 * - ConfigParseError: Configuration file syntax errors
 * - UnsupportedFormatError: Unknown file extension
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container / wrong value type
 */

#ifndef LOCSYNC_ERRORS_HPP
#define LOCSYNC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace locsync {

/**
 * @brief Base class for all locsync exceptions
 */
class SyncError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Base for errors tied to one named document
 */
class DocumentError : public SyncError {
public:
    DocumentError(std::string document, const std::string& message)
        : SyncError(message)
        , document_(std::move(document))
    {}

    /**
     * @brief Name (or path) of the offending document
     */
    const std::string& document() const noexcept {
        return document_;
    }

private:
    std::string document_;
};

/**
 * @brief The reference document could not be found
 */
class MissingReferenceDocument : public DocumentError {
public:
    explicit MissingReferenceDocument(std::string document)
        : DocumentError(document, "Reference document not found: " + document)
    {}
};

/**
 * @brief A locale named on the command line could not be found
 */
class MissingLocaleDocument : public DocumentError {
public:
    explicit MissingLocaleDocument(std::string document)
        : DocumentError(document, "Locale document not found: " + document)
    {}
};

/**
 * @brief A document failed to parse as a nested key-value tree
 */
class MalformedDocument : public DocumentError {
public:
    /**
     * @param document Name or path of the document
     * @param details Detailed error message from the parser
     */
    MalformedDocument(std::string document, std::string details)
        : DocumentError(document, "Malformed document '" + document + "': " + details)
        , details_(std::move(details))
    {}

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string details_;
};

/**
 * @brief Writing a document back to storage failed
 */
class PersistFailure : public DocumentError {
public:
    PersistFailure(std::string document, std::string details)
        : DocumentError(document, "Failed to write '" + document + "': " + details)
        , details_(std::move(details))
    {}

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string details_;
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public SyncError {
public:
    explicit FileNotFoundError(std::string path)
        : SyncError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file parse error (JSON/TOML syntax)
 */
class ConfigParseError : public SyncError {
public:
    /**
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, std::string details)
        : SyncError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief File extension is neither .json nor .toml
 */
class UnsupportedFormatError : public SyncError {
public:
    explicit UnsupportedFormatError(std::string path)
        : SyncError("Unsupported document format: '" + path + "' (expected .json or .toml)")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public SyncError {
public:
    /**
     * @param path Full dot-path being accessed (e.g., "locales.dir")
     * @param segment The specific segment that doesn't exist (e.g., "dir")
     */
    KeyError(std::string path, std::string segment)
        : SyncError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal or typed access
 *
 * Raised when attempting to traverse into a non-container (e.g. reading
 * "output.indent.width" where indent is an integer) or when a setting
 * holds a value of the wrong type.
 */
class TypeError : public SyncError {
public:
    /**
     * @param path Full dot-path being accessed
     * @param expected Expected type (e.g., "object")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : SyncError("Type mismatch at path '" + path + "': expected " + expected +
                    ", found " + actual)
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace locsync

#endif // LOCSYNC_ERRORS_HPP
