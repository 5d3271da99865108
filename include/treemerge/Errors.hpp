/**
 * @file Errors.hpp
 * @brief Exception types for treemerge
 *
 * Error taxonomy:
 * - TreeMergeError: Base class
 * - SchemaMismatch: Two nodes cannot be compared
 * - ApplyError: Patch inconsistent with the document it is applied to
 * - AlignmentCancelled: Cancellation or deadline hit during alignment
 * - PathNotFound: Path segment not found
 * - PathTypeError: Traversal into a node that has no children
 * - PatchFormatError: Malformed serialized patch or conflict
 * - FileNotFoundError: Input file not found
 * - ConfigParseError: JSON/TOML syntax or option type errors
 */

#ifndef TREEMERGE_ERRORS_HPP
#define TREEMERGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace treemerge {

/**
 * @brief Base class for all treemerge exceptions
 */
class TreeMergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Node kinds are incomparable in a way the model does not define
 *
 * Raised for null nodes and unrepresentable values; well-formed documents never raise it.
 */
class SchemaMismatch : public TreeMergeError {
public:
    SchemaMismatch(std::string path, std::string base_kind, std::string target_kind)
        : TreeMergeError("Schema mismatch at '" + path + "': cannot compare " +
                         base_kind + " with " + target_kind)
        , path_(std::move(path))
        , base_kind_(std::move(base_kind))
        , target_kind_(std::move(target_kind))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& base_kind() const noexcept { return base_kind_; }
    const std::string& target_kind() const noexcept { return target_kind_; }

private:
    std::string path_;
    std::string base_kind_;
    std::string target_kind_;
};

/**
 * @brief A patch does not match the document it is applied to
 *
 * Carries the path of the offending node and a description of what the
 * patch expected to find there versus what the document holds.
 */
class ApplyError : public TreeMergeError {
public:
    /**
     * @brief Construct with location and expected/found descriptions
     * @param path Text form of the path (e.g., "cells[1].source")
     * @param expected What the patch assumed
     * @param found What the document actually holds
     */
    ApplyError(std::string path, std::string expected, std::string found)
        : TreeMergeError("Cannot apply patch at '" + path + "': expected " +
                         expected + ", found " + found)
        , path_(std::move(path))
        , expected_(std::move(expected))
        , found_(std::move(found))
    {}

    /**
     * @brief Get the path where the patch diverged from the document
     */
    const std::string& path() const noexcept {
        return path_;
    }

    /**
     * @brief Get the description of what the patch expected
     */
    const std::string& expected() const noexcept {
        return expected_;
    }

    /**
     * @brief Get the description of what was found
     */
    const std::string& found() const noexcept {
        return found_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string found_;
};

/**
 * @brief Sequence alignment was aborted by cancellation or deadline
 */
class AlignmentCancelled : public TreeMergeError {
public:
    explicit AlignmentCancelled(std::string reason)
        : TreeMergeError("Alignment cancelled: " + reason)
        , reason_(std::move(reason))
    {}

    const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
};

/**
 * @brief Path segment not found during traversal
 */
class PathNotFound : public TreeMergeError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full path being accessed (e.g., "cells[3].source")
     * @param segment The segment that doesn't exist (e.g., "[3]")
     */
    PathNotFound(std::string path, std::string segment)
        : TreeMergeError("Path segment not found: '" + segment + "' in path '" + path + "'")
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
 * @brief Type mismatch during path traversal
 *
 * Raised when a key segment meets a sequence, an index segment meets a
 * mapping, or any segment meets a leaf.
 */
class PathTypeError : public TreeMergeError {
public:
    PathTypeError(std::string path, std::string expected, std::string actual)
        : TreeMergeError("Cannot traverse into " + actual +
                         " (expected " + expected + ") at path '" + path + "'")
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

/**
 * @brief Serialized patch, conflict or resolution is malformed
 */
class PatchFormatError : public TreeMergeError {
public:
    explicit PatchFormatError(std::string detail)
        : TreeMergeError("Malformed patch: " + detail)
        , detail_(std::move(detail))
    {}

    const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public TreeMergeError {
public:
    explicit FileNotFoundError(std::string path)
        : TreeMergeError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Parse error in a document, patch or options file
 *
 * Line and column are 0 when the parser does not report a position.
 */
class ConfigParseError : public TreeMergeError {
public:
    ConfigParseError(std::string file, int line, int column, std::string details)
        : TreeMergeError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) + ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

} // namespace treemerge

#endif // TREEMERGE_ERRORS_HPP
