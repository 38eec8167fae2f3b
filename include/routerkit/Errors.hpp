/**
 * @file Errors.hpp
 * @brief Exception types for routerkit
 *
 * Error taxonomy:
 * - RouterKitError: Base class
 * - InvalidPathError: Path string does not match the path grammar
 * - TypeMismatchError: Mutation applied to a target of the wrong shape
 * - DocumentError: Document could not be loaded, parsed or written
 * - CollaboratorError: Cluster CLI call failed and was not tolerated
 * - RenderingFailedError: Dry-run render produced nothing usable
 * - ConfigError and subclasses: Router configuration problems
 *
 * Lookups that simply find nothing are not errors; they return
 * std::optional and drive the create/no-op branching.
 */

#ifndef ROUTERKIT_ERRORS_HPP
#define ROUTERKIT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace routerkit {

/**
 * @brief Base class for all routerkit exceptions
 */
class RouterKitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Document & path engine
// ============================================================================

/**
 * @brief Path string does not match the path grammar
 */
class InvalidPathError : public RouterKitError {
public:
    /**
     * @brief Construct with the offending path and active separator
     * @param path The rejected path string
     * @param separator The separator that was active during validation
     */
    InvalidPathError(std::string path, char separator)
        : RouterKitError("Invalid path '" + path + "' (separator '" +
                         std::string(1, separator) + "')")
        , path_(std::move(path))
        , separator_(separator)
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    char separator() const noexcept {
        return separator_;
    }

private:
    std::string path_;
    char separator_;
};

/**
 * @brief Mutation target has an incompatible type
 *
 * Raised e.g. when merging a non-mapping value into a mapping target.
 */
class TypeMismatchError : public RouterKitError {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Path of the mutation target
     * @param expected Expected type (e.g., "mapping")
     * @param actual Actual type encountered (e.g., "string")
     */
    TypeMismatchError(std::string path, std::string expected, std::string actual)
        : RouterKitError("Type mismatch at path '" + path + "': expected " +
                         expected + ", got " + actual)
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
 * @brief Document load, parse or write failure
 */
class DocumentError : public RouterKitError {
public:
    DocumentError(std::string file, std::string details)
        : RouterKitError("Document error" +
                         (file.empty() ? std::string() : " in '" + file + "'") +
                         ": " + details)
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

// ============================================================================
// Cluster collaborator & reconciliation
// ============================================================================

/**
 * @brief Cluster CLI invocation failed
 *
 * Carries the command line, exit status and captured stderr so the
 * diagnostic can be surfaced verbatim in the pass status.
 */
class CollaboratorError : public RouterKitError {
public:
    CollaboratorError(std::string cmd, int returncode, std::string stderr_text)
        : RouterKitError("Command '" + cmd + "' failed with exit code " +
                         std::to_string(returncode) +
                         (stderr_text.empty() ? std::string() : ": " + stderr_text))
        , cmd_(std::move(cmd))
        , returncode_(returncode)
        , stderr_(std::move(stderr_text))
    {}

    const std::string& cmd() const noexcept {
        return cmd_;
    }

    int returncode() const noexcept {
        return returncode_;
    }

    const std::string& stderr_text() const noexcept {
        return stderr_;
    }

private:
    std::string cmd_;
    int returncode_;
    std::string stderr_;
};

/**
 * @brief Dry-run render produced no usable deployment, or the declared
 *        edits collectively changed nothing
 */
class RenderingFailedError : public RouterKitError {
public:
    explicit RenderingFailedError(const std::string& reason)
        : RouterKitError("Router rendering failed: " + reason)
    {}
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Base class for router configuration errors
 */
class ConfigError : public RouterKitError {
public:
    using RouterKitError::RouterKitError;
};

/**
 * @brief Mandatory configuration keys are missing after merge
 */
class MissingMandatoryConfig : public ConfigError {
public:
    /**
     * @brief Construct with list of missing keys
     * @param keys Names of missing mandatory options
     */
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : ConfigError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
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
class ConfigParseError : public ConfigError {
public:
    ConfigParseError(std::string file, std::string details)
        : ConfigError("Parse error in '" + file + "': " + details)
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

} // namespace routerkit

#endif // ROUTERKIT_ERRORS_HPP
