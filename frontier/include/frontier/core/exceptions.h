#pragma once

#include <exception>
#include <string>

namespace frontier {

// ============================================================================
// Frontier Exceptions
// ============================================================================

/**
 * @brief Base exception for all frontier errors
 */
class FrontierException : public std::exception {
public:
    explicit FrontierException(std::string message) : message_(std::move(message)) {}
    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

/**
 * @brief Thrown when a request is neither a Request nor a key-value document
 *
 * Fatal to the single push that raised it; queue state is left untouched.
 */
class InvalidRequestException : public FrontierException {
public:
    explicit InvalidRequestException(const std::string& reason)
        : FrontierException("Invalid request: " + reason) {}
};

/**
 * @brief Thrown when a persisted snapshot has the wrong shape
 *
 * Typically produced by a job directory written by an incompatible,
 * older version. Resuming must stop instead of dropping queued work.
 */
class MalformedSnapshotException : public FrontierException {
public:
    explicit MalformedSnapshotException(const std::string& reason)
        : FrontierException("Malformed scheduler snapshot: " + reason +
                            ". The job directory was probably written by an incompatible "
                            "version; finish or discard that job before resuming with this one") {}
};

/**
 * @brief Thrown on on-disk queue read/write failures or corrupt records
 */
class StorageIOException : public FrontierException {
public:
    StorageIOException(const std::string& path, const std::string& operation, const std::string& reason)
        : FrontierException("Queue storage " + operation + " failed for '" + path + "': " + reason) {}
};

/**
 * @brief Thrown when a request cannot be encoded for a disk backend
 */
class RequestSerializationException : public FrontierException {
public:
    RequestSerializationException(const std::string& url, const std::string& reason)
        : FrontierException("Unable to serialize request <" + url + ">: " + reason) {}
};

/**
 * @brief Thrown when an operation does not fit the current lifecycle state
 */
class QueueStateException : public FrontierException {
public:
    QueueStateException(const std::string& operation, const std::string& reason)
        : FrontierException("Cannot " + operation + ": " + reason) {}
};

/**
 * @brief Thrown when configuration cannot be loaded or is inconsistent
 */
class ConfigurationException : public FrontierException {
public:
    explicit ConfigurationException(const std::string& reason)
        : FrontierException("Invalid scheduler configuration: " + reason) {}
};

} // namespace frontier
