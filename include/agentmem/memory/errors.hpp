/*
 * agentmem - Memory error taxonomy
 *
 * Every failure of the memory subsystem is a MemoryError. Validation,
 * not-found, expired and version-conflict errors go straight back to the
 * caller; nothing retries inside the managers.
 */
#ifndef AGENTMEM_MEMORY_ERRORS_HPP
#define AGENTMEM_MEMORY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace agentmem {

class MemoryError : public std::runtime_error {
public:
    explicit MemoryError(const std::string& msg) : std::runtime_error(msg) {}
};

// Missing or empty required identifier
class ValidationError : public MemoryError {
public:
    explicit ValidationError(const std::string& msg) : MemoryError(msg) {}
};

class NotFoundError : public MemoryError {
public:
    explicit NotFoundError(const std::string& msg) : MemoryError(msg) {}
};

class AlreadyExistsError : public MemoryError {
public:
    explicit AlreadyExistsError(const std::string& msg) : MemoryError(msg) {}
};

// Working-memory entry read after its expiry
class ExpiredError : public MemoryError {
public:
    explicit ExpiredError(const std::string& msg) : MemoryError(msg) {}
};

// Optimistic lock failure; re-read and retry
class VersionConflictError : public MemoryError {
public:
    VersionConflictError(const std::string& msg, int expected, int actual)
        : MemoryError(msg), expected_(expected), actual_(actual) {}

    int expected_version() const { return expected_; }
    int actual_version() const { return actual_; }

private:
    int expected_;
    int actual_;
};

// Snapshot belongs to another agent
class OwnershipError : public MemoryError {
public:
    explicit OwnershipError(const std::string& msg) : MemoryError(msg) {}
};

// Stored checksum does not match the snapshot state
class IntegrityError : public MemoryError {
public:
    explicit IntegrityError(const std::string& msg) : MemoryError(msg) {}
};

class ManualResolutionRequiredError : public MemoryError {
public:
    explicit ManualResolutionRequiredError(const std::string& msg) : MemoryError(msg) {}
};

// Aggregate failure of a batch conflict resolution
class UnresolvedConflictsError : public MemoryError {
public:
    UnresolvedConflictsError(const std::string& msg, int unresolved)
        : MemoryError(msg), unresolved_(unresolved) {}

    int unresolved() const { return unresolved_; }

private:
    int unresolved_;
};

class AlreadyRunningError : public MemoryError {
public:
    explicit AlreadyRunningError(const std::string& msg) : MemoryError(msg) {}
};

class NotRunningError : public MemoryError {
public:
    explicit NotRunningError(const std::string& msg) : MemoryError(msg) {}
};

// Backing-store failure, with the operation context that produced it
class RepositoryError : public MemoryError {
public:
    RepositoryError(const std::string& entity,
                    const std::string& key,
                    const std::string& operation,
                    const std::string& detail)
        : MemoryError(operation + " " + entity + " '" + key + "' failed: " + detail)
        , entity_(entity)
        , key_(key)
        , operation_(operation)
    {}

    const std::string& entity() const { return entity_; }
    const std::string& key() const { return key_; }
    const std::string& operation() const { return operation_; }

private:
    std::string entity_;
    std::string key_;
    std::string operation_;
};

// Throws ValidationError when a required identifier is empty
inline void require_non_empty(const std::string& value, const char* name) {
    if (value.empty()) {
        throw ValidationError(std::string(name) + " is required");
    }
}

} // namespace agentmem

#endif // AGENTMEM_MEMORY_ERRORS_HPP
