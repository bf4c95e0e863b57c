#include <agentmem/memory/repository.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/core/logger.hpp>

namespace agentmem {

void raise_store_error(StoreStatus status,
                       const std::string& entity,
                       const std::string& key,
                       const std::string& operation,
                       const std::string& detail) {
    switch (status) {
        case StoreStatus::NOT_FOUND:
            throw NotFoundError(entity + " '" + key + "' not found");
        case StoreStatus::DUPLICATE:
            throw AlreadyExistsError(entity + " '" + key + "' already exists");
        case StoreStatus::OK:
        case StoreStatus::VERSION_MISMATCH:
        case StoreStatus::FAILED:
            break;
    }
    // Store-specific detail goes to the log only
    LOG_ERROR("[Repository] %s %s '%s': %s", operation.c_str(), entity.c_str(), key.c_str(),
              detail.empty() ? store_status_to_string(status) : detail.c_str());
    throw RepositoryError(entity, key, operation, store_status_to_string(status));
}

} // namespace agentmem
