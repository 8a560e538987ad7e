#pragma once

#include "workpipe/worker/WorkerHandle.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace workpipe {

/**
 * Name -> handle table that a ThreadPool reads once at startup.
 *
 * Registration must happen before the pool takes its snapshot; after that
 * the registry is sealed and registerWorker() throws RegistrationClosedError.
 * Thread-safe.
 */
class WorkerRegistry {
public:
    WorkerRegistry() = default;

    WorkerRegistry(const WorkerRegistry&) = delete;
    WorkerRegistry& operator=(const WorkerRegistry&) = delete;

    /**
     * Insert or replace the handle registered under handle->name().
     * @throws std::invalid_argument on a null handle or an empty name
     * @throws RegistrationClosedError once the registry is sealed
     */
    void registerWorker(std::shared_ptr<WorkerHandle> handle);

    // Null when no worker is registered under name
    std::shared_ptr<WorkerHandle> find(const std::string& name) const;

    // @return true if an entry was removed
    bool unregisterWorker(const std::string& name);

    /**
     * Seal the registry and return every handle, ordered by name.
     */
    std::vector<std::shared_ptr<WorkerHandle>> snapshot();

    size_t size() const;
    bool isSealed() const;

    // Process-wide registry for init-time registration
    static WorkerRegistry& global();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<WorkerHandle>> workers_;
    bool sealed_ = false;
};

} // namespace workpipe
