#include "workpipe/worker/WorkerRegistry.hpp"
#include "workpipe/Errors.hpp"
#include "workpipe/logger/Logger.hpp"
#include <stdexcept>

namespace workpipe {

void WorkerRegistry::registerWorker(std::shared_ptr<WorkerHandle> handle) {
    if (!handle) {
        throw std::invalid_argument("cannot register a null worker");
    }
    std::string name = handle->name();
    if (name.empty()) {
        throw std::invalid_argument("worker name must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_) {
        throw RegistrationClosedError("worker \"" + name + "\" registered after the pool started");
    }
    auto it = workers_.find(name);
    if (it != workers_.end()) {
        Logger::getInstance().logWarning(LogLine("replacing registered worker").with("worker", name));
        it->second = std::move(handle);
        return;
    }
    workers_.emplace(std::move(name), std::move(handle));
}

std::shared_ptr<WorkerHandle> WorkerRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(name);
    return it == workers_.end() ? nullptr : it->second;
}

bool WorkerRegistry::unregisterWorker(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.erase(name) > 0;
}

std::vector<std::shared_ptr<WorkerHandle>> WorkerRegistry::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    sealed_ = true;
    std::vector<std::shared_ptr<WorkerHandle>> handles;
    handles.reserve(workers_.size());
    for (const auto& entry : workers_) {
        handles.push_back(entry.second);
    }
    return handles;
}

size_t WorkerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

bool WorkerRegistry::isSealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

WorkerRegistry& WorkerRegistry::global() {
    static WorkerRegistry registry;
    return registry;
}

} // namespace workpipe
