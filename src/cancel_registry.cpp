#include "cancel_registry.hpp"

#include <stdexcept>

namespace ollie {

CancellationRegistry::Guard::Guard(CancellationRegistry& registry,
                                   std::string id, CancellationToken token)
    : registry_(registry), id_(std::move(id)), token_(std::move(token)) {}

CancellationRegistry::Guard::~Guard() {
    registry_.unregister(id_);
}

CancellationToken CancellationRegistry::register_pull(const std::string& id) {
    auto token = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = tokens_.emplace(id, token);
    if (!inserted)
        throw std::logic_error("pull ID already active: " + id);
    return it->second;
}

std::unique_ptr<CancellationRegistry::Guard>
CancellationRegistry::register_guarded(const std::string& id) {
    auto token = register_pull(id);
    return std::make_unique<Guard>(*this, id, std::move(token));
}

bool CancellationRegistry::request_cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(id);
    if (it == tokens_.end()) return false;
    it->second->store(true, std::memory_order_release);
    return true;
}

size_t CancellationRegistry::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, token] : tokens_) {
        token->store(true, std::memory_order_release);
    }
    return tokens_.size();
}

void CancellationRegistry::unregister(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.erase(id);
}

bool CancellationRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.count(id) > 0;
}

size_t CancellationRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

} // namespace ollie
