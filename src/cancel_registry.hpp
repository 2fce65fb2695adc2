#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ollie {

// Shared cancellation flag: the registry writes it, the pull loop reads it.
using CancellationToken = std::shared_ptr<std::atomic<bool>>;

// Maps active pull IDs to their cancellation flags. An entry exists only
// while the pull with that ID is running.
class CancellationRegistry {
public:
    // Unregisters its ID exactly once on destruction.
    class Guard {
    public:
        Guard(CancellationRegistry& registry, std::string id, CancellationToken token);
        ~Guard();
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        const std::string& id() const { return id_; }
        const CancellationToken& token() const { return token_; }
        bool cancelled() const { return token_->load(std::memory_order_acquire); }

    private:
        CancellationRegistry& registry_;
        std::string id_;
        CancellationToken token_;
    };

    // Insert a fresh (false) flag under id.
    // Throws std::logic_error if id is already registered.
    CancellationToken register_pull(const std::string& id);

    // register_pull() wrapped in a Guard.
    std::unique_ptr<Guard> register_guarded(const std::string& id);

    // Set the flag for id. Returns false if no such pull is active.
    bool request_cancel(const std::string& id);

    // Set every registered flag; returns how many were set.
    size_t cancel_all();

    // Remove id (no-op if absent).
    void unregister(const std::string& id);

    bool contains(const std::string& id) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CancellationToken> tokens_;
};

} // namespace ollie
