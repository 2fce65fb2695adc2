#pragma once
#include "cancel_registry.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "result.hpp"
#include <future>
#include <optional>
#include <string>

namespace ollie {

constexpr long kPullTimeoutSeconds = 60 * 60; // large models take a while
constexpr const char* kPullCancelledMessage = "Cancelled by user";
constexpr const char* kPullNotFoundMessage = "Pull ID not found";

// Terminal states of a pull.
enum class PullState { Completed, Cancelled, Failed };

const char* pull_state_name(PullState state);

// Runs model pulls against an Ollama-compatible server and reports their
// lifecycle on the event bus:
//   models:pull-start → models:pull-progress* →
//   one of models:pull-complete | models:pull-cancelled | models:pull-error
// The pull's registry entry is removed before the terminal event is
// published, on every path.
class PullManager {
public:
    PullManager(HttpClient& http, CancellationRegistry& registry,
                std::string default_server_url);

    // Optional event bus; without one the pull runs silently.
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    // Blocking. pull_id defaults to a fresh UUID, server_url to the
    // configured one. Throws std::logic_error if pull_id is already active.
    SimpleResponse start_pull(const std::string& name,
                              const std::optional<std::string>& pull_id = std::nullopt,
                              const std::optional<std::string>& server_url = std::nullopt);

    // start_pull() on a new thread.
    std::future<SimpleResponse> start_pull_async(std::string name,
                                                 std::optional<std::string> pull_id = std::nullopt,
                                                 std::optional<std::string> server_url = std::nullopt);

    // Ask an active pull to stop at its next chunk boundary. Never blocks
    // on I/O. Fails with "Pull ID not found" if nothing is running under id.
    SimpleResponse cancel_pull(const std::string& pull_id);

    CancellationRegistry& registry() { return registry_; }

private:
    struct Outcome {
        PullState state = PullState::Failed;
        std::string error;
    };

    Outcome stream_progress(const std::string& endpoint,
                            const std::string& name,
                            const std::string& pull_id,
                            const CancellationRegistry::Guard& guard);

    void publish_progress(const std::string& pull_id, const std::string& line);

    template<typename E>
    void publish(const E& event) {
        if (event_bus_) event_bus_->publish(event);
    }

    HttpClient& http_;
    CancellationRegistry& registry_;
    std::string default_server_url_;
    EventBus* event_bus_ = nullptr;
};

} // namespace ollie
