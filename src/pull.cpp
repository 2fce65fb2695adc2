#include "pull.hpp"
#include "line_framer.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <exception>
#include <iostream>

using json = nlohmann::json;

namespace ollie {

const char* pull_state_name(PullState state) {
    switch (state) {
        case PullState::Completed: return "completed";
        case PullState::Cancelled: return "cancelled";
        case PullState::Failed:    return "failed";
    }
    return "unknown";
}

PullManager::PullManager(HttpClient& http, CancellationRegistry& registry,
                         std::string default_server_url)
    : http_(http), registry_(registry),
      default_server_url_(strip_trailing_slashes(default_server_url)) {}

SimpleResponse PullManager::start_pull(const std::string& name,
                                       const std::optional<std::string>& pull_id,
                                       const std::optional<std::string>& server_url) {
    std::string base = server_url ? strip_trailing_slashes(*server_url)
                                  : default_server_url_;
    std::string id = pull_id ? *pull_id : generate_uuid();
    std::string endpoint = base + "/api/pull";

    Outcome outcome;
    {
        auto guard = registry_.register_guarded(id);

        std::cerr << "[pull] " << id << " started: " << name << " from " << base << "\n";
        PullStartEvent start;
        start.pull_id = id;
        start.name = name;
        publish(start);

        outcome = stream_progress(endpoint, name, id, *guard);
    } // registry entry released here

    std::cerr << "[pull] " << id << " " << pull_state_name(outcome.state);
    if (!outcome.error.empty()) std::cerr << ": " << outcome.error;
    std::cerr << "\n";

    switch (outcome.state) {
        case PullState::Completed: {
            PullCompleteEvent ev;
            ev.pull_id = id;
            publish(ev);
            return SimpleResponse::ok();
        }
        case PullState::Cancelled: {
            PullCancelledEvent ev;
            ev.pull_id = id;
            publish(ev);
            return SimpleResponse::fail(kPullCancelledMessage);
        }
        case PullState::Failed: {
            PullErrorEvent ev;
            ev.pull_id = id;
            ev.error = outcome.error;
            publish(ev);
            return SimpleResponse::fail(outcome.error);
        }
    }
    return SimpleResponse::fail(outcome.error);
}

std::future<SimpleResponse> PullManager::start_pull_async(std::string name,
                                                          std::optional<std::string> pull_id,
                                                          std::optional<std::string> server_url) {
    return std::async(std::launch::async,
        [this, name = std::move(name), pull_id = std::move(pull_id),
         server_url = std::move(server_url)]() {
            return start_pull(name, pull_id, server_url);
        });
}

SimpleResponse PullManager::cancel_pull(const std::string& pull_id) {
    if (!registry_.request_cancel(pull_id))
        return SimpleResponse::fail(kPullNotFoundMessage);
    std::cerr << "[pull] " << pull_id << " cancellation requested\n";
    return SimpleResponse::ok();
}

// "HTTP error: 404", plus the server's {"error": ...} text when present.
static std::string describe_http_error(const HttpResponse& response) {
    std::string message = "HTTP error: " + std::to_string(response.status_code);
    auto body = json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object() &&
        body.contains("error") && body["error"].is_string())
        message += " (" + body["error"].get<std::string>() + ")";
    return message;
}

void PullManager::publish_progress(const std::string& pull_id, const std::string& line) {
    PullProgressEvent ev;
    ev.pull_id = pull_id;
    ev.progress = parse_progress(line);
    publish(ev);
}

PullManager::Outcome PullManager::stream_progress(const std::string& endpoint,
                                                  const std::string& name,
                                                  const std::string& pull_id,
                                                  const CancellationRegistry::Guard& guard) {
    json request;
    request["name"] = name;
    std::vector<Header> headers = {
        {"Content-Type", "application/json"},
        {"Accept", "application/x-ndjson"}
    };

    LineFramer framer;
    bool cancelled = false;
    std::string callback_error;

    // Runs inside the transport (possibly under C frames): must not throw.
    RawChunkCallback on_chunk = [&](const char* data, size_t len) -> bool {
        if (guard.cancelled()) {
            cancelled = true;
            return false;
        }
        try {
            framer.feed(data, len);
            for (const auto& line : framer.drain())
                publish_progress(pull_id, line);
        } catch (const std::exception& e) {
            callback_error = e.what();
            return false;
        }
        // Cancelled while handling this chunk: stop before waiting for more data.
        if (guard.cancelled()) {
            cancelled = true;
            return false;
        }
        return true;
    };

    HttpResponse response;
    try {
        response = http_.stream_post_raw(endpoint, request.dump(), headers,
                                         on_chunk, kPullTimeoutSeconds);
    } catch (const std::exception& e) {
        return {PullState::Failed, std::string("Request error: ") + e.what()};
    }

    if (cancelled) return {PullState::Cancelled, kPullCancelledMessage};
    if (!callback_error.empty()) return {PullState::Failed, callback_error};
    if (response.status_code == 0) {
        return {PullState::Failed, "Request error: " +
            (response.error.empty() ? std::string("no response from server") : response.error)};
    }
    if (!is_success(response))
        return {PullState::Failed, describe_http_error(response)};
    if (!response.error.empty()) return {PullState::Failed, response.error};

    // End of stream counts as a chunk boundary for cancellation.
    if (guard.cancelled()) return {PullState::Cancelled, kPullCancelledMessage};

    // The final record may lack its newline.
    try {
        if (auto rest = framer.flush_remainder())
            publish_progress(pull_id, *rest);
    } catch (const std::exception& e) {
        return {PullState::Failed, e.what()};
    }
    return {PullState::Completed, ""};
}

} // namespace ollie
