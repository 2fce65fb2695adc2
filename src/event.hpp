#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace ollie {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* PullStart     = "models:pull-start";
    constexpr const char* PullProgress  = "models:pull-progress";
    constexpr const char* PullCancelled = "models:pull-cancelled";
    constexpr const char* PullError     = "models:pull-error";
    constexpr const char* PullComplete  = "models:pull-complete";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────
// to_json() gives the payload object forwarded to external observers.

struct PullStartEvent : Event {
    static constexpr const char* TAG = event_tags::PullStart;
    std::string pull_id;
    std::string name;

    PullStartEvent() { type_tag = TAG; }
    nlohmann::json to_json() const { return {{"pull_id", pull_id}, {"name", name}}; }
};

struct PullProgressEvent : Event {
    static constexpr const char* TAG = event_tags::PullProgress;
    std::string pull_id;
    nlohmann::json progress; // opaque server record (or parsing_error wrapper)

    PullProgressEvent() { type_tag = TAG; }
    nlohmann::json to_json() const { return {{"pull_id", pull_id}, {"progress", progress}}; }
};

struct PullCancelledEvent : Event {
    static constexpr const char* TAG = event_tags::PullCancelled;
    std::string pull_id;

    PullCancelledEvent() { type_tag = TAG; }
    nlohmann::json to_json() const { return {{"pull_id", pull_id}}; }
};

struct PullErrorEvent : Event {
    static constexpr const char* TAG = event_tags::PullError;
    std::string pull_id;
    std::string error;

    PullErrorEvent() { type_tag = TAG; }
    nlohmann::json to_json() const { return {{"pull_id", pull_id}, {"error", error}}; }
};

struct PullCompleteEvent : Event {
    static constexpr const char* TAG = event_tags::PullComplete;
    std::string pull_id;

    PullCompleteEvent() { type_tag = TAG; }
    nlohmann::json to_json() const { return {{"pull_id", pull_id}}; }
};

} // namespace ollie
