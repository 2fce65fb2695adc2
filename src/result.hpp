#pragma once
#include <optional>
#include <string>

namespace ollie {

// Outcome of a fire-and-report command (pull, cancel, delete).
struct SimpleResponse {
    bool success = false;
    std::optional<std::string> error;

    static SimpleResponse ok() { return {true, std::nullopt}; }
    static SimpleResponse fail(std::string message) { return {false, std::move(message)}; }
};

} // namespace ollie
