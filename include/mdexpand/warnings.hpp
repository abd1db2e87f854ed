#pragma once

#include "mdexpand/types.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdexpand {

// ============================================================================
// Warning Collector
// ============================================================================

// Collects non-fatal conditions during an expansion. Safe to share between
// concurrent resolutions; entries are append-only.
class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    WarningCollector(const WarningCollector&) = delete;
    WarningCollector& operator=(const WarningCollector&) = delete;

    // Emit a warning with fields; logged at warn (or error) level unless ignored
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    void emit(Warning warning);

    // Emit a warning by key string (for dynamic warning keys)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    void apply_override(const std::string& warning_key, WarningAction action);

    // Warnings after policy application; ignored ones are excluded
    std::vector<WarningObject> get_warnings() const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    bool has_effective_warnings() const;

    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;
    std::unordered_map<std::string, WarningAction> overrides_;

    WarningAction get_effective_action(const std::string& key) const;
};

// ============================================================================
// Warning field builders
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> glob_binary_skipped(
    const std::string& pattern,
    const std::string& path) {
    return {{"pattern", pattern}, {"path", path}};
}

inline std::unordered_map<std::string, std::string> high_token_count(
    const std::string& pattern,
    size_t tokens,
    size_t limit) {
    return {{"pattern", pattern}, {"tokens", std::to_string(tokens)},
            {"limit", std::to_string(limit)}};
}

inline std::unordered_map<std::string, std::string> invalid_configuration(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

} // namespace warnings

} // namespace mdexpand
