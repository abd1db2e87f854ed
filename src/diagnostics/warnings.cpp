#include "mdexpand/warnings.hpp"

#include <algorithm>
#include <cctype>
#include <map>

#include <spdlog/spdlog.h>

namespace mdexpand {

namespace {

std::string normalize_key(const std::string& key) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// "key (a=1, b=2)" with fields in a stable order
std::string describe(const std::string& key,
                     const std::unordered_map<std::string, std::string>& fields) {
    if (fields.empty()) return key;
    std::map<std::string, std::string> sorted(fields.begin(), fields.end());
    std::string out = key + " (";
    bool first = true;
    for (const auto& [k, v] : sorted) {
        if (!first) out += ", ";
        out += k + "=" + v;
        first = false;
    }
    out += ")";
    return out;
}

} // namespace

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    WarningAction action = get_effective_action(warning_key);

    if (action == WarningAction::Warn) {
        spdlog::warn("{}", describe(warning_key, fields));
    } else if (action == WarningAction::Error) {
        spdlog::error("{}", describe(warning_key, fields));
    }

    // Ignored warnings are still collected but marked
    warnings_.push_back({warning_key, std::move(fields), action});
}

void WarningCollector::apply_override(const std::string& warning_key, WarningAction action) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[normalize_key(warning_key)] = action;
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

bool WarningCollector::has_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action == WarningAction::Error;
    });
}

bool WarningCollector::has_effective_warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action != WarningAction::Ignore;
    });
}

void WarningCollector::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.clear();
}

// Caller holds mutex_
WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    std::string lower_key = normalize_key(key);

    auto override_it = overrides_.find(lower_key);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }

    auto policy_it = policy_.find(lower_key);
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    return WarningAction::Warn;
}

} // namespace mdexpand
