#include "mdexpand/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <type_traits>

namespace mdexpand {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

ActionType action_type(const ImportAction& action) {
    return std::visit([](const auto& a) -> ActionType {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, FileImport>) return ActionType::File;
        else if constexpr (std::is_same_v<T, SymbolImport>) return ActionType::Symbol;
        else if constexpr (std::is_same_v<T, GlobImport>) return ActionType::Glob;
        else if constexpr (std::is_same_v<T, UrlImport>) return ActionType::Url;
        else if constexpr (std::is_same_v<T, CommandImport>) return ActionType::Command;
        else return ActionType::ExecutableCodeFence;
    }, action);
}

const std::string& original_text(const ImportAction& action) {
    return std::visit([](const auto& a) -> const std::string& { return a.original_text; }, action);
}

size_t source_index(const ImportAction& action) {
    return std::visit([](const auto& a) { return a.source_index; }, action);
}

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "glob_binary_skipped") return Warning::glob_binary_skipped;
    if (lower == "high_token_count") return Warning::high_token_count;
    if (lower == "invalid_configuration") return Warning::invalid_configuration;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

} // namespace mdexpand
