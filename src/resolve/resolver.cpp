#include "mdexpand/resolver.hpp"
#include "mdexpand/content_type.hpp"
#include "mdexpand/pipeline.hpp"
#include "mdexpand/platform.hpp"
#include "mdexpand/symbols.hpp"
#include "mdexpand/template.hpp"
#include "mdexpand/text_utils.hpp"
#include "mdexpand/tokens.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace mdexpand {

namespace fs = std::filesystem;

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

SystemEnvironment& host_environment() {
    static HostEnvironment host;
    return host;
}

// 12345 -> "12,345"
std::string with_commas(size_t n) {
    std::string digits = std::to_string(n);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) out.insert(out.begin(), ',');
        out.insert(out.begin(), *it);
        ++count;
    }
    return out;
}

std::string limit_label(uint64_t limit) {
    constexpr uint64_t MIB = 1024 * 1024;
    if (limit >= MIB && limit % MIB == 0) {
        return std::to_string(limit / MIB) + "MB";
    }
    return format_bytes(limit);
}

// The path as written after the '@'
std::string import_text(const std::string& original_text) {
    return original_text.empty() ? original_text : original_text.substr(1);
}

// Removes the wrapped path when the guard goes out of scope
class TempFileGuard {
public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!path_.empty()) remove_file(path_);
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::string first_nonempty(const std::string& a, const std::string& b, const char* fallback) {
    if (!a.empty()) return a;
    if (!b.empty()) return b;
    return fallback;
}

} // namespace

// ============================================================================
// Path helpers
// ============================================================================

std::string resolve_import_path(const std::string& path, const std::string& base_dir) {
    std::string expanded = expand_tilde(path);
    if (fs::path(expanded).is_absolute()) {
        return fs::path(expanded).lexically_normal().string();
    }
    return join_path(base_dir, expanded);
}

std::string glob_tag_name(const std::string& path) {
    std::string name = get_filename(path);
    size_t dot = name.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    } else if (dot == 0 && name.size() > 1) {
        name.clear();
    }

    std::string slug;
    bool pending_dash = false;
    for (char raw : name) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (!keep) {
            pending_dash = true;
            continue;
        }
        if (pending_dash && !slug.empty()) slug += '-';
        pending_dash = false;
        slug += c;
    }

    if (!slug.empty() && std::isdigit(static_cast<unsigned char>(slug[0]))) {
        slug.insert(slug.begin(), '_');
    }
    return slug.empty() ? "file" : slug;
}

std::string code_fence_extension(const std::string& language) {
    if (language == "bash") return "sh";
    return language;
}

bool is_markdown_file_command(const std::string& command) {
    size_t end = 0;
    while (end < command.size() && !std::isspace(static_cast<unsigned char>(command[end]))) {
        ++end;
    }
    return end > 3 && command.compare(end - 3, 3, ".md") == 0;
}

// ============================================================================
// Resolver
// ============================================================================

Resolver::Resolver(const ResolutionContext& ctx)
    : ctx_(ctx), system_(ctx.system ? *ctx.system : host_environment()) {}

Result<std::string> Resolver::resolve(const ImportAction& action,
                                      const std::string& current_dir,
                                      const ImportStack& stack) const {
    return std::visit(overloaded{
        [&](const FileImport& a) {
            return a.line_range ? resolve_line_range(a, current_dir)
                                : resolve_file(a, current_dir, stack);
        },
        [&](const SymbolImport& a) { return resolve_symbol(a, current_dir); },
        [&](const GlobImport& a) { return resolve_glob(a, current_dir); },
        [&](const UrlImport& a) { return resolve_url(a); },
        [&](const CommandImport& a) { return resolve_command(a, current_dir); },
        [&](const ExecutableCodeFence& a) { return resolve_code_fence(a, current_dir); },
    }, action);
}

void Resolver::record(const std::string& entry) const {
    if (ctx_.imported) ctx_.imported->record(entry);
}

std::string Resolver::command_cwd(const std::string& current_dir) const {
    return ctx_.invocation_cwd.empty() ? current_dir : ctx_.invocation_cwd;
}

bool Resolver::is_binary(const std::string& resolved_path) const {
    if (has_binary_extension(resolved_path)) return true;
    return contains_null_byte(system_.read_prefix(resolved_path, BINARY_CHECK_SIZE),
                              BINARY_CHECK_SIZE);
}

Result<void> Resolver::check_size(const std::string& resolved_path) const {
    auto size = system_.file_size(resolved_path);
    if (!size) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "Failed to stat file: " + resolved_path,
                                       {{"resolved_path", resolved_path}}));
    }

    if (exceeds_limit(ctx_.config, *size)) {
        uint64_t limit = ctx_.config.max_file_size;
        return Result<void>::err(Error(
            ErrorCode::FILE_TOO_LARGE,
            "File \"" + resolved_path + "\" exceeds " + limit_label(limit) + " limit (" +
                format_bytes(*size) + "). Consider using line ranges (@./file.ts:1-100) or "
                "symbol extraction (@./file.ts#FunctionName) to import only the relevant portion.",
            {{"resolved_path", resolved_path},
             {"size", std::to_string(*size)},
             {"limit", std::to_string(limit)}}));
    }
    return Result<void>::ok();
}

Result<void> Resolver::check_importable(const std::string& import_path,
                                        const std::string& resolved_path) const {
    if (!system_.file_exists(resolved_path)) {
        return Result<void>::err(Error(
            ErrorCode::IMPORT_NOT_FOUND,
            "Import not found: " + import_path + " (resolved to " + resolved_path + ")",
            {{"path", import_path}, {"resolved_path", resolved_path}}));
    }

    auto size_check = check_size(resolved_path);
    if (size_check.isErr()) return size_check;

    if (is_binary(resolved_path)) {
        return Result<void>::err(Error(
            ErrorCode::BINARY_IMPORT_REJECTED,
            "Cannot import binary file: " + import_path + " (resolved to " + resolved_path + ")",
            {{"path", import_path}, {"resolved_path", resolved_path}}));
    }
    return Result<void>::ok();
}

// ============================================================================
// File imports
// ============================================================================

Result<std::string> Resolver::resolve_file(const FileImport& action,
                                           const std::string& current_dir,
                                           const ImportStack& stack) const {
    std::string resolved = resolve_import_path(action.path, current_dir);

    if (!system_.file_exists(resolved)) {
        return Result<std::string>::err(Error(
            ErrorCode::IMPORT_NOT_FOUND,
            "Import not found: " + action.path + " (resolved to " + resolved + ")",
            {{"path", action.path}, {"resolved_path", resolved}}));
    }

    // Symlink aliases of the same file share one canonical path
    std::string canonical = system_.canonical_path(resolved).value_or(resolved);
    if (stack.contains(canonical)) {
        std::string chain = stack.chain_to(canonical);
        return Result<std::string>::err(Error(ErrorCode::CIRCULAR_IMPORT,
                                              "Circular import detected: " + chain,
                                              {{"path", action.path}, {"chain", chain}}));
    }

    auto size_check = check_size(resolved);
    if (size_check.isErr()) return Result<std::string>::err(size_check.error());

    if (is_binary(resolved)) {
        return Result<std::string>::err(Error(
            ErrorCode::BINARY_IMPORT_REJECTED,
            "Cannot import binary file: " + action.path + " (resolved to " + resolved + ")",
            {{"path", action.path}, {"resolved_path", resolved}}));
    }

    spdlog::info("Loading: {}", action.path);
    record(import_text(action.original_text));

    auto content = system_.read_file(resolved);
    if (content.isErr()) return content;

    ImportStack next = stack.extended(canonical);
    std::string dir = get_parent_directory(resolved);
    if (ctx_.content_only) {
        return expand_content_imports(content.value(), dir, next, ctx_);
    }
    return expand_imports(content.value(), dir, next, ctx_);
}

Result<std::string> Resolver::resolve_line_range(const FileImport& action,
                                                 const std::string& current_dir) const {
    std::string resolved = resolve_import_path(action.path, current_dir);
    auto check = check_importable(action.path, resolved);
    if (check.isErr()) return Result<std::string>::err(check.error());

    const LineRange& range = *action.line_range;
    spdlog::debug("Loading lines {}-{} from: {}", range.start, range.end, action.path);

    auto content = system_.read_file(resolved);
    if (content.isErr()) return content;

    record(import_text(action.original_text));
    return Result<std::string>::ok(extract_lines(content.value(), range.start, range.end));
}

Result<std::string> Resolver::resolve_symbol(const SymbolImport& action,
                                             const std::string& current_dir) const {
    std::string resolved = resolve_import_path(action.path, current_dir);
    auto check = check_importable(action.path, resolved);
    if (check.isErr()) return Result<std::string>::err(check.error());

    spdlog::debug("Extracting symbol \"{}\" from: {}", action.symbol, action.path);

    auto content = system_.read_file(resolved);
    if (content.isErr()) return content;

    record(import_text(action.original_text));

    auto extracted = extract_symbol(content.value(), action.symbol);
    if (extracted.isErr()) {
        extracted.error().withField("path", action.path);
    }
    return extracted;
}

// ============================================================================
// Glob imports
// ============================================================================

IgnoreRules Resolver::load_ignore_rules(const std::string& current_dir) const {
    IgnoreRules rules = IgnoreRules::with_defaults();

    std::string dir = current_dir;
    while (!dir.empty()) {
        std::string gitignore = join_path(dir, ".gitignore");
        if (system_.file_exists(gitignore)) {
            auto content = system_.read_file(gitignore);
            if (content.isOk()) {
                rules.add_lines(content.value());
            } else {
                spdlog::debug("Skipping unreadable {}: {}", gitignore, content.error().message());
            }
        }

        if (path_exists(join_path(dir, ".git"))) break;

        std::string parent = get_parent_directory(dir);
        if (parent.empty() || parent == dir) break;
        dir = parent;
    }
    return rules;
}

Result<std::string> Resolver::resolve_glob(const GlobImport& action,
                                           const std::string& current_dir) const {
    std::string pattern = expand_tilde(action.pattern);
    bool absolute = !pattern.empty() && pattern[0] == '/';
    std::string base_dir = absolute ? "/" : current_dir;
    if (!absolute) {
        while (pattern.rfind("./", 0) == 0) pattern.erase(0, 2);
    }

    spdlog::debug("Glob pattern: {} in {}", pattern, current_dir);

    IgnoreRules ignore = load_ignore_rules(current_dir);

    struct GlobFile {
        std::string path;
        std::string content;
    };
    std::vector<GlobFile> files;

    std::error_code ec;
    fs::path root = fs::absolute(current_dir, ec);
    if (ec) root = current_dir;

    for (const auto& file : system_.glob_files(pattern, base_dir)) {
        std::string relative = fs::path(file).lexically_relative(root).generic_string();
        if (relative.empty()) relative = file;
        if (ignore.ignores(relative)) continue;

        if (is_binary(file)) {
            if (ctx_.warnings) {
                ctx_.warnings->emit(Warning::glob_binary_skipped,
                                    warnings::glob_binary_skipped(action.pattern, relative));
            }
            continue;
        }

        auto size_check = check_size(file);
        if (size_check.isErr()) return Result<std::string>::err(size_check.error());

        auto content = system_.read_file(file);
        if (content.isErr()) return content;
        files.push_back({relative, std::move(content.value())});
    }

    std::sort(files.begin(), files.end(),
              [](const GlobFile& a, const GlobFile& b) { return a.path < b.path; });

    std::string all_content;
    for (size_t i = 0; i < files.size(); ++i) {
        if (i > 0) all_content += '\n';
        all_content += files[i].content;
    }

    size_t limit = context_limit(ctx_.config);
    size_t tokens = estimate_tokens(all_content);
    bool refined = static_cast<double>(tokens) > static_cast<double>(limit) * 0.7;
    if (refined) {
        tokens = count_tokens(all_content);
    }

    spdlog::info("Expanding {}: {} files (~{} tokens{})", action.pattern, files.size(),
                 with_commas(tokens), refined ? " refined est" : " est");

    if (tokens > limit && !ctx_.config.force_context) {
        return Result<std::string>::err(Error(
            ErrorCode::CONTEXT_BUDGET_EXCEEDED,
            "Glob import \"" + action.pattern + "\" would include ~" + with_commas(tokens) +
                " tokens (" + std::to_string(files.size()) + " files), which exceeds the " +
                with_commas(limit) + " token limit.\n"
                "To override this limit, set MDEXPAND_FORCE_CONTEXT=1 or pass --force-context.",
            {{"pattern", action.pattern},
             {"tokens", std::to_string(tokens)},
             {"limit", std::to_string(limit)}}));
    }

    if (tokens > limit / 2 && tokens <= limit && ctx_.warnings) {
        ctx_.warnings->emit(Warning::high_token_count,
                            warnings::high_token_count(action.pattern, tokens, limit));
    }

    record(import_text(action.original_text));

    std::string output;
    for (size_t i = 0; i < files.size(); ++i) {
        if (i > 0) output += "\n\n";
        std::string tag = glob_tag_name(files[i].path);
        output += "<" + tag + " path=\"" + files[i].path + "\">\n" + files[i].content +
                  "\n</" + tag + ">";
    }
    return Result<std::string>::ok(output);
}

// ============================================================================
// URL imports
// ============================================================================

Result<std::string> Resolver::resolve_url(const UrlImport& action) const {
    const std::string& url = action.url;
    RemoteCache* cache = system_.remote_cache();

    std::unordered_map<std::string, std::string> headers = {
        {"Accept", URL_ACCEPT_HEADER},
        {"User-Agent", USER_AGENT},
    };

    CacheLookup cached;
    if (cache) {
        cached = cache->lookup(url);
        if (cached.hit && cached.content) {
            spdlog::debug("Cache hit: {}", url);
            record(url);
            return Result<std::string>::ok(*cached.content);
        }
        if (cached.expired && cached.content && cached.metadata) {
            if (cached.metadata->etag) {
                headers["If-None-Match"] = *cached.metadata->etag;
            }
            if (cached.metadata->last_modified) {
                headers["If-Modified-Since"] = *cached.metadata->last_modified;
            }
        }
    }

    spdlog::info("Fetching: {}", url);
    HttpResponse response = system_.fetch(url, headers);

    if (!response.ok) {
        return Result<std::string>::err(Error(ErrorCode::URL_FETCH_FAILED,
                                              "Failed to fetch URL: " + url + " - " + response.error,
                                              {{"url", url}}));
    }

    if (response.status == 304 && cached.content) {
        spdlog::debug("Not modified, refreshing cache: {}", url);
        cache->refresh(url);
        record(url);
        return Result<std::string>::ok(*cached.content);
    }

    if (response.status < 200 || response.status >= 300) {
        return Result<std::string>::err(Error(
            ErrorCode::URL_FETCH_FAILED,
            "Failed to fetch URL: " + url + " - HTTP " + std::to_string(response.status),
            {{"url", url}, {"status", std::to_string(response.status)}}));
    }

    std::string content_type = response.header("content-type");
    if (!is_allowed_content_type(content_type)) {
        ContentKind inferred = infer_content_kind(response.body, url);
        if (inferred == ContentKind::Unknown) {
            return Result<std::string>::err(Error(
                ErrorCode::UNSUPPORTED_CONTENT_TYPE,
                "URL returned unsupported content type: " +
                    (content_type.empty() ? std::string("unknown") : content_type) +
                    ". Only markdown and JSON are allowed. URL: " + url,
                {{"url", url}, {"content_type", content_type}}));
        }
        spdlog::debug("Inferred {} content for {}", content_kind_to_string(inferred), url);
    }

    std::string content = trim(response.body);

    if (cache) {
        CacheMetadata meta;
        meta.url = url;
        std::string etag = response.header("etag");
        std::string last_modified = response.header("last-modified");
        if (!etag.empty()) meta.etag = etag;
        if (!last_modified.empty()) meta.last_modified = last_modified;
        if (!cache->store(url, content, meta)) {
            spdlog::debug("Failed to cache {}", url);
        }
    }

    record(url);
    return Result<std::string>::ok(content);
}

// ============================================================================
// Commands
// ============================================================================

Result<std::string> Resolver::resolve_command(const CommandImport& action,
                                              const std::string& current_dir) const {
    std::string command = substitute(action.command, ctx_.template_vars);
    if (command != action.command) {
        spdlog::debug("Command with vars: {} -> {}", action.command, command);
    }

    // A bare markdown file path runs through this tool
    std::string actual = trim(command);
    if (is_markdown_file_command(actual)) {
        actual = ctx_.config.self_command + " " + actual;
        spdlog::debug("Running markdown file with {}: {}", ctx_.config.self_command, actual);
    }

    if (ctx_.dry_run) {
        spdlog::info("Dry run: skipping '{}'", actual);
        return Result<std::string>::ok("[Dry Run: Command \"" + actual + "\" not executed]");
    }

    spdlog::info("Executing: {}", actual);

    ProcessOptions options;
    options.cwd = command_cwd(current_dir);
    options.env = ctx_.env;
    options.timeout_ms = ctx_.config.command_timeout_ms;

    ProcessResult proc = system_.run_process(shell_argv(actual), options);

    if (proc.timed_out) {
        return Result<std::string>::err(Error(
            ErrorCode::COMMAND_TIMED_OUT,
            "Command timed out after " + std::to_string(options.timeout_ms) + "ms: " + actual,
            {{"command", actual}, {"timeout_ms", std::to_string(options.timeout_ms)}}));
    }
    if (!proc.ok) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                                              "Failed to run command: " + actual + " - " + proc.error,
                                              {{"command", actual}}));
    }

    if (contains_null_byte(proc.stdout_text, COMMAND_BINARY_CHECK_SIZE)) {
        return Result<std::string>::err(Error(
            ErrorCode::BINARY_COMMAND_OUTPUT,
            "Command returned binary data. Inline commands must return text: " + actual,
            {{"command", actual}}));
    }

    std::string out = strip_ansi(trim(proc.stdout_text));
    std::string err = strip_ansi(trim(proc.stderr_text));

    if (proc.exit_code != 0) {
        return Result<std::string>::err(Error(
            ErrorCode::COMMAND_FAILED,
            "Command failed (Exit " + std::to_string(proc.exit_code) + "): " + actual +
                "\nOutput: " + first_nonempty(err, out, "No output"),
            {{"command", actual},
             {"stderr", err},
             {"stdout", out},
             {"exit_code", std::to_string(proc.exit_code)}}));
    }

    std::string output;
    if (!err.empty() && !out.empty()) {
        output = err + "\n" + out;
    } else {
        output = out.empty() ? err : out;
    }

    return Result<std::string>::ok(wrap_raw(truncate_output(output, ctx_.config.max_command_output)));
}

Result<std::string> Resolver::resolve_code_fence(const ExecutableCodeFence& action,
                                                 const std::string& current_dir) const {
    spdlog::info("Executing code fence ({}): {}", action.language, action.shebang);

    if (ctx_.dry_run) {
        return Result<std::string>::ok("[Dry Run: Code fence not executed]");
    }

    TempFileGuard script(make_temp_path("mdexpand-", code_fence_extension(action.language)));
    auto written = atomic_write_file(script.path(), action.shebang + "\n" + action.code);
    if (!written.ok) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                                              "Failed to write code fence script: " + written.error,
                                              {{"path", script.path()}}));
    }

#ifndef _WIN32
    if (chmod(script.path().c_str(), 0755) != 0) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                                              "Failed to make code fence script executable",
                                              {{"path", script.path()}}));
    }
#endif

    ProcessOptions options;
    options.cwd = command_cwd(current_dir);
    options.env = ctx_.env;
    options.timeout_ms = ctx_.config.command_timeout_ms;

    ProcessResult proc = system_.run_process({script.path()}, options);

    if (proc.timed_out) {
        return Result<std::string>::err(Error(
            ErrorCode::COMMAND_TIMED_OUT,
            "Code fence timed out after " + std::to_string(options.timeout_ms) + "ms: " +
                action.shebang,
            {{"command", action.shebang}, {"timeout_ms", std::to_string(options.timeout_ms)}}));
    }
    if (!proc.ok) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                                              "Failed to run code fence: " + proc.error,
                                              {{"command", action.shebang}}));
    }

    if (proc.exit_code != 0) {
        return Result<std::string>::err(Error(
            ErrorCode::CODE_FENCE_FAILED,
            "Code fence failed (Exit " + std::to_string(proc.exit_code) + "): " +
                first_nonempty(proc.stderr_text, proc.stdout_text, "No output"),
            {{"command", action.shebang},
             {"stderr", proc.stderr_text},
             {"stdout", proc.stdout_text},
             {"exit_code", std::to_string(proc.exit_code)}}));
    }

    std::string output = strip_ansi(trim(proc.stdout_text + proc.stderr_text));
    return Result<std::string>::ok(wrap_raw(truncate_output(output, ctx_.config.max_command_output)));
}

} // namespace mdexpand
