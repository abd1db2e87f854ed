#include "mdexpand/pipeline.hpp"
#include "mdexpand/injector.hpp"
#include "mdexpand/parser.hpp"
#include "mdexpand/semaphore.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

namespace mdexpand {

namespace {

enum class Phase {
    All,
    Content,
    Commands
};

bool in_phase(const ImportAction& action, Phase phase) {
    switch (phase) {
        case Phase::Content: return is_content_action(action);
        case Phase::Commands: return is_command_action(action);
        default: return true;
    }
}

Result<std::string> run_expansion(const std::string& text,
                                  const std::string& current_dir,
                                  const ImportStack& stack,
                                  const ResolutionContext& ctx,
                                  Phase phase) {
    std::vector<ImportAction> actions;
    for (auto& action : parse_imports(text)) {
        if (in_phase(action, phase)) {
            actions.push_back(std::move(action));
        }
    }

    if (actions.empty()) {
        return Result<std::string>::ok(text);
    }

    spdlog::debug("Resolving {} import(s) in {}", actions.size(), current_dir);

    // One semaphore per level; nested expansions get their own
    Semaphore semaphore(ctx.config.concurrency_limit);
    Resolver resolver(ctx);

    std::atomic<size_t> next_action{0};
    std::atomic<bool> cancelled{false};
    std::mutex failure_mutex;
    std::optional<Error> first_failure;
    std::vector<std::optional<std::string>> contents(actions.size());

    auto record_failure = [&](Error error) {
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (!first_failure) {
            first_failure = std::move(error);
        }
        cancelled.store(true);
    };

    // Workers pull action indices until the level is drained
    auto work = [&]() {
        for (size_t i = next_action.fetch_add(1); i < actions.size(); i = next_action.fetch_add(1)) {
            SemaphoreGuard permit(semaphore);
            if (cancelled.load()) {
                continue;
            }

            try {
                auto result = resolver.resolve(actions[i], current_dir, stack);
                if (result.isErr()) {
                    record_failure(result.error());
                } else {
                    contents[i] = std::move(result.value());
                }
            } catch (const std::exception& e) {
                record_failure(Error(ErrorCode::IO_ERROR,
                                     "Failed to resolve " + original_text(actions[i]) + ": " + e.what(),
                                     {{"import", original_text(actions[i])}}));
            }
        }
    };

    size_t worker_count = std::min(actions.size(), std::max<size_t>(ctx.config.concurrency_limit, 1));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t w = 1; w < worker_count; ++w) {
        try {
            workers.emplace_back(work);
        } catch (const std::system_error& e) {
            spdlog::debug("Running with {} worker(s): {}", workers.size() + 1, e.what());
            break;
        }
    }
    // The calling thread is always one of the workers
    work();
    for (auto& worker : workers) {
        worker.join();
    }

    std::vector<ResolvedImport> resolved;
    resolved.reserve(actions.size());
    for (size_t i = 0; i < actions.size(); ++i) {
        if (contents[i]) {
            resolved.push_back(ResolvedImport{actions[i], std::move(*contents[i])});
        }
    }

    if (first_failure) {
        return Result<std::string>::err(*first_failure);
    }

    return Result<std::string>::ok(inject_imports(text, std::move(resolved)));
}

} // namespace

Result<std::string> expand_imports(const std::string& text,
                                   const std::string& current_dir,
                                   const ImportStack& stack,
                                   const ResolutionContext& ctx) {
    return run_expansion(text, current_dir, stack, ctx, Phase::All);
}

Result<std::string> expand_content_imports(const std::string& text,
                                           const std::string& current_dir,
                                           const ImportStack& stack,
                                           const ResolutionContext& ctx) {
    if (ctx.content_only) {
        return run_expansion(text, current_dir, stack, ctx, Phase::Content);
    }

    ResolutionContext content_ctx = ctx;
    content_ctx.content_only = true;
    return run_expansion(text, current_dir, stack, content_ctx, Phase::Content);
}

Result<std::string> expand_command_imports(const std::string& text,
                                           const std::string& current_dir,
                                           const ResolutionContext& ctx) {
    return run_expansion(text, current_dir, ImportStack(), ctx, Phase::Commands);
}

} // namespace mdexpand
