#pragma once

/**
 * @file mdexpand.hpp
 * @brief Import expansion for markdown documents
 *
 * A document can pull in other content with directives:
 *
 * - `@./file.md`, `@./src/app.ts:10-40`, `@./src/app.ts#Config`
 * - `@./docs/**\/*.md` (glob, concatenated with per-file tags)
 * - `@https://example.com/notes.md`
 * - !`git log -3` (inline command)
 * - a fenced block whose first line is a shebang (executed)
 *
 * Directives inside code spans and ordinary fenced blocks are left alone.
 *
 * ## Example
 *
 * ```cpp
 * #include <mdexpand/mdexpand.hpp>
 *
 * mdexpand::ResolutionContext ctx;
 * ctx.config = mdexpand::get_default_config();
 *
 * auto result = mdexpand::expand_imports(text, "/path/to/doc/dir", {}, ctx);
 * if (result.isErr()) {
 *     std::cerr << result.error().message() << "\n";
 * }
 * ```
 */

#ifndef MDEXPAND_VERSION
#define MDEXPAND_VERSION "unknown"
#endif

#include "mdexpand/config.hpp"
#include "mdexpand/environment.hpp"
#include "mdexpand/error.hpp"
#include "mdexpand/import_stack.hpp"
#include "mdexpand/injector.hpp"
#include "mdexpand/parser.hpp"
#include "mdexpand/pipeline.hpp"
#include "mdexpand/resolver.hpp"
#include "mdexpand/scanner.hpp"
#include "mdexpand/template.hpp"
#include "mdexpand/types.hpp"
#include "mdexpand/warnings.hpp"
