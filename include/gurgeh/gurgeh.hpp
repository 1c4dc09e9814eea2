#pragma once

/**
 * @file gurgeh.hpp
 * @brief Main convenience header for the Gurgeh coach engine
 *
 * Gurgeh is a header-only C++17 library that runs streaming chat exchanges
 * against an OpenAI-compatible chat-completions endpoint and lets the model
 * call locally registered tools between rounds. The HTTP transport is the
 * only compiled part (gurgeh_transport, libcurl).
 *
 * Quick Start:
 * @code
 * #include <gurgeh/gurgeh.hpp>
 *
 * int main() {
 *     gurgeh::Config config;
 *     config.api_key = std::getenv("OPENROUTER_API_KEY");
 *     config.system_prompt = gurgeh::chess::kCoachSystemPrompt;
 *
 *     auto agent = gurgeh::Agent::create(config);
 *     if (!agent) {
 *         std::cerr << "Error: " << agent.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto store = gurgeh::chess::SqliteDataSource::open("tacticus.db");
 *     if (store) {
 *         gurgeh::chess::register_coach_tools((*agent)->tools(), *store);
 *     }
 *
 *     auto handle = (*agent)->run_exchange({}, gurgeh::Message::user("How am I doing?"));
 *     auto result = handle.future.get();
 *     if (result) {
 *         std::cout << result->text << std::endl;
 *     }
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - gurgeh::Agent: worker pool running exchanges, returns ExchangeHandle
 * - gurgeh::Conversation: caller-owned user/assistant history
 * - gurgeh::engine::AgenticLoop: round/tool state machine for one exchange
 * - gurgeh::engine::ToolRegistry: named tools with JSON parameter schemas
 * - gurgeh::chess: coach tools, data source seam and prompts
 *
 * Thread Safety:
 * - run_exchange() and cancel() may be called from any thread
 * - Callbacks execute on a worker thread
 */

// Core types
#include "types.hpp"
#include "log.hpp"

// Public API
#include "agent.hpp"
#include "conversation.hpp"

// Transport interface (for custom implementations and testing)
#include "transport/IHttpTransport.hpp"

// Engine components (optional, for advanced usage)
#include "engine/sse_decoder.hpp"
#include "engine/tool_call_accumulator.hpp"
#include "engine/transcript_builder.hpp"
#include "engine/stream_client.hpp"
#include "engine/tool_registry.hpp"
#include "engine/agentic_loop.hpp"

// Chess coach
#include "chess/coach_tools.hpp"
#include "chess/sqlite_data_source.hpp"
#include "chess/prompts.hpp"

/**
 * @namespace gurgeh
 * @brief Main namespace for the Gurgeh coach engine
 *
 * Nested namespaces:
 * - gurgeh::transport - HTTP transport interface and libcurl implementation
 * - gurgeh::engine - exchange internals
 * - gurgeh::chess - chess coach tools and data access
 */
