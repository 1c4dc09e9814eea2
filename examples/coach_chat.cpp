/**
 * Gurgeh Coach Chat
 *
 * Interactive CLI chatting with the Gurgeh chess coach over an
 * OpenAI-compatible streaming API, with the coach tools reading the
 * player's chess database.
 *
 * Usage:
 *   OPENROUTER_API_KEY=... ./coach_chat --db <chess.db> [options]
 *
 * Options:
 *   --db <path>              Chess application database (required)
 *   --model <id>             Model identifier (default: anthropic/claude-3-haiku)
 *   --max-rounds <int>       Model rounds per exchange (default: 5)
 *   --verbose                Debug logging to stderr
 *   --help                   Show this help message
 *
 * Environment:
 *   OPENROUTER_API_KEY       Bearer credential (required)
 *   OPENROUTER_BASE_URL      Provider base URL override
 */

#include "gurgeh/gurgeh.hpp"
#include "gurgeh/transport/curl_transport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <string>

// Set by SIGINT; the main loop turns it into a cancel of the running exchange
std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = true;
    }
}

struct CLIArgs {
    std::string db_path;
    std::string model;
    int max_rounds = 5;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Gurgeh Coach Chat\n\n";
    std::cout << "Usage:\n";
    std::cout << "  OPENROUTER_API_KEY=... " << program_name << " --db <chess.db> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --db <path>              Chess application database (required)\n";
    std::cout << "  --model <id>             Model identifier (default: anthropic/claude-3-haiku)\n";
    std::cout << "  --max-rounds <int>       Model rounds per exchange (default: 5)\n";
    std::cout << "  --verbose                Debug logging to stderr\n";
    std::cout << "  --help                   Show this help message\n\n";
    std::cout << "Interactive Commands:\n";
    std::cout << "  /analyze <fen>  Ask for an analysis of a position\n";
    std::cout << "  /greet <name>   Personalized greeting from the coach\n";
    std::cout << "  /clear          Clear conversation history\n";
    std::cout << "  /quit, /exit    Exit the application\n";
    std::cout << "  Ctrl+C          Stop the current answer\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            args.help = true;
            return args;
        } else if (arg == "--db" && i + 1 < argc) {
            args.db_path = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            args.model = argv[++i];
        } else if (arg == "--max-rounds" && i + 1 < argc) {
            try {
                args.max_rounds = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --max-rounds value: " << argv[i] << "\n";
                args.help = true;
                return args;
            }
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }
    if (args.db_path.empty()) {
        args.help = true;
    }
    return args;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\n\r"));
    s.erase(s.find_last_not_of(" \t\n\r") + 1);
    return s;
}

/**
 * Run one exchange, printing streamed text and tool activity, and record
 * the outcome in the conversation. Ctrl+C cancels the exchange.
 */
void run_turn(gurgeh::Agent& agent, gurgeh::Conversation& conversation, const std::string& text) {
    gurgeh::ExchangeCallbacks callbacks;
    callbacks.on_chunk = [](std::string_view chunk) {
        std::cout << chunk << std::flush;
    };
    callbacks.on_tool_start = [](const std::string& name, const nlohmann::json& args) {
        std::cout << "\n  [tool] " << name << " " << args.dump() << "\n" << std::flush;
    };
    callbacks.on_tool_result = [](const std::string& name, const nlohmann::json& result) {
        const bool ok = result.value("success", false);
        std::cout << "  [tool] " << name << (ok ? " done" : " failed") << "\n" << std::flush;
    };

    auto user = gurgeh::Message::user(text);
    std::cout << "\nGurgeh: " << std::flush;

    g_interrupted = false;
    auto handle = agent.run_exchange(conversation.snapshot(), user, callbacks);

    while (handle.future.wait_for(std::chrono::milliseconds(100)) == std::future_status::timeout) {
        if (g_interrupted.exchange(false)) {
            handle.cancel();
        }
    }

    auto result = handle.future.get();
    if (!result) {
        std::cerr << "\nError: " << result.error().to_string() << "\n";
        conversation.record_rejected(user, result.error());
        return;
    }

    if (result->state == gurgeh::ExchangeState::Failed) {
        std::cout << "\n" << gurgeh::user_facing_message(*result->error) << "\n";
    } else {
        std::cout << "\n";
        if (result->budget_exhausted) {
            std::cout << "  (stopped after " << result->rounds_used << " rounds)\n";
        }
    }
    conversation.record_exchange(user, *result);

    print_separator();
    std::cout << "  Rounds: " << result->rounds_used
              << "  Tools: " << result->tool_invocations
              << "  Tokens: " << result->usage.total_tokens
              << "  Latency: " << result->metrics.latency_ms.count() << " ms\n";
    print_separator();
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);
    if (args.help) {
        print_usage(argv[0]);
        return args.db_path.empty() ? 1 : 0;
    }

    gurgeh::Logger::get().set_level(args.verbose ? gurgeh::LogLevel::Debug : gurgeh::LogLevel::Warn);
    std::signal(SIGINT, signal_handler);

    gurgeh::Config config;
    if (const char* key = std::getenv("OPENROUTER_API_KEY")) {
        config.api_key = key;
    }
    if (const char* base = std::getenv("OPENROUTER_BASE_URL")) {
        config.base_url = base;
    }
    if (!args.model.empty()) {
        config.model = args.model;
    }
    config.max_rounds = args.max_rounds;
    config.system_prompt = gurgeh::chess::kCoachSystemPrompt;

    auto source = gurgeh::chess::SqliteDataSource::open(args.db_path);
    if (!source) {
        std::cerr << "Error: " << source.error().to_string() << "\n";
        return 1;
    }

    auto agent_result = gurgeh::Agent::create(config, std::make_unique<gurgeh::transport::CurlTransport>());
    if (!agent_result) {
        std::cerr << "Error: " << agent_result.error().to_string() << "\n";
        if (agent_result.error().code == gurgeh::ErrorCode::MissingApiKey) {
            std::cerr << "Set OPENROUTER_API_KEY to your OpenRouter API key.\n";
        }
        return 1;
    }
    auto agent = std::move(*agent_result);
    gurgeh::chess::register_coach_tools(agent->tools(), *source);

    print_separator();
    std::cout << "Gurgeh Coach Chat\n";
    print_separator();
    std::cout << "Model: " << config.model << "\n";
    std::cout << "Database: " << (*source)->path() << "\n";
    std::cout << "Tools: " << agent->tool_count() << "\n";
    std::cout << "Max rounds: " << config.max_rounds << "\n";
    print_separator();
    std::cout << "\nType your message and press Enter. Type '/quit' to exit.\n";

    gurgeh::Conversation conversation;
    std::string line;
    while (true) {
        std::cout << "\nYou: " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        if (line[0] != '/') {
            run_turn(*agent, conversation, line);
            continue;
        }

        if (line == "/quit" || line == "/exit") {
            std::cout << "Goodbye!\n";
            break;
        } else if (line == "/clear") {
            conversation.clear();
            std::cout << "Conversation history cleared.\n";
        } else if (line.rfind("/analyze ", 0) == 0) {
            run_turn(*agent, conversation, gurgeh::chess::position_analysis_prompt(trim(line.substr(9))));
        } else if (line.rfind("/greet ", 0) == 0) {
            run_turn(*agent, conversation, gurgeh::chess::personalized_greeting_request(trim(line.substr(7))));
        } else {
            std::cout << "Unknown command: " << line << "\n";
        }
    }

    agent->stop();
    return 0;
}
