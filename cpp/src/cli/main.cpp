// =============================================================================
// promptmap CLI - Unified Command-Line Interface
// =============================================================================
//
// Single entry point for inspecting prompt-style markup documents.
//
// Usage:
//   promptmap [global options] <command> [options]
//
// Commands:
//   parse       Parse a document and print its node tree
//   tokenize    Count tokens per node for a model
//   summarize   Print the aggregated display tree
//   search      Find nodes by tag or path
//   models      List known models
//   version     Show version information
//
// Examples:
//   promptmap parse prompt.xml
//   promptmap tokenize prompt.xml -m gpt-4o-128k
//   promptmap summarize prompt.xml -m claude-3-opus-200k --max-nodes 200
//   promptmap search prompt.xml file_contents
//
// JSON goes to stdout, log lines to stderr.
//
// =============================================================================

#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/json.hpp>
#include <boost/version.hpp>
#include <libxml/xmlversion.h>

#include "promptmap/config.hpp"
#include "promptmap/error.hpp"
#include "promptmap/json_export.hpp"
#include "promptmap/logging.hpp"
#include "promptmap/pipeline.hpp"
#include "promptmap/search.hpp"
#include "promptmap/transform/tree_transform.hpp"

// Forward declarations for command modules
namespace promptmap::cli {
    int cmd_parse(int argc, char* argv[]);
    int cmd_tokenize(int argc, char* argv[]);
    int cmd_summarize(int argc, char* argv[]);
    int cmd_search(int argc, char* argv[]);
    int cmd_models(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define PROMPTMAP_VERSION_MAJOR 1
#define PROMPTMAP_VERSION_MINOR 0
#define PROMPTMAP_VERSION_PATCH 0
#define PROMPTMAP_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"parse",     "Parse a document and print its node tree", promptmap::cli::cmd_parse},
    {"tokenize",  "Count tokens per node for a model", promptmap::cli::cmd_tokenize},
    {"summarize", "Print the aggregated display tree", promptmap::cli::cmd_summarize},
    {"search",    "Find nodes by tag or path", promptmap::cli::cmd_search},
    {"models",    "List known models and their context limits", promptmap::cli::cmd_models},
    {"version",   "Show version information", promptmap::cli::cmd_version},
    {"help",      "Show this help message", promptmap::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
};

static GlobalOptions g_options;

namespace promptmap::cli {

namespace {

// "-" reads standard input
std::string read_input(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Cannot open input file", path, "Check the path, or pass '-' to read stdin");
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

size_t parse_count(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size() || value.empty() || value[0] == '-') {
        throw InvalidArgumentError(flag + " expects a non-negative integer, got '" + value + "'");
    }
    return static_cast<size_t>(n);
}

double parse_fraction(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    double d = 0.0;
    try {
        d = std::stod(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size() || value.empty()) {
        throw InvalidArgumentError(flag + " expects a number, got '" + value + "'");
    }
    return d;
}

// Runs one parse request to completion on the pipeline's parse worker
ParsedNodePtr run_parse(Pipeline& pipeline, std::string text, const parse::ParseOptions& options) {
    ParsedNodePtr root;
    std::optional<parse::ParseFailure> failure;

    pipeline.submit_parse(std::move(text), options, [&](RequestId, const parse::ParseEvent& event) {
        if (const auto* done = std::get_if<parse::ParseDone>(&event)) {
            root = done->root;
        } else if (const auto* error = std::get_if<parse::ParseFailure>(&event)) {
            failure = *error;
        }
    });
    pipeline.wait_idle();

    if (failure) {
        throw ParseError(failure->message, failure->line, failure->column);
    }
    return root;
}

struct TokenizeOutcome {
    tokenize::TokenizeDone done;
    std::vector<tokenize::TokenUpdate> updates;
};

// Counts every node and folds the exact counts into `cache`
TokenizeOutcome run_tokenize(Pipeline& pipeline, const ParsedNodePtr& root, const std::string& model_id,
                             tokenize::TokenCache& cache) {
    pipeline.registry().catalog().require(model_id);

    TokenizeOutcome outcome;
    std::optional<std::string> failure;

    pipeline.submit_tokenize(root, model_id, [&](RequestId, const tokenize::TokenizeEvent& event) {
        if (const auto* partial = std::get_if<tokenize::TokenizePartial>(&event)) {
            cache.merge_updates(partial->updates, model_id);
            outcome.updates.insert(outcome.updates.end(), partial->updates.begin(), partial->updates.end());
        } else if (const auto* done = std::get_if<tokenize::TokenizeDone>(&event)) {
            outcome.done = *done;
        } else if (const auto* error = std::get_if<tokenize::TokenizeFailure>(&event)) {
            failure = error->message;
        }
    });
    pipeline.wait_idle();

    if (failure) {
        throw TokenizerUnavailableError(*failure, model_id);
    }
    return outcome;
}

void print_json(const boost::json::value& value) {
    std::cout << boost::json::serialize(value) << "\n";
}

} // namespace

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "promptmap - Token-aware structure maps for markup prompts\n";
    std::cout << "Version " << PROMPTMAP_VERSION_STRING << "\n\n";
    std::cout << "Usage: promptmap [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     key=value configuration file\n";
    std::cout << "  -v, --verbose           Debug logging on stderr\n";
    std::cout << "\nCommand Options:\n";
    std::cout << "  parse <file> [--no-attributes] [--no-namespaces] [--text]\n";
    std::cout << "  tokenize <file> -m <model>\n";
    std::cout << "  summarize <file> [-m <model>] [-b tokens|chars] [--threshold <f>]\n";
    std::cout << "            [--max-nodes <n>] [--max-depth <n>] [--preview <n>]\n";
    std::cout << "  search <file> <query...> [--limit <n>]\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  PM_LOG_LEVEL            debug, info, warn or error\n";
    std::cout << "  PM_VOCAB_DIR            Directory holding <family>.tiktoken rank files\n";
    std::cout << "  PM_STREAMING_THRESHOLD  Input size (bytes) that selects the streaming parser\n";
    std::cout << "\nExamples:\n";
    std::cout << "  promptmap parse prompt.xml\n";
    std::cout << "  promptmap summarize prompt.xml -m gpt-4o-128k --max-nodes 200\n";
    std::cout << "  promptmap search prompt.xml file contents\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "promptmap " << PROMPTMAP_VERSION_STRING << "\n";
    std::cout << "libxml2: " << LIBXML_DOTTED_VERSION << "\n";
    std::cout << "Boost: " << BOOST_VERSION / 100000 << "." << BOOST_VERSION / 100 % 1000 << "\n";
    return 0;
}

// =============================================================================
// Models Command
// =============================================================================

int cmd_models([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    print_json(json::to_json(tokenize::ModelCatalog::builtin()));
    return 0;
}

// =============================================================================
// Parse Command
// =============================================================================

int cmd_parse(int argc, char* argv[]) {
    std::string input_path;
    parse::ParseOptions options;
    bool include_text = false;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-attributes") {
            options.preserve_attributes = false;
        } else if (arg == "--no-namespaces") {
            options.honor_namespaces = false;
        } else if (arg == "--text") {
            include_text = true;
        } else if ((arg[0] != '-' || arg == "-") && input_path.empty()) {
            input_path = arg;
        } else {
            throw InvalidArgumentError("Unknown option for parse: " + arg);
        }
    }

    if (input_path.empty()) {
        std::cerr << "Usage: promptmap parse <file> [--no-attributes] [--no-namespaces] [--text]\n";
        return 1;
    }

    auto pipeline = Pipeline::from_config();
    ParsedNodePtr root = run_parse(*pipeline, read_input(input_path), options);
    print_json(json::to_json(*root, include_text));
    return 0;
}

// =============================================================================
// Tokenize Command
// =============================================================================

int cmd_tokenize(int argc, char* argv[]) {
    std::string input_path;
    std::string model_id;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-m" || arg == "--model") && i + 1 < argc) {
            model_id = argv[++i];
        } else if ((arg[0] != '-' || arg == "-") && input_path.empty()) {
            input_path = arg;
        } else {
            throw InvalidArgumentError("Unknown option for tokenize: " + arg);
        }
    }

    if (input_path.empty() || model_id.empty()) {
        std::cerr << "Usage: promptmap tokenize <file> -m <model>\n";
        std::cerr << "Run 'promptmap models' for the list of models.\n";
        return 1;
    }

    auto pipeline = Pipeline::from_config();
    ParsedNodePtr root = run_parse(*pipeline, read_input(input_path), parse::ParseOptions{});

    tokenize::TokenCache cache;
    TokenizeOutcome outcome = run_tokenize(*pipeline, root, model_id, cache);

    const auto& model = pipeline->registry().catalog().require(model_id);

    boost::json::object out;
    out["model"] = model_id;
    out["totalTokens"] = outcome.done.total_tokens;
    out["approximate"] = outcome.done.approximate;
    out["contextUsage"] = tokenize::context_usage(outcome.done.total_tokens, model);

    boost::json::array nodes;
    nodes.reserve(outcome.updates.size());
    for (const auto& update : outcome.updates) {
        nodes.push_back(json::to_json(update));
    }
    out["nodes"] = std::move(nodes);

    print_json(out);
    return 0;
}

// =============================================================================
// Summarize Command
// =============================================================================

int cmd_summarize(int argc, char* argv[]) {
    std::string input_path;
    std::string model_id;
    std::optional<SizeBasis> basis;
    transform::TransformOptions options = transform::TransformOptions::from_config();

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-m" || arg == "--model") && i + 1 < argc) {
            model_id = argv[++i];
        } else if ((arg == "-b" || arg == "--basis") && i + 1 < argc) {
            std::string value = argv[++i];
            if (value == "tokens") basis = SizeBasis::Tokens;
            else if (value == "chars") basis = SizeBasis::Chars;
            else throw InvalidArgumentError("--basis expects 'tokens' or 'chars', got '" + value + "'");
        } else if (arg == "--threshold" && i + 1 < argc) {
            options.aggregation_threshold = parse_fraction(arg, argv[++i]);
        } else if (arg == "--max-nodes" && i + 1 < argc) {
            options.max_visible_nodes = parse_count(arg, argv[++i]);
        } else if (arg == "--max-depth" && i + 1 < argc) {
            options.max_depth = parse_count(arg, argv[++i]);
        } else if (arg == "--preview" && i + 1 < argc) {
            options.preview_length = parse_count(arg, argv[++i]);
        } else if ((arg[0] != '-' || arg == "-") && input_path.empty()) {
            input_path = arg;
        } else {
            throw InvalidArgumentError("Unknown option for summarize: " + arg);
        }
    }

    if (input_path.empty()) {
        std::cerr << "Usage: promptmap summarize <file> [-m <model>] [-b tokens|chars] [--threshold <f>]\n";
        std::cerr << "                           [--max-nodes <n>] [--max-depth <n>] [--preview <n>]\n";
        return 1;
    }

    // Reject bad options before doing any work
    options.validate();

    auto pipeline = Pipeline::from_config();
    ParsedNodePtr root = run_parse(*pipeline, read_input(input_path), parse::ParseOptions{});

    tokenize::TokenCache cache;
    const tokenize::ModelConfig* model = nullptr;
    if (!model_id.empty()) {
        model = &pipeline->registry().catalog().require(model_id);
        run_tokenize(*pipeline, root, model_id, cache);
    }

    SizeBasis effective = basis.value_or(model ? SizeBasis::Tokens : SizeBasis::Chars);
    transform::TransformResult result = transform::transform(*root, effective, model_id, cache, options);

    LOG_DEBUG("Display tree has ", result.visible_nodes, " nodes");
    print_json(json::to_json(result, effective, model));
    return 0;
}

// =============================================================================
// Search Command
// =============================================================================

int cmd_search(int argc, char* argv[]) {
    std::string input_path;
    std::string query;
    size_t limit = 50;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = parse_count(arg, argv[++i]);
        } else if ((arg[0] != '-' || arg == "-") && input_path.empty()) {
            input_path = arg;
        } else if (arg[0] != '-') {
            if (!query.empty()) query += ' ';
            query += arg;
        } else {
            throw InvalidArgumentError("Unknown option for search: " + arg);
        }
    }

    if (input_path.empty() || query.empty()) {
        std::cerr << "Usage: promptmap search <file> <query...> [--limit <n>]\n";
        return 1;
    }

    auto pipeline = Pipeline::from_config();
    ParsedNodePtr root = run_parse(*pipeline, read_input(input_path), parse::ParseOptions{});
    print_json(json::to_json(search_nodes(*root, query, limit)));
    return 0;
}

} // namespace promptmap::cli

// =============================================================================
// Main Entry Point
// =============================================================================

static void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }

    // Shift argv to point to command
    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!promptmap::init_config(g_options.config_file)) {
        return 1;
    }
    if (g_options.verbose) {
        promptmap::set_log_level(promptmap::LogLevel::DEBUG);
        promptmap::Config::getInstance().print();
    }

    if (argc < 1) {
        promptmap::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    // Find and execute command
    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const promptmap::ParseError& e) {
                std::cerr << "Parse error at line " << e.line() << ", column " << e.column()
                          << ": " << e.message() << "\n";
                return 1;
            } catch (const promptmap::PromptmapException& e) {
                std::cerr << e.what() << "\n";
                return 1;
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'promptmap help' for usage.\n";
    return 1;
}
