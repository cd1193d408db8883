/// @file main.cpp
/// @brief flow_run entry point - loads a flow graph document and runs it
///
/// The document is {nodes, edges, configs?}. Node configurations under
/// "configs" seed the configuration store; the run report is printed to
/// stdout as JSON.

#include <flow_engine/core/config.hpp>
#include <flow_engine/core/log.hpp>
#include <flow_engine/graph/config_store.hpp>
#include <flow_engine/graph/runner.hpp>
#include <flow_engine/nodes/builtin.hpp>
#include <flow_engine/services/services.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int k_exit_ok = 0;
constexpr int k_exit_node_error = 1;
constexpr int k_exit_usage = 2;

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] GRAPH_JSON\n"
              << "\n"
              << "Arguments:\n"
              << "  GRAPH_JSON          Flow document {nodes, edges, configs?}\n"
              << "\n"
              << "Options:\n"
              << "  --trigger <id>      Node to start from (default: every root)\n"
              << "  --input <json>      Value handed to the start nodes\n"
              << "  --config <toml>     Engine configuration file\n"
              << "  --log-level <lvl>   trace, debug, info, warn, error, critical, off\n"
              << "  --help, -h          Show this help message\n"
              << "  --version, -v       Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " flows/summarize.json\n"
              << "  " << program_name << " flows/summarize.json --trigger input-1 --input '\"hello\"'\n";
}

void print_version() {
    std::cout << "flow_run 1.0.0\n"
              << "flow_engine workflow runtime\n";
}

struct Arguments {
    fs::path graph_path;
    fs::path config_path;
    std::string trigger;
    std::string input;
    std::string log_level;
};

bool read_file(const fs::path& path, std::string& out) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    Arguments args;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto take_value = [&](std::string& target) -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return k_exit_ok;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return k_exit_ok;
        } else if (arg == "--trigger") {
            if (!take_value(args.trigger)) return k_exit_usage;
        } else if (arg == "--input") {
            if (!take_value(args.input)) return k_exit_usage;
        } else if (arg == "--log-level") {
            if (!take_value(args.log_level)) return k_exit_usage;
        } else if (arg == "--config") {
            std::string path;
            if (!take_value(path)) return k_exit_usage;
            args.config_path = path;
        } else if (!arg.empty() && arg[0] != '-') {
            args.graph_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return k_exit_usage;
        }
    }

    if (args.graph_path.empty()) {
        std::cerr << "Error: No graph specified.\n\n";
        print_usage(argv[0]);
        return k_exit_usage;
    }

    // Engine configuration: file, then environment, then command line
    flow_core::EngineConfig config;
    if (!args.config_path.empty()) {
        auto loaded = flow_core::load_engine_config(args.config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << flow_core::build_error_chain(loaded.error()) << "\n";
            return k_exit_usage;
        }
        config = std::move(*loaded);
    }
    flow_core::apply_environment(config, flow_core::process_environment());

    if (!args.log_level.empty()) {
        auto level = flow_core::parse_log_level(args.log_level);
        if (!level) {
            std::cerr << "Unknown log level: " << args.log_level << "\n";
            return k_exit_usage;
        }
        config.logging.level = *level;
    }
    flow_core::configure_logging(config.logging);

    // Graph document
    std::string text;
    if (!read_file(args.graph_path, text)) {
        FLOW_LOG_ERROR("Cannot read graph file: {}", args.graph_path.string());
        return k_exit_usage;
    }

    flow_graph::Value document = flow_graph::Value::parse(text, nullptr, false);
    if (document.is_discarded()) {
        FLOW_LOG_ERROR("Graph file is not valid JSON: {}", args.graph_path.string());
        return k_exit_usage;
    }

    auto graph = flow_graph::FlowGraph::from_json(document);
    if (!graph) {
        FLOW_LOG_ERROR("Failed to load graph: {}", flow_core::build_error_chain(graph.error()));
        return k_exit_usage;
    }

    auto configs = std::make_shared<flow_graph::ConfigStore>();
    if (auto stored = document.find("configs"); stored != document.end()) {
        configs->load(*stored);
    }

    flow_graph::RunOptions options;
    if (!args.trigger.empty()) {
        options.trigger = args.trigger;
    } else if (!config.default_trigger.empty()) {
        options.trigger = config.default_trigger;
    }
    if (!args.input.empty()) {
        options.input = flow_graph::Value::parse(args.input, nullptr, false);
        if (options.input.is_discarded()) {
            // Plain text input
            options.input = args.input;
        }
    }

    FLOW_LOG_INFO("Loaded {} nodes, {} edges from {}", graph->node_count(), graph->edge_count(),
        args.graph_path.filename().string());
    if (auto crossing = graph->cross_scope_edges(); !crossing.empty()) {
        FLOW_LOG_WARN("{} edge(s) cross a group boundary and are ignored", crossing.size());
    }

    flow_nodes::NodeServices services{configs, flow_services::make_services(config.services)};
    flow_graph::FlowRunner runner(flow_nodes::make_builtin_registry(services));

    auto report = runner.run(std::make_shared<const flow_graph::FlowGraph>(std::move(*graph)), options);
    if (!report) {
        FLOW_LOG_ERROR("Run failed: {}", flow_core::build_error_chain(report.error()));
        flow_core::shutdown_logging();
        return k_exit_usage;
    }

    std::cout << report->to_json().dump(2) << std::endl;

    const bool failed = report->has_errors();
    if (failed) {
        FLOW_LOG_WARN("Run {} finished with {} failed nodes", report->run_id,
            report->count(flow_graph::NodeStatus::Error));
    }

    flow_core::shutdown_logging();
    return failed ? k_exit_node_error : k_exit_ok;
}
