// marga-cli: Command-line driver for the retrieval planner
//
// Usage: marga-cli <command> [options]
//
// Commands:
//   plan <query.json>   Build an execution plan and print it as JSON
//   pattern "<text>"    Show the intent template a query text matches
//   weights <types...>  Show edge types in priority order with weights
//   help                Show this help

#include <marga/marga.hpp>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace marga;

namespace {

const char* prog_name(const char* prog) {
    const char* slash = std::strrchr(prog, '/');
    return slash ? slash + 1 : prog;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "marga " << MARGA_VERSION << " - Graph-aware retrieval planner\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  plan <query.json>    Build an execution plan\n"
              << "  pattern \"<text>\"     Detect the query intent\n"
              << "  weights <types...>   Prioritize edge types\n"
              << "  help                 Show this help\n\n"
              << "Options:\n"
              << "  --config PATH        Planner configuration (JSON)\n"
              << "  --graph PATH         Graph snapshot (JSON) for plan\n"
              << "  --priority P         low | normal | high (overrides the query)\n"
              << "  --trace              Write trace events to stderr\n"
              << "  -v, --version        Show version\n";
}

json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open " + path);
    return json::parse(in);
}

int cmd_plan(const std::string& query_path, const PlannerConfig& config,
             const std::string& graph_path, const std::string& priority, bool trace) {
    Query query = Query::from_json(read_json_file(query_path));
    if (!priority.empty()) {
        auto p = parse_priority(priority);
        if (!p) {
            std::cerr << "Unknown priority: " << priority << "\n";
            return 1;
        }
        query.priority = *p;
    }

    StderrTracer tracer;
    Orchestrator orchestrator(config, trace ? &tracer : nullptr);

    std::optional<JsonGraphAccessor> graph;
    if (!graph_path.empty()) {
        graph = JsonGraphAccessor::from_file(graph_path);
        for (const auto& [parent, child] : graph->category_edges()) {
            orchestrator.categories().register_edge(parent, child);
        }
    }

    DataAccess data;
    if (graph) data.graph = &*graph;

    ExecutionPlan plan = orchestrator.plan(query, data);
    std::cout << plan.to_json().dump(2) << "\n";
    return 0;
}

int cmd_pattern(const std::string& text) {
    QueryRewriter rewriter;
    auto match = rewriter.rewrite(text);
    if (!match) {
        std::cout << "No pattern matched\n";
        return 0;
    }
    std::cout << "Pattern:  " << pattern_name(match->kind) << "\n";
    for (const auto& e : match->entities) {
        std::cout << "Entity:   " << e << "\n";
    }
    return 0;
}

int cmd_weights(const std::vector<std::string>& edge_types, const PlannerConfig& config) {
    RelationshipWeightTable table(config.weights);
    std::vector<std::string> types = edge_types;
    if (types.empty()) {
        for (const auto& [edge_type, _] : table.snapshot()) types.push_back(edge_type);
    }

    std::cout << "Edge type                  Weight  Cost\n";
    std::cout << "═══════════════════════════════════════\n";
    for (const auto& e : table.prioritize(types)) {
        std::cout << std::left << std::setw(26) << e << " "
                  << std::fixed << std::setprecision(2)
                  << std::setw(7) << table.weight(e) << " "
                  << traversal_cost(e)
                  << (table.has_explicit_weight(e) ? "" : "  (default)") << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command;
    std::string config_path;
    std::string graph_path;
    std::string priority;
    bool trace = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--graph") == 0 && i + 1 < argc) {
            graph_path = argv[++i];
        } else if (std::strcmp(argv[i], "--priority") == 0 && i + 1 < argc) {
            priority = argv[++i];
        } else if (std::strcmp(argv[i], "--trace") == 0) {
            trace = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << "marga " << MARGA_VERSION << " (plan format "
                      << MARGA_PLAN_FORMAT_VERSION_MAJOR << "."
                      << MARGA_PLAN_FORMAT_VERSION_MINOR << ")\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else {
                positional.push_back(argv[i]);
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "version") {
        std::cout << "marga " << MARGA_VERSION << "\n";
        return 0;
    }

    try {
        PlannerConfig config = config_path.empty() ? PlannerConfig{} : load_config(config_path);

        if (command == "plan") {
            if (positional.empty()) {
                std::cerr << "Usage: marga-cli plan <query.json> [--config PATH] [--graph PATH]\n";
                return 1;
            }
            return cmd_plan(positional[0], config, graph_path, priority, trace);
        }
        if (command == "pattern") {
            if (positional.empty()) {
                std::cerr << "Usage: marga-cli pattern \"<text>\"\n";
                return 1;
            }
            std::string text;
            for (const auto& p : positional) {
                if (!text.empty()) text += " ";
                text += p;
            }
            return cmd_pattern(text);
        }
        if (command == "weights") {
            return cmd_weights(positional, config);
        }
    } catch (const PlannerError& e) {
        std::cerr << "[marga] " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[marga] error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
