// reframe: Command-line driver for frame graph scenarios
//
// Usage: reframe <command> [options]
//
// Commands:
//   run        Run the scripted growth/perturb/validate scenario
//   demo       Perturb and reseal the seed boundary, step by step
//   show       Seed, grow, and print every entity
//   help       Show this help

#include <reframe/reframe.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <cstdarg>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>

using namespace reframe;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

static bool verbose_mode = false;
static bool quiet_mode = false;

void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << component << "] ";

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "reframe " << REFRAME_VERSION << " - Nested reference frame scenarios\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  run                Run the growth/perturb/validate scenario\n"
              << "  demo               Perturb and reseal the seed boundary step by step\n"
              << "  show               Seed, grow and print every node, boundary and frame\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --config PATH      JSON scenario config (flags override it)\n"
              << "  --rounds N         Scenario rounds (default: 5)\n"
              << "  --grow K           Nodes added per round (default: 2)\n"
              << "  --perturb X        Coherence removed per perturbation (default: 0.40)\n"
              << "  --kick X           State added to every node per perturbation (default: 0.05)\n"
              << "  --every N          Perturb every N rounds, 0 = never (default: 2)\n"
              << "  --threshold T      Stability threshold on sum |state| (default: 1.0)\n"
              << "  --cutoff C         Divergence cutoff on sum state (default: 100.0)\n"
              << "  --max-depth N      Nesting recursion guard (default: 256)\n"
              << "  --json             Output as JSON\n"
              << "  --quiet            Do not print graph events\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

static bool parse_real(const char* text, double& out) {
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(text, &end);
    if (errno != 0 || end == text || *end != '\0') return false;
    out = v;
    return true;
}

static bool parse_count(const char* text, uint64_t& out) {
    if (text[0] == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') return false;
    if (v > detail::MAX_COUNT) return false;
    out = v;
    return true;
}

// Events go to stdout, prefixed by their source
static EventSink stdout_sink() {
    return [](const Event& e) {
        if (quiet_mode) return;
        std::cout << format_event(e) << "\n";
    };
}

int cmd_run(const ScenarioConfig& config, bool json_output) {
    Scenario scenario(config, json_output ? EventSink{} : stdout_sink());
    scenario.initialize();

    Summary summary;
    for (uint32_t i = 0; i < config.rounds; ++i) {
        RoundReport r = scenario.run_round();
        log_debug("run", "round %u: grown=%zu perturbed=%d coherent=%d stable=%d diverged=%d sum|x|=%.3f",
                  r.round, r.grown, r.perturbed ? 1 : 0, r.coherent ? 1 : 0,
                  r.stable ? 1 : 0, r.diverged ? 1 : 0, r.total_abs_state);
        if (r.depth_limited) {
            std::cerr << "[run] Warning: nesting depth limit reached in round " << r.round << "\n";
        }
        summary.rounds.push_back(r);
    }

    Summary totals = scenario.summarize();
    totals.rounds = std::move(summary.rounds);

    if (json_output) {
        std::cout << summary_json(totals, config).dump(2) << "\n";
    } else {
        std::cout << "\n" << summary_text(totals);
    }
    return 0;
}

int cmd_demo(const ScenarioConfig& config, bool json_output) {
    Scenario scenario(config, json_output ? EventSink{} : stdout_sink());
    scenario.initialize();
    FrameGraph& graph = scenario.graph();
    BoundaryId seed(0);

    auto print_state = [&](const char* step) {
        if (json_output) return;
        std::cout << "-- " << step << "\n";
        for (const auto& n : graph.nodes()) std::cout << "  " << n.render() << "\n";
        std::cout << "  " << graph.frame(scenario.root_frame()).render() << "\n";
        std::cout << "  " << graph.boundary(seed).render() << "\n";
    };

    print_state("initial");

    graph.perturb_boundary(seed, config.perturb_amount);
    print_state("after perturb");

    bool coherent = scenario.check_coherence();
    log_debug("demo", "coherent after perturb: %d", coherent ? 1 : 0);

    graph.seal_boundary(seed);
    print_state("after seal");

    if (json_output) {
        std::cout << snapshot_json(graph).dump(2) << "\n";
    }
    return 0;
}

int cmd_show(const ScenarioConfig& config, bool json_output) {
    Scenario scenario(config, json_output ? EventSink{} : stdout_sink());
    scenario.initialize();
    scenario.grow(config.growth_per_round);
    const FrameGraph& graph = scenario.graph();

    if (json_output) {
        std::cout << snapshot_json(graph).dump(2) << "\n";
        return 0;
    }

    std::cout << "Nodes:\n";
    for (const auto& n : graph.nodes()) std::cout << "  " << n.render() << "\n";
    std::cout << "Boundaries:\n";
    for (const auto& b : graph.boundaries()) std::cout << "  " << b.render() << "\n";
    std::cout << "Frames:\n";
    for (const auto& f : graph.frames()) std::cout << "  " << f.render() << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command;
    std::string config_path;
    bool json_output = false;

    // Flag overrides, applied after the config file
    std::optional<uint64_t> rounds, grow, every, max_depth;
    std::optional<double> perturb, kick, threshold, cutoff;

    auto bad_value = [&](const char* flag, const char* value) {
        std::cerr << "Error: invalid value for " << flag << ": " << value << "\n";
        return 1;
    };

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;
        uint64_t n = 0;
        double x = 0.0;

        if (strcmp(arg, "--config") == 0 && has_value) {
            config_path = argv[++i];
        } else if (strcmp(arg, "--rounds") == 0 && has_value) {
            if (!parse_count(argv[++i], n)) return bad_value(arg, argv[i]);
            rounds = n;
        } else if (strcmp(arg, "--grow") == 0 && has_value) {
            if (!parse_count(argv[++i], n)) return bad_value(arg, argv[i]);
            grow = n;
        } else if (strcmp(arg, "--every") == 0 && has_value) {
            if (!parse_count(argv[++i], n)) return bad_value(arg, argv[i]);
            every = n;
        } else if (strcmp(arg, "--max-depth") == 0 && has_value) {
            if (!parse_count(argv[++i], n)) return bad_value(arg, argv[i]);
            max_depth = n;
        } else if (strcmp(arg, "--perturb") == 0 && has_value) {
            if (!parse_real(argv[++i], x)) return bad_value(arg, argv[i]);
            perturb = x;
        } else if (strcmp(arg, "--kick") == 0 && has_value) {
            if (!parse_real(argv[++i], x)) return bad_value(arg, argv[i]);
            kick = x;
        } else if (strcmp(arg, "--threshold") == 0 && has_value) {
            if (!parse_real(argv[++i], x)) return bad_value(arg, argv[i]);
            threshold = x;
        } else if (strcmp(arg, "--cutoff") == 0 && has_value) {
            if (!parse_real(argv[++i], x)) return bad_value(arg, argv[i]);
            cutoff = x;
        } else if (strcmp(arg, "--json") == 0) {
            json_output = true;
        } else if (strcmp(arg, "--quiet") == 0) {
            quiet_mode = true;
        } else if (strcmp(arg, "--verbose") == 0) {
            verbose_mode = true;
        } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--version") == 0) {
            std::cout << "reframe " << REFRAME_VERSION << "\n";
            return 0;
        } else if (arg[0] != '-' && command.empty()) {
            command = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }

    ScenarioConfig config;
    if (!config_path.empty()) {
        std::string error;
        if (!load_config(config_path, config, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        log_debug("config", "loaded %s", config_path.c_str());
    }

    if (rounds) config.rounds = static_cast<uint32_t>(*rounds);
    if (grow) config.growth_per_round = static_cast<uint32_t>(*grow);
    if (every) config.perturb_every = static_cast<uint32_t>(*every);
    if (max_depth) config.max_nesting_depth = static_cast<size_t>(*max_depth);
    if (perturb) config.perturb_amount = *perturb;
    if (kick) config.state_kick = *kick;
    if (threshold) config.stability_threshold = *threshold;
    if (cutoff) config.divergence_cutoff = *cutoff;

    log_debug("config", "%s", json(config).dump().c_str());

    if (command == "run") {
        return cmd_run(config, json_output);
    } else if (command == "demo") {
        return cmd_demo(config, json_output);
    } else if (command == "show") {
        return cmd_show(config, json_output);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
