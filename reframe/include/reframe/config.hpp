#pragma once
// ScenarioConfig: knobs for the scenario driver
//
// Loaded from a JSON object; every key is optional and falls back to the
// default below. Command-line flags are applied on top by the CLI.

#include "types.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace reframe {

using json = nlohmann::json;

struct ScenarioConfig {
    // Driver loop
    uint32_t rounds = 5;
    uint32_t growth_per_round = 2;
    double new_node_state = 0.1;

    // Perturbation (0 = never)
    uint32_t perturb_every = 2;
    double perturb_amount = 0.40;  // coherence removed from every boundary
    double state_kick = 0.05;      // added to every node state

    // Checks
    double stability_threshold = 1.0;
    double divergence_cutoff = DEFAULT_DIVERGENCE_CUTOFF;

    // Safety guard for nesting traversal
    size_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH;
};

inline void to_json(json& j, const ScenarioConfig& c) {
    j = json{
        {"version", std::to_string(REFRAME_CONFIG_VERSION_MAJOR) + "." +
                    std::to_string(REFRAME_CONFIG_VERSION_MINOR)},
        {"rounds", c.rounds},
        {"growth_per_round", c.growth_per_round},
        {"new_node_state", c.new_node_state},
        {"perturb_every", c.perturb_every},
        {"perturb_amount", c.perturb_amount},
        {"state_kick", c.state_kick},
        {"stability_threshold", c.stability_threshold},
        {"divergence_cutoff", c.divergence_cutoff},
        {"max_nesting_depth", c.max_nesting_depth}
    };
}

namespace detail {

constexpr uint64_t MAX_COUNT = std::numeric_limits<uint32_t>::max();

inline bool read_count(const json& j, const char* key, uint64_t& out, std::string& error,
                       uint64_t max = MAX_COUNT) {
    if (!j.contains(key)) return true;
    const json& v = j.at(key);
    uint64_t value = 0;
    if (v.is_number_unsigned()) {
        value = v.get<uint64_t>();
    } else if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        value = static_cast<uint64_t>(v.get<int64_t>());
    } else {
        error = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    if (value > max) {
        error = std::string("'") + key + "' must be at most " + std::to_string(max);
        return false;
    }
    out = value;
    return true;
}

inline bool read_real(const json& j, const char* key, double& out, std::string& error) {
    if (!j.contains(key)) return true;
    const json& v = j.at(key);
    if (!v.is_number()) {
        error = std::string("'") + key + "' must be a number";
        return false;
    }
    out = v.get<double>();
    return true;
}

} // namespace detail

// Apply the keys present in j onto out. On failure out is unchanged.
inline bool config_from_json(const json& j, ScenarioConfig& out, std::string& error) {
    if (!j.is_object()) {
        error = "config must be a JSON object";
        return false;
    }

    if (j.contains("version")) {
        const json& v = j.at("version");
        int major = 0, minor = 0;
        if (!v.is_string() ||
            sscanf(v.get<std::string>().c_str(), "%d.%d", &major, &minor) != 2) {
            error = "'version' must be a \"major.minor\" string";
            return false;
        }
        if (!version::config_compatible(major, minor)) {
            error = "config version " + v.get<std::string>() + " not supported";
            return false;
        }
    }

    ScenarioConfig c = out;
    uint64_t rounds = c.rounds;
    uint64_t growth = c.growth_per_round;
    uint64_t every = c.perturb_every;
    uint64_t depth = c.max_nesting_depth;

    if (!detail::read_count(j, "rounds", rounds, error)) return false;
    if (!detail::read_count(j, "growth_per_round", growth, error)) return false;
    if (!detail::read_count(j, "perturb_every", every, error)) return false;
    if (!detail::read_count(j, "max_nesting_depth", depth, error)) return false;
    if (!detail::read_real(j, "new_node_state", c.new_node_state, error)) return false;
    if (!detail::read_real(j, "perturb_amount", c.perturb_amount, error)) return false;
    if (!detail::read_real(j, "state_kick", c.state_kick, error)) return false;
    if (!detail::read_real(j, "stability_threshold", c.stability_threshold, error)) return false;
    if (!detail::read_real(j, "divergence_cutoff", c.divergence_cutoff, error)) return false;

    c.rounds = static_cast<uint32_t>(rounds);
    c.growth_per_round = static_cast<uint32_t>(growth);
    c.perturb_every = static_cast<uint32_t>(every);
    c.max_nesting_depth = static_cast<size_t>(depth);

    out = c;
    return true;
}

inline bool parse_config(const std::string& text, ScenarioConfig& out, std::string& error) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        error = std::string("malformed JSON: ") + e.what();
        return false;
    }
    return config_from_json(j, out, error);
}

inline bool load_config(const std::string& path, ScenarioConfig& out, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open config file: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (!parse_config(buffer.str(), out, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

} // namespace reframe
