#pragma once
// reframe: nested reference frames with self-correcting boundaries
//
// - Types: DistinctionNode, typed handles, damping constants
// - Boundary: coherence gate with sealed/unsealed states
// - Frame: scale, phase, nesting and peer edges
// - Graph: arena, self-adjustment and one-hop propagation
// - Scenario: growth, perturbation and stability checks
// - Report: JSON and text summaries

#include "version.hpp"
#include "types.hpp"
#include "events.hpp"
#include "boundary.hpp"
#include "frame.hpp"
#include "graph.hpp"
#include "config.hpp"
#include "scenario.hpp"
#include "report.hpp"
