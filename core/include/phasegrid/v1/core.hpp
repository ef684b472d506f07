#pragma once

// =============================================================================
// PhaseGrid v1 - Multi-Phase Electric Grid Model Builder
// =============================================================================
// Main header. It provides:
// - Typed electric grid data tables
// - The grid index mapping (element, phase) pairs onto matrix positions
// - Line and transformer element models
// - The grid model with nodal/branch admittance and incidence matrices
// - YAML configuration of the model options
// =============================================================================

#include "phasegrid/v1/numeric_types.hpp"
#include "phasegrid/v1/diagnostics.hpp"
#include "phasegrid/v1/sparse_builder.hpp"
#include "phasegrid/v1/grid_data.hpp"
#include "phasegrid/v1/options.hpp"
#include "phasegrid/v1/electric_grid_index.hpp"
#include "phasegrid/v1/components/base.hpp"
#include "phasegrid/v1/components/line.hpp"
#include "phasegrid/v1/components/transformer.hpp"
#include "phasegrid/v1/electric_grid_model.hpp"
#include "phasegrid/v1/parser/yaml_parser.hpp"
