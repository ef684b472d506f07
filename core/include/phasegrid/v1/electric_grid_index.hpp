#pragma once

// =============================================================================
// PhaseGrid - Electric Grid Index
// =============================================================================
// Maps named, partially phase-connected elements onto dense matrix positions.
//
// - The nodal admittance matrix has one row/column per connected phase of each
//   node. Missing phases get no row, otherwise the matrix would be singular.
// - Branches (lines, then first windings of transformers) get one row per
//   connected phase in the branch matrices.
// - Flattened tables are phase-major: all phase 1 entries first, then phase 2,
//   then phase 3, each in declared element order.
// =============================================================================

#include "phasegrid/v1/diagnostics.hpp"
#include "phasegrid/v1/grid_data.hpp"
#include "phasegrid/v1/numeric_types.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace phasegrid::v1 {

enum class NodeType {
    Source,
    NoSource,
};

enum class BranchType {
    Line,
    Transformer,
};

[[nodiscard]] const char* to_string(NodeType type);
[[nodiscard]] const char* to_string(BranchType type);

/// Row of the flattened node table
struct NodePhase {
    std::string node_name;
    Phase phase = Phase::One;
    NodeType node_type = NodeType::NoSource;

    friend bool operator==(const NodePhase&, const NodePhase&) = default;
};

/// Row of the flattened branch table
struct BranchPhase {
    std::string branch_name;
    Phase phase = Phase::One;
    BranchType branch_type = BranchType::Line;

    friend bool operator==(const BranchPhase&, const BranchPhase&) = default;
};

template<typename Key>
using PositionMap = std::map<Key, PositionList, std::less<>>;

class ElectricGridIndex {
public:
    /// Build the index; throws ConfigurationError for a missing source node or duplicate names
    explicit ElectricGridIndex(const ElectricGridData& data, DiagnosticLog* log = nullptr);

    // =========================================================================
    // Dimensions
    // =========================================================================

    [[nodiscard]] Index node_dimension() const { return node_dimension_; }
    [[nodiscard]] Index line_dimension() const { return line_dimension_; }
    [[nodiscard]] Index transformer_dimension() const { return transformer_dimension_; }
    [[nodiscard]] Index branch_dimension() const { return line_dimension_ + transformer_dimension_; }
    [[nodiscard]] Index load_dimension() const { return static_cast<Index>(load_names_.size()); }

    // =========================================================================
    // Element lists
    // =========================================================================

    [[nodiscard]] const std::vector<Phase>& phases() const { return phases_; }
    [[nodiscard]] const std::vector<std::string>& node_names() const { return node_names_; }
    [[nodiscard]] const std::vector<NodeType>& node_types() const { return node_types_; }
    [[nodiscard]] const std::vector<NodePhase>& nodes_phases() const { return nodes_phases_; }
    [[nodiscard]] const std::vector<std::string>& line_names() const { return line_names_; }
    [[nodiscard]] const std::vector<std::string>& transformer_names() const { return transformer_names_; }
    /// Distinct branch names, lines first, then transformers
    [[nodiscard]] const std::vector<std::string>& branch_names() const { return branch_names_; }
    [[nodiscard]] const std::vector<BranchType>& branch_types() const { return branch_types_; }
    [[nodiscard]] const std::vector<BranchPhase>& branches_phases() const { return branches_phases_; }
    [[nodiscard]] const std::vector<std::string>& load_names() const { return load_names_; }
    [[nodiscard]] const std::string& source_node_name() const { return source_node_name_; }

    // =========================================================================
    // Position lookups
    // =========================================================================

    [[nodiscard]] const PositionMap<std::string>& node_by_node_name() const { return node_by_node_name_; }
    [[nodiscard]] const PositionMap<Phase>& node_by_phase() const { return node_by_phase_; }
    [[nodiscard]] const PositionMap<NodeType>& node_by_node_type() const { return node_by_node_type_; }
    [[nodiscard]] const PositionMap<std::string>& node_by_load_name() const { return node_by_load_name_; }
    [[nodiscard]] const PositionMap<std::string>& branch_by_line_name() const { return branch_by_line_name_; }
    [[nodiscard]] const PositionMap<std::string>& branch_by_transformer_name() const {
        return branch_by_transformer_name_;
    }
    [[nodiscard]] const PositionMap<Phase>& branch_by_phase() const { return branch_by_phase_; }
    [[nodiscard]] const std::map<std::string, Index, std::less<>>& load_by_load_name() const {
        return load_by_load_name_;
    }

    /// Positions of a node; throws ConfigurationError if the node is unknown
    [[nodiscard]] const PositionList& node(std::string_view node_name) const;

    /// Positions of a node restricted to `phases`, in node table order.
    /// Phases the node does not have are skipped.
    [[nodiscard]] PositionList node_positions(std::string_view node_name, const PhaseConnection& phases) const;

    [[nodiscard]] const PositionList& line_branch(std::string_view line_name) const;
    [[nodiscard]] const PositionList& transformer_branch(std::string_view transformer_name) const;
    [[nodiscard]] const PositionList& load_nodes(std::string_view load_name) const;
    [[nodiscard]] Index load(std::string_view load_name) const;

    [[nodiscard]] bool has_node(std::string_view node_name) const {
        return node_by_node_name_.find(node_name) != node_by_node_name_.end();
    }

    friend bool operator==(const ElectricGridIndex&, const ElectricGridIndex&) = default;

private:
    void build_nodes(const ElectricGridData& data);
    void build_branches(const ElectricGridData& data, DiagnosticLog* log);
    void build_loads(const ElectricGridData& data);

    Index node_dimension_ = 0;
    Index line_dimension_ = 0;
    Index transformer_dimension_ = 0;

    std::string source_node_name_;
    std::vector<Phase> phases_;
    std::vector<std::string> node_names_;
    std::vector<NodeType> node_types_;
    std::vector<NodePhase> nodes_phases_;
    std::vector<std::string> line_names_;
    std::vector<std::string> transformer_names_;
    std::vector<std::string> branch_names_;
    std::vector<BranchType> branch_types_;
    std::vector<BranchPhase> branches_phases_;
    std::vector<std::string> load_names_;

    PositionMap<std::string> node_by_node_name_;
    PositionMap<Phase> node_by_phase_;
    PositionMap<NodeType> node_by_node_type_;
    PositionMap<std::string> node_by_load_name_;
    PositionMap<std::string> branch_by_line_name_;
    PositionMap<std::string> branch_by_transformer_name_;
    PositionMap<Phase> branch_by_phase_;
    std::map<std::string, Index, std::less<>> load_by_load_name_;
};

}  // namespace phasegrid::v1
