#include "phasegrid/v1/electric_grid_index.hpp"

#include <algorithm>
#include <unordered_set>

namespace phasegrid::v1 {

namespace {

template<typename Record, typename Key>
void require_unique_names(const std::vector<Record>& table, Key key, const char* element_kind) {
    std::unordered_set<std::string> seen;
    for (const auto& record : table) {
        if (!seen.insert(record.*key).second) {
            throw ConfigurationError(diag::kDuplicateName, record.*key,
                                     std::string("Duplicate ") + element_kind + " name '" +
                                         record.*key + "'");
        }
    }
}

const PositionList& lookup(const PositionMap<std::string>& map, std::string_view name,
                           const char* code, const char* element_kind) {
    const auto it = map.find(name);
    if (it == map.end()) {
        throw ConfigurationError(code, std::string(name),
                                 std::string("Unknown ") + element_kind + " '" + std::string(name) + "'");
    }
    return it->second;
}

}  // namespace

const char* to_string(NodeType type) {
    switch (type) {
        case NodeType::Source: return "source";
        case NodeType::NoSource: return "no_source";
    }
    return "unknown";
}

const char* to_string(BranchType type) {
    switch (type) {
        case BranchType::Line: return "line";
        case BranchType::Transformer: return "transformer";
    }
    return "unknown";
}

ElectricGridIndex::ElectricGridIndex(const ElectricGridData& data, DiagnosticLog* log)
    : source_node_name_(data.electric_grid.source_node_name)
    , phases_(kAllPhases.begin(), kAllPhases.end())
    , node_types_{NodeType::Source, NodeType::NoSource}
    , branch_types_{BranchType::Line, BranchType::Transformer} {

    require_unique_names(data.nodes, &NodeRecord::node_name, "node");
    require_unique_names(data.lines, &LineRecord::line_name, "line");
    require_unique_names(data.loads, &LoadRecord::load_name, "load");

    if (source_node_name_.empty()) {
        throw ConfigurationError(diag::kSourceNode, data.electric_grid.electric_grid_name,
                                 "Electric grid '" + data.electric_grid.electric_grid_name +
                                     "' does not define a source node");
    }
    const NodeRecord* source = data.find_node(source_node_name_);
    if (source == nullptr) {
        throw ConfigurationError(diag::kSourceNode, source_node_name_,
                                 "Source node '" + source_node_name_ + "' is not a grid node");
    }
    if (source->phases.empty()) {
        throw ConfigurationError(diag::kSourceNode, source_node_name_,
                                 "Source node '" + source_node_name_ + "' has no connected phase");
    }

    build_nodes(data);
    build_branches(data, log);
    build_loads(data);

    if (log != nullptr) {
        for (const auto& node : data.nodes) {
            if (node.phases.empty()) {
                log->warning(diag::kZeroPhaseElement, node.node_name,
                             "Node '" + node.node_name + "' has no connected phase");
            }
        }
        for (const auto& line : data.lines) {
            if (line.phases.empty()) {
                log->warning(diag::kZeroPhaseElement, line.line_name,
                             "Line '" + line.line_name + "' has no connected phase");
            }
        }
        log->info(diag::kIndexSummary, data.electric_grid.electric_grid_name,
                  "Grid index: node dimension " + std::to_string(node_dimension()) +
                      ", branch dimension " + std::to_string(branch_dimension()) +
                      ", load dimension " + std::to_string(load_dimension()));
    }
}

void ElectricGridIndex::build_nodes(const ElectricGridData& data) {
    for (const auto& node : data.nodes) {
        node_dimension_ += node.phases.count();
        node_names_.push_back(node.node_name);
        node_by_node_name_[node.node_name];
    }

    nodes_phases_.reserve(static_cast<std::size_t>(node_dimension_));
    for (Phase phase : kAllPhases) {
        for (const auto& node : data.nodes) {
            if (!node.phases.is_connected(phase)) continue;
            const NodeType type = node.node_name == source_node_name_ ? NodeType::Source : NodeType::NoSource;
            nodes_phases_.push_back({node.node_name, phase, type});
        }
    }

    for (Phase phase : phases_) node_by_phase_[phase];
    for (NodeType type : node_types_) node_by_node_type_[type];

    for (std::size_t row = 0; row < nodes_phases_.size(); ++row) {
        const auto& entry = nodes_phases_[row];
        const auto position = static_cast<Index>(row);
        node_by_node_name_[entry.node_name].push_back(position);
        node_by_phase_[entry.phase].push_back(position);
        node_by_node_type_[entry.node_type].push_back(position);
    }
}

void ElectricGridIndex::build_branches(const ElectricGridData& data, DiagnosticLog* log) {
    const auto transformers = data.one_winding_transformers();

    std::unordered_set<std::string> transformer_seen;
    for (const auto* transformer : transformers) {
        if (!transformer_seen.insert(transformer->transformer_name).second) {
            throw ConfigurationError(diag::kDuplicateName, transformer->transformer_name,
                                     "Duplicate first winding for transformer '" +
                                         transformer->transformer_name + "'");
        }
    }

    // Every transformer needs exactly windings 1 and 2, whichever records are present
    std::map<std::string, std::vector<int>, std::less<>> windings_by_name;
    for (const auto& winding : data.transformers) {
        windings_by_name[winding.transformer_name].push_back(winding.winding);
    }
    for (auto& [name, windings] : windings_by_name) {
        std::sort(windings.begin(), windings.end());
        if (windings != std::vector<int>{1, 2}) {
            throw ConfigurationError(diag::kTransformerWindings, name,
                                     "Transformer '" + name + "' must have exactly windings 1 and 2, got " +
                                         std::to_string(windings.size()) + " winding records");
        }
    }

    for (const auto& line : data.lines) {
        line_dimension_ += line.phases.count();
        line_names_.push_back(line.line_name);
        branch_names_.push_back(line.line_name);
        branch_by_line_name_[line.line_name];
    }
    for (const auto* transformer : transformers) {
        transformer_dimension_ += transformer->phases.count();
        transformer_names_.push_back(transformer->transformer_name);
        branch_names_.push_back(transformer->transformer_name);
        branch_by_transformer_name_[transformer->transformer_name];

        if (branch_by_line_name_.find(transformer->transformer_name) != branch_by_line_name_.end() &&
            log != nullptr) {
            log->warning(diag::kNameCollision, transformer->transformer_name,
                         "Transformer '" + transformer->transformer_name +
                             "' shares its name with a line; lookups stay separate by branch type");
        }
        if (transformer->phases.empty() && log != nullptr) {
            log->warning(diag::kZeroPhaseElement, transformer->transformer_name,
                         "Transformer '" + transformer->transformer_name + "' has no connected phase");
        }
    }

    branches_phases_.reserve(static_cast<std::size_t>(branch_dimension()));
    for (Phase phase : kAllPhases) {
        for (const auto& line : data.lines) {
            if (line.phases.is_connected(phase)) {
                branches_phases_.push_back({line.line_name, phase, BranchType::Line});
            }
        }
    }
    for (Phase phase : kAllPhases) {
        for (const auto* transformer : transformers) {
            if (transformer->phases.is_connected(phase)) {
                branches_phases_.push_back({transformer->transformer_name, phase, BranchType::Transformer});
            }
        }
    }

    for (Phase phase : phases_) branch_by_phase_[phase];

    for (std::size_t row = 0; row < branches_phases_.size(); ++row) {
        const auto& entry = branches_phases_[row];
        const auto position = static_cast<Index>(row);
        if (entry.branch_type == BranchType::Line) {
            branch_by_line_name_[entry.branch_name].push_back(position);
        } else {
            branch_by_transformer_name_[entry.branch_name].push_back(position);
        }
        branch_by_phase_[entry.phase].push_back(position);
    }
}

void ElectricGridIndex::build_loads(const ElectricGridData& data) {
    for (const auto& load : data.loads) {
        const auto position = static_cast<Index>(load_names_.size());
        load_names_.push_back(load.load_name);
        load_by_load_name_[load.load_name] = position;

        // Empty when the node is unknown or lacks the load's phases
        PositionList& positions = node_by_load_name_[load.load_name];
        for (std::size_t row = 0; row < nodes_phases_.size(); ++row) {
            const auto& entry = nodes_phases_[row];
            if (entry.node_name == load.node_name && load.phases.is_connected(entry.phase)) {
                positions.push_back(static_cast<Index>(row));
            }
        }
    }
}

const PositionList& ElectricGridIndex::node(std::string_view node_name) const {
    return lookup(node_by_node_name_, node_name, diag::kNodeUnknown, "node");
}

PositionList ElectricGridIndex::node_positions(std::string_view node_name, const PhaseConnection& phases) const {
    PositionList result;
    for (Index position : node(node_name)) {
        if (phases.is_connected(nodes_phases_[static_cast<std::size_t>(position)].phase)) {
            result.push_back(position);
        }
    }
    return result;
}

const PositionList& ElectricGridIndex::line_branch(std::string_view line_name) const {
    return lookup(branch_by_line_name_, line_name, diag::kElementUnknown, "line");
}

const PositionList& ElectricGridIndex::transformer_branch(std::string_view transformer_name) const {
    return lookup(branch_by_transformer_name_, transformer_name, diag::kElementUnknown, "transformer");
}

const PositionList& ElectricGridIndex::load_nodes(std::string_view load_name) const {
    return lookup(node_by_load_name_, load_name, diag::kElementUnknown, "load");
}

Index ElectricGridIndex::load(std::string_view load_name) const {
    const auto it = load_by_load_name_.find(load_name);
    if (it == load_by_load_name_.end()) {
        throw ConfigurationError(diag::kElementUnknown, std::string(load_name),
                                 "Unknown load '" + std::string(load_name) + "'");
    }
    return it->second;
}

}  // namespace phasegrid::v1
