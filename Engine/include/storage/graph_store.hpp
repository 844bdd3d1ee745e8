/**
 * @file graph_store.hpp
 * @brief Entity/edge graph contract
 *
 * Implementations scope every call by Scope::tenant_id. Project isolation is
 * enforced by the brain core on top of the returned rows.
 */

#pragma once

#include <core/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Cerebrum {

struct EntityFilter {
    std::vector<std::string> entity_types; // empty = any type
};

struct EdgeFilter {
    std::vector<std::string> edge_types;   // empty = any type
    std::optional<std::string> source_entity_id;
    std::optional<std::string> target_entity_id;
    std::optional<size_t> limit;
};

struct EntityInput {
    std::string id;
    std::string entity_type;
    std::string display_name;
    std::optional<std::string> canonical_path;
    PropertyBag properties = PropertyBag::object();
};

struct EdgeInput {
    std::string edge_type;
    std::string source_entity_id;
    std::string target_entity_id;
    PropertyBag metadata = PropertyBag::object();
};

class GraphStore {
public:
    virtual ~GraphStore() = default;

    virtual std::optional<Entity> get_entity(const std::string& id, const Scope& scope) = 0;
    virtual std::vector<Entity> list_entities(const EntityFilter& filter, const Scope& scope) = 0;
    virtual std::vector<Edge> list_edges(const EdgeFilter& filter, const Scope& scope) = 0;

    /// Insert or replace by (tenant, id).
    virtual Entity upsert_entity(const EntityInput& input, const Scope& scope) = 0;

    /// Insert or update by (edge_type, source, target).
    virtual Edge upsert_edge(const EdgeInput& input, const Scope& scope) = 0;
};

} // namespace Cerebrum
