#include <storage/memory_graph_store.hpp>
#include <algorithm>
#include <mutex>

namespace Cerebrum {

namespace {

bool type_allowed(const std::vector<std::string>& allowed, const std::string& type) {
    return allowed.empty() || std::find(allowed.begin(), allowed.end(), type) != allowed.end();
}

std::string edge_slot(const std::string& tenant_id, const std::string& logical_key) {
    return tenant_id + "#" + logical_key;
}

} // namespace

MemoryGraphStore::MemoryGraphStore(NowFn now) : now_(std::move(now)) {}

std::optional<Entity> MemoryGraphStore::get_entity(const std::string& id, const Scope& scope) {
    std::shared_lock lock(mutex_);
    auto it = entities_.find({scope.tenant_id, id});
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Entity> MemoryGraphStore::list_entities(const EntityFilter& filter, const Scope& scope) {
    std::shared_lock lock(mutex_);
    std::vector<Entity> out;
    for (auto it = entities_.lower_bound({scope.tenant_id, std::string()});
         it != entities_.end() && it->first.first == scope.tenant_id; ++it) {
        const Entity& entity = it->second;
        if (!type_allowed(filter.entity_types, entity.entity_type)) continue;
        out.push_back(entity);
    }
    return out;
}

std::vector<Edge> MemoryGraphStore::list_edges(const EdgeFilter& filter, const Scope& scope) {
    std::shared_lock lock(mutex_);
    std::vector<Edge> out;
    for (const auto& edge : edges_) {
        if (filter.limit && out.size() >= *filter.limit) break;
        if (edge.tenant_id != scope.tenant_id) continue;
        if (!type_allowed(filter.edge_types, edge.edge_type)) continue;
        if (filter.source_entity_id && edge.source_entity_id != *filter.source_entity_id) continue;
        if (filter.target_entity_id && edge.target_entity_id != *filter.target_entity_id) continue;
        out.push_back(edge);
    }
    return out;
}

Entity MemoryGraphStore::upsert_entity(const EntityInput& input, const Scope& scope) {
    std::unique_lock lock(mutex_);
    TimePoint now = now_();

    Entity entity;
    entity.id = input.id;
    entity.entity_type = input.entity_type;
    entity.display_name = input.display_name.empty() ? input.id : input.display_name;
    entity.canonical_path = input.canonical_path;
    entity.properties = input.properties.is_object() ? input.properties : PropertyBag::object();
    entity.tenant_id = scope.tenant_id;
    entity.project_id = scope.project_id;
    entity.updated_at = now;

    EntityKey key{scope.tenant_id, input.id};
    auto it = entities_.find(key);
    entity.created_at = (it != entities_.end() && it->second.created_at) ? it->second.created_at : now;

    entities_[key] = entity;
    return entity;
}

Edge MemoryGraphStore::upsert_edge(const EdgeInput& input, const Scope& scope) {
    std::unique_lock lock(mutex_);

    Edge edge;
    edge.id = edge_id_for(input.edge_type, input.source_entity_id, input.target_entity_id);
    edge.edge_type = input.edge_type;
    edge.source_entity_id = input.source_entity_id;
    edge.target_entity_id = input.target_entity_id;
    edge.metadata = input.metadata.is_object() ? input.metadata : PropertyBag::object();
    edge.tenant_id = scope.tenant_id;
    edge.project_id = scope.project_id;

    auto slot = edge_slot(scope.tenant_id, edge_logical_key(edge.edge_type, edge.source_entity_id, edge.target_entity_id));
    auto it = edge_index_.find(slot);
    if (it != edge_index_.end()) {
        edges_[it->second] = edge;
    } else {
        edge_index_.emplace(slot, edges_.size());
        edges_.push_back(edge);
    }
    return edge;
}

void MemoryGraphStore::put_entity(const Entity& entity) {
    std::unique_lock lock(mutex_);
    entities_[{entity.tenant_id, entity.id}] = entity;
}

size_t MemoryGraphStore::entity_count() const {
    std::shared_lock lock(mutex_);
    return entities_.size();
}

size_t MemoryGraphStore::edge_count() const {
    std::shared_lock lock(mutex_);
    return edges_.size();
}

} // namespace Cerebrum
