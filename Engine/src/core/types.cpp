#include <core/types.hpp>
#include <hashing/content_hash.hpp>
#include <unordered_map>

namespace Cerebrum {

EntityKind entity_kind_of(std::string_view entity_type) {
    static const std::unordered_map<std::string_view, EntityKind> table = {
        {EntityTypes::kWorkItem, EntityKind::Work},
        {EntityTypes::kDocItem, EntityKind::Doc},
        {EntityTypes::kCluster, EntityKind::Cluster},
        {EntityTypes::kSignal, EntityKind::Signal},
    };
    auto it = table.find(entity_type);
    return it != table.end() ? it->second : EntityKind::Other;
}

const char* to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::Work:    return "work";
        case EntityKind::Doc:     return "doc";
        case EntityKind::Cluster: return "cluster";
        case EntityKind::Signal:  return "signal";
        case EntityKind::Other:   break;
    }
    return "other";
}

std::string edge_logical_key(const std::string& edge_type, const std::string& source_id, const std::string& target_id) {
    return edge_type + "|" + source_id + "|" + target_id;
}

std::string edge_id_for(const std::string& edge_type, const std::string& source_id, const std::string& target_id) {
    return "edge:" + ContentHash::to_hex(ContentHash::hash(edge_logical_key(edge_type, source_id, target_id)));
}

} // namespace Cerebrum
