/**
 * @file types.hpp
 * @brief Graph entities, edges and scope
 */

#pragma once

#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Cerebrum {

/// Open, string-keyed property bag. Always a JSON object.
using PropertyBag = nlohmann::json;

namespace EntityTypes {
inline constexpr const char* kWorkItem = "cdm.work.item";
inline constexpr const char* kDocItem = "cdm.doc.item";
inline constexpr const char* kCluster = "kg.cluster";
inline constexpr const char* kSignal = "signal.instance";
}

namespace EdgeTypes {
inline constexpr const char* kInCluster = "IN_CLUSTER";
inline constexpr const char* kHasSignal = "HAS_SIGNAL";
}

enum class EntityKind {
    Work,
    Doc,
    Cluster,
    Signal,
    Other
};

/**
 * @brief Exact entity-type lookup. Unknown types map to Other.
 */
EntityKind entity_kind_of(std::string_view entity_type);
const char* to_string(EntityKind kind);

/**
 * @brief Tenant/project pair every read and write is filtered by.
 *
 * actor_id is the authenticated principal, when there is one.
 */
struct Scope {
    std::string tenant_id;
    std::string project_id;
    std::optional<std::string> actor_id;
};

struct Entity {
    std::string id;
    std::string entity_type;
    std::string display_name;
    std::optional<std::string> canonical_path;
    PropertyBag properties = PropertyBag::object();
    std::string tenant_id;
    std::string project_id;
    std::optional<TimePoint> created_at;
    std::optional<TimePoint> updated_at;

    EntityKind kind() const { return entity_kind_of(entity_type); }
};

struct Edge {
    std::string id;
    std::string edge_type;
    std::string source_entity_id;
    std::string target_entity_id;
    PropertyBag metadata = PropertyBag::object();
    std::string tenant_id;
    std::string project_id;
};

/**
 * @brief Logical key of an edge; upserts are idempotent on it.
 */
std::string edge_logical_key(const std::string& edge_type, const std::string& source_id, const std::string& target_id);

/**
 * @brief Stable edge id derived from the logical key.
 */
std::string edge_id_for(const std::string& edge_type, const std::string& source_id, const std::string& target_id);

} // namespace Cerebrum
