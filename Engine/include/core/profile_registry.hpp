/**
 * @file profile_registry.hpp
 * @brief Entity-type → index-profile table, resolved once at startup
 *
 * Every component that needs to know "which profile / kind is this entity"
 * asks the registry. Nothing dispatches on type-name prefixes.
 */

#pragma once

#include <core/index_profile.hpp>
#include <core/types.hpp>
#include <storage/index_profile_store.hpp>
#include <export.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Cerebrum {

namespace ProfileIds {
inline constexpr const char* kWorkSummary = "cdm.work.summary";
inline constexpr const char* kDocBody = "cdm.doc.body";
}

class CEREBRUM_API ProfileRegistry {
public:
    /**
     * @brief Built-in work/doc profiles (cdm.work.summary, cdm.doc.body).
     */
    static ProfileRegistry defaults(const std::string& embedding_model = "text-embedding-3-small");

    /**
     * @brief Bind every enabled profile of the store. When two profiles claim
     * the same node type, the one with the smallest id wins.
     */
    static ProfileRegistry load(IndexProfileStore& store);

    explicit ProfileRegistry(std::vector<IndexProfile> profiles);

    /// Profile bound to entity_type, or nullptr.
    const IndexProfile* for_entity_type(std::string_view entity_type) const;

    /// Kind of the bound profile, else the kind implied by the entity kind.
    ProfileKind kind_for_entity_type(std::string_view entity_type) const;

    /// Entity types whose bound profile is Work or Doc, sorted.
    std::vector<std::string> member_entity_types() const;
    bool is_member_type(std::string_view entity_type) const;

    /// Work and Doc profiles in that order; the default BrainSearch fan-out.
    std::vector<IndexProfile> search_profiles() const;

    const std::vector<IndexProfile>& profiles() const { return profiles_; }

    /// Seed query keys used when a profile declares none.
    static std::vector<std::string> default_query_fields(ProfileKind kind);

private:
    std::vector<IndexProfile> profiles_;
    std::unordered_map<std::string, size_t> by_node_type_;
};

} // namespace Cerebrum
