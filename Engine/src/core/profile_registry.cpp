#include <core/profile_registry.hpp>
#include <algorithm>
#include <unordered_map>

namespace Cerebrum {

ProfileKind profile_kind_from_string(std::string_view tag) {
    static const std::unordered_map<std::string_view, ProfileKind> table = {
        {"work", ProfileKind::Work},
        {"doc", ProfileKind::Doc},
        {"signal", ProfileKind::Signal},
        {"cluster", ProfileKind::Cluster},
    };
    auto it = table.find(tag);
    return it != table.end() ? it->second : ProfileKind::Other;
}

const char* to_string(ProfileKind kind) {
    switch (kind) {
        case ProfileKind::Work:    return "work";
        case ProfileKind::Doc:     return "doc";
        case ProfileKind::Signal:  return "signal";
        case ProfileKind::Cluster: return "cluster";
        case ProfileKind::Other:   break;
    }
    return "other";
}

std::vector<std::string> ProfileRegistry::default_query_fields(ProfileKind kind) {
    switch (kind) {
        case ProfileKind::Work: return {"summary", "title", "displayName"};
        case ProfileKind::Doc:  return {"body", "title", "text", "displayName"};
        default:                return {"summary", "title", "body", "text", "displayName"};
    }
}

ProfileRegistry ProfileRegistry::defaults(const std::string& embedding_model) {
    IndexProfile work;
    work.id = ProfileIds::kWorkSummary;
    work.family = "work";
    work.node_type = EntityTypes::kWorkItem;
    work.embedding_model = embedding_model;
    work.profile_kind = "work";
    work.text_source.from = "cdm";
    work.text_source.field = "summary";

    IndexProfile doc;
    doc.id = ProfileIds::kDocBody;
    doc.family = "doc";
    doc.node_type = EntityTypes::kDocItem;
    doc.embedding_model = embedding_model;
    doc.profile_kind = "doc";
    doc.text_source.from = "cdm.doc";
    doc.text_source.field = "body";

    return ProfileRegistry({work, doc});
}

ProfileRegistry ProfileRegistry::load(IndexProfileStore& store) {
    std::vector<IndexProfile> enabled;
    for (auto& profile : store.list_profiles()) {
        if (profile.enabled) enabled.push_back(std::move(profile));
    }
    return ProfileRegistry(std::move(enabled));
}

ProfileRegistry::ProfileRegistry(std::vector<IndexProfile> profiles) : profiles_(std::move(profiles)) {
    std::sort(profiles_.begin(), profiles_.end(),
              [](const IndexProfile& a, const IndexProfile& b) { return a.id < b.id; });
    for (size_t i = 0; i < profiles_.size(); ++i) {
        auto& profile = profiles_[i];
        if (profile.query_fields.empty()) {
            profile.query_fields = default_query_fields(profile.kind());
        }
        by_node_type_.emplace(profile.node_type, i);
    }
}

const IndexProfile* ProfileRegistry::for_entity_type(std::string_view entity_type) const {
    auto it = by_node_type_.find(std::string(entity_type));
    return it != by_node_type_.end() ? &profiles_[it->second] : nullptr;
}

ProfileKind ProfileRegistry::kind_for_entity_type(std::string_view entity_type) const {
    if (const auto* profile = for_entity_type(entity_type)) {
        return profile->kind();
    }
    switch (entity_kind_of(entity_type)) {
        case EntityKind::Work:    return ProfileKind::Work;
        case EntityKind::Doc:     return ProfileKind::Doc;
        case EntityKind::Cluster: return ProfileKind::Cluster;
        case EntityKind::Signal:  return ProfileKind::Signal;
        case EntityKind::Other:   break;
    }
    return ProfileKind::Other;
}

std::vector<std::string> ProfileRegistry::member_entity_types() const {
    std::vector<std::string> types;
    for (const auto& [node_type, idx] : by_node_type_) {
        auto kind = profiles_[idx].kind();
        if (kind == ProfileKind::Work || kind == ProfileKind::Doc) {
            types.push_back(node_type);
        }
    }
    std::sort(types.begin(), types.end());
    return types;
}

bool ProfileRegistry::is_member_type(std::string_view entity_type) const {
    const auto* profile = for_entity_type(entity_type);
    if (!profile) return false;
    auto kind = profile->kind();
    return kind == ProfileKind::Work || kind == ProfileKind::Doc;
}

std::vector<IndexProfile> ProfileRegistry::search_profiles() const {
    std::vector<IndexProfile> out;
    for (ProfileKind wanted : {ProfileKind::Work, ProfileKind::Doc}) {
        for (const auto& profile : profiles_) {
            if (profile.kind() == wanted) {
                out.push_back(profile);
                break;
            }
        }
    }
    return out;
}

} // namespace Cerebrum
