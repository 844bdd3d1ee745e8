#include <query/vector_search.hpp>
#include <core/errors.hpp>
#include <core/properties.hpp>
#include <algorithm>
#include <map>
#include <unordered_map>

namespace Cerebrum {

namespace {

// Index metadata keeps descriptive fields either at the top level or under "raw".
std::optional<std::string> metadata_string(const PropertyBag& metadata, std::initializer_list<std::string_view> keys) {
    if (auto value = props::first_string(metadata, keys)) return value;
    auto raw = metadata.find("raw");
    if (raw != metadata.end() && raw->is_object()) {
        return props::first_string(*raw, keys);
    }
    return std::nullopt;
}

} // namespace

VectorSearchGateway::VectorSearchGateway(IndexProfileStore& profiles, VectorIndexStore& index,
                                         EmbeddingProvider& embedder)
    : profiles_(profiles), index_(index), embedder_(embedder) {}

std::vector<IndexProfile> VectorSearchGateway::target_profiles(const IndexProfile& base,
                                                               const std::vector<std::string>& kinds) {
    if (kinds.empty()) return {base};

    std::vector<IndexProfile> targets;
    bool has_base = false;
    for (auto& profile : profiles_.list_profiles()) {
        if (std::find(kinds.begin(), kinds.end(), profile.profile_kind) == kinds.end()) continue;
        if (profile.id == base.id) has_base = true;
        targets.push_back(std::move(profile));
    }
    if (!has_base) targets.push_back(base);
    return targets;
}

std::vector<SearchHit> VectorSearchGateway::search(const VectorSearchRequest& request) {
    auto base = profiles_.get_profile(request.profile_id);
    if (!base) {
        throw NotFoundError("Index profile not found: " + request.profile_id);
    }

    const size_t top_k = std::max<size_t>(1, request.top_k);
    auto targets = target_profiles(*base, request.profile_kind_in);

    // One embedding per distinct model
    std::map<std::string, Embedding> by_model;
    for (const auto& profile : targets) {
        if (by_model.count(profile.embedding_model)) continue;

        auto vectors = embedder_.embed_text(profile.embedding_model, {request.query_text});
        if (vectors.size() != 1) {
            throw ShapeError("Embedding provider returned " + std::to_string(vectors.size()) +
                             " vectors for one query text (model " + profile.embedding_model + ")");
        }
        if (vectors[0].size() != embedder_.dimension()) {
            throw ShapeError("Query embedding has dimension " + std::to_string(vectors[0].size()) +
                             ", provider declares " + std::to_string(embedder_.dimension()));
        }
        by_model.emplace(profile.embedding_model, std::move(vectors[0]));
    }

    VectorQueryFilter filter;
    filter.tenant_id = request.tenant_id;
    filter.project_key_in = request.project_key_in;
    filter.profile_kind_in = request.profile_kind_in;

    std::vector<SearchHit> combined;
    for (const auto& profile : targets) {
        auto matches = index_.query(profile.id, by_model.at(profile.embedding_model), top_k, filter);
        for (auto& match : matches) {
            SearchHit hit;
            hit.node_id = match.node_id;
            hit.profile_id = profile.id;
            hit.profile_kind = props::string_at(match.metadata, "profileKind").value_or(profile.profile_kind);
            hit.score = match.score;
            hit.title = metadata_string(match.metadata, {"title", "summary", "displayName"});
            hit.url = metadata_string(match.metadata, {"url", "sourceUrl", "canonicalPath"});
            hit.project_key = props::string_at(match.metadata, "projectKey");
            hit.metadata = std::move(match.metadata);
            combined.push_back(std::move(hit));
        }
    }

    return merge_hits(combined, top_k);
}

std::vector<SearchHit> merge_hits(const std::vector<SearchHit>& hits, size_t top_k) {
    std::vector<SearchHit> merged;
    std::unordered_map<std::string, size_t> position;

    for (const auto& hit : hits) {
        auto it = position.find(hit.node_id);
        if (it == position.end()) {
            position.emplace(hit.node_id, merged.size());
            merged.push_back(hit);
        } else if (hit.score > merged[it->second].score) {
            merged[it->second] = hit;
        }
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const SearchHit& a, const SearchHit& b) { return a.score > b.score; });
    if (merged.size() > top_k) merged.resize(top_k);
    return merged;
}

} // namespace Cerebrum
