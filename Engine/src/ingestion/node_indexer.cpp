#include <ingestion/node_indexer.hpp>
#include <core/errors.hpp>
#include <core/properties.hpp>
#include <core/scope.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <unordered_set>

namespace Cerebrum {

namespace {

const PropertyBag* dig(const PropertyBag& root, const std::vector<std::string>& path) {
    const PropertyBag* cursor = &root;
    for (const auto& key : path) {
        if (!cursor->is_object()) return nullptr;
        auto it = cursor->find(key);
        if (it == cursor->end()) return nullptr;
        cursor = &*it;
    }
    return cursor;
}

std::optional<std::string> stringify(const PropertyBag* value) {
    if (!value) return std::nullopt;
    if (value->is_string()) {
        std::string text = trim(value->get_ref<const std::string&>());
        if (!text.empty()) return text;
        return std::nullopt;
    }
    if (value->is_array()) {
        std::string joined;
        for (const auto& part : *value) {
            if (!part.is_string()) continue;
            std::string text = trim(part.get_ref<const std::string&>());
            if (text.empty()) continue;
            if (!joined.empty()) joined += "\n";
            joined += text;
        }
        if (!joined.empty()) return joined;
    }
    return std::nullopt;
}

std::optional<std::string> deep_find_string(const PropertyBag& value, const std::string& key) {
    if (!value.is_object()) return std::nullopt;
    auto direct = value.find(key);
    if (direct != value.end() && direct->is_string()) {
        std::string text = trim(direct->get_ref<const std::string&>());
        if (!text.empty()) return text;
    }
    for (const auto& [k, child] : value.items()) {
        if (auto found = deep_find_string(child, key)) return found;
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> extract_index_text(const IndexProfile& profile, const PropertyBag& properties) {
    const TextSource& source = profile.text_source;

    const PropertyBag* base = &properties;
    if (source.from && properties.is_object()) {
        auto it = properties.find(*source.from);
        if (it != properties.end() && it->is_object()) base = &*it;
    }

    if (!source.path.empty()) {
        if (auto text = stringify(dig(*base, source.path))) return text;
    }
    if (source.field && !source.field->empty()) {
        if (auto text = stringify(dig(*base, {*source.field}))) return text;
        if (auto text = deep_find_string(*base, *source.field)) return text;
    }
    for (const char* key : {"summary", "body", "text", "content"}) {
        if (auto text = stringify(dig(*base, {key}))) return text;
    }
    return std::nullopt;
}

std::optional<std::string> index_project_key(const Entity& entity) {
    const auto& raw = entity.properties;
    if (auto value = props::first_string(raw, {"projectKey", "project_key", "source_project_key", "sourceProjectKey",
                                               "project", "projectId", "project_id"})) {
        return value;
    }
    auto meta = raw.find("_metadata");
    if (meta != raw.end() && meta->is_object()) {
        if (auto value = props::first_string(*meta, {"projectKey", "project_key", "source_project_key"})) {
            return value;
        }
    }
    if (!trim(entity.project_id).empty()) return trim(entity.project_id);
    return std::nullopt;
}

NodeIndexer::NodeIndexer(GraphStore& graph, IndexProfileStore& profiles, VectorIndexStore& index,
                         EmbeddingProvider& embedder, size_t index_dimension)
    : graph_(graph), profiles_(profiles), index_(index), embedder_(embedder), index_dimension_(index_dimension) {}

VectorIndexEntry NodeIndexer::make_entry(const Entity& entity, const IndexProfile& profile, Embedding embedding,
                                         const Scope& scope) const {
    EntityView view(entity);

    VectorIndexEntry entry;
    entry.node_id = entity.id;
    entry.profile_id = profile.id;
    entry.embedding = std::move(embedding);
    entry.tenant_id = view.tenant_id().value_or(scope.tenant_id);
    entry.project_key = index_project_key(entity);
    entry.profile_kind = profile.profile_kind;
    entry.source_system = props::string_at(entity.properties, "sourceSystem");

    entry.raw_metadata = {
        {"entityType", entity.entity_type},
        {"scopeOrgId", entity.tenant_id},
        {"scopeProjectId", entity.project_id},
        {"projectKey", entry.project_key ? PropertyBag(*entry.project_key) : PropertyBag(nullptr)},
        {"profileKind", profile.profile_kind},
        {"title", view.title() ? PropertyBag(*view.title()) : PropertyBag(nullptr)},
        {"url", view.url() ? PropertyBag(*view.url()) : PropertyBag(nullptr)},
        {"properties", entity.properties},
    };
    return entry;
}

IndexResult NodeIndexer::index_nodes_for_profile(const IndexRequest& request) {
    auto profile = profiles_.get_profile(request.profile_id);
    if (!profile) {
        throw NotFoundError("Index profile not found: " + request.profile_id);
    }
    if (!profile->enabled) {
        Logger::info("Profile " + profile->id + " is disabled; nothing indexed");
        return {};
    }

    EntityFilter filter;
    filter.entity_types = {profile->node_type};
    auto entities = graph_.list_entities(filter, request.scope);

    if (request.node_ids) {
        std::unordered_set<std::string> wanted(request.node_ids->begin(), request.node_ids->end());
        entities.erase(std::remove_if(entities.begin(), entities.end(),
                                      [&](const Entity& e) { return wanted.count(e.id) == 0; }),
                       entities.end());
    }
    std::stable_sort(entities.begin(), entities.end(), more_recent);

    const size_t batch_size = std::max<size_t>(1, request.batch_size);
    IndexResult result;

    for (size_t offset = 0; offset < entities.size(); offset += batch_size) {
        size_t end = std::min(entities.size(), offset + batch_size);

        std::vector<const Entity*> batch;
        std::vector<std::string> texts;
        for (size_t i = offset; i < end; ++i) {
            auto text = extract_index_text(*profile, entities[i].properties);
            if (!text) {
                ++result.skipped;
                continue;
            }
            batch.push_back(&entities[i]);
            texts.push_back(std::move(*text));
        }
        if (batch.empty()) continue;

        auto embeddings = embedder_.embed_text(profile->embedding_model, texts);
        if (embeddings.size() != batch.size()) {
            throw ShapeError("Embedding provider returned " + std::to_string(embeddings.size()) +
                             " vectors for " + std::to_string(batch.size()) + " texts");
        }

        std::vector<VectorIndexEntry> entries;
        entries.reserve(batch.size());
        for (size_t i = 0; i < batch.size(); ++i) {
            if (embeddings[i].size() != index_dimension_) {
                throw ShapeError("Embedding dimension " + std::to_string(embeddings[i].size()) +
                                 " does not match expected " + std::to_string(index_dimension_));
            }
            entries.push_back(make_entry(*batch[i], *profile, std::move(embeddings[i]), request.scope));
        }

        index_.upsert_entries(entries);
        result.indexed += entries.size();
    }

    Logger::success("Indexed " + std::to_string(result.indexed) + " nodes for " + profile->id +
                    " (" + std::to_string(result.skipped) + " without text)");
    return result;
}

} // namespace Cerebrum
