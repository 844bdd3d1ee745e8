#include <storage/memory_vector_index.hpp>
#include <core/errors.hpp>
#include <Eigen/Core>
#include <algorithm>
#include <mutex>

namespace Cerebrum {

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

bool matches_filter(const VectorIndexEntry& entry, const VectorQueryFilter& filter) {
    if (!filter.tenant_id.empty() && entry.tenant_id != filter.tenant_id) return false;
    if (!filter.project_key_in.empty() && !contains(filter.project_key_in, entry.project_key.value_or(""))) return false;
    if (!filter.profile_kind_in.empty() && !contains(filter.profile_kind_in, entry.profile_kind)) return false;
    return true;
}

} // namespace

MemoryVectorIndex::MemoryVectorIndex(size_t dimension) : dimension_(dimension) {}

double MemoryVectorIndex::cosine_similarity(const Embedding& a, const Embedding& b) {
    const Eigen::Index n = static_cast<Eigen::Index>(std::min(a.size(), b.size()));
    if (n == 0) return 0.0;

    Eigen::Map<const Eigen::VectorXf> va(a.data(), n);
    Eigen::Map<const Eigen::VectorXf> vb(b.data(), n);
    const double na = va.norm();
    const double nb = vb.norm();
    if (na == 0.0 || nb == 0.0) return 0.0;
    return static_cast<double>(va.dot(vb)) / (na * nb);
}

void MemoryVectorIndex::check_dimension(const Embedding& embedding, const char* what) const {
    if (embedding.size() != dimension_) {
        throw ShapeError(std::string(what) + " dimension " + std::to_string(embedding.size()) +
                         " does not match index dimension " + std::to_string(dimension_));
    }
}

void MemoryVectorIndex::upsert_entries(const std::vector<VectorIndexEntry>& entries) {
    for (const auto& entry : entries) {
        check_dimension(entry.embedding, "Entry embedding");
    }

    std::unique_lock lock(mutex_);
    for (const auto& entry : entries) {
        std::string slot = entry.tenant_id + "#" + entry.node_id + "|" + entry.profile_id + "|" + entry.chunk_id;
        auto it = slots_.find(slot);
        if (it != slots_.end()) {
            entries_[it->second] = entry;
        } else {
            slots_.emplace(slot, entries_.size());
            entries_.push_back(entry);
        }
    }
}

std::vector<VectorMatch> MemoryVectorIndex::query(const std::string& profile_id, const Embedding& embedding,
                                                  size_t top_k, const VectorQueryFilter& filter) {
    check_dimension(embedding, "Query embedding");

    struct Scored {
        const VectorIndexEntry* entry;
        double score;
    };

    std::shared_lock lock(mutex_);
    std::vector<Scored> scored;
    for (const auto& entry : entries_) {
        if (entry.profile_id != profile_id || !matches_filter(entry, filter)) continue;
        scored.push_back({&entry, cosine_similarity(entry.embedding, embedding)});
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const Scored& a, const Scored& b) { return a.score > b.score; });
    if (scored.size() > std::max<size_t>(1, top_k)) {
        scored.resize(std::max<size_t>(1, top_k));
    }

    std::vector<VectorMatch> out;
    out.reserve(scored.size());
    for (const auto& s : scored) {
        VectorMatch match;
        match.node_id = s.entry->node_id;
        match.score = s.score;
        match.metadata = {
            {"profileId", s.entry->profile_id},
            {"profileKind", s.entry->profile_kind},
            {"projectKey", s.entry->project_key ? PropertyBag(*s.entry->project_key) : PropertyBag(nullptr)},
            {"sourceSystem", s.entry->source_system ? PropertyBag(*s.entry->source_system) : PropertyBag(nullptr)},
            {"tenantId", s.entry->tenant_id},
            {"raw", s.entry->raw_metadata},
        };
        out.push_back(std::move(match));
    }
    return out;
}

size_t MemoryVectorIndex::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace Cerebrum
