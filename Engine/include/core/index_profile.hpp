/**
 * @file index_profile.hpp
 * @brief Binding of an entity type to an embedding model, text rule and semantic kind
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Cerebrum {

enum class ProfileKind {
    Work,
    Doc,
    Signal,
    Cluster,
    Other
};

ProfileKind profile_kind_from_string(std::string_view tag);
const char* to_string(ProfileKind kind);

/**
 * @brief Where the indexer finds the text to embed.
 *
 * `from` names a nested object to start at, `path` digs through nested keys,
 * `field` is searched directly and then anywhere below `from`.
 */
struct TextSource {
    std::optional<std::string> from;
    std::optional<std::string> field;
    std::vector<std::string> path;
};

struct IndexProfile {
    std::string id;
    std::string family;
    std::string node_type;
    std::string embedding_model;
    std::string profile_kind;          // stored tag, e.g. "work"
    TextSource text_source;
    std::vector<std::string> query_fields; // prioritized seed query text keys
    bool enabled = true;

    ProfileKind kind() const { return profile_kind_from_string(profile_kind); }
};

} // namespace Cerebrum
