/**
 * @file prompt_pack.hpp
 * @brief Deterministic retrieval context for prompt assembly
 */

#pragma once

#include <export.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Cerebrum {

struct BrainSearchHit {
    std::string node_id;
    std::string node_type;
    std::string profile_id;
    std::string profile_kind;
    double score = 0.0;
    std::optional<std::string> title;
    std::optional<std::string> url;
};

struct BrainSearchEpisode {
    std::string cluster_node_id;
    std::string cluster_kind;
    std::string project_key;
    double score = 0.0;
    double size = 0.0;
    std::vector<std::string> member_node_ids; // sorted
};

struct Passage {
    std::string source_node_id;
    std::string source_kind;
    std::string text;
    std::optional<std::string> url;
};

struct Citation {
    std::string source_node_id;
    std::optional<std::string> url;
    std::optional<std::string> title;
    std::string node_type;
};

struct PromptPack {
    std::string context_markdown;
    std::vector<Citation> citations;
};

/**
 * @brief Render the context block. A pure function: equal inputs give equal bytes.
 *
 * Layout, lines joined with '\n' and no trailing newline:
 *   # Brain Search Context
 *   Query: <query>
 *   Episodes:                        (only when non-empty)
 *   1. <id> [<kind>] score=0.000 members=a,b
 *   Hits:                            (only when non-empty)
 *   1. <title or id> (<nodeType>) score=0.000 id=<id>
 *   Passages:                        (only when non-empty)
 *   1. (<kind>) <text>
 */
CEREBRUM_API PromptPack build_prompt_pack(const std::string& query_text,
                                          const std::vector<BrainSearchHit>& hits,
                                          const std::vector<BrainSearchEpisode>& episodes,
                                          const std::vector<Passage>& passages);

/// Fixed three-decimal rendering ("0.600").
std::string format_score(double score);

} // namespace Cerebrum
