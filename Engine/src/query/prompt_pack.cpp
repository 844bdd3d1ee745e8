#include <query/prompt_pack.hpp>
#include <cstdio>

namespace Cerebrum {

std::string format_score(double score) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", score);
    return buf;
}

PromptPack build_prompt_pack(const std::string& query_text,
                             const std::vector<BrainSearchHit>& hits,
                             const std::vector<BrainSearchEpisode>& episodes,
                             const std::vector<Passage>& passages) {
    std::vector<std::string> lines;
    lines.push_back("# Brain Search Context");
    lines.push_back("Query: " + query_text);

    if (!episodes.empty()) {
        lines.push_back("Episodes:");
        for (size_t i = 0; i < episodes.size(); ++i) {
            const auto& episode = episodes[i];
            std::string members;
            for (const auto& id : episode.member_node_ids) {
                if (!members.empty()) members += ",";
                members += id;
            }
            lines.push_back(std::to_string(i + 1) + ". " + episode.cluster_node_id + " [" + episode.cluster_kind +
                            "] score=" + format_score(episode.score) + " members=" + members);
        }
    }

    if (!hits.empty()) {
        lines.push_back("Hits:");
        for (size_t i = 0; i < hits.size(); ++i) {
            const auto& hit = hits[i];
            lines.push_back(std::to_string(i + 1) + ". " + hit.title.value_or(hit.node_id) + " (" + hit.node_type +
                            ") score=" + format_score(hit.score) + " id=" + hit.node_id);
        }
    }

    if (!passages.empty()) {
        lines.push_back("Passages:");
        for (size_t i = 0; i < passages.size(); ++i) {
            lines.push_back(std::to_string(i + 1) + ". (" + passages[i].source_kind + ") " + passages[i].text);
        }
    }

    PromptPack pack;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) pack.context_markdown += '\n';
        pack.context_markdown += lines[i];
    }

    pack.citations.reserve(hits.size());
    for (const auto& hit : hits) {
        pack.citations.push_back({hit.node_id, hit.url, hit.title, hit.node_type});
    }
    return pack;
}

} // namespace Cerebrum
