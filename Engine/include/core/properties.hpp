/**
 * @file properties.hpp
 * @brief Typed accessors over the open entity property bag
 *
 * Upstream sources disagree on field names, so every accessor walks a fixed
 * priority list. raw() stays available for extension fields.
 */

#pragma once

#include <core/types.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Cerebrum {

namespace props {

/// Trimmed, non-empty string value of key. Non-string values yield nullopt.
std::optional<std::string> string_at(const PropertyBag& bag, std::string_view key);

/// Like string_at, but numbers and booleans are rendered as text.
std::optional<std::string> text_at(const PropertyBag& bag, std::string_view key);

/// First key in order with a non-empty string value.
std::optional<std::string> first_string(const PropertyBag& bag, std::initializer_list<std::string_view> keys);
std::optional<std::string> first_string(const PropertyBag& bag, const std::vector<std::string>& keys);

/// Finite number, or a string that parses fully as one.
std::optional<double> number_at(const PropertyBag& bag, std::string_view key);

/// True only for a JSON boolean true.
bool flag_at(const PropertyBag& bag, std::string_view key);

std::optional<TimePoint> time_at(const PropertyBag& bag, std::string_view key);

std::vector<std::string> string_list_at(const PropertyBag& bag, std::string_view key);

} // namespace props

/**
 * @brief Fields every entity kind shares.
 */
class EntityView {
public:
    explicit EntityView(const Entity& entity) : entity_(entity) {}

    const Entity& entity() const { return entity_; }
    const PropertyBag& raw() const { return entity_.properties; }

    std::optional<std::string> display_name() const;

    /// properties.tenantId, then the entity scope.
    std::optional<std::string> tenant_id() const;

    /// projectKey, project_key, project, sourceProjectKey, projectId, then the entity scope.
    std::optional<std::string> project_key() const;

    /// properties.updatedAt, properties.createdAt, entity updated_at, entity created_at.
    std::optional<TimePoint> timestamp() const;

    /// url, sourceUrl, canonicalPath, then the entity canonical path.
    std::optional<std::string> url() const;

    /// title, summary, then display name.
    std::optional<std::string> title() const;

    bool is_secured() const;

private:
    const Entity& entity_;
};

class WorkItemView : public EntityView {
public:
    using EntityView::EntityView;

    /// sourceIssueKey, workKey, canonicalPath.
    std::optional<std::string> work_key() const;
};

class DocItemView : public EntityView {
public:
    using EntityView::EntityView;

    /// sourceUrl, url, canonicalPath.
    std::optional<std::string> doc_url() const;
};

class ClusterView : public EntityView {
public:
    using EntityView::EntityView;

    std::string cluster_kind() const;
    std::optional<double> size() const;
    std::optional<double> score() const;
    std::vector<std::string> seed_node_ids() const;
    std::optional<TimePoint> created_at() const;
    std::optional<TimePoint> updated_at() const;
    std::optional<TimePoint> window_start() const;
    std::optional<TimePoint> window_end() const;
    std::optional<std::string> summary() const;
};

class SignalView : public EntityView {
public:
    using EntityView::EntityView;

    std::optional<std::string> definition_id() const;
    std::optional<std::string> severity() const;
    std::optional<std::string> status() const;
    std::optional<std::string> summary() const;
};

} // namespace Cerebrum
