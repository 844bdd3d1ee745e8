/**
 * @file scope.hpp
 * @brief Tenant/project isolation and time-window predicates
 */

#pragma once

#include <core/types.hpp>
#include <optional>
#include <string>

namespace Cerebrum {

struct TimeWindow {
    std::optional<TimePoint> start;
    std::optional<TimePoint> end;

    bool empty() const { return !start && !end; }

    /// "start|end" with ISO timestamps; absent bounds are empty strings.
    std::string key() const;
};

/**
 * @brief Strict project membership: the entity must positively name projectKey.
 *
 * A matching entity scope wins; otherwise the first project-like property decides.
 * Entities with no project information do not belong.
 */
bool belongs_to_project(const Entity& entity, const std::string& project_key);

/**
 * @brief Lenient scope check: rejects only entities that name a different tenant or project.
 */
bool matches_scope(const Entity& entity, const std::string& tenant_id, const std::string& project_key);

/**
 * @brief Tenant check only; entities without tenant information pass.
 */
bool matches_tenant(const Entity& entity, const std::string& tenant_id);

/**
 * @brief Entities without a resolvable timestamp are inside every window.
 */
bool within_window(const Entity& entity, const TimeWindow& window);

/**
 * @brief Strict-weak "more recent first" ordering; entities without a timestamp sort last.
 */
bool more_recent(const Entity& left, const Entity& right);

} // namespace Cerebrum
