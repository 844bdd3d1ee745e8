#include <core/scope.hpp>
#include <core/properties.hpp>

namespace Cerebrum {

std::string TimeWindow::key() const {
    return (start ? to_iso_string(*start) : std::string()) + "|" + (end ? to_iso_string(*end) : std::string());
}

bool belongs_to_project(const Entity& entity, const std::string& project_key) {
    if (!entity.project_id.empty() && entity.project_id == project_key) {
        return true;
    }
    auto declared = props::first_string(entity.properties,
                                        {"projectKey", "project_key", "project", "sourceProjectKey", "projectId"});
    return declared && *declared == project_key;
}

bool matches_tenant(const Entity& entity, const std::string& tenant_id) {
    auto tenant = EntityView(entity).tenant_id();
    return !tenant || *tenant == tenant_id;
}

bool matches_scope(const Entity& entity, const std::string& tenant_id, const std::string& project_key) {
    if (!matches_tenant(entity, tenant_id)) {
        return false;
    }
    auto project = EntityView(entity).project_key();
    return !project || *project == project_key;
}

bool within_window(const Entity& entity, const TimeWindow& window) {
    if (window.empty()) return true;
    auto ts = EntityView(entity).timestamp();
    if (!ts) return true;
    if (window.start && *ts < *window.start) return false;
    if (window.end && *ts > *window.end) return false;
    return true;
}

bool more_recent(const Entity& left, const Entity& right) {
    auto l = EntityView(left).timestamp();
    auto r = EntityView(right).timestamp();
    if (!l) return false;
    if (!r) return true;
    return *l > *r;
}

} // namespace Cerebrum
