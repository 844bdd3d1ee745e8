#include <core/properties.hpp>
#include <utils/unicode.hpp>
#include <cmath>
#include <cstdlib>

namespace Cerebrum {

namespace props {

namespace {

const PropertyBag* lookup(const PropertyBag& bag, std::string_view key) {
    if (!bag.is_object()) return nullptr;
    auto it = bag.find(std::string(key));
    if (it == bag.end() || it->is_null()) return nullptr;
    return &*it;
}

std::optional<std::string> non_empty(std::string value) {
    value = trim(value);
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace

std::optional<std::string> string_at(const PropertyBag& bag, std::string_view key) {
    const PropertyBag* value = lookup(bag, key);
    if (!value || !value->is_string()) return std::nullopt;
    return non_empty(value->get<std::string>());
}

std::optional<std::string> text_at(const PropertyBag& bag, std::string_view key) {
    const PropertyBag* value = lookup(bag, key);
    if (!value) return std::nullopt;
    if (value->is_string()) return non_empty(value->get<std::string>());
    if (value->is_number() || value->is_boolean()) return value->dump();
    return std::nullopt;
}

std::optional<std::string> first_string(const PropertyBag& bag, std::initializer_list<std::string_view> keys) {
    for (auto key : keys) {
        if (auto value = string_at(bag, key)) return value;
    }
    return std::nullopt;
}

std::optional<std::string> first_string(const PropertyBag& bag, const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        if (auto value = string_at(bag, key)) return value;
    }
    return std::nullopt;
}

std::optional<double> number_at(const PropertyBag& bag, std::string_view key) {
    const PropertyBag* value = lookup(bag, key);
    if (!value) return std::nullopt;
    if (value->is_number()) {
        double d = value->get<double>();
        return std::isfinite(d) ? std::optional<double>(d) : std::nullopt;
    }
    if (value->is_string()) {
        std::string text = trim(value->get<std::string>());
        if (text.empty()) return std::nullopt;
        char* end = nullptr;
        double d = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size() || !std::isfinite(d)) return std::nullopt;
        return d;
    }
    return std::nullopt;
}

bool flag_at(const PropertyBag& bag, std::string_view key) {
    const PropertyBag* value = lookup(bag, key);
    return value && value->is_boolean() && value->get<bool>();
}

std::optional<TimePoint> time_at(const PropertyBag& bag, std::string_view key) {
    auto text = string_at(bag, key);
    if (!text) return std::nullopt;
    return parse_iso_time(*text);
}

std::vector<std::string> string_list_at(const PropertyBag& bag, std::string_view key) {
    std::vector<std::string> out;
    const PropertyBag* value = lookup(bag, key);
    if (!value || !value->is_array()) return out;
    for (const auto& item : *value) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace props

std::optional<std::string> EntityView::display_name() const {
    std::string name = trim(entity_.display_name);
    if (name.empty()) return std::nullopt;
    return name;
}

std::optional<std::string> EntityView::tenant_id() const {
    if (auto value = props::string_at(raw(), "tenantId")) return value;
    if (!entity_.tenant_id.empty()) return entity_.tenant_id;
    return std::nullopt;
}

std::optional<std::string> EntityView::project_key() const {
    if (auto value = props::first_string(raw(), {"projectKey", "project_key", "project", "sourceProjectKey", "projectId"})) {
        return value;
    }
    if (!entity_.project_id.empty()) return entity_.project_id;
    return std::nullopt;
}

std::optional<TimePoint> EntityView::timestamp() const {
    if (auto ts = props::time_at(raw(), "updatedAt")) return ts;
    if (auto ts = props::time_at(raw(), "createdAt")) return ts;
    if (entity_.updated_at) return entity_.updated_at;
    return entity_.created_at;
}

std::optional<std::string> EntityView::url() const {
    if (auto value = props::first_string(raw(), {"url", "sourceUrl", "canonicalPath"})) return value;
    if (entity_.canonical_path) {
        std::string path = trim(*entity_.canonical_path);
        if (!path.empty()) return path;
    }
    return std::nullopt;
}

std::optional<std::string> EntityView::title() const {
    if (auto value = props::first_string(raw(), {"title", "summary"})) return value;
    return display_name();
}

bool EntityView::is_secured() const {
    return props::flag_at(raw(), "secured") || props::flag_at(raw(), "isSecured");
}

std::optional<std::string> WorkItemView::work_key() const {
    return props::first_string(raw(), {"sourceIssueKey", "workKey", "canonicalPath"});
}

std::optional<std::string> DocItemView::doc_url() const {
    return props::first_string(raw(), {"sourceUrl", "url", "canonicalPath"});
}

std::string ClusterView::cluster_kind() const {
    return props::string_at(raw(), "clusterKind").value_or("unknown");
}

std::optional<double> ClusterView::size() const { return props::number_at(raw(), "size"); }
std::optional<double> ClusterView::score() const { return props::number_at(raw(), "score"); }

std::vector<std::string> ClusterView::seed_node_ids() const {
    return props::string_list_at(raw(), "seedNodeIds");
}

std::optional<TimePoint> ClusterView::created_at() const {
    if (auto ts = props::time_at(raw(), "createdAt")) return ts;
    return entity().created_at;
}

std::optional<TimePoint> ClusterView::updated_at() const {
    if (auto ts = props::time_at(raw(), "updatedAt")) return ts;
    if (entity().updated_at) return entity().updated_at;
    return created_at();
}

std::optional<TimePoint> ClusterView::window_start() const { return props::time_at(raw(), "windowStart"); }
std::optional<TimePoint> ClusterView::window_end() const { return props::time_at(raw(), "windowEnd"); }

std::optional<std::string> ClusterView::summary() const {
    if (auto value = props::text_at(raw(), "summary")) return value;
    return display_name();
}

std::optional<std::string> SignalView::definition_id() const { return props::string_at(raw(), "definitionId"); }
std::optional<std::string> SignalView::severity() const { return props::string_at(raw(), "severity"); }
std::optional<std::string> SignalView::status() const { return props::string_at(raw(), "status"); }
std::optional<std::string> SignalView::summary() const { return props::string_at(raw(), "summary"); }

} // namespace Cerebrum
