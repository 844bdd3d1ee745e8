#pragma once

#include <optional>
#include <string>

namespace Cerebrum {

struct SignalDefinition {
    std::string id;
    std::string slug;
    std::string title;
    std::string severity;
};

struct SignalInstance {
    std::string id;
    std::string definition_id;
    std::optional<SignalDefinition> definition; // populated when the store joins it
    std::string entity_ref;
    std::string severity;
    std::string status;
    std::string summary;
};

class SignalStore {
public:
    virtual ~SignalStore() = default;

    virtual std::optional<SignalDefinition> get_definition(const std::string& id) = 0;
    virtual std::optional<SignalInstance> get_instance(const std::string& id) = 0;
};

} // namespace Cerebrum
