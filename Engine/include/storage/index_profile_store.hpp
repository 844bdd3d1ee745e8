#pragma once

#include <core/index_profile.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Cerebrum {

class IndexProfileStore {
public:
    virtual ~IndexProfileStore() = default;

    virtual std::vector<IndexProfile> list_profiles() = 0;
    virtual std::optional<IndexProfile> get_profile(const std::string& id) = 0;
};

} // namespace Cerebrum
