/**
 * @file memory_catalog.hpp
 * @brief In-memory profile and signal stores
 */

#pragma once

#include <storage/index_profile_store.hpp>
#include <storage/signal_store.hpp>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace Cerebrum {

class MemoryProfileStore : public IndexProfileStore {
public:
    MemoryProfileStore() = default;
    explicit MemoryProfileStore(std::vector<IndexProfile> profiles) : profiles_(std::move(profiles)) {}

    std::vector<IndexProfile> list_profiles() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return profiles_;
    }

    std::optional<IndexProfile> get_profile(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& profile : profiles_) {
            if (profile.id == id) return profile;
        }
        return std::nullopt;
    }

    void put(const IndexProfile& profile) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& existing : profiles_) {
            if (existing.id == profile.id) {
                existing = profile;
                return;
            }
        }
        profiles_.push_back(profile);
    }

private:
    std::mutex mutex_;
    std::vector<IndexProfile> profiles_;
};

/**
 * @brief Signal store that joins the definition onto instances it returns.
 *
 * Lookup counters let tests observe per-request caching.
 */
class MemorySignalStore : public SignalStore {
public:
    std::optional<SignalDefinition> get_definition(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++definition_lookups_;
        auto it = definitions_.find(id);
        if (it == definitions_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<SignalInstance> get_instance(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(id);
        if (it == instances_.end()) return std::nullopt;
        SignalInstance instance = it->second;
        if (join_definitions_) {
            auto def = definitions_.find(instance.definition_id);
            if (def != definitions_.end()) instance.definition = def->second;
        }
        return instance;
    }

    void put_definition(const SignalDefinition& definition) {
        std::lock_guard<std::mutex> lock(mutex_);
        definitions_[definition.id] = definition;
    }

    void put_instance(const SignalInstance& instance) {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_[instance.id] = instance;
    }

    /// When false, instances come back without their definition (forces slug lookups).
    void set_join_definitions(bool join) {
        std::lock_guard<std::mutex> lock(mutex_);
        join_definitions_ = join;
    }

    size_t definition_lookups() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return definition_lookups_;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SignalDefinition> definitions_;
    std::unordered_map<std::string, SignalInstance> instances_;
    bool join_definitions_ = true;
    size_t definition_lookups_ = 0;
};

} // namespace Cerebrum
