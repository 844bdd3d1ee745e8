/**
 * @file run_lock.hpp
 * @brief Per tenant+project mutual exclusion for cluster builds
 */

#pragma once

#include <export.hpp>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>

namespace Cerebrum {

class PostgresConnection;

class RunLock {
public:
    virtual ~RunLock() = default;

    /// Blocks until the key is free.
    virtual void acquire(const std::string& key) = 0;
    virtual void release(const std::string& key) = 0;

    static std::string key_for(const std::string& tenant_id, const std::string& project_key) {
        return "cerebrum:clusters:" + tenant_id + ":" + project_key;
    }
};

/**
 * @brief Process-local lock: one held-key set under a mutex and condition variable.
 */
class CEREBRUM_API LocalRunLock : public RunLock {
public:
    void acquire(const std::string& key) override;
    void release(const std::string& key) override;

    /// Non-blocking acquire; false when the key is held.
    bool try_acquire(const std::string& key);
    bool is_held(const std::string& key) const;

private:
    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::set<std::string> held_;
};

/**
 * @brief Session-level PostgreSQL advisory lock on hashtextextended(key, 0).
 *
 * Serializes builds across processes sharing the database. The connection
 * must not be used concurrently by another request while the lock is held.
 */
class CEREBRUM_API PgAdvisoryRunLock : public RunLock {
public:
    explicit PgAdvisoryRunLock(PostgresConnection& db) : db_(db) {}

    void acquire(const std::string& key) override;
    void release(const std::string& key) override;

private:
    PostgresConnection& db_;
};

/**
 * @brief Holds a RunLock key for the guard's lifetime.
 */
class CEREBRUM_API RunLockGuard {
public:
    RunLockGuard(RunLock& lock, std::string key);
    ~RunLockGuard();

    RunLockGuard(const RunLockGuard&) = delete;
    RunLockGuard& operator=(const RunLockGuard&) = delete;

private:
    RunLock& lock_;
    std::string key_;
};

} // namespace Cerebrum
