#include <storage/run_lock.hpp>
#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>

namespace Cerebrum {

void LocalRunLock::acquire(const std::string& key) {
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [&] { return held_.count(key) == 0; });
    held_.insert(key);
}

bool LocalRunLock::try_acquire(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.insert(key).second;
}

void LocalRunLock::release(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(key);
    }
    released_.notify_all();
}

bool LocalRunLock::is_held(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(key) != 0;
}

void PgAdvisoryRunLock::acquire(const std::string& key) {
    db_.execute("SELECT pg_advisory_lock(hashtextextended($1, 0))", {key});
}

void PgAdvisoryRunLock::release(const std::string& key) {
    auto released = db_.query_single("SELECT pg_advisory_unlock(hashtextextended($1, 0))", {key});
    if (!released || *released != "t") {
        Logger::warn("Advisory lock was not held: " + key);
    }
}

RunLockGuard::RunLockGuard(RunLock& lock, std::string key) : lock_(lock), key_(std::move(key)) {
    lock_.acquire(key_);
}

RunLockGuard::~RunLockGuard() {
    try {
        lock_.release(key_);
    } catch (const std::exception& e) {
        Logger::error("Failed to release run lock " + key_ + ": " + e.what());
    }
}

} // namespace Cerebrum
