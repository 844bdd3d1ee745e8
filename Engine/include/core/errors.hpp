/**
 * @file errors.hpp
 * @brief Exception hierarchy for the brain core
 *
 * Best-effort skips never throw. Collaborator failures (libpq, I/O) propagate
 * as whatever the collaborator raised; nothing here retries.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Cerebrum {

class BrainError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Missing tenant/project, missing actor on a secured call, bad arguments.
class ValidationError : public BrainError {
public:
    using BrainError::BrainError;
};

/// Unknown index profile (or other addressed resource that must exist).
class NotFoundError : public BrainError {
public:
    using BrainError::BrainError;
};

/// A direct by-id lookup resolved to data outside the requested tenant/project.
class ScopeMismatchError : public BrainError {
public:
    ScopeMismatchError(const std::string& entity_id, const std::string& tenant_id, const std::string& project_key)
        : BrainError("Entity " + entity_id + " is outside scope " + tenant_id + "/" + project_key),
          entity_id_(entity_id) {}

    const std::string& entity_id() const { return entity_id_; }

private:
    std::string entity_id_;
};

/// Structural violations such as wrong-dimension embeddings. Configuration bugs, not runtime conditions.
class ShapeError : public BrainError {
public:
    using BrainError::BrainError;
};

class ConfigError : public BrainError {
public:
    using BrainError::BrainError;
};

} // namespace Cerebrum
