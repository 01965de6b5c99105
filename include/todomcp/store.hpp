// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file store.hpp
/// @brief Persistence contract the tool handlers rely on

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <todomcp/types.hpp>
#include <vector>

namespace todomcp
{

// =============================================================================
// Store Exceptions
// =============================================================================

/// Exception thrown when the backing store fails
class StoreError : public std::runtime_error
{
  public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

/// Exception thrown when an operation rejects its input
class ValidationError : public StoreError
{
  public:
    explicit ValidationError(const std::string& message) : StoreError(message) {}
};

// =============================================================================
// Store Interface
// =============================================================================

/// Owner of the todo table
///
/// Every operation is atomic and runs in its own transaction; no state is held
/// between calls.
class TodoStore
{
  public:
    virtual ~TodoStore() = default;

    /// All todos, not-done first, then oldest first
    virtual std::vector<Todo> list_all() = 0;

    /// Insert a new todo (done = false, created_at == updated_at)
    /// @return The assigned id
    /// @throws ValidationError if content is empty
    virtual int64_t add(const std::string& content) = 0;

    /// Update the supplied fields and refresh updated_at
    /// @return false if neither field is supplied (no write happens) or the id
    ///         does not exist
    /// @throws ValidationError if content is supplied but empty
    virtual bool update(
        int64_t id, const std::optional<std::string>& content, std::optional<bool> done
    ) = 0;

    /// @return true iff a row existed and was removed
    virtual bool remove(int64_t id) = 0;
};

} // namespace todomcp
