// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/value.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tsingest {

// What a typed Row accessor does when the stored case is neither the
// requested type nor Null. A mismatch is a schema or provider bug, not bad
// data: development runs should stop loudly, a live ingestion process should
// keep going.
enum class TypeMismatchPolicy {
    Throw,        // raise TypeMismatchError
    ReturnEmpty,  // behave as if the slot were Null
};

#ifdef NDEBUG
inline constexpr TypeMismatchPolicy kDefaultTypeMismatchPolicy = TypeMismatchPolicy::ReturnEmpty;
#else
inline constexpr TypeMismatchPolicy kDefaultTypeMismatchPolicy = TypeMismatchPolicy::Throw;
#endif

class TypeMismatchError : public std::logic_error {
public:
    TypeMismatchError(std::size_t index, std::string_view expected, const Value& actual);

    std::size_t index() const { return index_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::size_t index_;
    std::string expected_;
    std::string actual_;
};

// Process-wide policy, initialised to kDefaultTypeMismatchPolicy.
TypeMismatchPolicy type_mismatch_policy();

// Returns the previous policy.
TypeMismatchPolicy set_type_mismatch_policy(TypeMismatchPolicy policy);

// Installs a policy for the lifetime of the guard.
class ScopedTypeMismatchPolicy {
public:
    explicit ScopedTypeMismatchPolicy(TypeMismatchPolicy policy)
        : previous_(set_type_mismatch_policy(policy)) {}
    ~ScopedTypeMismatchPolicy() { set_type_mismatch_policy(previous_); }

    ScopedTypeMismatchPolicy(const ScopedTypeMismatchPolicy&) = delete;
    ScopedTypeMismatchPolicy& operator=(const ScopedTypeMismatchPolicy&) = delete;

private:
    TypeMismatchPolicy previous_;
};

}  // namespace tsingest
