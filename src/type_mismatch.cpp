// SPDX-License-Identifier: MIT

#include "tsingest/type_mismatch.hpp"
#include <atomic>

namespace tsingest {

namespace {

std::atomic<TypeMismatchPolicy> g_policy{kDefaultTypeMismatchPolicy};

}  // namespace

TypeMismatchError::TypeMismatchError(std::size_t index, std::string_view expected,
                                     const Value& actual)
    : std::logic_error(fmt::format("Expected `{}` value at index {}, got {}",
                                   expected, index, actual))
    , index_(index)
    , expected_(expected)
    , actual_(to_string(actual)) {}

TypeMismatchPolicy type_mismatch_policy() {
    return g_policy.load(std::memory_order_relaxed);
}

TypeMismatchPolicy set_type_mismatch_policy(TypeMismatchPolicy policy) {
    return g_policy.exchange(policy, std::memory_order_relaxed);
}

}  // namespace tsingest
