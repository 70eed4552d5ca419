//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// client/session_state.hpp
//
// Per-connection mutable session context
//===----------------------------------------------------------------------===//

#pragma once

#include "client/url.hpp"
#include "types/value.hpp"
#include <optional>
#include <parallel_hashmap/phmap.h>

namespace surreal_client {

// Owned by exactly one connection and mutated only by operations on that
// connection. Not thread-safe.
struct SessionState {
    explicit SessionState(Url endpoint_p)
        : endpoint(std::move(endpoint_p)) {}

    const Url endpoint;

    std::optional<std::string> auth_token;

    // Set together by use(); never one without the other
    std::optional<std::string> namespace_;
    std::optional<std::string> database;

    phmap::flat_hash_map<std::string, Value> bound_variables;

    std::string last_correlation_id;

    bool HasToken() const { return auth_token.has_value() && !auth_token->empty(); }
    bool HasScope() const { return namespace_.has_value() && database.has_value(); }

    void SetScope(const std::string& ns, const std::string& db) {
        namespace_ = ns;
        database = db;
    }

    // Bound variables written over the caller's parameters; a bound
    // variable replaces a same-named call-site parameter.
    Object MergeVariables(Object params) const {
        for (const auto& entry : bound_variables) {
            params.Set(entry.first, entry.second);
        }
        return params;
    }
};

} // namespace surreal_client
