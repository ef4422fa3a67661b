#pragma once

#include <batchstake/execution/config.hpp>
#include <batchstake/schema/capability.hpp>
#include <batchstake/schema/origin.hpp>
#include <functional>

namespace batchstake::execution {

/// Decide whether `origin` holds `capability`.
using capability_check_t =
    std::function<bool(batchstake::schema::capability_t capability,
                       const batchstake::schema::origin_t& origin)>;

/// Role table check built from configuration:
/// signed -> any signed origin;
/// issuer -> root, or a signed account listed in `config.issuers`;
/// governance -> root, or a signed account listed in `config.governors`.
capability_check_t make_default_capability_check(const engine_config& config);

}  // namespace batchstake::execution
