/**
 * @file Compare.hpp
 * @brief Structural comparison of desired vs. observed resource definitions
 */

#ifndef ROUTERKIT_COMPARE_HPP
#define ROUTERKIT_COMPARE_HPP

#include "routerkit/Value.hpp"
#include <set>
#include <string>

namespace routerkit {

/// Keys populated by the server and never compared
extern const std::set<std::string> kAlwaysSkippedKeys;

/**
 * @brief Decide whether @p desired matches @p observed, ignoring skipped keys
 *
 * Walks the keys of @p observed (the live object):
 * - keys in {metadata, status} ∪ @p skip_keys are ignored
 * - sequence: @p desired must hold a sequence of the same length under the
 *   key; mapping/mapping pairs recurse, other pairs must be equal
 * - mapping: @p desired must hold a mapping with the same key set (minus
 *   skipped keys), then recurse
 * - scalar: @p desired must hold an equal value
 *
 * Keys present only in @p desired at a given level are not detected unless
 * a parent mapping's key-set check catches them.
 *
 * @param desired Rendered definition
 * @param observed Live definition
 * @param skip_keys Additional key names to ignore at every depth
 * @param debug Log the reason for a mismatch at debug level
 * @return true when equivalent under the skip set
 *
 * Example:
 * ```cpp
 * Value desired  = {{"spec", {{"ports", {{{"port", 80}}}}}}};
 * Value observed = {{"spec", {{"ports", {{{"port", 80}}}}}},
 *                   {"status", {{"ready", true}}}};
 * equal_under_skip(desired, observed);  // true: status is skipped
 * ```
 */
bool equal_under_skip(const Value& desired,
                      const Value& observed,
                      const std::set<std::string>& skip_keys = {},
                      bool debug = false);

} // namespace routerkit

#endif // ROUTERKIT_COMPARE_HPP
