/**
 * @file Status.hpp
 * @brief Outcome of one reconciliation pass
 */

#ifndef ROUTERKIT_STATUS_HPP
#define ROUTERKIT_STATUS_HPP

#include "routerkit/Value.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace routerkit {

enum class State {
    Present,
    Absent
};

const char* to_string(State state) noexcept;

/**
 * @brief Parse "present" / "absent"
 */
std::optional<State> state_from_string(const std::string& text);

/**
 * @brief Reported result of a pass
 *
 * Serialized as {changed, state, results[, msg]} or, on failure,
 * {failed: true, msg}.
 */
struct Status {
    bool changed = false;
    bool failed = false;
    std::optional<State> state;
    Value results;
    std::string msg;

    Value to_json() const;

    static Status failure(std::string msg);
};

/**
 * @brief Write @p status as indented JSON followed by a newline
 * @return Process exit code: 1 for a failed status, else 0
 */
int report(std::ostream& out, const Status& status);

} // namespace routerkit

#endif // ROUTERKIT_STATUS_HPP
