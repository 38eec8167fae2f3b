/**
 * @file Status.cpp
 * @brief Status serialization
 */

#include "routerkit/Status.hpp"

namespace routerkit {

const char* to_string(State state) noexcept {
    switch (state) {
        case State::Present: return "present";
        case State::Absent:  return "absent";
    }
    return "unknown";
}

std::optional<State> state_from_string(const std::string& text) {
    if (text == "present") return State::Present;
    if (text == "absent") return State::Absent;
    return std::nullopt;
}

Value Status::to_json() const {
    if (failed) {
        return Value{{"failed", true}, {"msg", msg}};
    }

    Value j = {{"changed", changed}};
    if (state) {
        j["state"] = to_string(*state);
    }
    if (!results.is_null()) {
        j["results"] = results;
    }
    if (!msg.empty()) {
        j["msg"] = msg;
    }
    return j;
}

Status Status::failure(std::string msg) {
    Status status;
    status.failed = true;
    status.msg = std::move(msg);
    return status;
}

int report(std::ostream& out, const Status& status) {
    out << status.to_json().dump(2) << "\n";
    return status.failed ? 1 : 0;
}

} // namespace routerkit
