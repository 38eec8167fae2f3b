/**
 * @file Compare.cpp
 * @brief Implementation of the structural comparator
 */

#include "routerkit/Compare.hpp"

#include <spdlog/spdlog.h>

namespace routerkit {

const std::set<std::string> kAlwaysSkippedKeys = {"metadata", "status"};

namespace {
    std::set<std::string> key_set(const Value& mapping, const std::set<std::string>& skip) {
        std::set<std::string> keys;
        for (auto it = mapping.begin(); it != mapping.end(); ++it) {
            if (skip.count(it.key()) == 0) {
                keys.insert(it.key());
            }
        }
        return keys;
    }

    bool compare(const Value& desired, const Value& observed,
                 const std::set<std::string>& skip, bool debug);

    bool compare_sequence(const std::string& key, const Value& desired, const Value& observed,
                          const std::set<std::string>& skip, bool debug) {
        if (!desired.is_array()) {
            if (debug) spdlog::debug("compare: desired [{}] is not a sequence: {}", key, desired.dump());
            return false;
        }
        if (desired.size() != observed.size()) {
            if (debug) {
                spdlog::debug("compare: sequence lengths differ at [{}]: desired {} != observed {}",
                              key, desired.size(), observed.size());
            }
            return false;
        }

        for (size_t i = 0; i < observed.size(); ++i) {
            const Value& want = desired[i];
            const Value& have = observed[i];
            if (want.is_object() && have.is_object()) {
                if (!compare(want, have, skip, debug)) {
                    if (debug) spdlog::debug("compare: element {} of [{}] differs", i, key);
                    return false;
                }
            } else if (want != have) {
                if (debug) {
                    spdlog::debug("compare: element {} of [{}] should be identical: {} != {}",
                                  i, key, want.dump(), have.dump());
                }
                return false;
            }
        }
        return true;
    }

    bool compare_mapping(const std::string& key, const Value& desired, const Value& observed,
                         const std::set<std::string>& skip, bool debug) {
        if (!desired.is_object()) {
            if (debug) spdlog::debug("compare: desired [{}] is not a mapping: {}", key, desired.dump());
            return false;
        }
        if (key_set(observed, skip) != key_set(desired, skip)) {
            if (debug) {
                spdlog::debug("compare: key sets differ at [{}]: observed {} desired {}",
                              key, observed.dump(), desired.dump());
            }
            return false;
        }
        return compare(desired, observed, skip, debug);
    }

    bool compare(const Value& desired, const Value& observed,
                 const std::set<std::string>& skip, bool debug) {
        if (!observed.is_object() || !desired.is_object()) {
            return desired == observed;
        }

        for (auto it = observed.begin(); it != observed.end(); ++it) {
            const std::string& key = it.key();
            if (skip.count(key) > 0) {
                continue;
            }

            auto found = desired.find(key);
            if (found == desired.end()) {
                if (debug) spdlog::debug("compare: desired does not have key [{}]", key);
                return false;
            }

            const Value& have = it.value();
            bool equal = true;
            switch (have.type()) {
                case Value::value_t::array:
                    equal = compare_sequence(key, *found, have, skip, debug);
                    break;
                case Value::value_t::object:
                    equal = compare_mapping(key, *found, have, skip, debug);
                    break;
                default:
                    equal = *found == have;
                    if (!equal && debug) {
                        spdlog::debug("compare: value mismatch at [{}]: desired {} observed {}",
                                      key, found->dump(), have.dump());
                    }
                    break;
            }

            if (!equal) {
                return false;
            }
        }
        return true;
    }
}

bool equal_under_skip(const Value& desired,
                      const Value& observed,
                      const std::set<std::string>& skip_keys,
                      bool debug) {
    std::set<std::string> skip = kAlwaysSkippedKeys;
    skip.insert(skip_keys.begin(), skip_keys.end());
    return compare(desired, observed, skip, debug);
}

} // namespace routerkit
