#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "worker_runtime.hpp"

// model_type -> unit of work.
class UnitRegistry {
public:
    void add(const std::string& model_type, UnitOfWork unit);
    bool contains(const std::string& model_type) const;
    std::vector<std::string> names() const;

    // Unknown model types resolve to a unit that throws, so a claimed job
    // with no implementation is failed instead of left running.
    UnitOfWork resolve(const std::string& model_type) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, UnitOfWork> units_;
};

// Smoke-test units:
//   sleep  parameters = milliseconds to sleep, polling for cancel every slice
//   fail   always throws with parameters as the message
void register_builtin_units(UnitRegistry& registry);
