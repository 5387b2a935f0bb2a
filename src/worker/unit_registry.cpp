#include "unit_registry.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

void UnitRegistry::add(const std::string& model_type, UnitOfWork unit) {
    std::lock_guard<std::mutex> lock(mutex_);
    units_[model_type] = std::move(unit);
}

bool UnitRegistry::contains(const std::string& model_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return units_.count(model_type) > 0;
}

std::vector<std::string> UnitRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [name, unit] : units_) out.push_back(name);
    return out;
}

UnitOfWork UnitRegistry::resolve(const std::string& model_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = units_.find(model_type);
    if (it != units_.end()) return it->second;
    return [model_type](JobContext&) -> std::string {
        throw std::invalid_argument(fmt::format("no unit of work registered for '{}'", model_type));
    };
}

void register_builtin_units(UnitRegistry& registry) {
    registry.add("sleep", [](JobContext& ctx) {
        int total_ms = std::max(0, safe_stoi(ctx.job().parameters, 0));
        int slept = 0;
        while (slept < total_ms) {
            ctx.throw_if_cancelled();
            int slice = std::min(SHUTDOWN_SLICE_MS, total_ms - slept);
            platform::sleep_ms(slice);
            slept += slice;
        }
        nlohmann::json result = {{"slept_ms", slept}, {"worker", ctx.worker_ref()}};
        return result.dump();
    });

    registry.add("fail", [](JobContext& ctx) -> std::string {
        std::string msg = ctx.job().parameters.empty() ? "requested failure" : ctx.job().parameters;
        throw std::runtime_error(msg);
    });
}
