#include "fitgen/workout/intensity.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace fitgen::workout {

IntensityTable IntensityTable::defaults() {
    IntensityTable table;
    table.add("EEC", Intensity::warmup_cooldown);
    table.add("VAC", Intensity::warmup_cooldown);
    table.add("Pasada", Intensity::active);
    table.add("Pausa", Intensity::rest);
    table.add("Rodaje", Intensity::active);
    table.add("Tempo", Intensity::active);
    table.add("Fartlek", Intensity::active);
    return table;
}

void IntensityTable::add(std::string label, Intensity intensity) {
    entries_.insert_or_assign(std::move(label), intensity);
}

std::optional<Intensity> IntensityTable::find(std::string_view label) const {
    const auto it = entries_.find(label);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Intensity IntensityTable::classify(std::string_view label) const {
    const auto hit = find(label);
    if (!hit.has_value()) {
        spdlog::debug("fitgen: unknown step type '{}', treating as active",
                      label);
        return Intensity::active;
    }
    return *hit;
}

Intensity classify_intensity(std::string_view label) {
    // 函数内静态对象：首次调用时初始化一次，之后只读，可并发访问。
    static const IntensityTable table = IntensityTable::defaults();
    return table.classify(label);
}

} // namespace fitgen::workout
