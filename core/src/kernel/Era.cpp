#include "kernel/Era.h"

#include <algorithm>
#include <stdexcept>

namespace {
double lookup(const std::map<std::string, double>& table, const std::string& key) {
    auto it = table.find(key);
    return it != table.end() ? it->second : 1.0;
}
}

const Era& selectEra(std::size_t epoch, const std::vector<Era>& eras, std::size_t epochsPerEra) {
    if (eras.empty()) {
        throw std::invalid_argument("selectEra requires at least one era");
    }
    const std::size_t perEra = std::max<std::size_t>(1, epochsPerEra);
    const std::size_t index = std::min(epoch / perEra, eras.size() - 1);
    return eras[index];
}

double getTemplateWeight(const Era& era, const std::string& templateId, double baseWeight) {
    return baseWeight * lookup(era.templateWeights, templateId);
}

double getSystemModifier(const Era& era, const std::string& systemId, double baseValue) {
    return baseValue * lookup(era.systemModifiers, systemId);
}

double getPressureModifier(const Era& era, const std::string& pressureId) {
    return lookup(era.pressureModifiers, pressureId);
}
