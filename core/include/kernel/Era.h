#ifndef ERA_H
#define ERA_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

// Coarse simulation phase. Missing weights and modifiers mean 1.0; a template
// weight of 0 disables the template, a system modifier of 0 skips the system.
struct Era {
    std::string id;
    std::string name;
    std::string description;
    std::map<std::string, double> templateWeights;
    std::map<std::string, double> systemModifiers;
    std::map<std::string, double> pressureModifiers;
};

const Era& selectEra(std::size_t epoch, const std::vector<Era>& eras, std::size_t epochsPerEra);
double getTemplateWeight(const Era& era, const std::string& templateId, double baseWeight = 1.0);
double getSystemModifier(const Era& era, const std::string& systemId, double baseValue = 1.0);
double getPressureModifier(const Era& era, const std::string& pressureId);

#endif
