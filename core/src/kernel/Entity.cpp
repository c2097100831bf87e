#include "kernel/Entity.h"

#include <algorithm>

int prominenceValue(Prominence p) {
    return static_cast<int>(p);
}

Prominence prominenceFromValue(int value) {
    return static_cast<Prominence>(std::clamp(value, 0, 4));
}

Prominence adjustProminence(Prominence p, int delta) {
    return prominenceFromValue(prominenceValue(p) + delta);
}

const char* prominenceName(Prominence p) {
    switch (p) {
        case Prominence::Forgotten: return "forgotten";
        case Prominence::Marginal: return "marginal";
        case Prominence::Recognized: return "recognized";
        case Prominence::Renowned: return "renowned";
        case Prominence::Mythic: return "mythic";
    }
    return "marginal";
}

std::optional<Prominence> parseProminence(const std::string& name) {
    for (int v = 0; v <= 4; ++v) {
        const Prominence p = static_cast<Prominence>(v);
        if (name == prominenceName(p)) {
            return p;
        }
    }
    return std::nullopt;
}
