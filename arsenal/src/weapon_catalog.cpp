#include "weapon_catalog.h"

#include "weapon_blueprints.h"

#include <algorithm>

WeaponCatalog::WeaponCatalog() {
    RegisterDefaults();
}

void WeaponCatalog::Register(const WeaponDefinition& definition) {
    definitions_[definition.id] = std::make_shared<const WeaponDefinition>(definition);
}

// Armas iniciais; as evoluídas entram via WeaponEvolution.
void WeaponCatalog::RegisterDefaults() {
    for (const WeaponDefinition& definition : GetStockWeaponDefinitions()) {
        Register(definition);
    }
}

std::shared_ptr<const WeaponDefinition> WeaponCatalog::Find(const std::string& id) const {
    auto it = definitions_.find(id);
    if (it == definitions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<const WeaponDefinition>> WeaponCatalog::GetAll() const {
    std::vector<std::shared_ptr<const WeaponDefinition>> all;
    all.reserve(definitions_.size());
    for (const auto& pair : definitions_) {
        all.push_back(pair.second);
    }

    std::sort(all.begin(), all.end(), [](const auto& lhs, const auto& rhs) {
        return lhs->id < rhs->id;
    });
    return all;
}
