#pragma once

#include "weapon.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Registro de definições de arma por id. Registrar um id existente substitui a
// definição (última escrita vence); instâncias já criadas mantêm a antiga.
class WeaponCatalog {
public:
    WeaponCatalog();

    void Register(const WeaponDefinition& definition);
    void RegisterDefaults();

    std::shared_ptr<const WeaponDefinition> Find(const std::string& id) const;
    bool Contains(const std::string& id) const { return definitions_.count(id) > 0; }
    std::size_t Size() const { return definitions_.size(); }

    // Todas as definições ordenadas por id.
    std::vector<std::shared_ptr<const WeaponDefinition>> GetAll() const;

private:
    std::unordered_map<std::string, std::shared_ptr<const WeaponDefinition>> definitions_{};
};
