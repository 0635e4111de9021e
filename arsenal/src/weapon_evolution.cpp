#include "weapon_evolution.h"

#include "arsenal.h"
#include "weapon_blueprints.h"

#include <algorithm>
#include <iostream>
#include <vector>

namespace {

EvolutionRecipe MakeRecipe(const std::string& id,
                           const std::string& baseWeaponId,
                           const std::string& requiredPassiveId,
                           const std::string& evolvedWeaponId,
                           const std::string& evolutionName,
                           const std::string& description,
                           int minPassiveLevel) {
    EvolutionRecipe recipe{};
    recipe.id = id;
    recipe.baseWeaponId = baseWeaponId;
    recipe.requiredPassiveId = requiredPassiveId;
    recipe.evolvedWeaponId = evolvedWeaponId;
    recipe.evolutionName = evolutionName;
    recipe.description = description;
    recipe.minWeaponLevel = kMaxWeaponLevel;
    recipe.minPassiveLevel = minPassiveLevel;
    return recipe;
}

int LookupPassiveLevel(const PassiveLevels& passives, const std::string& passiveId) {
    auto it = passives.find(passiveId);
    return (it != passives.end()) ? it->second : 0;
}

// Posição da definição evoluída em GetEvolvedWeaponDefinitions(); -1 para evoluções customizadas.
int EvolvedDefinitionIndex(const std::string& evolvedWeaponId) {
    const std::vector<WeaponDefinition> evolved = GetEvolvedWeaponDefinitions();
    for (std::size_t i = 0; i < evolved.size(); ++i) {
        if (evolved[i].id == evolvedWeaponId) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// Devolve a arma base ao arsenal no nível que tinha antes da troca.
void RestoreBaseWeapon(WeaponArsenal& arsenal, const std::string& weaponId, int level) {
    if (!arsenal.AddWeapon(weaponId)) {
        std::cerr << "[Evolution] Nao foi possivel devolver " << weaponId << std::endl;
        return;
    }
    while (arsenal.GetWeaponLevel(weaponId) < level) {
        if (!arsenal.UpgradeWeapon(weaponId)) {
            return;
        }
    }
}

} // namespace

WeaponEvolution::WeaponEvolution() {
    RegisterRecipe(MakeRecipe("evolution_death_ray", "basic_laser", "damage_boost", "death_ray",
                              "Death Ray", "Basic Laser evolves into Death Ray - penetrates ALL enemies!", 3));
    RegisterRecipe(MakeRecipe("evolution_bullet_storm", "spread_shot", "extra_projectile", "bullet_storm",
                              "Bullet Storm", "Spread Shot evolves into Bullet Storm - 20 projectiles!", 3));
    RegisterRecipe(MakeRecipe("evolution_smart_missiles", "homing_missiles", "piercing", "smart_missiles",
                              "Smart Missiles", "Homing Missiles evolves into Smart Missiles - near-perfect tracking!", 1));
}

// Receita com id repetido substitui a anterior.
void WeaponEvolution::RegisterRecipe(const EvolutionRecipe& recipe) {
    auto it = std::find_if(recipes_.begin(), recipes_.end(), [&recipe](const EvolutionRecipe& existing) {
        return existing.id == recipe.id;
    });
    if (it != recipes_.end()) {
        *it = recipe;
        return;
    }
    recipes_.push_back(recipe);
}

const EvolutionRecipe* WeaponEvolution::FindRecipe(const std::string& recipeId) const {
    for (const EvolutionRecipe& recipe : recipes_) {
        if (recipe.id == recipeId) {
            return &recipe;
        }
    }
    return nullptr;
}

void WeaponEvolution::RegisterEvolvedWeapons(WeaponArsenal& arsenal) const {
    for (const WeaponDefinition& definition : GetEvolvedWeaponDefinitions()) {
        arsenal.RegisterWeapon(definition);
    }
}

bool WeaponEvolution::CanEvolve(const WeaponArsenal& arsenal, const std::string& recipeId, const PassiveLevels& passives) const {
    const EvolutionRecipe* recipe = FindRecipe(recipeId);
    if (recipe == nullptr) {
        return false;
    }

    if (arsenal.GetWeaponLevel(recipe->baseWeaponId) < recipe->minWeaponLevel) {
        return false;
    }

    if (LookupPassiveLevel(passives, recipe->requiredPassiveId) < recipe->minPassiveLevel) {
        return false;
    }

    if (!arsenal.GetCatalog().Contains(recipe->evolvedWeaponId) || arsenal.HasWeapon(recipe->evolvedWeaponId)) {
        return false;
    }

    // A troca não muda a contagem: só cabe se o arsenal não estiver acima do limite.
    if (static_cast<int>(arsenal.GetWeaponCount()) > arsenal.GetMaxWeapons()) {
        return false;
    }

    return !HasEvolved(recipe->evolvedWeaponId);
}

std::vector<const EvolutionRecipe*> WeaponEvolution::GetAvailableEvolutions(const WeaponArsenal& arsenal,
                                                                            const PassiveLevels& passives) const {
    std::vector<const EvolutionRecipe*> available;
    for (const EvolutionRecipe& recipe : recipes_) {
        if (CanEvolve(arsenal, recipe.id, passives)) {
            available.push_back(&recipe);
        }
    }
    return available;
}

bool WeaponEvolution::Evolve(WeaponArsenal& arsenal, const std::string& recipeId, const PassiveLevels& passives) {
    if (!CanEvolve(arsenal, recipeId, passives)) {
        std::cerr << "[Evolution] Evolucao indisponivel: " << recipeId << std::endl;
        return false;
    }

    const EvolutionRecipe& recipe = *FindRecipe(recipeId);
    const int baseLevel = arsenal.GetWeaponLevel(recipe.baseWeaponId);
    if (!arsenal.RemoveWeapon(recipe.baseWeaponId)) {
        return false;
    }

    if (!arsenal.AddWeapon(recipe.evolvedWeaponId)) {
        std::cerr << "[Evolution] Falha ao adicionar " << recipe.evolvedWeaponId << ", base restaurada" << std::endl;
        RestoreBaseWeapon(arsenal, recipe.baseWeaponId, baseLevel);
        return false;
    }

    evolved_.insert(recipe.evolvedWeaponId);
    arsenal.GetPorts().EmitEffect("weapon_evolved", arsenal.GetOwnerPosition(), EffectParams{
        {"evolvedIndex", static_cast<float>(EvolvedDefinitionIndex(recipe.evolvedWeaponId))},
        {"baseLevel", static_cast<float>(baseLevel)},
    });
    return true;
}
