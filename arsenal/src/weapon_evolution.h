#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class WeaponArsenal;

// Receita: arma base no nível máximo + passiva -> arma evoluída.
struct EvolutionRecipe {
    std::string id{};
    std::string baseWeaponId{};
    std::string requiredPassiveId{};
    std::string evolvedWeaponId{};
    std::string evolutionName{};
    std::string description{};
    int minWeaponLevel{5};
    int minPassiveLevel{1};
};

// Níveis atuais das passivas do jogador (mantidos pelo sistema de upgrades externo).
using PassiveLevels = std::unordered_map<std::string, int>;

// Troca armas no nível máximo pelas formas evoluídas. Cada evolução acontece uma vez por run.
class WeaponEvolution {
public:
    WeaponEvolution();

    void RegisterRecipe(const EvolutionRecipe& recipe);
    const EvolutionRecipe* FindRecipe(const std::string& recipeId) const;
    const std::vector<EvolutionRecipe>& GetRecipes() const { return recipes_; }

    // Registra as definições evoluídas no catálogo do arsenal.
    void RegisterEvolvedWeapons(WeaponArsenal& arsenal) const;

    bool CanEvolve(const WeaponArsenal& arsenal, const std::string& recipeId, const PassiveLevels& passives) const;
    std::vector<const EvolutionRecipe*> GetAvailableEvolutions(const WeaponArsenal& arsenal, const PassiveLevels& passives) const;

    // Remove a arma base (e seus projéteis) e adiciona a evoluída no nível 1.
    // Emite "weapon_evolved" na posição do dono com evolvedIndex (em GetEvolvedWeaponDefinitions, -1 se custom) e baseLevel.
    // Se a evoluída não entrar, a base volta no mesmo nível e retorna false.
    bool Evolve(WeaponArsenal& arsenal, const std::string& recipeId, const PassiveLevels& passives);

    bool HasEvolved(const std::string& evolvedWeaponId) const { return evolved_.count(evolvedWeaponId) > 0; }
    void Reset() { evolved_.clear(); }

private:
    std::vector<EvolutionRecipe> recipes_{};
    std::unordered_set<std::string> evolved_{};
};
