#include "weapon.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace {

// Tabela de upgrades (nível 1 = stats base). Dano e cadência nunca diminuem entre níveis.
const std::array<UpgradeScaling, kMaxWeaponLevel> kUpgradeTable{{
    {1.00f, 1.00f, 0, 1.00f, 0.0f, 0},
    {1.25f, 1.10f, 0, 1.05f, 0.0f, 0},
    {1.50f, 1.20f, 1, 1.10f, 5.0f, 1},
    {2.00f, 1.35f, 1, 1.20f, 10.0f, 1},
    {2.75f, 1.50f, 2, 1.30f, 15.0f, 2},
}};

struct BehaviorTypeVisitor {
    WeaponBehaviorType operator()(const StandardBehaviorConfig&) const { return WeaponBehaviorType::Standard; }
    WeaponBehaviorType operator()(const SpreadBehaviorConfig&) const { return WeaponBehaviorType::Spread; }
    WeaponBehaviorType operator()(const HomingBehaviorConfig&) const { return WeaponBehaviorType::Homing; }
    WeaponBehaviorType operator()(const OrbitalBehaviorConfig&) const { return WeaponBehaviorType::Orbital; }
    WeaponBehaviorType operator()(const ChainBehaviorConfig&) const { return WeaponBehaviorType::Chain; }
    WeaponBehaviorType operator()(const AreaBehaviorConfig&) const { return WeaponBehaviorType::Area; }
    WeaponBehaviorType operator()(const BeamBehaviorConfig&) const { return WeaponBehaviorType::Beam; }
    WeaponBehaviorType operator()(const VortexBehaviorConfig&) const { return WeaponBehaviorType::Vortex; }
};

} // namespace

WeaponBehaviorType GetBehaviorType(const WeaponBehaviorConfig& config) {
    return std::visit(BehaviorTypeVisitor{}, config);
}

const char* BehaviorTypeName(WeaponBehaviorType type) {
    switch (type) {
        case WeaponBehaviorType::Standard: return "standard";
        case WeaponBehaviorType::Spread: return "spread";
        case WeaponBehaviorType::Homing: return "homing";
        case WeaponBehaviorType::Orbital: return "orbital";
        case WeaponBehaviorType::Chain: return "chain";
        case WeaponBehaviorType::Area: return "area";
        case WeaponBehaviorType::Beam: return "beam";
        case WeaponBehaviorType::Vortex: return "vortex";
    }
    return "unknown";
}

const UpgradeScaling& GetUpgradeScaling(int level) {
    if (level < kMinWeaponLevel || level > kMaxWeaponLevel) {
        return kUpgradeTable[0];
    }
    return kUpgradeTable[static_cast<std::size_t>(level - 1)];
}

// Função pura: mesma definição e nível sempre produzem o mesmo resultado.
WeaponComputedStats ComputeWeaponStats(const WeaponDefinition& definition, int level) {
    const UpgradeScaling& scaling = GetUpgradeScaling(level);

    WeaponComputedStats stats{};
    stats.damage = std::floor(definition.baseDamage * scaling.damageMultiplier);
    stats.fireRate = definition.baseFireRate * scaling.fireRateMultiplier;
    stats.projectileCount = definition.baseProjectileCount + scaling.projectileCountBonus;
    stats.projectileSpeed = definition.baseProjectileSpeed * scaling.projectileSpeedMultiplier;
    stats.spread = std::max(0.0f, definition.baseSpread - scaling.spreadReduction);
    stats.pierceCount = definition.piercing ? kBasePierceCount + scaling.pierceBonus : 0;
    return stats;
}

WeaponInstance MakeWeaponInstance(std::shared_ptr<const WeaponDefinition> definition, int level) {
    WeaponInstance instance{};
    instance.level = std::clamp(level, kMinWeaponLevel, kMaxWeaponLevel);
    if (definition != nullptr) {
        instance.stats = ComputeWeaponStats(*definition, instance.level);
    }
    instance.definition = std::move(definition);
    return instance;
}
