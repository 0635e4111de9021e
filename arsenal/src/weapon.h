#pragma once

#include "raymath.h"

#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

// Os oito comportamentos de disparo suportados pelo arsenal.
enum class WeaponBehaviorType {
    Standard,
    Spread,
    Homing,
    Orbital,
    Chain,
    Area,
    Beam,
    Vortex
};

// Tiro reto no inimigo mais próximo; vários projéteis abrem um leque pequeno.
struct StandardBehaviorConfig {
    float spreadStepRadians{0.1f};
};

// Leque distribuído ao longo de computedSpread; não precisa de parâmetros extras.
struct SpreadBehaviorConfig {
};

// Mísseis teleguiados com curva limitada.
struct HomingBehaviorConfig {
    float turnSpeed{5.0f}; // radianos por segundo
    float maxLifetime{5.0f}; // segundos antes de se autodestruir
};

// Orbes que giram em volta do dono.
struct OrbitalBehaviorConfig {
    float orbitRadius{80.0f};
    int maxOrbitals{8};
    float orbitSpeedDegrees{180.0f}; // graus por segundo
};

// Raio instantâneo que salta entre inimigos próximos.
struct ChainBehaviorConfig {
    int chainCount{3}; // saltos adicionais no nível 1
    float chainRange{150.0f};
    float chainDamageDecay{0.7f}; // cada salto causa 70% do anterior
};

// Cone de dano contínuo (lança-chamas).
struct AreaBehaviorConfig {
    float range{120.0f};
    float coneAngleDegrees{45.0f};
    float facingDegrees{0.0f};
};

// Feixe contínuo que atravessa todos os inimigos na linha.
struct BeamBehaviorConfig {
    float beamWidth{12.0f};
    float beamRange{800.0f};
    float tickRate{10.0f}; // acertos por segundo no mesmo inimigo
    float slowFactor{0.5f};
    float slowDuration{0.5f};
};

// Singularidade que puxa inimigos e implode ao fim da vida.
struct VortexBehaviorConfig {
    float vortexRadius{160.0f};
    float damageRadius{60.0f};
    float implosionRadius{120.0f};
    float lifetime{3.0f};
    int maxVortices{2};
    float placementRange{300.0f};
    float tickRate{4.0f};
    float pullStrength{220.0f};
    float centerDamageBonus{1.0f}; // dano extra (fração) no centro exato
    float implosionMultiplier{3.0f};
};

// União fechada: cada comportamento recebe apenas os campos que usa.
using WeaponBehaviorConfig = std::variant<StandardBehaviorConfig,
                                          SpreadBehaviorConfig,
                                          HomingBehaviorConfig,
                                          OrbitalBehaviorConfig,
                                          ChainBehaviorConfig,
                                          AreaBehaviorConfig,
                                          BeamBehaviorConfig,
                                          VortexBehaviorConfig>;

WeaponBehaviorType GetBehaviorType(const WeaponBehaviorConfig& config);
const char* BehaviorTypeName(WeaponBehaviorType type);

// Definição imutável de uma arma (registrada no catálogo pelo id).
struct WeaponDefinition {
    std::string id{};
    std::string name{};
    std::string description{};
    float baseDamage{0.0f};
    float baseFireRate{1.0f}; // disparos por segundo
    float baseProjectileSpeed{0.0f};
    int baseProjectileCount{1};
    float baseSpread{0.0f}; // graus
    bool piercing{false};
    bool homing{false}; // false: mísseis do comportamento Homing voam retos
    WeaponBehaviorConfig behavior{StandardBehaviorConfig{}};

    WeaponBehaviorType BehaviorType() const { return GetBehaviorType(behavior); }
};

// Multiplicadores aplicados por nível de upgrade.
struct UpgradeScaling {
    float damageMultiplier{1.0f};
    float fireRateMultiplier{1.0f};
    int projectileCountBonus{0};
    float projectileSpeedMultiplier{1.0f};
    float spreadReduction{0.0f};
    int pierceBonus{0};
};

constexpr int kMinWeaponLevel = 1;
constexpr int kMaxWeaponLevel = 5;
constexpr int kBasePierceCount = 3;

// Linha da tabela para o nível; níveis fora de [1,5] caem na linha do nível 1.
const UpgradeScaling& GetUpgradeScaling(int level);

// Estatísticas derivadas de (definição, nível); nunca alteradas pelo gameplay.
struct WeaponComputedStats {
    float damage{0.0f};
    float fireRate{0.0f};
    int projectileCount{0};
    float projectileSpeed{0.0f};
    float spread{0.0f};
    int pierceCount{0};
};

WeaponComputedStats ComputeWeaponStats(const WeaponDefinition& definition, int level);

inline bool operator==(const WeaponComputedStats& lhs, const WeaponComputedStats& rhs) {
    return lhs.damage == rhs.damage && lhs.fireRate == rhs.fireRate && lhs.projectileCount == rhs.projectileCount &&
           lhs.projectileSpeed == rhs.projectileSpeed && lhs.spread == rhs.spread && lhs.pierceCount == rhs.pierceCount;
}

inline bool operator!=(const WeaponComputedStats& lhs, const WeaponComputedStats& rhs) {
    return !(lhs == rhs);
}

// Tolerância na comparação de intervalos; absorve o arredondamento da soma de passos fixos.
constexpr double kHitIntervalEpsilon = 1e-6;

// Controla o tempo mínimo entre acertos da mesma arma no mesmo inimigo.
struct PerTargetHitTracker {
    std::unordered_map<int, double> lastHitSeconds{};

    // Retorna true se já se passou tempo suficiente desde o último acerto no alvo.
    bool CanHit(int enemyId, double currentTimeSeconds, float cooldownSeconds) const {
        if (cooldownSeconds <= 0.0f) {
            return true;
        }

        auto it = lastHitSeconds.find(enemyId);
        if (it == lastHitSeconds.end()) {
            return true;
        }

        return (currentTimeSeconds - it->second) + kHitIntervalEpsilon >= static_cast<double>(cooldownSeconds);
    }

    // Registra o instante (tempo de simulação) em que o alvo foi atingido.
    void RecordHit(int enemyId, double currentTimeSeconds) {
        lastHitSeconds[enemyId] = currentTimeSeconds;
    }

    void Clear() { lastHitSeconds.clear(); }
};

// Ponto de vórtice ativo com contagem regressiva própria.
struct VortexState {
    Vector2 position{0.0f, 0.0f};
    float remainingLifetime{0.0f};
};

// Estado runtime de uma arma adquirida (nível, cooldown, stats e estado do comportamento).
struct WeaponInstance {
    std::shared_ptr<const WeaponDefinition> definition{};
    int level{kMinWeaponLevel};
    float cooldown{0.0f};
    WeaponComputedStats stats{};

    float orbitalAngle{0.0f};
    std::unordered_set<int> areaTargets{};
    std::vector<VortexState> vortices{};
    std::optional<Vector2> beamAimPoint{};
    PerTargetHitTracker hitTracker{};

    const std::string& Id() const { return definition->id; }

    // Decrementa o cooldown; retorna true quando a arma deve disparar neste quadro.
    // Cadência <= 0 significa arma que nunca dispara.
    bool TickCooldown(float deltaSeconds) {
        if (stats.fireRate <= 0.0f) {
            cooldown = std::numeric_limits<float>::infinity();
            return false;
        }
        cooldown -= deltaSeconds;
        if (cooldown <= 0.0f) {
            cooldown = 0.0f;
            return true;
        }
        return false;
    }

    // Reinicia cooldown a partir da cadência calculada e retorna o intervalo aplicado.
    float ResetCooldown() {
        float interval = (stats.fireRate > 0.0f) ? 1.0f / stats.fireRate : std::numeric_limits<float>::infinity();
        cooldown = interval;
        return interval;
    }
};

// Monta uma instância nova no nível pedido (clampado a [1,5]).
WeaponInstance MakeWeaponInstance(std::shared_ptr<const WeaponDefinition> definition, int level);
