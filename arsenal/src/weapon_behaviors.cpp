#include "weapon_behaviors.h"

#include "targeting.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace {

constexpr float kTwoPi = 2.0f * PI;

// Normaliza ângulo para (-PI, PI].
float WrapAngle(float angle) {
    while (angle > PI) angle -= kTwoPi;
    while (angle < -PI) angle += kTwoPi;
    return angle;
}

float AngleTo(Vector2 from, Vector2 to) {
    return std::atan2(to.y - from.y, to.x - from.x);
}

// Clamps auxiliar limitado a [0,1].
float Clamp01(float value) {
    if (value < 0.0f) return 0.0f;
    if (value > 1.0f) return 1.0f;
    return value;
}

// Distância mínima entre um ponto e um segmento 2D; usada pelo feixe.
float DistancePointToSegment(Vector2 point, Vector2 segStart, Vector2 segEnd) {
    Vector2 segment = Vector2Subtract(segEnd, segStart);
    float segmentLengthSq = Vector2LengthSqr(segment);
    if (segmentLengthSq <= 1e-5f) {
        return Vector2Distance(point, segStart);
    }

    float t = Vector2DotProduct(Vector2Subtract(point, segStart), segment) / segmentLengthSq;
    t = Clamp01(t);
    Vector2 closest = Vector2Add(segStart, Vector2Scale(segment, t));
    return Vector2Distance(point, closest);
}

// Cria um projétil reto com os stats atuais da arma (dano fotografado no disparo).
Projectile MakeProjectile(const BehaviorContext& context, Vector2 position, float angle) {
    const WeaponInstance& weapon = context.weapon;
    const float speed = weapon.stats.projectileSpeed;

    Projectile projectile{};
    projectile.weaponId = weapon.Id();
    projectile.position = position;
    projectile.velocity = Vector2{std::cos(angle) * speed, std::sin(angle) * speed};
    projectile.speed = speed;
    projectile.damage = weapon.stats.damage;
    projectile.pierceBudget = weapon.stats.pierceCount;
    projectile.remainingLifetime = context.defaultProjectileLifetime;
    return projectile;
}

// Ângulo do i-ésimo projétil distribuído em [-arc/2, +arc/2] em torno da mira.
float FanAngle(float baseAngle, int index, int count, float arcRadians) {
    if (count <= 1) {
        return baseAngle;
    }
    float fraction = static_cast<float>(index) / static_cast<float>(count - 1);
    return baseAngle + (fraction - 0.5f) * arcRadians;
}

void FireStandard(BehaviorContext& context, const StandardBehaviorConfig& config) {
    const EnemySnapshot* target = FindClosestEnemy(context.ownerPosition, context.enemies);
    if (target == nullptr) {
        return;
    }

    const float aim = AngleTo(context.ownerPosition, target->position);
    const int count = context.weapon.stats.projectileCount;
    for (int i = 0; i < count; ++i) {
        float angle = FanAngle(aim, i, count, config.spreadStepRadians);
        context.projectiles.Spawn(MakeProjectile(context, context.ownerPosition, angle));
    }

    context.ports.EmitEffect("muzzle_flash", context.ownerPosition);
}

// Dispara mesmo sem inimigos (mira padrão para a direita).
void FireSpread(BehaviorContext& context) {
    const EnemySnapshot* target = FindClosestEnemy(context.ownerPosition, context.enemies);
    const float aim = (target != nullptr) ? AngleTo(context.ownerPosition, target->position) : 0.0f;
    const float spreadRadians = context.weapon.stats.spread * DEG2RAD;
    const int count = context.weapon.stats.projectileCount;

    for (int i = 0; i < count; ++i) {
        float angle = FanAngle(aim, i, count, spreadRadians);
        context.projectiles.Spawn(MakeProjectile(context, context.ownerPosition, angle));
    }

    context.ports.EmitEffect("spread_blast", context.ownerPosition);
}

// Cada míssil pega um inimigo distinto do mais perto ao mais longe; se faltar inimigo, repete em round-robin.
void FireHoming(BehaviorContext& context, const HomingBehaviorConfig& config) {
    std::vector<const EnemySnapshot*> sorted = FindNearestEnemies(context.ownerPosition, context.enemies);
    if (sorted.empty()) {
        return;
    }

    const int count = context.weapon.stats.projectileCount;
    for (int i = 0; i < count; ++i) {
        const EnemySnapshot* target = sorted[static_cast<std::size_t>(i) % sorted.size()];
        Projectile projectile = MakeProjectile(context, context.ownerPosition, AngleTo(context.ownerPosition, target->position));
        if (context.weapon.definition->homing) {
            projectile.homingTargetId = target->id;
            projectile.turnSpeed = config.turnSpeed;
        }
        projectile.remainingLifetime = config.maxLifetime;
        context.projectiles.Spawn(std::move(projectile));
    }

    context.ports.EmitEffect("missile_launch", context.ownerPosition);
}

void FireOrbital(BehaviorContext& context, const OrbitalBehaviorConfig& config) {
    WeaponInstance& weapon = context.weapon;
    const int existing = static_cast<int>(context.projectiles.CountByWeapon(weapon.Id(), true));
    if (existing >= config.maxOrbitals) {
        return;
    }

    const int count = weapon.stats.projectileCount;
    const int toSpawn = std::min(count, config.maxOrbitals - existing);
    if (toSpawn <= 0) {
        return;
    }

    // Respawn zera o histórico de acertos dos orbes que já estavam girando.
    context.projectiles.ForEachOrbital(weapon.Id(), [](Projectile& projectile) {
        projectile.hitEnemyIds.clear();
    });

    const float spacing = kTwoPi / static_cast<float>(count);
    for (int i = 0; i < toSpawn; ++i) {
        OrbitalMotion orbit{};
        orbit.angle = weapon.orbitalAngle + static_cast<float>(i) * spacing;
        orbit.radius = config.orbitRadius;
        orbit.angularSpeed = config.orbitSpeedDegrees * DEG2RAD;
        orbit.ownerPosition = context.ownerPosition;

        Projectile projectile = MakeProjectile(context, context.ownerPosition, 0.0f);
        projectile.position = Vector2{context.ownerPosition.x + std::cos(orbit.angle) * orbit.radius,
                                      context.ownerPosition.y + std::sin(orbit.angle) * orbit.radius};
        projectile.velocity = Vector2{0.0f, 0.0f};
        projectile.remainingLifetime = kInfiniteLifetime;
        projectile.orbital = orbit;
        context.projectiles.Spawn(std::move(projectile));
    }

    context.ports.EmitEffect("orbital_spawn", context.ownerPosition, EffectParams{{"count", static_cast<float>(toSpawn)}});
}

// Raio instantâneo: nunca repete inimigo na mesma cadeia.
void FireChain(BehaviorContext& context, const ChainBehaviorConfig& config) {
    const WeaponInstance& weapon = context.weapon;
    const EnemySnapshot* current = FindClosestEnemy(context.ownerPosition, context.enemies);
    if (current == nullptr) {
        return;
    }

    const int extraHops = config.chainCount + weapon.level / 2;
    std::unordered_set<int> visited;
    float damage = weapon.stats.damage;
    Vector2 previous = context.ownerPosition;

    for (int hop = 0; hop <= extraHops; ++hop) {
        if (current == nullptr || visited.count(current->id) > 0) {
            break;
        }

        context.ports.EmitDamage(current->id, damage, weapon.Id(), current->position);
        context.ports.EmitEffect("lightning_bolt", previous, EffectParams{
            {"targetX", current->position.x},
            {"targetY", current->position.y},
            {"damage", damage},
            {"hop", static_cast<float>(hop)},
        });

        visited.insert(current->id);
        previous = current->position;
        damage = std::floor(damage * config.chainDamageDecay);

        current = FindClosestEnemyExcluding(current->position, context.enemies, visited, config.chainRange);
    }
}

// Cone fixo na direção facingDegrees; intensidade do efeito cai com a distância.
void FireArea(BehaviorContext& context, const AreaBehaviorConfig& config) {
    WeaponInstance& weapon = context.weapon;
    const float facing = config.facingDegrees * DEG2RAD;
    const float halfCone = config.coneAngleDegrees * DEG2RAD * 0.5f;

    weapon.areaTargets.clear();
    for (const EnemySnapshot& enemy : context.enemies) {
        if (!enemy.IsTargetable()) {
            continue;
        }

        float distance = Vector2Distance(context.ownerPosition, enemy.position);
        if (distance > config.range) {
            continue;
        }

        float angleDiff = std::fabs(WrapAngle(AngleTo(context.ownerPosition, enemy.position) - facing));
        if (angleDiff > halfCone) {
            continue;
        }

        context.ports.EmitDamage(enemy.id, weapon.stats.damage, weapon.Id(), enemy.position);
        float intensity = (config.range > 0.0f) ? 1.0f - distance / config.range : 1.0f;
        context.ports.EmitEffect("flame_hit", enemy.position, EffectParams{{"intensity", intensity}});
        weapon.areaTargets.insert(enemy.id);
    }

    context.ports.EmitEffect("flamethrower", context.ownerPosition, EffectParams{
        {"angle", config.facingDegrees},
        {"range", config.range},
        {"coneAngle", config.coneAngleDegrees},
    });
}

// Reposiciona a mira do feixe; o dano acontece no tick.
void FireBeam(BehaviorContext& context, const BeamBehaviorConfig& config) {
    const EnemySnapshot* target = FindClosestEnemy(context.ownerPosition, context.enemies);
    Vector2 aim = (target != nullptr)
        ? target->position
        : Vector2{context.ownerPosition.x + config.beamRange, context.ownerPosition.y};
    context.weapon.beamAimPoint = aim;

    context.ports.EmitEffect("beam_fire", context.ownerPosition, EffectParams{
        {"targetX", aim.x},
        {"targetY", aim.y},
        {"width", config.beamWidth},
    });
}

void FireVortex(BehaviorContext& context, const VortexBehaviorConfig& config) {
    WeaponInstance& weapon = context.weapon;
    if (static_cast<int>(weapon.vortices.size()) >= config.maxVortices) {
        return;
    }

    Vector2 center{};
    if (!FindDensestClusterCenter(context.ownerPosition, context.enemies, config.placementRange, config.vortexRadius, center)) {
        std::uniform_real_distribution<float> unit(0.0f, 1.0f);
        float angle = unit(context.rng) * kTwoPi;
        float radius = config.placementRange * std::sqrt(unit(context.rng));
        center = Vector2{context.ownerPosition.x + std::cos(angle) * radius,
                         context.ownerPosition.y + std::sin(angle) * radius};
    }

    weapon.vortices.push_back(VortexState{center, config.lifetime});
    context.ports.EmitEffect("vortex_spawn", center, EffectParams{
        {"radius", config.vortexRadius},
        {"lifetime", config.lifetime},
    });
}

// Aplica dano em todos os inimigos dentro do feixe, respeitando o intervalo por inimigo.
// O freeze_slow acompanha cada acerto; a duração cobre o intervalo entre ticks.
void TickBeam(BehaviorContext& context, const BeamBehaviorConfig& config) {
    WeaponInstance& weapon = context.weapon;
    if (!weapon.beamAimPoint.has_value()) {
        return;
    }

    Vector2 direction = Vector2Subtract(*weapon.beamAimPoint, context.ownerPosition);
    if (Vector2LengthSqr(direction) <= 1e-6f) {
        direction = Vector2{1.0f, 0.0f};
    }
    direction = Vector2Normalize(direction);
    const Vector2 beamEnd = Vector2Add(context.ownerPosition, Vector2Scale(direction, config.beamRange));
    const float hitInterval = (config.tickRate > 0.0f) ? 1.0f / config.tickRate : 0.0f;

    for (const EnemySnapshot& enemy : context.enemies) {
        if (!enemy.IsTargetable()) {
            continue;
        }
        if (!IsPointInBeam(enemy.position, context.ownerPosition, beamEnd, config.beamWidth)) {
            continue;
        }
        if (!weapon.hitTracker.CanHit(enemy.id, context.nowSeconds, hitInterval)) {
            continue;
        }

        weapon.hitTracker.RecordHit(enemy.id, context.nowSeconds);
        context.ports.EmitDamage(enemy.id, weapon.stats.damage, weapon.Id(), enemy.position);
        context.ports.EmitEffect("freeze_slow", enemy.position, EffectParams{
            {"enemyId", static_cast<float>(enemy.id)},
            {"slowFactor", config.slowFactor},
            {"duration", config.slowDuration},
        });
    }
}

// Explosão final do vórtice: acontece uma única vez, no tick em que a vida chega a zero.
void ImplodeVortex(BehaviorContext& context, const VortexBehaviorConfig& config, const VortexState& vortex) {
    const WeaponInstance& weapon = context.weapon;
    const float burst = weapon.stats.damage * config.implosionMultiplier;
    int victims = 0;

    for (const EnemySnapshot& enemy : context.enemies) {
        if (!enemy.IsTargetable()) {
            continue;
        }
        if (Vector2Distance(vortex.position, enemy.position) > config.implosionRadius) {
            continue;
        }
        context.ports.EmitDamage(enemy.id, burst, weapon.Id(), enemy.position);
        ++victims;
    }

    context.ports.EmitEffect("vortex_implosion", vortex.position, EffectParams{
        {"radius", config.implosionRadius},
        {"damage", burst},
        {"victims", static_cast<float>(victims)},
    });
}

void TickVortex(BehaviorContext& context, const VortexBehaviorConfig& config) {
    WeaponInstance& weapon = context.weapon;
    const float hitInterval = (config.tickRate > 0.0f) ? 1.0f / config.tickRate : 0.0f;

    for (VortexState& vortex : weapon.vortices) {
        for (const EnemySnapshot& enemy : context.enemies) {
            if (!enemy.IsTargetable()) {
                continue;
            }

            Vector2 toCenter = Vector2Subtract(vortex.position, enemy.position);
            float distance = Vector2Length(toCenter);
            if (distance >= config.vortexRadius) {
                continue;
            }

            // Só sinaliza o puxão; quem move o inimigo é o chamador.
            Vector2 pullDir = (distance > 1e-4f) ? Vector2Scale(toCenter, 1.0f / distance) : Vector2{0.0f, 0.0f};
            context.ports.EmitEffect("vortex_pull", enemy.position, EffectParams{
                {"enemyId", static_cast<float>(enemy.id)},
                {"strength", config.pullStrength * (1.0f - distance / config.vortexRadius)},
                {"dirX", pullDir.x},
                {"dirY", pullDir.y},
            });

            if (distance >= config.damageRadius) {
                continue;
            }
            if (!weapon.hitTracker.CanHit(enemy.id, context.nowSeconds, hitInterval)) {
                continue;
            }

            float damage = weapon.stats.damage * (1.0f + config.centerDamageBonus * (1.0f - distance / config.damageRadius));
            weapon.hitTracker.RecordHit(enemy.id, context.nowSeconds);
            context.ports.EmitDamage(enemy.id, damage, weapon.Id(), enemy.position);
            context.ports.EmitEffect("vortex_damage", enemy.position, EffectParams{{"damage", damage}});
        }
    }

    std::vector<VortexState> survivors;
    survivors.reserve(weapon.vortices.size());
    for (VortexState& vortex : weapon.vortices) {
        vortex.remainingLifetime -= context.deltaSeconds;
        if (vortex.remainingLifetime <= 0.0f) {
            ImplodeVortex(context, config, vortex);
            continue;
        }
        survivors.push_back(vortex);
    }
    weapon.vortices = std::move(survivors);
}

} // namespace

bool IsPointInBeam(Vector2 point, Vector2 beamStart, Vector2 beamEnd, float beamWidth) {
    return DistancePointToSegment(point, beamStart, beamEnd) <= beamWidth * 0.5f;
}

void FireWeaponBehavior(BehaviorContext& context) {
    if (context.weapon.definition == nullptr) {
        return;
    }

    const WeaponBehaviorConfig& behavior = context.weapon.definition->behavior;
    switch (GetBehaviorType(behavior)) {
        case WeaponBehaviorType::Standard:
            FireStandard(context, std::get<StandardBehaviorConfig>(behavior));
            break;
        case WeaponBehaviorType::Spread:
            FireSpread(context);
            break;
        case WeaponBehaviorType::Homing:
            FireHoming(context, std::get<HomingBehaviorConfig>(behavior));
            break;
        case WeaponBehaviorType::Orbital:
            FireOrbital(context, std::get<OrbitalBehaviorConfig>(behavior));
            break;
        case WeaponBehaviorType::Chain:
            FireChain(context, std::get<ChainBehaviorConfig>(behavior));
            break;
        case WeaponBehaviorType::Area:
            FireArea(context, std::get<AreaBehaviorConfig>(behavior));
            break;
        case WeaponBehaviorType::Beam:
            FireBeam(context, std::get<BeamBehaviorConfig>(behavior));
            break;
        case WeaponBehaviorType::Vortex:
            FireVortex(context, std::get<VortexBehaviorConfig>(behavior));
            break;
    }
}

void TickWeaponBehavior(BehaviorContext& context) {
    if (context.weapon.definition == nullptr) {
        return;
    }

    const WeaponBehaviorConfig& behavior = context.weapon.definition->behavior;
    switch (GetBehaviorType(behavior)) {
        case WeaponBehaviorType::Orbital: {
            const auto& config = std::get<OrbitalBehaviorConfig>(behavior);
            context.weapon.orbitalAngle += config.orbitSpeedDegrees * DEG2RAD * context.deltaSeconds;
            break;
        }
        case WeaponBehaviorType::Beam:
            TickBeam(context, std::get<BeamBehaviorConfig>(behavior));
            break;
        case WeaponBehaviorType::Vortex:
            TickVortex(context, std::get<VortexBehaviorConfig>(behavior));
            break;
        default:
            break;
    }
}
