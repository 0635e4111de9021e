#include "projectile.h"

#include "targeting.h"

#include <algorithm>
#include <cmath>

namespace {

constexpr float kTwoPi = 2.0f * PI;

// Normaliza ângulo para (-PI, PI], usado para achar o menor giro assinado.
float WrapAngle(float angle) {
    while (angle > PI) angle -= kTwoPi;
    while (angle < -PI) angle += kTwoPi;
    return angle;
}

const EnemySnapshot* FindEnemyById(int id, const std::vector<EnemySnapshot>& enemies) {
    for (const EnemySnapshot& enemy : enemies) {
        if (enemy.id == id) {
            return &enemy;
        }
    }
    return nullptr;
}

} // namespace

ProjectileSystem::ProjectileSystem(float hitRadius) : hitRadius_(hitRadius) {}

ProjectileId ProjectileSystem::Spawn(Projectile projectile) {
    projectile.id = nextId_++;
    projectile.pierceBudget = std::max(projectile.pierceBudget, 0);
    const ProjectileId id = projectile.id;
    if (updating_) {
        pendingSpawns_.push_back(std::move(projectile));
    } else {
        projectiles_.push_back(std::move(projectile));
    }
    return id;
}

// Atualiza todos os projéteis ativos e limpa, numa única varredura, os que expiraram ou esgotaram a perfuração.
// A lista não muda de tamanho durante o laço; as referências continuam válidas entre callbacks.
void ProjectileSystem::Update(float deltaSeconds,
                              Vector2 ownerPosition,
                              const std::vector<EnemySnapshot>& enemies,
                              const CombatPorts& ports) {
    std::vector<bool> removeFlags(projectiles_.size(), false);
    updating_ = true;

    for (std::size_t i = 0; i < projectiles_.size(); ++i) {
        Projectile& projectile = projectiles_[i];
        if (pendingClear_ || IsPurged(projectile)) {
            removeFlags[i] = true;
            continue;
        }

        projectile.remainingLifetime -= deltaSeconds;
        if (projectile.remainingLifetime <= 0.0f) {
            removeFlags[i] = true;
            continue;
        }

        if (projectile.IsOrbital()) {
            MoveOrbital(projectile, ownerPosition, deltaSeconds);
        } else if (projectile.IsHoming()) {
            MoveHoming(projectile, deltaSeconds, enemies);
        } else {
            projectile.position = Vector2Add(projectile.position, Vector2Scale(projectile.velocity, deltaSeconds));
        }

        if (ResolveCollisions(projectile, enemies, ports)) {
            removeFlags[i] = true;
        }
    }

    updating_ = false;
    ApplyPendingChanges(removeFlags);
}

void ProjectileSystem::ApplyPendingChanges(const std::vector<bool>& removeFlags) {
    if (pendingClear_) {
        projectiles_.clear();
    } else {
        std::size_t kept = 0;
        for (std::size_t i = 0; i < projectiles_.size(); ++i) {
            if (removeFlags[i] || IsPurged(projectiles_[i])) {
                continue;
            }
            if (kept != i) {
                projectiles_[kept] = std::move(projectiles_[i]);
            }
            ++kept;
        }
        projectiles_.resize(kept);
    }

    for (Projectile& projectile : pendingSpawns_) {
        projectiles_.push_back(std::move(projectile));
    }
    pendingSpawns_.clear();
    pendingPurges_.clear();
    pendingClear_ = false;
}

bool ProjectileSystem::IsPurged(const Projectile& projectile) const {
    return !pendingPurges_.empty() && pendingPurges_.count(projectile.weaponId) > 0;
}

// Orbitais nunca integram velocidade: posição recalculada a partir do dono atual.
void ProjectileSystem::MoveOrbital(Projectile& projectile, Vector2 ownerPosition, float deltaSeconds) const {
    OrbitalMotion& orbit = *projectile.orbital;
    orbit.angle += orbit.angularSpeed * deltaSeconds;
    orbit.ownerPosition = ownerPosition;
    projectile.position = Vector2{ownerPosition.x + std::cos(orbit.angle) * orbit.radius,
                                  ownerPosition.y + std::sin(orbit.angle) * orbit.radius};
}

// Gira a velocidade em direção ao alvo limitado por turnSpeed*dt; nunca encaixa direto no ângulo alvo.
void ProjectileSystem::MoveHoming(Projectile& projectile, float deltaSeconds, const std::vector<EnemySnapshot>& enemies) const {
    const EnemySnapshot* target = FindEnemyById(*projectile.homingTargetId, enemies);
    if (target == nullptr || !target->IsTargetable()) {
        target = FindClosestEnemy(projectile.position, enemies);
        if (target != nullptr) {
            projectile.homingTargetId = target->id;
        }
    }

    if (target != nullptr) {
        Vector2 toTarget = Vector2Subtract(target->position, projectile.position);
        float desiredAngle = std::atan2(toTarget.y, toTarget.x);
        float currentAngle = std::atan2(projectile.velocity.y, projectile.velocity.x);
        float maxTurn = projectile.turnSpeed * deltaSeconds;
        float turn = std::clamp(WrapAngle(desiredAngle - currentAngle), -maxTurn, maxTurn);
        float newAngle = currentAngle + turn;
        projectile.velocity = Vector2{std::cos(newAngle) * projectile.speed, std::sin(newAngle) * projectile.speed};
    }

    projectile.position = Vector2Add(projectile.position, Vector2Scale(projectile.velocity, deltaSeconds));
}

bool ProjectileSystem::ResolveCollisions(Projectile& projectile,
                                         const std::vector<EnemySnapshot>& enemies,
                                         const CombatPorts& ports) const {
    for (const EnemySnapshot& enemy : enemies) {
        if (projectile.hitEnemyIds.count(enemy.id) > 0 || !enemy.IsTargetable()) {
            continue;
        }

        if (Vector2Distance(projectile.position, enemy.position) >= hitRadius_) {
            continue;
        }

        ports.EmitDamage(enemy.id, projectile.damage, projectile.weaponId, projectile.position);
        projectile.hitEnemyIds.insert(enemy.id);
        ports.EmitEffect("hit_impact", projectile.position);

        // Arma removida ou lista limpa pelo callback: o projétil para de colidir.
        if (pendingClear_ || IsPurged(projectile)) {
            return true;
        }

        if (projectile.pierceBudget <= 0) {
            return true;
        }
        --projectile.pierceBudget;
    }

    return false;
}

std::size_t ProjectileSystem::RemoveByWeapon(const std::string& weaponId) {
    auto matches = [&weaponId](const Projectile& projectile) {
        return projectile.weaponId == weaponId;
    };

    const std::size_t spawnsBefore = pendingSpawns_.size();
    pendingSpawns_.erase(std::remove_if(pendingSpawns_.begin(), pendingSpawns_.end(), matches), pendingSpawns_.end());
    const std::size_t droppedSpawns = spawnsBefore - pendingSpawns_.size();

    if (updating_) {
        if (pendingClear_ || pendingPurges_.count(weaponId) > 0) {
            return droppedSpawns;
        }
        pendingPurges_.insert(weaponId);
        return droppedSpawns + static_cast<std::size_t>(std::count_if(projectiles_.begin(), projectiles_.end(), matches));
    }

    const std::size_t before = projectiles_.size();
    projectiles_.erase(std::remove_if(projectiles_.begin(), projectiles_.end(), matches), projectiles_.end());
    return droppedSpawns + (before - projectiles_.size());
}

std::size_t ProjectileSystem::CountByWeapon(const std::string& weaponId, bool orbitalOnly) const {
    auto matches = [&](const Projectile& projectile) {
        return projectile.weaponId == weaponId && (!orbitalOnly || projectile.IsOrbital());
    };
    std::size_t count = static_cast<std::size_t>(std::count_if(pendingSpawns_.begin(), pendingSpawns_.end(), matches));
    if (pendingClear_ || pendingPurges_.count(weaponId) > 0) {
        return count;
    }
    return count + static_cast<std::size_t>(std::count_if(projectiles_.begin(), projectiles_.end(), matches));
}

void ProjectileSystem::ForEachOrbital(const std::string& weaponId, const std::function<void(Projectile&)>& fn) {
    for (Projectile& projectile : projectiles_) {
        if (projectile.weaponId == weaponId && projectile.IsOrbital()) {
            fn(projectile);
        }
    }
}

// Remove instantaneamente todos os projéteis, usado ao reiniciar a run.
void ProjectileSystem::Clear() {
    pendingSpawns_.clear();
    if (updating_) {
        pendingClear_ = true;
        return;
    }
    projectiles_.clear();
}
