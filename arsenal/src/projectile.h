#pragma once

#include "combat_ports.h"

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

using ProjectileId = std::uint32_t;

// Campos usados apenas por projéteis orbitais.
struct OrbitalMotion {
    float angle{0.0f}; // radianos
    float radius{80.0f};
    float angularSpeed{0.0f}; // radianos por segundo
    Vector2 ownerPosition{0.0f, 0.0f}; // posição do dono no último quadro
};

// Registro de simulação de um projétil vivo. Não conhece sprites: a camada
// visual externa cria/posiciona a representação pelo id.
struct Projectile {
    ProjectileId id{0};
    std::string weaponId{};
    Vector2 position{0.0f, 0.0f};
    Vector2 velocity{0.0f, 0.0f};
    float speed{0.0f}; // módulo usado pelos mísseis ao girar
    float damage{0.0f}; // fotografia do dano no disparo
    int pierceBudget{0};
    float remainingLifetime{3.0f};
    std::unordered_set<int> hitEnemyIds{};
    std::optional<int> homingTargetId{};
    float turnSpeed{0.0f};
    std::optional<OrbitalMotion> orbital{};

    bool IsOrbital() const { return orbital.has_value(); }
    bool IsHoming() const { return homingTargetId.has_value(); }
};

// Sistema responsável por mover projéteis, detectar colisões e remover expirados.
class ProjectileSystem {
public:
    explicit ProjectileSystem(float hitRadius = 20.0f);

    ProjectileSystem(const ProjectileSystem&) = delete;
    ProjectileSystem& operator=(const ProjectileSystem&) = delete;

    // Adiciona o projétil e devolve o id atribuído. Durante Update entra na lista ao final da varredura.
    ProjectileId Spawn(Projectile projectile);

    // Avança vida, movimento e colisões; remove expirados/esgotados ao final.
    // Callbacks disparados aqui podem chamar Spawn/RemoveByWeapon/Clear: as mudanças valem ao fim da varredura.
    void Update(float deltaSeconds,
                Vector2 ownerPosition,
                const std::vector<EnemySnapshot>& enemies,
                const CombatPorts& ports);

    // Descarta todos os projéteis da arma, independente da vida restante.
    // Durante Update os projéteis da arma param de colidir na hora e saem ao fim da varredura.
    std::size_t RemoveByWeapon(const std::string& weaponId);
    std::size_t CountByWeapon(const std::string& weaponId, bool orbitalOnly = false) const;
    void ForEachOrbital(const std::string& weaponId, const std::function<void(Projectile&)>& fn);

    void Clear();

    const std::vector<Projectile>& GetProjectiles() const { return projectiles_; }
    std::size_t Size() const { return projectiles_.size(); }
    float GetHitRadius() const { return hitRadius_; }

private:
    void MoveOrbital(Projectile& projectile, Vector2 ownerPosition, float deltaSeconds) const;
    void MoveHoming(Projectile& projectile, float deltaSeconds, const std::vector<EnemySnapshot>& enemies) const;
    // Retorna true se o projétil deve ser removido (perfuração esgotada).
    bool ResolveCollisions(Projectile& projectile, const std::vector<EnemySnapshot>& enemies, const CombatPorts& ports) const;
    bool IsPurged(const Projectile& projectile) const;
    void ApplyPendingChanges(const std::vector<bool>& removeFlags);

    // Lista ativa de projéteis em voo.
    std::vector<Projectile> projectiles_{};
    ProjectileId nextId_{1};
    float hitRadius_{20.0f};

    // Mudanças pedidas por callbacks enquanto Update percorre a lista.
    bool updating_{false};
    bool pendingClear_{false};
    std::unordered_set<std::string> pendingPurges_{};
    std::vector<Projectile> pendingSpawns_{};
};

constexpr float kInfiniteLifetime = std::numeric_limits<float>::infinity();
