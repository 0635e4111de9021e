#pragma once

#include "combat_ports.h"
#include "projectile.h"
#include "weapon.h"

#include <random>
#include <vector>

// Tudo que um comportamento precisa para disparar ou atualizar uma arma neste quadro.
struct BehaviorContext {
    WeaponInstance& weapon;
    Vector2 ownerPosition{};
    const std::vector<EnemySnapshot>& enemies;
    ProjectileSystem& projectiles;
    const CombatPorts& ports;
    std::mt19937& rng;
    double nowSeconds{0.0}; // tempo de simulação acumulado
    float deltaSeconds{0.0f};
    float defaultProjectileLifetime{3.0f};
};

// Executa o passo de disparo do comportamento da arma (chamado quando o cooldown zera).
void FireWeaponBehavior(BehaviorContext& context);

// Atualização contínua por quadro (órbita, feixe, vórtices). Não faz nada para os demais.
void TickWeaponBehavior(BehaviorContext& context);

// Teste ponto-no-feixe: projeta o ponto no segmento (t limitado a [0,1]) e compara
// a distância perpendicular com metade da largura.
bool IsPointInBeam(Vector2 point, Vector2 beamStart, Vector2 beamEnd, float beamWidth);
