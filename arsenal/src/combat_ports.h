#pragma once

#include "raymath.h"

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

// Estado de leitura de um inimigo fornecido pelo chamador a cada quadro.
struct EnemySnapshot {
    int id{0};
    Vector2 position{0.0f, 0.0f};
    float health{1.0f};
    bool active{true};

    // Inimigo pode ser alvo/atingido somente se ativo e com vida.
    bool IsTargetable() const { return active && health > 0.0f; }
};

// Parâmetros livres anexados a um efeito (ex.: targetX, intensity, enemyId).
using EffectParams = std::unordered_map<std::string, float>;

using DamageCallback = std::function<void(int enemyId, float amount, const std::string& weaponId, Vector2 position)>;
using EffectCallback = std::function<void(const std::string& kind, float x, float y, const EffectParams& params)>;

// Portas de saída do motor: dano aplicado e pistas visuais/sonoras.
// Nenhuma das duas retorna valor; o motor nunca espera resposta.
class CombatPorts {
public:
    void SetDamageCallback(DamageCallback callback) { onDamage_ = std::move(callback); }
    void SetEffectCallback(EffectCallback callback) { onEffect_ = std::move(callback); }

    void EmitDamage(int enemyId, float amount, const std::string& weaponId, Vector2 position) const {
        if (onDamage_) {
            onDamage_(enemyId, amount, weaponId, position);
        }
    }

    void EmitEffect(const std::string& kind, Vector2 position, const EffectParams& params = EffectParams{}) const {
        if (onEffect_) {
            onEffect_(kind, position.x, position.y, params);
        }
    }

private:
    DamageCallback onDamage_{};
    EffectCallback onEffect_{};
};
