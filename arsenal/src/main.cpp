#include "raymath.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "arsenal.h"
#include "weapon_evolution.h"

namespace {

// Passo fixo da simulação (60 quadros por segundo).
constexpr float SIM_STEP_SECONDS = 1.0f / 60.0f;

// Anel onde os inimigos surgem em volta do jogador.
constexpr float SPAWN_RING_RADIUS = 420.0f;
constexpr float SPAWN_INTERVAL_SECONDS = 0.35f;
constexpr float ENEMY_MAX_HEALTH = 60.0f;
constexpr float ENEMY_SPEED = 70.0f;
constexpr float ENEMY_CONTACT_RADIUS = 24.0f;

// Intervalo entre "level ups" do jogador no roteiro da arena.
constexpr float LEVEL_UP_INTERVAL_SECONDS = 6.0f;

// Inimigo da arena de teste; o motor só enxerga o EnemySnapshot correspondente.
struct ArenaEnemy {
    int id{0};
    Vector2 position{};
    float health{ENEMY_MAX_HEALTH};
    float slowFactor{1.0f};
    float slowTimer{0.0f};
    Vector2 pendingPull{};
};

struct WeaponReport {
    float damage{0.0f};
    int hits{0};
    int kills{0};
};

// Ordem em que o roteiro entrega armas/upgrades ao jogador.
const std::vector<std::string> kAcquisitionOrder{
    "basic_laser", "spread_shot", "orbital_shield", "lightning", "homing_missiles", "void_vortex", "flamethrower",
};

std::vector<EnemySnapshot> BuildSnapshots(const std::vector<ArenaEnemy>& enemies) {
    std::vector<EnemySnapshot> snapshots;
    snapshots.reserve(enemies.size());
    for (const ArenaEnemy& enemy : enemies) {
        snapshots.push_back(EnemySnapshot{enemy.id, enemy.position, enemy.health, enemy.health > 0.0f});
    }
    return snapshots;
}

// Arma base que já virou a forma evoluída não volta ao roteiro.
bool WasEvolvedAway(const WeaponEvolution& evolution, const std::string& weaponId) {
    for (const EvolutionRecipe& recipe : evolution.GetRecipes()) {
        if (recipe.baseWeaponId == weaponId && evolution.HasEvolved(recipe.evolvedWeaponId)) {
            return true;
        }
    }
    return false;
}

// Próxima arma ou upgrade do roteiro: adiciona a primeira ausente, senão sobe a de menor nível.
void GrantLevelUp(WeaponArsenal& arsenal, const WeaponEvolution& evolution) {
    for (const std::string& weaponId : kAcquisitionOrder) {
        if (WasEvolvedAway(evolution, weaponId)) {
            continue;
        }
        if (!arsenal.HasWeapon(weaponId) && static_cast<int>(arsenal.GetWeaponCount()) < arsenal.GetMaxWeapons()) {
            if (arsenal.AddWeapon(weaponId)) {
                return;
            }
        }
    }

    const WeaponInstance* lowest = nullptr;
    for (const WeaponInstance* weapon : arsenal.GetActiveWeapons()) {
        if (weapon->level < kMaxWeaponLevel && (lowest == nullptr || weapon->level < lowest->level)) {
            lowest = weapon;
        }
    }
    if (lowest != nullptr && !arsenal.UpgradeWeapon(lowest->Id())) {
        std::cerr << "[Sandbox] Upgrade falhou: " << lowest->Id() << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    const float durationSeconds = (argc > 1) ? static_cast<float>(std::atof(argv[1])) : 60.0f;
    const unsigned int seed = (argc > 2) ? static_cast<unsigned int>(std::strtoul(argv[2], nullptr, 10)) : 1337u;

    ArsenalConfig config{};
    config.rngSeed = seed;
    config.verboseLogging = true;

    WeaponArsenal arsenal{config};
    WeaponEvolution evolution;
    evolution.RegisterEvolvedWeapons(arsenal);

    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> angleDist(0.0f, 2.0f * PI);

    std::vector<ArenaEnemy> enemies;
    std::unordered_map<int, std::size_t> enemyIndex;
    std::map<std::string, WeaponReport> reports;
    int nextEnemyId = 1;
    int playerContacts = 0;
    const Vector2 playerPosition{0.0f, 0.0f};

    // Dano é aplicado direto na arena; o motor só informa.
    arsenal.SetDamageCallback([&](int enemyId, float amount, const std::string& weaponId, Vector2) {
        auto it = enemyIndex.find(enemyId);
        if (it == enemyIndex.end()) {
            return;
        }
        ArenaEnemy& enemy = enemies[it->second];
        if (enemy.health <= 0.0f) {
            return;
        }
        WeaponReport& report = reports[weaponId];
        report.damage += amount;
        report.hits += 1;
        enemy.health -= amount;
        if (enemy.health <= 0.0f) {
            report.kills += 1;
        }
    });

    arsenal.SetEffectCallback([&](const std::string& kind, float, float, const EffectParams& params) {
        if (kind != "vortex_pull" && kind != "freeze_slow") {
            return;
        }
        auto idIt = params.find("enemyId");
        if (idIt == params.end()) {
            return;
        }
        auto it = enemyIndex.find(static_cast<int>(idIt->second));
        if (it == enemyIndex.end()) {
            return;
        }
        ArenaEnemy& enemy = enemies[it->second];
        if (kind == "freeze_slow") {
            enemy.slowFactor = params.at("slowFactor");
            enemy.slowTimer = params.at("duration");
        } else {
            Vector2 dir{params.at("dirX"), params.at("dirY")};
            enemy.pendingPull = Vector2Add(enemy.pendingPull, Vector2Scale(dir, params.at("strength")));
        }
    });

    GrantLevelUp(arsenal, evolution);

    float spawnTimer = 0.0f;
    float levelUpTimer = 0.0f;
    const int totalSteps = static_cast<int>(durationSeconds / SIM_STEP_SECONDS);

    for (int step = 0; step < totalSteps; ++step) {
        spawnTimer += SIM_STEP_SECONDS;
        while (spawnTimer >= SPAWN_INTERVAL_SECONDS) {
            spawnTimer -= SPAWN_INTERVAL_SECONDS;
            float angle = angleDist(rng);
            ArenaEnemy enemy{};
            enemy.id = nextEnemyId++;
            enemy.position = Vector2{std::cos(angle) * SPAWN_RING_RADIUS, std::sin(angle) * SPAWN_RING_RADIUS};
            enemyIndex[enemy.id] = enemies.size();
            enemies.push_back(enemy);
        }

        levelUpTimer += SIM_STEP_SECONDS;
        if (levelUpTimer >= LEVEL_UP_INTERVAL_SECONDS) {
            levelUpTimer -= LEVEL_UP_INTERVAL_SECONDS;
            GrantLevelUp(arsenal, evolution);

            PassiveLevels passives{{"damage_boost", 3}, {"extra_projectile", 3}, {"piercing", 1}};
            for (const EvolutionRecipe* recipe : evolution.GetAvailableEvolutions(arsenal, passives)) {
                if (evolution.Evolve(arsenal, recipe->id, passives)) {
                    std::cout << "[Sandbox] Evolucao: " << recipe->evolutionName << std::endl;
                }
            }
        }

        arsenal.Update(SIM_STEP_SECONDS, playerPosition, BuildSnapshots(enemies));

        // Movimento dos inimigos: caminham até o jogador, somando puxões de vórtice.
        for (ArenaEnemy& enemy : enemies) {
            if (enemy.health <= 0.0f) {
                continue;
            }
            Vector2 toPlayer = Vector2Subtract(playerPosition, enemy.position);
            float distance = Vector2Length(toPlayer);
            if (distance <= ENEMY_CONTACT_RADIUS) {
                ++playerContacts;
                enemy.health = 0.0f;
                continue;
            }
            float speed = ENEMY_SPEED * ((enemy.slowTimer > 0.0f) ? enemy.slowFactor : 1.0f);
            Vector2 walk = Vector2Scale(toPlayer, speed / distance);
            Vector2 velocity = Vector2Add(walk, enemy.pendingPull);
            enemy.position = Vector2Add(enemy.position, Vector2Scale(velocity, SIM_STEP_SECONDS));
            enemy.pendingPull = Vector2{0.0f, 0.0f};
            enemy.slowTimer = std::max(0.0f, enemy.slowTimer - SIM_STEP_SECONDS);
        }
    }

    std::cout << "\n[Sandbox] " << durationSeconds << "s, seed " << seed << ", " << (nextEnemyId - 1)
              << " inimigos, " << playerContacts << " contatos\n";
    std::cout << std::left << std::setw(18) << "arma" << std::setw(8) << "nivel" << std::setw(12) << "dano"
              << std::setw(8) << "hits" << "kills\n";
    for (const auto& pair : reports) {
        std::cout << std::left << std::setw(18) << pair.first << std::setw(8) << arsenal.GetWeaponLevel(pair.first)
                  << std::setw(12) << std::fixed << std::setprecision(1) << pair.second.damage << std::setw(8)
                  << pair.second.hits << pair.second.kills << "\n";
    }
    std::cout << std::flush;
    return 0;
}
