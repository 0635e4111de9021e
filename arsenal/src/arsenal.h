#pragma once

#include "combat_ports.h"
#include "projectile.h"
#include "weapon.h"
#include "weapon_catalog.h"

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

// Parâmetros do motor definidos pelo chamador na construção.
struct ArsenalConfig {
    int maxWeapons{6};
    float projectileHitRadius{20.0f};
    float defaultProjectileLifetime{3.0f};
    std::optional<unsigned int> rngSeed{}; // vazio = semente aleatória
    bool verboseLogging{false};
};

// Par (arma, nível) usado por camadas externas de save/load.
using LoadoutEntry = std::pair<std::string, int>;

// Gerencia o arsenal do jogador: aquisição, upgrades, disparo automático e projéteis.
// Instância explícita, sem estado global; Reset() reinicia a run.
class WeaponArsenal {
public:
    explicit WeaponArsenal(const ArsenalConfig& config = ArsenalConfig{});

    WeaponArsenal(const WeaponArsenal&) = delete;
    WeaponArsenal& operator=(const WeaponArsenal&) = delete;

    // Adiciona a arma no nível 1; se já possuída, faz upgrade. Falha se desconhecida ou arsenal cheio.
    bool AddWeapon(const std::string& weaponId);
    // Substitui a instância por uma nova no nível seguinte. Falha se não possuída ou já no nível 5.
    bool UpgradeWeapon(const std::string& weaponId);
    // Remove a arma e todos os projéteis dela.
    bool RemoveWeapon(const std::string& weaponId);
    // Add/Upgrade/Remove/Reset chamados de um callback durante Update valem na hora para consultas;
    // a instância substituída só é destruída ao fim do quadro e não dispara mais nele.
    void RegisterWeapon(const WeaponDefinition& definition);

    // Único ponto de entrada por quadro: cooldowns -> disparos -> ticks -> projéteis. Não é reentrante.
    void Update(float deltaSeconds, Vector2 ownerPosition, const std::vector<EnemySnapshot>& enemies);

    bool HasWeapon(const std::string& weaponId) const { return FindWeapon(weaponId) != nullptr; }
    const WeaponInstance* GetWeapon(const std::string& weaponId) const { return FindWeapon(weaponId); }
    int GetWeaponLevel(const std::string& weaponId) const;
    std::vector<const WeaponInstance*> GetActiveWeapons() const;
    std::size_t GetWeaponCount() const { return weapons_.size(); }

    const std::vector<Projectile>& GetProjectiles() const { return projectiles_.GetProjectiles(); }
    void ClearProjectiles() { projectiles_.Clear(); }
    void Reset();

    void SetMaxWeapons(int maxWeapons) { config_.maxWeapons = maxWeapons; }
    int GetMaxWeapons() const { return config_.maxWeapons; }

    void SetDamageCallback(DamageCallback callback) { ports_.SetDamageCallback(std::move(callback)); }
    void SetEffectCallback(EffectCallback callback) { ports_.SetEffectCallback(std::move(callback)); }
    const CombatPorts& GetPorts() const { return ports_; }

    std::vector<LoadoutEntry> ExportLoadout() const;
    // Reinicia e reconstrói o arsenal a partir dos pares; ids desconhecidos são ignorados.
    void RestoreLoadout(const std::vector<LoadoutEntry>& loadout);

    const WeaponCatalog& GetCatalog() const { return catalog_; }
    double GetElapsedSeconds() const { return elapsedSeconds_; }
    // Posição do dono recebida no último Update.
    Vector2 GetOwnerPosition() const { return ownerPosition_; }

private:
    WeaponInstance* FindWeapon(const std::string& weaponId);
    const WeaponInstance* FindWeapon(const std::string& weaponId) const;
    bool OwnsInstance(const WeaponInstance* weapon) const;
    // Tira a instância do slot; durante Update ela vai para retired_ até o fim do quadro.
    void RetireInstance(std::unique_ptr<WeaponInstance> weapon);

    ArsenalConfig config_{};
    WeaponCatalog catalog_{};
    // Armas na ordem de aquisição; o upgrade troca a instância no mesmo slot.
    std::vector<std::unique_ptr<WeaponInstance>> weapons_{};
    ProjectileSystem projectiles_;
    CombatPorts ports_{};
    std::mt19937 rng_;
    double elapsedSeconds_{0.0};
    Vector2 ownerPosition_{0.0f, 0.0f};
    bool updating_{false};
    std::vector<std::unique_ptr<WeaponInstance>> retired_{};
};
