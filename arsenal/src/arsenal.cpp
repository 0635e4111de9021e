#include "arsenal.h"

#include "weapon_behaviors.h"

#include <algorithm>
#include <iostream>

WeaponArsenal::WeaponArsenal(const ArsenalConfig& config)
    : config_(config),
      projectiles_(config.projectileHitRadius),
      rng_(config.rngSeed.has_value() ? *config.rngSeed : std::random_device{}()) {}

bool WeaponArsenal::AddWeapon(const std::string& weaponId) {
    if (HasWeapon(weaponId)) {
        return UpgradeWeapon(weaponId);
    }

    if (static_cast<int>(weapons_.size()) >= config_.maxWeapons) {
        std::cerr << "[Arsenal] Arsenal cheio, nao foi possivel adicionar " << weaponId
                  << " (max " << config_.maxWeapons << ")" << std::endl;
        return false;
    }

    std::shared_ptr<const WeaponDefinition> definition = catalog_.Find(weaponId);
    if (definition == nullptr) {
        std::cerr << "[Arsenal] Arma desconhecida: " << weaponId << std::endl;
        return false;
    }

    weapons_.push_back(std::make_unique<WeaponInstance>(MakeWeaponInstance(definition, kMinWeaponLevel)));

    if (config_.verboseLogging) {
        std::cout << "[Arsenal] Arma adicionada: " << definition->name << " (nivel 1)" << std::endl;
    }
    return true;
}

bool WeaponArsenal::UpgradeWeapon(const std::string& weaponId) {
    auto it = std::find_if(weapons_.begin(), weapons_.end(), [&weaponId](const std::unique_ptr<WeaponInstance>& weapon) {
        return weapon->Id() == weaponId;
    });
    if (it == weapons_.end()) {
        std::cerr << "[Arsenal] Upgrade ignorado, arma nao possuida: " << weaponId << std::endl;
        return false;
    }

    const WeaponInstance& current = **it;
    if (current.level >= kMaxWeaponLevel) {
        std::cerr << "[Arsenal] Upgrade ignorado, " << weaponId << " ja esta no nivel maximo" << std::endl;
        return false;
    }

    // Nova instância; só o estado runtime explícito é carregado da antiga.
    auto upgraded = std::make_unique<WeaponInstance>(MakeWeaponInstance(current.definition, current.level + 1));
    upgraded->cooldown = current.cooldown;
    upgraded->orbitalAngle = current.orbitalAngle;
    upgraded->areaTargets = current.areaTargets;

    const int newLevel = upgraded->level;
    RetireInstance(std::move(*it));
    *it = std::move(upgraded);

    if (config_.verboseLogging) {
        std::cout << "[Arsenal] Upgrade: " << weaponId << " -> nivel " << newLevel << std::endl;
    }
    return true;
}

bool WeaponArsenal::RemoveWeapon(const std::string& weaponId) {
    auto it = std::find_if(weapons_.begin(), weapons_.end(), [&weaponId](const std::unique_ptr<WeaponInstance>& weapon) {
        return weapon->Id() == weaponId;
    });
    if (it == weapons_.end()) {
        return false;
    }

    RetireInstance(std::move(*it));
    weapons_.erase(it);
    projectiles_.RemoveByWeapon(weaponId);
    return true;
}

void WeaponArsenal::RegisterWeapon(const WeaponDefinition& definition) {
    catalog_.Register(definition);
}

void WeaponArsenal::Update(float deltaSeconds, Vector2 ownerPosition, const std::vector<EnemySnapshot>& enemies) {
    if (updating_) {
        std::cerr << "[Arsenal] Update chamado de dentro de um callback, ignorado" << std::endl;
        return;
    }
    updating_ = true;
    elapsedSeconds_ += static_cast<double>(deltaSeconds);
    ownerPosition_ = ownerPosition;

    // Fotografia dos slots: armas adicionadas por callbacks só disparam no próximo quadro.
    std::vector<WeaponInstance*> frameWeapons;
    frameWeapons.reserve(weapons_.size());
    for (auto& weapon : weapons_) {
        frameWeapons.push_back(weapon.get());
    }

    for (WeaponInstance* weapon : frameWeapons) {
        if (!OwnsInstance(weapon)) {
            continue;
        }
        BehaviorContext context{*weapon,
                                ownerPosition,
                                enemies,
                                projectiles_,
                                ports_,
                                rng_,
                                elapsedSeconds_,
                                deltaSeconds,
                                config_.defaultProjectileLifetime};

        if (weapon->TickCooldown(deltaSeconds)) {
            FireWeaponBehavior(context);
            weapon->ResetCooldown();
            // Removida no meio do disparo: descarta o que ela acabou de lançar.
            if (!HasWeapon(weapon->Id())) {
                projectiles_.RemoveByWeapon(weapon->Id());
            }
        }
    }

    for (WeaponInstance* weapon : frameWeapons) {
        if (!OwnsInstance(weapon)) {
            continue;
        }
        BehaviorContext context{*weapon,
                                ownerPosition,
                                enemies,
                                projectiles_,
                                ports_,
                                rng_,
                                elapsedSeconds_,
                                deltaSeconds,
                                config_.defaultProjectileLifetime};
        TickWeaponBehavior(context);
    }

    projectiles_.Update(deltaSeconds, ownerPosition, enemies, ports_);

    updating_ = false;
    retired_.clear();
}

int WeaponArsenal::GetWeaponLevel(const std::string& weaponId) const {
    const WeaponInstance* weapon = FindWeapon(weaponId);
    return (weapon != nullptr) ? weapon->level : 0;
}

std::vector<const WeaponInstance*> WeaponArsenal::GetActiveWeapons() const {
    std::vector<const WeaponInstance*> active;
    active.reserve(weapons_.size());
    for (const auto& weapon : weapons_) {
        active.push_back(weapon.get());
    }
    return active;
}

void WeaponArsenal::Reset() {
    for (auto& weapon : weapons_) {
        RetireInstance(std::move(weapon));
    }
    weapons_.clear();
    projectiles_.Clear();
    elapsedSeconds_ = 0.0;
}

std::vector<LoadoutEntry> WeaponArsenal::ExportLoadout() const {
    std::vector<LoadoutEntry> loadout;
    loadout.reserve(weapons_.size());
    for (const auto& weapon : weapons_) {
        loadout.emplace_back(weapon->Id(), weapon->level);
    }
    return loadout;
}

void WeaponArsenal::RestoreLoadout(const std::vector<LoadoutEntry>& loadout) {
    Reset();
    for (const LoadoutEntry& entry : loadout) {
        if (!AddWeapon(entry.first)) {
            continue;
        }
        while (GetWeaponLevel(entry.first) < std::min(entry.second, kMaxWeaponLevel)) {
            if (!UpgradeWeapon(entry.first)) {
                break;
            }
        }
    }
}

WeaponInstance* WeaponArsenal::FindWeapon(const std::string& weaponId) {
    for (auto& weapon : weapons_) {
        if (weapon->Id() == weaponId) {
            return weapon.get();
        }
    }
    return nullptr;
}

const WeaponInstance* WeaponArsenal::FindWeapon(const std::string& weaponId) const {
    for (const auto& weapon : weapons_) {
        if (weapon->Id() == weaponId) {
            return weapon.get();
        }
    }
    return nullptr;
}

bool WeaponArsenal::OwnsInstance(const WeaponInstance* weapon) const {
    for (const auto& owned : weapons_) {
        if (owned.get() == weapon) {
            return true;
        }
    }
    return false;
}

void WeaponArsenal::RetireInstance(std::unique_ptr<WeaponInstance> weapon) {
    if (updating_ && weapon != nullptr) {
        retired_.push_back(std::move(weapon));
    }
}
