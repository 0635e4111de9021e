#include "weapon_blueprints.h"

// Tweak weapon balance here: each definition is the level-1 baseline.
// - damage/fireRate/projectileSpeed/projectileCount/spread: stats base antes da tabela de upgrade.
// - piercing: projéteis atravessam 3 inimigos (+ bônus do nível) antes de sumir.
// - behavior: parametros especificos do comportamento (raio de orbita, saltos, cone, etc.).

namespace {

// Laser básico: mira no inimigo mais próximo, cadência alta.
WeaponDefinition MakeBasicLaserDefinition() {
    WeaponDefinition definition{};
    definition.id = "basic_laser";
    definition.name = "Basic Laser";
    definition.description = "A reliable energy bolt that targets the closest enemy. Fast and accurate.";
    definition.baseDamage = 8.0f;
    definition.baseFireRate = 3.0f; // 3 shots per second
    definition.baseProjectileSpeed = 600.0f;
    definition.baseProjectileCount = 1;
    definition.baseSpread = 0.0f;
    definition.piercing = false;
    definition.homing = false;
    definition.behavior = StandardBehaviorConfig{};
    return definition;
}

// Leque de pelotas para controle de multidão.
WeaponDefinition MakeSpreadShotDefinition() {
    WeaponDefinition definition{};
    definition.id = "spread_shot";
    definition.name = "Spread Shot";
    definition.description = "Fires a burst of energy pellets in a wide arc. Great for crowd control.";
    definition.baseDamage = 5.0f;
    definition.baseFireRate = 1.5f;
    definition.baseProjectileSpeed = 450.0f;
    definition.baseProjectileCount = 5;
    definition.baseSpread = 30.0f; // total arc in degrees
    definition.behavior = SpreadBehaviorConfig{};
    return definition;
}

// Mísseis lentos que perseguem o alvo.
WeaponDefinition MakeHomingMissilesDefinition() {
    HomingBehaviorConfig homing{};
    homing.turnSpeed = 5.0f;
    homing.maxLifetime = 5.0f;

    WeaponDefinition definition{};
    definition.id = "homing_missiles";
    definition.name = "Homing Missiles";
    definition.description = "Smart missiles that seek out enemies. Slower but never miss.";
    definition.baseDamage = 15.0f;
    definition.baseFireRate = 0.8f;
    definition.baseProjectileSpeed = 250.0f;
    definition.baseProjectileCount = 1;
    definition.homing = true;
    definition.behavior = homing;
    return definition;
}

// Orbes persistentes girando em volta do jogador.
WeaponDefinition MakeOrbitalShieldDefinition() {
    OrbitalBehaviorConfig orbital{};
    orbital.orbitRadius = 80.0f;
    orbital.maxOrbitals = 8;
    orbital.orbitSpeedDegrees = 180.0f;

    WeaponDefinition definition{};
    definition.id = "orbital_shield";
    definition.name = "Orbital Shield";
    definition.description = "Energy orbs that circle around you, damaging enemies on contact.";
    definition.baseDamage = 12.0f;
    definition.baseFireRate = 0.5f; // spawns new orbs slowly
    definition.baseProjectileSpeed = 0.0f; // orbitals never integrate velocity
    definition.baseProjectileCount = 3;
    definition.baseSpread = 120.0f; // 360/3
    definition.piercing = true;
    definition.behavior = orbital;
    return definition;
}

// Raio instantâneo que encadeia em inimigos próximos.
WeaponDefinition MakeLightningDefinition() {
    ChainBehaviorConfig chain{};
    chain.chainCount = 3;
    chain.chainRange = 150.0f;
    chain.chainDamageDecay = 0.7f;

    WeaponDefinition definition{};
    definition.id = "lightning";
    definition.name = "Lightning";
    definition.description = "Electric bolt that instantly strikes and chains to nearby enemies.";
    definition.baseDamage = 20.0f;
    definition.baseFireRate = 0.6f;
    definition.baseProjectileSpeed = 0.0f; // instant
    definition.baseProjectileCount = 1;
    definition.piercing = true;
    definition.behavior = chain;
    return definition;
}

// Dano contínuo em cone de curto alcance.
WeaponDefinition MakeFlamethrowerDefinition() {
    AreaBehaviorConfig area{};
    area.range = 120.0f;
    area.coneAngleDegrees = 45.0f;
    area.facingDegrees = 0.0f;

    WeaponDefinition definition{};
    definition.id = "flamethrower";
    definition.name = "Flamethrower";
    definition.description = "Engulfs nearby enemies in flames. Short range but devastating.";
    definition.baseDamage = 4.0f; // per tick
    definition.baseFireRate = 10.0f; // ticks per second
    definition.baseProjectileCount = 1;
    definition.baseSpread = 45.0f;
    definition.piercing = true;
    definition.behavior = area;
    return definition;
}

// Singularidade que puxa inimigos e implode.
WeaponDefinition MakeVoidVortexDefinition() {
    VortexBehaviorConfig vortex{};
    vortex.vortexRadius = 160.0f;
    vortex.damageRadius = 60.0f;
    vortex.implosionRadius = 120.0f;
    vortex.lifetime = 3.0f;
    vortex.maxVortices = 2;
    vortex.placementRange = 300.0f;
    vortex.tickRate = 4.0f;
    vortex.pullStrength = 220.0f;
    vortex.centerDamageBonus = 1.0f;
    vortex.implosionMultiplier = 3.0f;

    WeaponDefinition definition{};
    definition.id = "void_vortex";
    definition.name = "Void Vortex";
    definition.description = "Opens a singularity over the thickest crowd, then collapses it.";
    definition.baseDamage = 6.0f;
    definition.baseFireRate = 0.4f;
    definition.baseProjectileCount = 1;
    definition.behavior = vortex;
    return definition;
}

// Evolução do Basic Laser: feixe que atravessa tudo.
WeaponDefinition MakeDeathRayDefinition() {
    BeamBehaviorConfig beam{};
    beam.beamWidth = 12.0f;
    beam.beamRange = 800.0f;
    beam.tickRate = 10.0f; // one hit per enemy every 0.1s
    beam.slowFactor = 0.5f;
    beam.slowDuration = 0.5f;

    WeaponDefinition definition{};
    definition.id = "death_ray";
    definition.name = "Death Ray";
    definition.description = "A devastating beam that penetrates through ALL enemies. Nothing can stop it.";
    definition.baseDamage = 35.0f;
    definition.baseFireRate = 2.5f; // re-aim rate
    definition.baseProjectileSpeed = 1200.0f;
    definition.baseProjectileCount = 1;
    definition.piercing = true;
    definition.behavior = beam;
    return definition;
}

// Evolução do Spread Shot: 20 projéteis em círculo completo.
WeaponDefinition MakeBulletStormDefinition() {
    WeaponDefinition definition{};
    definition.id = "bullet_storm";
    definition.name = "Bullet Storm";
    definition.description = "Unleashes a storm of 20 projectiles, overwhelming enemies with sheer numbers.";
    definition.baseDamage = 8.0f;
    definition.baseFireRate = 1.0f;
    definition.baseProjectileSpeed = 600.0f;
    definition.baseProjectileCount = 20;
    definition.baseSpread = 360.0f;
    definition.behavior = SpreadBehaviorConfig{};
    return definition;
}

// Evolução dos Homing Missiles: curva muito mais rápida.
WeaponDefinition MakeSmartMissilesDefinition() {
    HomingBehaviorConfig homing{};
    homing.turnSpeed = 15.0f;
    homing.maxLifetime = 8.0f;

    WeaponDefinition definition{};
    definition.id = "smart_missiles";
    definition.name = "Smart Missiles";
    definition.description = "Advanced missiles with near-perfect tracking.";
    definition.baseDamage = 40.0f;
    definition.baseFireRate = 0.8f;
    definition.baseProjectileSpeed = 400.0f;
    definition.baseProjectileCount = 3;
    definition.baseSpread = 30.0f;
    definition.homing = true;
    definition.behavior = homing;
    return definition;
}

} // namespace

const WeaponDefinition& GetBasicLaserDefinition() {
    static const WeaponDefinition definition = MakeBasicLaserDefinition();
    return definition;
}

const WeaponDefinition& GetSpreadShotDefinition() {
    static const WeaponDefinition definition = MakeSpreadShotDefinition();
    return definition;
}

const WeaponDefinition& GetHomingMissilesDefinition() {
    static const WeaponDefinition definition = MakeHomingMissilesDefinition();
    return definition;
}

const WeaponDefinition& GetOrbitalShieldDefinition() {
    static const WeaponDefinition definition = MakeOrbitalShieldDefinition();
    return definition;
}

const WeaponDefinition& GetLightningDefinition() {
    static const WeaponDefinition definition = MakeLightningDefinition();
    return definition;
}

const WeaponDefinition& GetFlamethrowerDefinition() {
    static const WeaponDefinition definition = MakeFlamethrowerDefinition();
    return definition;
}

const WeaponDefinition& GetVoidVortexDefinition() {
    static const WeaponDefinition definition = MakeVoidVortexDefinition();
    return definition;
}

const WeaponDefinition& GetDeathRayDefinition() {
    static const WeaponDefinition definition = MakeDeathRayDefinition();
    return definition;
}

const WeaponDefinition& GetBulletStormDefinition() {
    static const WeaponDefinition definition = MakeBulletStormDefinition();
    return definition;
}

const WeaponDefinition& GetSmartMissilesDefinition() {
    static const WeaponDefinition definition = MakeSmartMissilesDefinition();
    return definition;
}

std::vector<WeaponDefinition> GetStockWeaponDefinitions() {
    return {
        GetBasicLaserDefinition(),
        GetSpreadShotDefinition(),
        GetHomingMissilesDefinition(),
        GetOrbitalShieldDefinition(),
        GetLightningDefinition(),
        GetFlamethrowerDefinition(),
        GetVoidVortexDefinition(),
    };
}

std::vector<WeaponDefinition> GetEvolvedWeaponDefinitions() {
    return {
        GetDeathRayDefinition(),
        GetBulletStormDefinition(),
        GetSmartMissilesDefinition(),
    };
}
