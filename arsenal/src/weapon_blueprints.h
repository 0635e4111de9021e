#pragma once

#include "weapon.h"

#include <memory>
#include <vector>

// Armas iniciais disponíveis para aquisição.
const WeaponDefinition& GetBasicLaserDefinition();
const WeaponDefinition& GetSpreadShotDefinition();
const WeaponDefinition& GetHomingMissilesDefinition();
const WeaponDefinition& GetOrbitalShieldDefinition();
const WeaponDefinition& GetLightningDefinition();
const WeaponDefinition& GetFlamethrowerDefinition();
const WeaponDefinition& GetVoidVortexDefinition();

// Formas evoluídas (registradas pelo sistema de evolução).
const WeaponDefinition& GetDeathRayDefinition();
const WeaponDefinition& GetBulletStormDefinition();
const WeaponDefinition& GetSmartMissilesDefinition();

std::vector<WeaponDefinition> GetStockWeaponDefinitions();
std::vector<WeaponDefinition> GetEvolvedWeaponDefinitions();
