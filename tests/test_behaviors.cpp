#include <gtest/gtest.h>

#include "arsenal.h"
#include "weapon_behaviors.h"
#include "weapon_blueprints.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace {

struct DamageRecord {
    int enemyId{0};
    float amount{0.0f};
    std::string weaponId{};
};

struct EffectRecord {
    std::string kind{};
    Vector2 position{};
    EffectParams params{};
};

// Arsenal determinístico com as duas portas gravando em vetores.
class BehaviorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ArsenalConfig config{};
        config.rngSeed = 1234u;
        arsenal_ = std::make_unique<WeaponArsenal>(config);
        arsenal_->SetDamageCallback([this](int enemyId, float amount, const std::string& weaponId, Vector2) {
            damage_.push_back(DamageRecord{enemyId, amount, weaponId});
        });
        arsenal_->SetEffectCallback([this](const std::string& kind, float x, float y, const EffectParams& params) {
            effects_.push_back(EffectRecord{kind, Vector2{x, y}, params});
        });
    }

    void AddAtLevel(const std::string& weaponId, int level) {
        ASSERT_TRUE(arsenal_->AddWeapon(weaponId));
        while (arsenal_->GetWeaponLevel(weaponId) < level) {
            ASSERT_TRUE(arsenal_->UpgradeWeapon(weaponId));
        }
    }

    int CountEffects(const std::string& kind) const {
        return static_cast<int>(std::count_if(effects_.begin(), effects_.end(), [&kind](const EffectRecord& effect) {
            return effect.kind == kind;
        }));
    }

    std::vector<float> ProjectileAngles() const {
        std::vector<float> angles;
        for (const Projectile& projectile : arsenal_->GetProjectiles()) {
            angles.push_back(std::atan2(projectile.velocity.y, projectile.velocity.x));
        }
        return angles;
    }

    std::unique_ptr<WeaponArsenal> arsenal_{};
    std::vector<DamageRecord> damage_{};
    std::vector<EffectRecord> effects_{};
    const Vector2 origin_{0.0f, 0.0f};
};

// Uma arma isolada do arsenal para controlar o relógio manualmente.
struct BehaviorHarness {
    explicit BehaviorHarness(const WeaponDefinition& definition, int level = 1)
        : weapon(MakeWeaponInstance(std::make_shared<const WeaponDefinition>(definition), level)) {
        ports.SetDamageCallback([this](int enemyId, float amount, const std::string& weaponId, Vector2) {
            damage.push_back(DamageRecord{enemyId, amount, weaponId});
        });
        ports.SetEffectCallback([this](const std::string& kind, float, float, const EffectParams&) {
            effects.push_back(kind);
        });
    }

    WeaponInstance weapon;
    ProjectileSystem projectiles{};
    CombatPorts ports{};
    std::mt19937 rng{99u};
    std::vector<EnemySnapshot> enemies{};
    std::vector<DamageRecord> damage{};
    std::vector<std::string> effects{};

    BehaviorContext Context(double nowSeconds, float deltaSeconds) {
        return BehaviorContext{weapon, Vector2{0.0f, 0.0f}, enemies, projectiles, ports, rng, nowSeconds, deltaSeconds, 3.0f};
    }

    int Count(const std::string& kind) const {
        return static_cast<int>(std::count(effects.begin(), effects.end(), kind));
    }
};

} // namespace

TEST_F(BehaviorTest, BasicLaserFiresOneProjectileStraightAtTheEnemy) {
    AddAtLevel("basic_laser", 1);
    std::vector<EnemySnapshot> enemies{{1, Vector2{100.0f, 0.0f}}};

    arsenal_->Update(0.001f, origin_, enemies);

    ASSERT_EQ(arsenal_->GetProjectiles().size(), 1u);
    const Projectile& shot = arsenal_->GetProjectiles()[0];
    EXPECT_NEAR(shot.velocity.x, 600.0f, 1e-3f);
    EXPECT_NEAR(shot.velocity.y, 0.0f, 1e-3f);
    EXPECT_EQ(shot.weaponId, "basic_laser");
    EXPECT_EQ(CountEffects("muzzle_flash"), 1);
    EXPECT_TRUE(damage_.empty());
}

TEST_F(BehaviorTest, StandardDoesNothingWithoutTarget) {
    AddAtLevel("basic_laser", 1);
    arsenal_->Update(0.016f, origin_, {});

    EXPECT_TRUE(arsenal_->GetProjectiles().empty());
    EXPECT_EQ(CountEffects("muzzle_flash"), 0);
}

TEST_F(BehaviorTest, ZeroFireRateWeaponNeverFires) {
    WeaponDefinition stalled = GetBasicLaserDefinition();
    stalled.id = "stalled_laser";
    stalled.baseFireRate = 0.0f;
    arsenal_->RegisterWeapon(stalled);
    AddAtLevel("stalled_laser", 1);
    std::vector<EnemySnapshot> enemies{{1, Vector2{100.0f, 0.0f}}};

    for (int frame = 0; frame < 10; ++frame) {
        arsenal_->Update(0.016f, origin_, enemies);
    }
    ASSERT_TRUE(arsenal_->UpgradeWeapon("stalled_laser"));
    for (int frame = 0; frame < 10; ++frame) {
        arsenal_->Update(0.016f, origin_, enemies);
    }

    EXPECT_TRUE(arsenal_->GetProjectiles().empty());
    EXPECT_EQ(CountEffects("muzzle_flash"), 0);
    EXPECT_TRUE(std::isinf(arsenal_->GetWeapon("stalled_laser")->cooldown));
}

TEST_F(BehaviorTest, StandardMultiShotUsesSmallFixedFan) {
    AddAtLevel("basic_laser", 3);
    std::vector<EnemySnapshot> enemies{{1, Vector2{0.0f, 300.0f}}};

    arsenal_->Update(0.001f, origin_, enemies);

    std::vector<float> angles = ProjectileAngles();
    ASSERT_EQ(angles.size(), 2u);
    const float aim = PI / 2.0f;
    EXPECT_NEAR(angles[0], aim - 0.05f, 1e-4f);
    EXPECT_NEAR(angles[1], aim + 0.05f, 1e-4f);
}

TEST_F(BehaviorTest, SpreadShotLevelThreeFansSixProjectilesAcrossComputedSpread) {
    AddAtLevel("spread_shot", 3);
    std::vector<EnemySnapshot> enemies{{1, Vector2{300.0f, 0.0f}}};

    arsenal_->Update(0.001f, origin_, enemies);

    std::vector<float> angles = ProjectileAngles();
    ASSERT_EQ(angles.size(), 6u);
    const float step = 5.0f * DEG2RAD;
    for (std::size_t i = 0; i < angles.size(); ++i) {
        EXPECT_NEAR(angles[i], -12.5f * DEG2RAD + step * static_cast<float>(i), 1e-4f);
    }
    EXPECT_TRUE(std::is_sorted(angles.begin(), angles.end()));
    EXPECT_EQ(CountEffects("spread_blast"), 1);
}

TEST_F(BehaviorTest, SpreadFiresTowardAngleZeroWithoutEnemies) {
    AddAtLevel("spread_shot", 1);
    arsenal_->Update(0.001f, origin_, {});

    std::vector<float> angles = ProjectileAngles();
    ASSERT_EQ(angles.size(), 5u);
    EXPECT_NEAR(angles[2], 0.0f, 1e-5f);
    EXPECT_NEAR(angles.front(), -15.0f * DEG2RAD, 1e-4f);
    EXPECT_NEAR(angles.back(), 15.0f * DEG2RAD, 1e-4f);
}

TEST_F(BehaviorTest, HomingAssignsNearestTargetsRoundRobin) {
    AddAtLevel("homing_missiles", 3);
    std::vector<EnemySnapshot> enemies{{5, Vector2{0.0f, 400.0f}}};

    arsenal_->Update(0.001f, origin_, enemies);

    ASSERT_EQ(arsenal_->GetProjectiles().size(), 2u);
    for (const Projectile& missile : arsenal_->GetProjectiles()) {
        EXPECT_EQ(missile.homingTargetId.value_or(-1), 5);
        EXPECT_FLOAT_EQ(missile.turnSpeed, 5.0f);
        EXPECT_NEAR(missile.remainingLifetime, 5.0f, 0.01f);
    }
    EXPECT_EQ(CountEffects("missile_launch"), 1);
}

TEST_F(BehaviorTest, HomingPicksDistinctEnemiesNearestFirst) {
    AddAtLevel("homing_missiles", 3);
    std::vector<EnemySnapshot> enemies{
        {1, Vector2{500.0f, 0.0f}},
        {2, Vector2{0.0f, 200.0f}},
        {3, Vector2{-300.0f, 0.0f}},
    };

    arsenal_->Update(0.001f, origin_, enemies);

    ASSERT_EQ(arsenal_->GetProjectiles().size(), 2u);
    EXPECT_EQ(arsenal_->GetProjectiles()[0].homingTargetId.value_or(-1), 2);
    EXPECT_EQ(arsenal_->GetProjectiles()[1].homingTargetId.value_or(-1), 3);
}

TEST_F(BehaviorTest, HomingBehaviorWithHomingFlagOffFliesStraight) {
    WeaponDefinition unguided = GetHomingMissilesDefinition();
    unguided.id = "unguided_missiles";
    unguided.homing = false;
    arsenal_->RegisterWeapon(unguided);
    AddAtLevel("unguided_missiles", 1);

    std::vector<EnemySnapshot> enemies{{5, Vector2{0.0f, 400.0f}}};
    arsenal_->Update(0.001f, origin_, enemies);
    ASSERT_EQ(arsenal_->GetProjectiles().size(), 1u);
    const Projectile& missile = arsenal_->GetProjectiles()[0];
    EXPECT_FALSE(missile.IsHoming());
    EXPECT_NEAR(missile.remainingLifetime, 5.0f, 0.01f);
    EXPECT_EQ(CountEffects("missile_launch"), 1);

    // O alvo troca de lado; o míssil não corrige a rota.
    enemies[0].position = Vector2{400.0f, 0.0f};
    arsenal_->Update(0.1f, origin_, enemies);
    ASSERT_EQ(arsenal_->GetProjectiles().size(), 1u);
    EXPECT_NEAR(arsenal_->GetProjectiles()[0].velocity.x, 0.0f, 1e-3f);
    EXPECT_NEAR(arsenal_->GetProjectiles()[0].velocity.y, 250.0f, 1e-3f);
}

TEST_F(BehaviorTest, OrbitalCountNeverExceedsCap) {
    AddAtLevel("orbital_shield", 5);

    std::size_t peak = 0;
    for (int frame = 0; frame < 300; ++frame) {
        arsenal_->Update(0.1f, origin_, {});
        std::size_t orbitals = 0;
        for (const Projectile& projectile : arsenal_->GetProjectiles()) {
            if (projectile.weaponId == "orbital_shield" && projectile.IsOrbital()) {
                ++orbitals;
            }
        }
        EXPECT_LE(orbitals, 8u);
        peak = std::max(peak, orbitals);
    }
    EXPECT_EQ(peak, 8u);
}

TEST_F(BehaviorTest, OrbitalsSitOnTheirRadiusAroundTheOwner) {
    AddAtLevel("orbital_shield", 1);
    const Vector2 owner{30.0f, -20.0f};

    arsenal_->Update(0.016f, owner, {});
    arsenal_->Update(0.016f, Vector2{60.0f, 0.0f}, {});

    ASSERT_EQ(arsenal_->GetProjectiles().size(), 3u);
    for (const Projectile& orb : arsenal_->GetProjectiles()) {
        EXPECT_NEAR(Vector2Distance(orb.position, Vector2{60.0f, 0.0f}), 80.0f, 1e-2f);
        EXPECT_TRUE(std::isinf(orb.remainingLifetime));
    }
    ASSERT_FALSE(effects_.empty());
    EXPECT_EQ(effects_.front().kind, "orbital_spawn");
    EXPECT_FLOAT_EQ(effects_.front().params.at("count"), 3.0f);
}

TEST(OrbitalBehavior, RespawnLetsExistingOrbitalsHitTheSameEnemyAgain) {
    BehaviorHarness harness{GetOrbitalShieldDefinition()};
    harness.enemies = {{7, Vector2{80.0f, 0.0f}}};

    Projectile orb{};
    orb.weaponId = "orbital_shield";
    orb.position = Vector2{80.0f, 0.0f};
    orb.damage = 12.0f;
    orb.pierceBudget = 3;
    orb.remainingLifetime = kInfiniteLifetime;
    orb.orbital = OrbitalMotion{0.0f, 80.0f, 0.0f, Vector2{0.0f, 0.0f}};
    const ProjectileId orbId = harness.projectiles.Spawn(orb);

    harness.projectiles.Update(0.016f, Vector2{0.0f, 0.0f}, harness.enemies, harness.ports);
    harness.projectiles.Update(0.016f, Vector2{0.0f, 0.0f}, harness.enemies, harness.ports);
    ASSERT_EQ(harness.damage.size(), 1u);

    // Novos orbes nascem do lado oposto, longe do inimigo.
    harness.weapon.orbitalAngle = PI;
    BehaviorContext fire = harness.Context(0.0, 0.016f);
    FireWeaponBehavior(fire);
    ASSERT_EQ(harness.projectiles.CountByWeapon("orbital_shield", true), 4u);
    for (const Projectile& projectile : harness.projectiles.GetProjectiles()) {
        EXPECT_TRUE(projectile.hitEnemyIds.empty());
        if (projectile.id == orbId) {
            EXPECT_EQ(projectile.pierceBudget, 2);
        }
    }

    harness.projectiles.Update(0.016f, Vector2{0.0f, 0.0f}, harness.enemies, harness.ports);
    ASSERT_EQ(harness.damage.size(), 2u);
    EXPECT_EQ(harness.damage[1].enemyId, 7);
}

TEST(OrbitalBehavior, FullRingKeepsHitHistory) {
    BehaviorHarness harness{GetOrbitalShieldDefinition()};
    const auto& config = std::get<OrbitalBehaviorConfig>(GetOrbitalShieldDefinition().behavior);

    for (int i = 0; i < config.maxOrbitals; ++i) {
        Projectile orb{};
        orb.weaponId = "orbital_shield";
        orb.remainingLifetime = kInfiniteLifetime;
        orb.orbital = OrbitalMotion{static_cast<float>(i), 80.0f, 0.0f, Vector2{0.0f, 0.0f}};
        orb.hitEnemyIds.insert(7);
        harness.projectiles.Spawn(orb);
    }

    BehaviorContext fire = harness.Context(0.0, 0.016f);
    FireWeaponBehavior(fire);

    EXPECT_EQ(static_cast<int>(harness.projectiles.CountByWeapon("orbital_shield", true)), config.maxOrbitals);
    for (const Projectile& projectile : harness.projectiles.GetProjectiles()) {
        EXPECT_EQ(projectile.hitEnemyIds.count(7), 1u);
    }
    EXPECT_EQ(harness.Count("orbital_spawn"), 0);
}

TEST_F(BehaviorTest, ChainHopsDecayAndNeverRepeatAnEnemy) {
    AddAtLevel("lightning", 1);
    std::vector<EnemySnapshot> enemies;
    for (int i = 1; i <= 10; ++i) {
        enemies.push_back(EnemySnapshot{i, Vector2{100.0f * static_cast<float>(i), 0.0f}});
    }

    arsenal_->Update(0.001f, origin_, enemies);

    // Nível 1: 3 saltos extras, 4 acertos no total.
    ASSERT_EQ(damage_.size(), 4u);
    const float expected[] = {20.0f, 14.0f, 9.0f, 6.0f};
    for (std::size_t i = 0; i < damage_.size(); ++i) {
        EXPECT_EQ(damage_[i].enemyId, static_cast<int>(i) + 1);
        EXPECT_FLOAT_EQ(damage_[i].amount, expected[i]);
    }
    EXPECT_EQ(CountEffects("lightning_bolt"), 4);
    EXPECT_TRUE(arsenal_->GetProjectiles().empty());
}

TEST_F(BehaviorTest, ChainHopBoundGrowsWithLevel) {
    AddAtLevel("lightning", 5);
    std::vector<EnemySnapshot> enemies;
    for (int i = 1; i <= 12; ++i) {
        enemies.push_back(EnemySnapshot{i, Vector2{100.0f * static_cast<float>(i), 0.0f}});
    }

    arsenal_->Update(0.001f, origin_, enemies);

    const int chainCount = std::get<ChainBehaviorConfig>(GetLightningDefinition().behavior).chainCount;
    EXPECT_EQ(static_cast<int>(damage_.size()), chainCount + 5 / 2 + 1);
    std::set<int> unique;
    for (const DamageRecord& hit : damage_) {
        unique.insert(hit.enemyId);
    }
    EXPECT_EQ(unique.size(), damage_.size());
}

TEST_F(BehaviorTest, ChainStopsWhenNoUnvisitedEnemyIsInRange) {
    AddAtLevel("lightning", 5);
    std::vector<EnemySnapshot> enemies{
        {1, Vector2{100.0f, 0.0f}},
        {2, Vector2{150.0f, 0.0f}},
        {3, Vector2{1000.0f, 0.0f}},
    };

    arsenal_->Update(0.001f, origin_, enemies);

    ASSERT_EQ(damage_.size(), 2u);
    EXPECT_EQ(damage_[0].enemyId, 1);
    EXPECT_EQ(damage_[1].enemyId, 2);
}

TEST_F(BehaviorTest, AreaHitsOnlyEnemiesInsideTheCone) {
    AddAtLevel("flamethrower", 1);
    std::vector<EnemySnapshot> enemies{
        {1, Vector2{60.0f, 0.0f}},
        {2, Vector2{50.0f, 50.0f}},
        {3, Vector2{200.0f, 0.0f}},
        {4, Vector2{0.0f, -50.0f}},
        {5, Vector2{90.0f, 10.0f}},
    };

    arsenal_->Update(0.001f, origin_, enemies);

    std::set<int> hit;
    for (const DamageRecord& record : damage_) {
        hit.insert(record.enemyId);
        EXPECT_FLOAT_EQ(record.amount, 4.0f);
    }
    EXPECT_EQ(hit, (std::set<int>{1, 5}));

    const WeaponInstance* flamer = arsenal_->GetWeapon("flamethrower");
    ASSERT_NE(flamer, nullptr);
    EXPECT_EQ(flamer->areaTargets.size(), 2u);
    EXPECT_EQ(flamer->areaTargets.count(1), 1u);
    EXPECT_EQ(flamer->areaTargets.count(5), 1u);
    EXPECT_EQ(CountEffects("flame_hit"), 2);
    EXPECT_EQ(CountEffects("flamethrower"), 1);

    for (const EffectRecord& effect : effects_) {
        if (effect.kind == "flame_hit" && effect.position.x == 60.0f) {
            EXPECT_NEAR(effect.params.at("intensity"), 0.5f, 1e-5f);
        }
    }
}

TEST(BeamGeometry, CenterlineIsInsideAndWideOffsetIsOutside) {
    const Vector2 start{0.0f, 0.0f};
    const Vector2 end{800.0f, 0.0f};

    EXPECT_TRUE(IsPointInBeam(Vector2{0.0f, 0.0f}, start, end, 12.0f));
    EXPECT_TRUE(IsPointInBeam(Vector2{400.0f, 0.0f}, start, end, 12.0f));
    EXPECT_TRUE(IsPointInBeam(Vector2{800.0f, 0.0f}, start, end, 12.0f));
    EXPECT_TRUE(IsPointInBeam(Vector2{400.0f, 6.0f}, start, end, 12.0f));
    EXPECT_FALSE(IsPointInBeam(Vector2{400.0f, 6.5f}, start, end, 12.0f));
    EXPECT_FALSE(IsPointInBeam(Vector2{820.0f, 0.0f}, start, end, 12.0f));
}

TEST(BeamGeometry, DiagonalBeamUsesPerpendicularDistance) {
    const Vector2 start{0.0f, 0.0f};
    const Vector2 end{300.0f, 300.0f};
    EXPECT_TRUE(IsPointInBeam(Vector2{150.0f, 150.0f}, start, end, 10.0f));
    EXPECT_TRUE(IsPointInBeam(Vector2{152.0f, 148.0f}, start, end, 10.0f));
    EXPECT_FALSE(IsPointInBeam(Vector2{160.0f, 140.0f}, start, end, 10.0f));
}

TEST_F(BehaviorTest, BeamDamagesAlongTheLineAtItsTickRate) {
    arsenal_->RegisterWeapon(GetDeathRayDefinition());
    AddAtLevel("death_ray", 1);
    std::vector<EnemySnapshot> enemies{
        {1, Vector2{300.0f, 0.0f}},
        {2, Vector2{600.0f, 3.0f}},
        {3, Vector2{300.0f, 100.0f}},
    };

    for (int frame = 0; frame < 50; ++frame) {
        arsenal_->Update(0.02f, origin_, enemies);
    }

    int hitsOnFirst = 0;
    int hitsOnSecond = 0;
    for (const DamageRecord& record : damage_) {
        EXPECT_NE(record.enemyId, 3);
        EXPECT_FLOAT_EQ(record.amount, 35.0f);
        hitsOnFirst += (record.enemyId == 1) ? 1 : 0;
        hitsOnSecond += (record.enemyId == 2) ? 1 : 0;
    }
    // Um segundo a 10 acertos por segundo.
    EXPECT_GE(hitsOnFirst, 9);
    EXPECT_LE(hitsOnFirst, 11);
    EXPECT_EQ(hitsOnFirst, hitsOnSecond);
    EXPECT_EQ(CountEffects("freeze_slow"), hitsOnFirst + hitsOnSecond);
    EXPECT_TRUE(arsenal_->GetProjectiles().empty());
}

TEST_F(BehaviorTest, BeamWithoutEnemiesAimsForward) {
    arsenal_->RegisterWeapon(GetDeathRayDefinition());
    AddAtLevel("death_ray", 1);

    arsenal_->Update(0.016f, origin_, {});

    const WeaponInstance* ray = arsenal_->GetWeapon("death_ray");
    ASSERT_NE(ray, nullptr);
    ASSERT_TRUE(ray->beamAimPoint.has_value());
    EXPECT_FLOAT_EQ(ray->beamAimPoint->x, 800.0f);
    EXPECT_FLOAT_EQ(ray->beamAimPoint->y, 0.0f);
}

TEST_F(BehaviorTest, BeamSlowIsSentWithEachDamageTickOnly) {
    arsenal_->RegisterWeapon(GetDeathRayDefinition());
    AddAtLevel("death_ray", 1);
    std::vector<EnemySnapshot> enemies{{1, Vector2{300.0f, 0.0f}}};

    arsenal_->Update(0.02f, origin_, enemies);
    ASSERT_EQ(damage_.size(), 1u);
    ASSERT_EQ(CountEffects("freeze_slow"), 1);

    // Ainda dentro do intervalo de 0.1s: o inimigo segue no feixe sem novo sinal.
    arsenal_->Update(0.02f, origin_, enemies);
    EXPECT_EQ(damage_.size(), 1u);
    EXPECT_EQ(CountEffects("freeze_slow"), 1);

    const auto& config = std::get<BeamBehaviorConfig>(GetDeathRayDefinition().behavior);
    for (const EffectRecord& effect : effects_) {
        if (effect.kind == "freeze_slow") {
            EXPECT_FLOAT_EQ(effect.params.at("enemyId"), 1.0f);
            EXPECT_GE(effect.params.at("duration"), 1.0f / config.tickRate);
        }
    }
}

TEST_F(BehaviorTest, BeamKeepsItsTickRateAfterTenMinutes) {
    arsenal_->RegisterWeapon(GetDeathRayDefinition());
    AddAtLevel("death_ray", 1);
    std::vector<EnemySnapshot> enemies{{1, Vector2{300.0f, 0.0f}}};
    const float step = 1.0f / 60.0f;

    for (int frame = 0; frame < 60 * 600; ++frame) {
        arsenal_->Update(step, origin_, enemies);
    }
    EXPECT_NEAR(arsenal_->GetElapsedSeconds(), 600.0, 1e-3);

    damage_.clear();
    for (int frame = 0; frame < 60 * 10; ++frame) {
        arsenal_->Update(step, origin_, enemies);
    }
    EXPECT_EQ(damage_.size(), 100u);
}

TEST(VortexBehavior, ImplosionFiresExactlyOnceWhenLifetimeCrossesZero) {
    BehaviorHarness harness{GetVoidVortexDefinition()};
    harness.enemies = {{1, Vector2{100.0f, 0.0f}}};

    BehaviorContext fire = harness.Context(0.0f, 0.5f);
    FireWeaponBehavior(fire);
    ASSERT_EQ(harness.weapon.vortices.size(), 1u);
    EXPECT_NEAR(harness.weapon.vortices[0].position.x, 100.0f, 1e-3f);
    EXPECT_NEAR(harness.weapon.vortices[0].position.y, 0.0f, 1e-3f);

    float now = 0.0f;
    int implosionTick = -1;
    for (int tick = 1; tick <= 10; ++tick) {
        now += 0.5f;
        BehaviorContext context = harness.Context(now, 0.5f);
        const int before = harness.Count("vortex_implosion");
        TickWeaponBehavior(context);
        if (harness.Count("vortex_implosion") > before) {
            implosionTick = tick;
        }
    }

    // Vida 3s com passos de 0.5s: cruza zero no sexto tick.
    EXPECT_EQ(harness.Count("vortex_implosion"), 1);
    EXPECT_EQ(implosionTick, 6);
    EXPECT_TRUE(harness.weapon.vortices.empty());

    const float burst = 6.0f * 3.0f;
    const int burstHits = static_cast<int>(std::count_if(harness.damage.begin(), harness.damage.end(),
                                                         [burst](const DamageRecord& record) {
                                                             return record.amount == burst;
                                                         }));
    EXPECT_EQ(burstHits, 1);
}

TEST(VortexBehavior, DamageIsScaledTowardTheCenterAndGatedPerEnemy) {
    BehaviorHarness harness{GetVoidVortexDefinition()};
    harness.enemies = {{1, Vector2{100.0f, 0.0f}}, {2, Vector2{130.0f, 0.0f}}};

    BehaviorContext fire = harness.Context(0.0f, 0.05f);
    FireWeaponBehavior(fire);
    ASSERT_EQ(harness.weapon.vortices.size(), 1u);

    // Força o centro sobre o inimigo 1 para valores exatos.
    harness.weapon.vortices[0].position = Vector2{100.0f, 0.0f};

    BehaviorContext first = harness.Context(0.05f, 0.05f);
    TickWeaponBehavior(first);
    ASSERT_EQ(harness.damage.size(), 2u);
    EXPECT_FLOAT_EQ(harness.damage[0].amount, 12.0f);
    EXPECT_FLOAT_EQ(harness.damage[1].amount, 6.0f * (1.0f + (1.0f - 30.0f / 60.0f)));

    // Dentro do intervalo de 0.25s nada é repetido.
    BehaviorContext second = harness.Context(0.15f, 0.05f);
    TickWeaponBehavior(second);
    EXPECT_EQ(harness.damage.size(), 2u);

    BehaviorContext third = harness.Context(0.35f, 0.05f);
    TickWeaponBehavior(third);
    EXPECT_EQ(harness.damage.size(), 4u);
    EXPECT_GE(harness.Count("vortex_pull"), 6);
}

TEST(VortexBehavior, RespectsMaxVorticesAndRandomPlacementRange) {
    BehaviorHarness harness{GetVoidVortexDefinition()};

    for (int i = 0; i < 5; ++i) {
        BehaviorContext fire = harness.Context(0.0f, 0.0f);
        FireWeaponBehavior(fire);
    }

    const auto& config = std::get<VortexBehaviorConfig>(GetVoidVortexDefinition().behavior);
    ASSERT_EQ(static_cast<int>(harness.weapon.vortices.size()), config.maxVortices);
    for (const VortexState& vortex : harness.weapon.vortices) {
        EXPECT_LE(Vector2Length(vortex.position), config.placementRange + 1e-3f);
        EXPECT_FLOAT_EQ(vortex.remainingLifetime, config.lifetime);
    }
    EXPECT_EQ(harness.Count("vortex_spawn"), config.maxVortices);
}

TEST(VortexBehavior, PullPointsTowardTheCenter) {
    BehaviorHarness harness{GetVoidVortexDefinition()};
    harness.weapon.vortices.push_back(VortexState{Vector2{0.0f, 0.0f}, 3.0f});
    harness.enemies = {{1, Vector2{80.0f, 0.0f}}};

    EffectParams pull{};
    harness.ports.SetEffectCallback([&pull](const std::string& kind, float, float, const EffectParams& params) {
        if (kind == "vortex_pull") {
            pull = params;
        }
    });

    BehaviorContext context = harness.Context(0.0f, 0.016f);
    TickWeaponBehavior(context);

    ASSERT_FALSE(pull.empty());
    EXPECT_FLOAT_EQ(pull.at("enemyId"), 1.0f);
    EXPECT_NEAR(pull.at("dirX"), -1.0f, 1e-5f);
    EXPECT_NEAR(pull.at("dirY"), 0.0f, 1e-5f);
    EXPECT_NEAR(pull.at("strength"), 220.0f * 0.5f, 1e-3f);
}

TEST(VortexBehavior, ZeroLifetimeVortexImplodesOnceAndFreesItsSlot) {
    WeaponDefinition fleeting = GetVoidVortexDefinition();
    auto& config = std::get<VortexBehaviorConfig>(fleeting.behavior);
    config.lifetime = 0.0f;
    BehaviorHarness harness{fleeting};

    for (int i = 0; i < config.maxVortices; ++i) {
        BehaviorContext fire = harness.Context(0.0, 0.016f);
        FireWeaponBehavior(fire);
    }
    ASSERT_EQ(static_cast<int>(harness.weapon.vortices.size()), config.maxVortices);

    BehaviorContext tick = harness.Context(0.016, 0.016f);
    TickWeaponBehavior(tick);
    EXPECT_EQ(harness.Count("vortex_implosion"), config.maxVortices);
    EXPECT_TRUE(harness.weapon.vortices.empty());

    BehaviorContext again = harness.Context(0.032, 0.016f);
    TickWeaponBehavior(again);
    EXPECT_EQ(harness.Count("vortex_implosion"), config.maxVortices);

    BehaviorContext refire = harness.Context(0.048, 0.016f);
    FireWeaponBehavior(refire);
    EXPECT_EQ(harness.weapon.vortices.size(), 1u);
}
