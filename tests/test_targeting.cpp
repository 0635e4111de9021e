#include <gtest/gtest.h>

#include "targeting.h"

#include <vector>

TEST(Targeting, ClosestIgnoresInactiveAndDeadEnemies) {
    std::vector<EnemySnapshot> enemies{
        {1, Vector2{10.0f, 0.0f}, 50.0f, false},
        {2, Vector2{20.0f, 0.0f}, 0.0f, true},
        {3, Vector2{300.0f, 0.0f}, 50.0f, true},
        {4, Vector2{0.0f, 120.0f}, 50.0f, true},
    };

    const EnemySnapshot* closest = FindClosestEnemy(Vector2{0.0f, 0.0f}, enemies);
    ASSERT_NE(closest, nullptr);
    EXPECT_EQ(closest->id, 4);
}

TEST(Targeting, ClosestReturnsNullWhenNothingQualifies) {
    EXPECT_EQ(FindClosestEnemy(Vector2{0.0f, 0.0f}, {}), nullptr);

    std::vector<EnemySnapshot> dead{{1, Vector2{5.0f, 5.0f}, -1.0f, true}};
    EXPECT_EQ(FindClosestEnemy(Vector2{0.0f, 0.0f}, dead), nullptr);
}

TEST(Targeting, TiesKeepTheFirstEnemyInTheList) {
    std::vector<EnemySnapshot> enemies{
        {7, Vector2{50.0f, 0.0f}},
        {8, Vector2{-50.0f, 0.0f}},
    };
    EXPECT_EQ(FindClosestEnemy(Vector2{0.0f, 0.0f}, enemies)->id, 7);
}

TEST(Targeting, ExcludingSkipsVisitedIdsAndRespectsExclusiveRange) {
    std::vector<EnemySnapshot> enemies{
        {1, Vector2{40.0f, 0.0f}},
        {2, Vector2{150.0f, 0.0f}},
        {3, Vector2{0.0f, 90.0f}},
    };
    const Vector2 origin{0.0f, 0.0f};

    const EnemySnapshot* next = FindClosestEnemyExcluding(origin, enemies, {1}, 150.0f);
    ASSERT_NE(next, nullptr);
    EXPECT_EQ(next->id, 3);

    // Exatamente no limite do alcance não conta.
    EXPECT_EQ(FindClosestEnemyExcluding(origin, enemies, {1, 3}, 150.0f), nullptr);
    EXPECT_EQ(FindClosestEnemyExcluding(origin, enemies, {1, 3}, 150.5f)->id, 2);
}

TEST(Targeting, NearestEnemiesAreSortedByDistance) {
    std::vector<EnemySnapshot> enemies{
        {1, Vector2{300.0f, 0.0f}},
        {2, Vector2{100.0f, 0.0f}},
        {3, Vector2{0.0f, 200.0f}},
        {4, Vector2{0.0f, 50.0f}, 10.0f, false},
    };

    std::vector<const EnemySnapshot*> sorted = FindNearestEnemies(Vector2{0.0f, 0.0f}, enemies);
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0]->id, 2);
    EXPECT_EQ(sorted[1]->id, 3);
    EXPECT_EQ(sorted[2]->id, 1);
}

TEST(Targeting, DensestClusterBeatsLoneEnemy) {
    std::vector<EnemySnapshot> enemies{
        {1, Vector2{-100.0f, 0.0f}},
        {2, Vector2{190.0f, 0.0f}},
        {3, Vector2{200.0f, 0.0f}},
        {4, Vector2{210.0f, 0.0f}},
    };

    Vector2 center{};
    ASSERT_TRUE(FindDensestClusterCenter(Vector2{0.0f, 0.0f}, enemies, 300.0f, 160.0f, center));
    EXPECT_NEAR(center.x, 200.0f, 1e-3f);
    EXPECT_NEAR(center.y, 0.0f, 1e-3f);
}

TEST(Targeting, DensestClusterFailsOutsideSearchRange) {
    std::vector<EnemySnapshot> enemies{{1, Vector2{500.0f, 0.0f}}};
    Vector2 center{123.0f, 456.0f};
    EXPECT_FALSE(FindDensestClusterCenter(Vector2{0.0f, 0.0f}, enemies, 300.0f, 160.0f, center));
    EXPECT_FLOAT_EQ(center.x, 123.0f);
}
