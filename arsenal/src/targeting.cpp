#include "targeting.h"

#include <algorithm>
#include <limits>

const EnemySnapshot* FindClosestEnemy(Vector2 origin, const std::vector<EnemySnapshot>& enemies) {
    const EnemySnapshot* closest = nullptr;
    float closestDistance = std::numeric_limits<float>::infinity();

    for (const EnemySnapshot& enemy : enemies) {
        if (!enemy.IsTargetable()) {
            continue;
        }

        float distance = Vector2Distance(origin, enemy.position);
        if (distance < closestDistance) {
            closestDistance = distance;
            closest = &enemy;
        }
    }

    return closest;
}

const EnemySnapshot* FindClosestEnemyExcluding(Vector2 origin,
                                               const std::vector<EnemySnapshot>& enemies,
                                               const std::unordered_set<int>& exclude,
                                               float maxRange) {
    const EnemySnapshot* closest = nullptr;
    float closestDistance = maxRange;

    for (const EnemySnapshot& enemy : enemies) {
        if (!enemy.IsTargetable() || exclude.count(enemy.id) > 0) {
            continue;
        }

        float distance = Vector2Distance(origin, enemy.position);
        if (distance < closestDistance) {
            closestDistance = distance;
            closest = &enemy;
        }
    }

    return closest;
}

std::vector<const EnemySnapshot*> FindNearestEnemies(Vector2 origin, const std::vector<EnemySnapshot>& enemies) {
    std::vector<const EnemySnapshot*> sorted;
    sorted.reserve(enemies.size());
    for (const EnemySnapshot& enemy : enemies) {
        if (enemy.IsTargetable()) {
            sorted.push_back(&enemy);
        }
    }

    std::stable_sort(sorted.begin(), sorted.end(), [origin](const EnemySnapshot* lhs, const EnemySnapshot* rhs) {
        return Vector2LengthSqr(Vector2Subtract(lhs->position, origin)) <
               Vector2LengthSqr(Vector2Subtract(rhs->position, origin));
    });
    return sorted;
}

bool FindDensestClusterCenter(Vector2 origin,
                              const std::vector<EnemySnapshot>& enemies,
                              float searchRange,
                              float clusterRadius,
                              Vector2& outCenter) {
    const EnemySnapshot* best = nullptr;
    float bestScore = -1.0f;

    for (const EnemySnapshot& candidate : enemies) {
        if (!candidate.IsTargetable() || Vector2Distance(origin, candidate.position) > searchRange) {
            continue;
        }

        float score = 1.0f;
        for (const EnemySnapshot& other : enemies) {
            if (&other == &candidate || !other.IsTargetable()) {
                continue;
            }
            float distance = Vector2Distance(candidate.position, other.position);
            if (clusterRadius > 0.0f && distance < clusterRadius) {
                score += 1.0f - distance / clusterRadius;
            }
        }

        if (score > bestScore) {
            bestScore = score;
            best = &candidate;
        }
    }

    if (best == nullptr) {
        return false;
    }

    // Centro ponderado: o candidato pesa 1, vizinhos pesam pela proximidade.
    Vector2 weightedSum = best->position;
    float totalWeight = 1.0f;
    for (const EnemySnapshot& other : enemies) {
        if (&other == best || !other.IsTargetable()) {
            continue;
        }
        float distance = Vector2Distance(best->position, other.position);
        if (clusterRadius > 0.0f && distance < clusterRadius) {
            float weight = 1.0f - distance / clusterRadius;
            weightedSum = Vector2Add(weightedSum, Vector2Scale(other.position, weight));
            totalWeight += weight;
        }
    }

    outCenter = Vector2Scale(weightedSum, 1.0f / totalWeight);
    return true;
}
