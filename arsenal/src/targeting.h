#pragma once

#include "combat_ports.h"

#include <unordered_set>
#include <vector>

// Consultas puras de mira; recalculadas a cada chamada, sem cache entre quadros.
// Somente inimigos ativos e vivos são considerados.

// Inimigo mais próximo de origin, ou nullptr se não houver nenhum.
const EnemySnapshot* FindClosestEnemy(Vector2 origin, const std::vector<EnemySnapshot>& enemies);

// Igual a FindClosestEnemy, ignorando ids em exclude e distâncias >= maxRange.
const EnemySnapshot* FindClosestEnemyExcluding(Vector2 origin,
                                               const std::vector<EnemySnapshot>& enemies,
                                               const std::unordered_set<int>& exclude,
                                               float maxRange);

// Todos os inimigos elegíveis ordenados do mais perto ao mais longe (ordenação estável).
std::vector<const EnemySnapshot*> FindNearestEnemies(Vector2 origin, const std::vector<EnemySnapshot>& enemies);

// Centro do grupo mais denso dentro de searchRange. Cada candidato pontua
// 1 + soma de (1 - d/clusterRadius) dos vizinhos dentro de clusterRadius.
// Retorna false se nenhum inimigo estiver ao alcance.
bool FindDensestClusterCenter(Vector2 origin,
                              const std::vector<EnemySnapshot>& enemies,
                              float searchRange,
                              float clusterRadius,
                              Vector2& outCenter);
