// pathfind.h
// Chase helpers for adversaries.
#pragma once
#include "direction.h"
#include <optional>

class Maze;

// First step of a shortest open path from -> to (BFS, 4-neighborhood).
// Empty when from == to or to is unreachable.
std::optional<Direction> nextStepToward(const Maze& maze, const Cell& from, const Cell& to);

// Axis-preference chase: close the larger gap first (ties go vertical), then
// the other axis. Empty when both candidates are walls.
std::optional<Direction> greedyStep(const Maze& maze, const Cell& from, const Cell& to);
