#pragma once
/**
 * @file column_clusterer.h
 * @brief Grouping recognized words into items by horizontal gaps
 */

#include "types.h"

#include <vector>

namespace overlay_ocr {

/**
 * @brief Split words into columns and merge each column into an Item
 *
 * Words are ordered by left edge; every gap between neighbours wider than
 * gapThreshold places a column boundary at the gap midpoint. Each word goes
 * to the column containing its horizontal center. Within a column, texts are
 * joined with single spaces in input order and boxes are merged.
 * Empty columns produce no Item; items are returned left to right.
 *
 * @param words Words in image or screen space (x grows to the right)
 * @param gapThreshold Minimum gap in pixels that separates two columns
 * @return Items, left to right
 */
std::vector<Item> clusterColumns(const std::vector<Word>& words, float gapThreshold);

/**
 * @brief Column boundaries (gap midpoints) for a word set, ascending
 */
std::vector<float> findColumnBoundaries(const std::vector<Word>& words, float gapThreshold);

} // namespace overlay_ocr
