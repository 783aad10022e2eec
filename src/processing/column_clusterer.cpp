/**
 * @file column_clusterer.cpp
 * @brief Grouping recognized words into items by horizontal gaps
 */

#include "processing/column_clusterer.h"

#include <algorithm>
#include <string>

namespace overlay_ocr {

std::vector<float> findColumnBoundaries(const std::vector<Word>& words, float gapThreshold) {
    std::vector<float> boundaries;
    if (words.size() < 2) {
        return boundaries;
    }

    std::vector<const Word*> sorted;
    sorted.reserve(words.size());
    for (const auto& w : words) {
        sorted.push_back(&w);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const Word* a, const Word* b) {
        return a->bounds.minX < b->bounds.minX;
    });

    for (size_t i = 0; i + 1 < sorted.size(); i++) {
        const float gap = sorted[i + 1]->bounds.minX - sorted[i]->bounds.maxX;
        if (gap > gapThreshold) {
            boundaries.push_back((sorted[i]->bounds.maxX + sorted[i + 1]->bounds.minX) / 2.0f);
        }
    }
    // Overlapping words can make later midpoints smaller than earlier ones.
    std::sort(boundaries.begin(), boundaries.end());
    return boundaries;
}

std::vector<Item> clusterColumns(const std::vector<Word>& words, float gapThreshold) {
    if (words.empty()) {
        return {};
    }

    const std::vector<float> boundaries = findColumnBoundaries(words, gapThreshold);

    std::vector<std::vector<const Word*>> columns(boundaries.size() + 1);
    for (const auto& word : words) {
        const float x = word.bounds.centerX();
        const size_t col = static_cast<size_t>(
            std::count_if(boundaries.begin(), boundaries.end(), [x](float b) { return x > b; }));
        columns[col].push_back(&word);
    }

    std::vector<Item> items;
    for (const auto& column : columns) {
        if (column.empty()) {
            continue;
        }

        Item item;
        item.bounds = column.front()->bounds;
        item.name = column.front()->text;
        for (size_t i = 1; i < column.size(); i++) {
            item.name += ' ';
            item.name += column[i]->text;
            item.bounds = item.bounds.merged(column[i]->bounds);
        }
        items.push_back(std::move(item));
    }
    return items;
}

} // namespace overlay_ocr
