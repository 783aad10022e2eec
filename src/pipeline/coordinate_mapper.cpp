/**
 * @file coordinate_mapper.cpp
 * @brief Image-space to screen-space coordinate conversion
 */

#include "pipeline/coordinate_mapper.h"
#include "utils/logger.h"

#include <algorithm>

namespace overlay_ocr {

namespace {

float mapX(float x, const ViewportProjection& p) {
    return (x - p.viewportWidth * 0.5f) * p.scale + p.cameraX;
}

float mapY(float y, const ViewportProjection& p) {
    return (p.viewportHeight * 0.5f - y) * p.scale + p.cameraY;
}

} // anonymous namespace

Aabb toScreenSpace(const Aabb& box, const ViewportProjection& projection) {
    const float x0 = mapX(box.minX, projection);
    const float x1 = mapX(box.maxX, projection);
    const float y0 = mapY(box.minY, projection);
    const float y1 = mapY(box.maxY, projection);
    return Aabb{(std::min)(x0, x1), (std::min)(y0, y1),
                (std::max)(x0, x1), (std::max)(y0, y1)};
}

bool mapResultsToScreenSpace(OcrResults& results, const ViewportProjection& projection) {
    if (results.space == CoordinateSpace::Screen) {
        logWarning("OCR results are already in screen space, not mapping again");
        return false;
    }

    results.detectBounds = toScreenSpace(results.detectBounds, projection);
    for (auto& word : results.words) {
        word.bounds = toScreenSpace(word.bounds, projection);
    }
    for (auto& line : results.lines) {
        line.bounds = toScreenSpace(line.bounds, projection);
    }
    for (auto& item : results.items) {
        item.bounds = toScreenSpace(item.bounds, projection);
    }
    results.space = CoordinateSpace::Screen;
    return true;
}

} // namespace overlay_ocr
