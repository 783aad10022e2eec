#pragma once
/**
 * @file coordinate_mapper.h
 * @brief Image-space to screen-space coordinate conversion
 */

#include "types.h"

namespace overlay_ocr {

/**
 * @brief Consumer viewport: pixel size plus the camera that displays it
 *
 * Screen space is centered on the camera with y pointing up; one image
 * pixel maps to `scale` screen units.
 */
struct ViewportProjection {
    float viewportWidth = 0.0f;
    float viewportHeight = 0.0f;
    float cameraX = 0.0f;
    float cameraY = 0.0f;
    float scale = 1.0f;
};

/**
 * @brief Map one box from image space to screen space
 *
 * x' = (x - w/2) * scale + cameraX, y' = (h/2 - y) * scale + cameraY.
 * The vertical flip swaps the y extremes; the result is renormalized so
 * minY <= maxY.
 */
Aabb toScreenSpace(const Aabb& box, const ViewportProjection& projection);

/**
 * @brief Map every box of a result set in place
 * @return false (and nothing changed) if the results are already in screen space
 */
bool mapResultsToScreenSpace(OcrResults& results, const ViewportProjection& projection);

} // namespace overlay_ocr
