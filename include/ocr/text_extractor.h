#pragma once
/**
 * @file text_extractor.h
 * @brief Crop, preprocess and OCR one layout region
 */

#include "types.h"
#include "ocr/ocr_engine.h"
#include "processing/preprocess.h"

#include <stdexcept>
#include <string>

namespace overlay_ocr {

/**
 * @brief Failure of one extraction pass
 */
class ExtractionError : public std::runtime_error {
public:
    ExtractionError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * @brief Tuning knobs for TextExtractor
 */
struct ExtractionOptions {
    float gapThreshold = 15.0f;         ///< Column gap for item clustering (pixels)
    PreprocessParams preprocess;        ///< Preprocessing sequence parameters
};

/**
 * @brief Turns a frame region into words, lines and items
 *
 * The engine lock is held only around the detect / line-group / recognize
 * calls; cropping, preprocessing and clustering run unlocked. Nothing is
 * retried here.
 */
class TextExtractor {
public:
    TextExtractor() = default;
    explicit TextExtractor(ExtractionOptions options) : m_options(options) {}

    /**
     * @brief Run one extraction pass
     * @param image Full RGBA frame
     * @param ocrBounds Region to recognize, in frame pixels
     * @param engine Shared OCR engine
     * @return Results in image space
     * @throws ExtractionError DegenerateCrop or EngineFailure
     */
    OcrResults extract(const RgbaImage& image, const PixelRect& ocrBounds,
                       GuardedOcrEngine& engine) const;

    const ExtractionOptions& getOptions() const { return m_options; }

private:
    ExtractionOptions m_options;
};

} // namespace overlay_ocr
