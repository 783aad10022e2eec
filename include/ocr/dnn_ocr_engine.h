#pragma once
/**
 * @file dnn_ocr_engine.h
 * @brief OCR engine on OpenCV DNN text models (DB detection + CTC recognition)
 */

#include "ocr/ocr_engine.h"

#include <opencv2/dnn.hpp>

#include <memory>
#include <string>
#include <vector>

namespace overlay_ocr {

/**
 * @brief Model files and input geometry for DnnOcrEngine
 */
struct DnnOcrModelConfig {
    std::string detectionModel;             ///< DB text detection ONNX model
    std::string recognitionModel;           ///< CRNN-style CTC recognition ONNX model
    std::string vocabulary;                 ///< One symbol per line, matching the recognition model
    cv::Size recognitionInputSize{100, 32}; ///< Recognition model input (w x h)
    bool recognitionRgb = false;            ///< Feed 3-channel crops instead of grayscale
    float binaryThreshold = 0.3f;
    float polygonThreshold = 0.5f;
    double unclipRatio = 2.0;
    int maxCandidates = 200;
};

/**
 * @brief Group word boxes into text lines by vertical overlap
 *
 * A word joins the line it overlaps vertically by at least half of the
 * smaller height. Lines are ordered top to bottom, words left to right.
 */
LineBoxes groupWordsIntoLines(const WordBoxes& words);

/**
 * @brief OcrEngine backed by cv::dnn::TextDetectionModel_DB and
 *        cv::dnn::TextRecognitionModel
 */
class DnnOcrEngine : public OcrEngine {
public:
    DnnOcrEngine();
    ~DnnOcrEngine() override;

    DnnOcrEngine(const DnnOcrEngine&) = delete;
    DnnOcrEngine& operator=(const DnnOcrEngine&) = delete;

    /**
     * @brief Load detection and recognition models plus the vocabulary
     * @return true if successful
     */
    bool loadModels(const DnnOcrModelConfig& config);

    /**
     * @brief Check if models are loaded
     */
    bool isLoaded() const;

    OcrInput prepareInput(const cv::Mat& rgba) override;
    WordBoxes detectWords(const OcrInput& input) override;
    LineBoxes findTextLines(const OcrInput& input, const WordBoxes& words) override;
    std::vector<std::optional<RecognizedLine>> recognizeText(
        const OcrInput& input, const LineBoxes& lines) override;

private:
    cv::Mat cropWord(const cv::Mat& bgr, const cv::RotatedRect& rect) const;

    DnnOcrModelConfig m_config;
    std::unique_ptr<cv::dnn::TextDetectionModel_DB> m_detector;
    std::unique_ptr<cv::dnn::TextRecognitionModel> m_recognizer;
};

} // namespace overlay_ocr
