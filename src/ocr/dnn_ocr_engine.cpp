/**
 * @file dnn_ocr_engine.cpp
 * @brief OCR engine on OpenCV DNN text models
 */

#include "ocr/dnn_ocr_engine.h"
#include "utils/logger.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <fstream>
#include <numeric>

namespace overlay_ocr {

namespace {

// DB models need input dimensions divisible by 32.
int roundUp32(int v) {
    return (std::max)(32, ((v + 31) / 32) * 32);
}

bool loadVocabulary(const std::string& path, std::vector<std::string>& vocabulary) {
    std::ifstream file(path);
    if (!file.good()) return false;

    vocabulary.clear();
    std::string line;
    while (std::getline(file, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        vocabulary.push_back(line);
    }
    return !vocabulary.empty();
}

} // namespace

LineBoxes groupWordsIntoLines(const WordBoxes& words) {
    struct LineAcc {
        float top;
        float bottom;
        WordBoxes words;
    };

    std::vector<size_t> order(words.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return words[a].center.y < words[b].center.y;
    });

    std::vector<LineAcc> lines;
    for (size_t idx : order) {
        const cv::Rect2f r = words[idx].boundingRect2f();
        const float top = r.y;
        const float bottom = r.y + r.height;

        LineAcc* target = nullptr;
        for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
            const float overlap = (std::min)(bottom, it->bottom) - (std::max)(top, it->top);
            const float minHeight = (std::min)(r.height, it->bottom - it->top);
            if (overlap > 0.0f && overlap >= 0.5f * minHeight) {
                target = &*it;
                break;
            }
        }

        if (target) {
            target->top = (std::min)(target->top, top);
            target->bottom = (std::max)(target->bottom, bottom);
            target->words.push_back(words[idx]);
        } else {
            lines.push_back(LineAcc{top, bottom, {words[idx]}});
        }
    }

    std::stable_sort(lines.begin(), lines.end(), [](const LineAcc& a, const LineAcc& b) {
        return a.top < b.top;
    });

    LineBoxes out;
    out.reserve(lines.size());
    for (auto& line : lines) {
        std::stable_sort(line.words.begin(), line.words.end(),
                         [](const cv::RotatedRect& a, const cv::RotatedRect& b) {
                             return a.center.x < b.center.x;
                         });
        out.push_back(std::move(line.words));
    }
    return out;
}

DnnOcrEngine::DnnOcrEngine() = default;
DnnOcrEngine::~DnnOcrEngine() = default;

bool DnnOcrEngine::loadModels(const DnnOcrModelConfig& config) {
    m_config = config;
    m_detector.reset();
    m_recognizer.reset();

    std::vector<std::string> vocabulary;
    if (!loadVocabulary(config.vocabulary, vocabulary)) {
        logError("DnnOcrEngine: cannot read vocabulary: " + config.vocabulary);
        return false;
    }

    try {
        auto detector = std::make_unique<cv::dnn::TextDetectionModel_DB>(config.detectionModel);
        detector->setBinaryThreshold(config.binaryThreshold)
            .setPolygonThreshold(config.polygonThreshold)
            .setUnclipRatio(config.unclipRatio)
            .setMaxCandidates(config.maxCandidates);
        detector->setInputParams(1.0 / 255.0, cv::Size(736, 736),
                                 cv::Scalar(122.67891434, 116.66876762, 104.00698793));

        auto recognizer = std::make_unique<cv::dnn::TextRecognitionModel>(config.recognitionModel);
        recognizer->setDecodeType("CTC-greedy");
        recognizer->setVocabulary(vocabulary);
        recognizer->setInputParams(1.0 / 127.5, config.recognitionInputSize,
                                   cv::Scalar(127.5, 127.5, 127.5));

        m_detector = std::move(detector);
        m_recognizer = std::move(recognizer);
    } catch (const cv::Exception& e) {
        logError(std::string("DnnOcrEngine: failed to load models: ") + e.what());
        return false;
    }

    logInfo("OCR models loaded: detection=" + config.detectionModel +
            ", recognition=" + config.recognitionModel +
            ", vocabulary=" + std::to_string(vocabulary.size()) + " symbols");
    return true;
}

bool DnnOcrEngine::isLoaded() const {
    return m_detector && m_recognizer;
}

OcrInput DnnOcrEngine::prepareInput(const cv::Mat& rgba) {
    if (!isLoaded()) {
        throw OcrEngineError("models are not loaded");
    }
    if (rgba.empty() || rgba.type() != CV_8UC4) {
        throw OcrEngineError("expected a non-empty RGBA image");
    }
    OcrInput input;
    cv::cvtColor(rgba, input.image, cv::COLOR_RGBA2BGR);
    return input;
}

WordBoxes DnnOcrEngine::detectWords(const OcrInput& input) {
    if (!isLoaded()) {
        throw OcrEngineError("models are not loaded");
    }
    m_detector->setInputSize(cv::Size(roundUp32(input.image.cols), roundUp32(input.image.rows)));

    WordBoxes boxes;
    std::vector<float> confidences;
    m_detector->detectTextRectangles(input.image, boxes, confidences);
    return boxes;
}

LineBoxes DnnOcrEngine::findTextLines(const OcrInput& input, const WordBoxes& words) {
    (void)input;
    return groupWordsIntoLines(words);
}

cv::Mat DnnOcrEngine::cropWord(const cv::Mat& bgr, const cv::RotatedRect& rect) const {
    const cv::Size outSize = m_config.recognitionInputSize;

    // RotatedRect::points order: bottomLeft, topLeft, topRight, bottomRight.
    cv::Point2f vertices[4];
    rect.points(vertices);
    const cv::Point2f target[4] = {
        cv::Point2f(0.0f, static_cast<float>(outSize.height - 1)),
        cv::Point2f(0.0f, 0.0f),
        cv::Point2f(static_cast<float>(outSize.width - 1), 0.0f),
        cv::Point2f(static_cast<float>(outSize.width - 1), static_cast<float>(outSize.height - 1))
    };

    cv::Mat warped;
    cv::warpPerspective(bgr, warped, cv::getPerspectiveTransform(vertices, target), outSize);
    if (!m_config.recognitionRgb) {
        cv::Mat gray;
        cv::cvtColor(warped, gray, cv::COLOR_BGR2GRAY);
        return gray;
    }
    return warped;
}

std::vector<std::optional<RecognizedLine>> DnnOcrEngine::recognizeText(
    const OcrInput& input, const LineBoxes& lines) {
    if (!isLoaded()) {
        throw OcrEngineError("models are not loaded");
    }

    std::vector<std::optional<RecognizedLine>> out;
    out.reserve(lines.size());
    for (const auto& line : lines) {
        RecognizedLine recognized;
        bool anyText = false;
        for (const auto& rect : line) {
            RecognizedWord word;
            word.rect = rect;
            word.text = m_recognizer->recognize(cropWord(input.image, rect));
            anyText = anyText || !word.text.empty();
            recognized.words.push_back(std::move(word));
        }
        if (anyText) {
            out.emplace_back(std::move(recognized));
        } else {
            out.emplace_back(std::nullopt);
        }
    }
    return out;
}

} // namespace overlay_ocr
