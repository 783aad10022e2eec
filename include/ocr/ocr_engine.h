#pragma once
/**
 * @file ocr_engine.h
 * @brief OCR engine interface and scoped access to a shared engine
 */

#include <opencv2/core.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace overlay_ocr {

/**
 * @brief Error raised by OCR engine implementations
 */
class OcrEngineError : public std::runtime_error {
public:
    explicit OcrEngineError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Engine-specific prepared input (converted and normalized image)
 */
struct OcrInput {
    cv::Mat image;
};

/**
 * @brief Recognized word with its box relative to the OCR input
 */
struct RecognizedWord {
    std::string text;
    cv::RotatedRect rect;
};

/**
 * @brief Recognized text line
 */
struct RecognizedLine {
    std::vector<RecognizedWord> words;

    /// Union of the word boxes; empty rect when there are no words
    cv::Rect2f boundingRect() const;
};

using WordBoxes = std::vector<cv::RotatedRect>;
using LineBoxes = std::vector<WordBoxes>;

/**
 * @brief Word/line detection and text recognition service
 *
 * Implementations are stateful and not safe for concurrent calls; share
 * them through GuardedOcrEngine. Failures are reported as OcrEngineError.
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    /**
     * @brief Convert an RGBA (CV_8UC4) image to the engine's input form
     */
    virtual OcrInput prepareInput(const cv::Mat& rgba) = 0;

    /**
     * @brief Detect word boxes in the input
     */
    virtual WordBoxes detectWords(const OcrInput& input) = 0;

    /**
     * @brief Group word boxes into text lines
     */
    virtual LineBoxes findTextLines(const OcrInput& input, const WordBoxes& words) = 0;

    /**
     * @brief Recognize the text of each line
     * @return One entry per input line; nullopt where nothing was recognized
     */
    virtual std::vector<std::optional<RecognizedLine>> recognizeText(
        const OcrInput& input, const LineBoxes& lines) = 0;
};

/**
 * @brief One OCR engine behind a mutex
 *
 * acquire() returns a Lease that holds the lock until it is destroyed.
 */
class GuardedOcrEngine {
public:
    explicit GuardedOcrEngine(std::unique_ptr<OcrEngine> engine);

    GuardedOcrEngine(const GuardedOcrEngine&) = delete;
    GuardedOcrEngine& operator=(const GuardedOcrEngine&) = delete;

    class Lease {
    public:
        Lease(std::unique_lock<std::mutex> lock, OcrEngine& engine)
            : m_lock(std::move(lock)), m_engine(&engine) {}

        OcrEngine& operator*() const { return *m_engine; }
        OcrEngine* operator->() const { return m_engine; }

        /// Release the engine before the lease goes out of scope
        void release() { m_lock.unlock(); m_engine = nullptr; }

    private:
        std::unique_lock<std::mutex> m_lock;
        OcrEngine* m_engine;
    };

    /**
     * @brief Block until the engine is free and lock it
     */
    Lease acquire();

    /**
     * @brief Lock the engine only if no other lease holds it
     * @return nullopt while the engine is busy
     */
    std::optional<Lease> tryAcquire();

private:
    std::unique_ptr<OcrEngine> m_engine;
    std::mutex m_mutex;
};

} // namespace overlay_ocr
