/**
 * @file text_extractor.cpp
 * @brief Crop, preprocess and OCR one layout region
 */

#include "ocr/text_extractor.h"
#include "processing/column_clusterer.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace overlay_ocr {

namespace {

Aabb aabbFromRotatedRect(const cv::RotatedRect& rect, float dx, float dy) {
	cv::Point2f pts[4];
	rect.points(pts);
	Aabb box{pts[0].x, pts[0].y, pts[0].x, pts[0].y};
	for (int i = 1; i < 4; i++) {
		box.minX = (std::min)(box.minX, pts[i].x);
		box.minY = (std::min)(box.minY, pts[i].y);
		box.maxX = (std::max)(box.maxX, pts[i].x);
		box.maxY = (std::max)(box.maxY, pts[i].y);
	}
	return box.translated(dx, dy);
}

bool isBlank(const std::string& s) {
	return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

OcrResults TextExtractor::extract(const RgbaImage& image, const PixelRect& ocrBounds,
                                  GuardedOcrEngine& engine) const {
	cv::Mat crop = cropRgba(image, ocrBounds);
	if (crop.empty() || crop.cols == 0 || crop.rows == 0) {
		std::ostringstream oss;
		oss << "OCR region " << ocrBounds.w << "x" << ocrBounds.h << " at (" << ocrBounds.x
		    << "," << ocrBounds.y << ") has no area in a " << image.width << "x" << image.height
		    << " frame";
		throw ExtractionError(ErrorKind::DegenerateCrop, oss.str());
	}

	cv::Mat processed;
	try {
		processed = preprocessForOcr(crop, m_options.preprocess);
	} catch (const cv::Exception& e) {
		throw ExtractionError(ErrorKind::EngineFailure, std::string("Preprocessing failed: ") + e.what());
	}

	LineBoxes lineRects;
	std::vector<std::optional<RecognizedLine>> lineTexts;
	try {
		// Hold the engine only for the inference calls.
		auto lease = engine.acquire();
		OcrInput input = lease->prepareInput(processed);
		WordBoxes wordRects = lease->detectWords(input);
		lineRects = lease->findTextLines(input, wordRects);
		lineTexts = lease->recognizeText(input, lineRects);
		lease.release();
	} catch (const OcrEngineError& e) {
		throw ExtractionError(ErrorKind::EngineFailure, std::string("OCR engine failed: ") + e.what());
	} catch (const cv::Exception& e) {
		throw ExtractionError(ErrorKind::EngineFailure, std::string("OCR engine failed: ") + e.what());
	}

	if (lineTexts.size() != lineRects.size()) {
		std::ostringstream oss;
		oss << "OCR engine returned " << lineTexts.size() << " line results for "
		    << lineRects.size() << " lines";
		throw ExtractionError(ErrorKind::EngineFailure, oss.str());
	}

	const float dx = static_cast<float>(ocrBounds.x);
	const float dy = static_cast<float>(ocrBounds.y);

	OcrResults results;
	results.detectBounds = Aabb::fromRect(ocrBounds);

	for (const auto& lineText : lineTexts) {
		if (!lineText) {
			continue;
		}

		const size_t firstIndex = results.words.size();
		for (const auto& word : lineText->words) {
			if (word.text.empty() || isBlank(word.text)) {
				continue;
			}
			results.words.push_back(Word{word.text, aabbFromRotatedRect(word.rect, dx, dy)});
		}
		if (results.words.size() == firstIndex) {
			continue;
		}

		const cv::Rect2f r = lineText->boundingRect();
		Line line;
		line.bounds = Aabb{r.x + dx, r.y + dy, r.x + r.width + dx, r.y + r.height + dy};
		line.wordBegin = firstIndex;
		line.wordEnd = results.words.size();
		results.lines.push_back(line);
	}

	results.items = clusterColumns(results.words, m_options.gapThreshold);
	return results;
}

} // namespace overlay_ocr
