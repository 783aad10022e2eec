/**
 * @file preprocess.cpp
 * @brief Image preprocessing for small, low-contrast overlay text
 */

#include "processing/preprocess.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <stdexcept>

namespace overlay_ocr {

namespace {

int clampInt(int v, int lo, int hi) {
    return (std::max)(lo, (std::min)(hi, v));
}

// 4-channel LUT that maps RGB through fn and leaves alpha as identity.
cv::Mat buildRgbLut(const std::function<int(int)>& fn) {
    cv::Mat lut(1, 256, CV_8UC4);
    for (int i = 0; i < 256; i++) {
        const uchar v = static_cast<uchar>(clampInt(fn(i), 0, 255));
        lut.at<cv::Vec4b>(0, i) = cv::Vec4b(v, v, v, static_cast<uchar>(i));
    }
    return lut;
}

void applyRgbLut(cv::Mat& img, const std::function<int(int)>& fn) {
    if (img.type() != CV_8UC4) {
        throw std::invalid_argument("expected CV_8UC4 image");
    }
    cv::Mat out;
    cv::LUT(img, buildRgbLut(fn), out);
    img = out;
}

} // namespace

cv::Mat wrapRgba(const RgbaImage& image) {
    if (image.empty()) return cv::Mat();
    return cv::Mat(static_cast<int>(image.height), static_cast<int>(image.width), CV_8UC4,
                   const_cast<uint8_t*>(image.pixels.data()));
}

cv::Mat cropRgba(const RgbaImage& image, const PixelRect& bounds) {
    if (image.empty()) return cv::Mat();

    const uint64_t x0 = (std::min)(static_cast<uint64_t>(bounds.x), static_cast<uint64_t>(image.width));
    const uint64_t y0 = (std::min)(static_cast<uint64_t>(bounds.y), static_cast<uint64_t>(image.height));
    const uint64_t x1 = (std::min)(static_cast<uint64_t>(bounds.x) + bounds.w, static_cast<uint64_t>(image.width));
    const uint64_t y1 = (std::min)(static_cast<uint64_t>(bounds.y) + bounds.h, static_cast<uint64_t>(image.height));
    if (x1 <= x0 || y1 <= y0) {
        return cv::Mat();
    }

    const cv::Rect roi(static_cast<int>(x0), static_cast<int>(y0),
                       static_cast<int>(x1 - x0), static_cast<int>(y1 - y0));
    return wrapRgba(image)(roi).clone();
}

cv::Mat unsharpen(const cv::Mat& src, float sigma, int threshold) {
    CV_Assert(src.type() == CV_8UC4);

    cv::Mat blurred;
    cv::GaussianBlur(src, blurred, cv::Size(0, 0), sigma, sigma);

    cv::Mat out(src.size(), src.type());
    const int channels = src.channels();
    for (int y = 0; y < src.rows; y++) {
        const uchar* a = src.ptr<uchar>(y);
        const uchar* b = blurred.ptr<uchar>(y);
        uchar* o = out.ptr<uchar>(y);
        for (int i = 0; i < src.cols * channels; i++) {
            const int ic = a[i];
            const int diff = ic - static_cast<int>(b[i]);
            o[i] = (std::abs(diff) > threshold)
                ? static_cast<uchar>(clampInt(ic + diff, 0, 255))
                : static_cast<uchar>(ic);
        }
    }
    return out;
}

void adjustContrast(cv::Mat& img, float contrast) {
    const float percent = std::pow((100.0f + contrast) / 100.0f, 2.0f);
    applyRgbLut(img, [percent](int c) {
        const float d = ((static_cast<float>(c) / 255.0f - 0.5f) * percent + 0.5f) * 255.0f;
        return static_cast<int>((std::max)(0.0f, (std::min)(255.0f, d)));
    });
}

void brighten(cv::Mat& img, int value) {
    applyRgbLut(img, [value](int c) { return c + value; });
}

void invertColors(cv::Mat& img) {
    applyRgbLut(img, [](int c) { return 255 - c; });
}

cv::Mat preprocessForOcr(const cv::Mat& rgba, const PreprocessParams& params) {
    cv::Mat img = unsharpen(rgba, params.firstUnsharpSigma, params.firstUnsharpThreshold);
    adjustContrast(img, params.firstContrast);

    cv::Mat blurred;
    cv::GaussianBlur(img, blurred, cv::Size(0, 0), params.blurSigma, params.blurSigma);

    img = unsharpen(blurred, params.secondUnsharpSigma, params.secondUnsharpThreshold);
    invertColors(img);
    brighten(img, params.brightness);
    adjustContrast(img, params.finalContrast);
    return img;
}

} // namespace overlay_ocr
