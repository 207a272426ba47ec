#ifndef TESSERACT_OCR_HPP
#define TESSERACT_OCR_HPP

#include "ocr/ocr_engine.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace tesseract {
class TessBaseAPI;
}

// Tesseract on a downscaled grayscale frame, single-block page segmentation
class TesseractFastOcr : public FastOcr {
public:
    struct Config {
        std::string language = "eng";
        std::string tessdataPath;
        int pageSegMode = 6;
        int maxSide = 960;
    };

    explicit TesseractFastOcr(Config config);
    ~TesseractFastOcr() override;

    TextResult extractText(const cv::Mat& image) override;

private:
    Config config_;
    std::unique_ptr<tesseract::TessBaseAPI> api_;
    std::mutex mutex_;
};

// Tesseract on an upscaled, denoised, binarized frame with orientation correction
// and per-line confidence filtering
class TesseractAccurateOcr : public AccurateOcr {
public:
    struct Config {
        std::string language = "eng";
        std::string tessdataPath;
        int pageSegMode = 3;
        int minTextHeight = 1080;
        float minLineConfidence = 40.0f;

        // Orientation pre-pass (needs osd.traineddata); rotated signs are turned upright first
        bool detectOrientation = true;
        float minOrientationConfidence = 2.0f;
    };

    explicit TesseractAccurateOcr(Config config);
    ~TesseractAccurateOcr() override;

    TextResult extract(const cv::Mat& image) override;

private:
    Config config_;
    std::unique_ptr<tesseract::TessBaseAPI> api_;
    std::mutex mutex_;
};

#endif
