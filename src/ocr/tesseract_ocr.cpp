#include "ocr/tesseract_ocr.hpp"
#include "util/log.hpp"

#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::unique_ptr<tesseract::TessBaseAPI> initApi(const std::string& tessdataPath, const std::string& language,
                                                int pageSegMode) {
    auto api = std::make_unique<tesseract::TessBaseAPI>();
    const char* datapath = tessdataPath.empty() ? nullptr : tessdataPath.c_str();
    if (api->Init(datapath, language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
        throw std::runtime_error("Tesseract init failed for language '" + language + "'");
    }
    api->SetPageSegMode(static_cast<tesseract::PageSegMode>(pageSegMode));
    api->SetVariable("debug_file", "/dev/null");
    return api;
}

cv::Mat toGray(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 1) {
        gray = image;
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    }
    return gray;
}

std::string takeText(char* raw) {
    std::string out = raw ? raw : "";
    delete[] raw;
    return out;
}

std::string collapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prevSpace = false;
    for (unsigned char ch : s) {
        if (std::isspace(ch)) {
            if (!out.empty() && !prevSpace) out.push_back(' ');
            prevSpace = true;
        } else {
            out.push_back((char)ch);
            prevSpace = false;
        }
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

} // namespace

// Constructor
TesseractFastOcr::TesseractFastOcr(Config config)
    : config_(std::move(config)), api_(initApi(config_.tessdataPath, config_.language, config_.pageSegMode)) {}

// Destructor
TesseractFastOcr::~TesseractFastOcr() {
    if (api_) api_->End();
}

TextResult TesseractFastOcr::extractText(const cv::Mat& image) {
    if (image.empty()) return TextResult::empty();

    try {
        cv::Mat img = image;
        const int maxSide = std::max(image.cols, image.rows);
        if (config_.maxSide > 0 && maxSide > config_.maxSide) {
            const double s = (double)config_.maxSide / (double)maxSide;
            cv::resize(image, img, cv::Size(), s, s, cv::INTER_AREA);
        }
        const cv::Mat gray = toGray(img);

        std::lock_guard<std::mutex> lock(mutex_);
        api_->SetImage(gray.data, gray.cols, gray.rows, 1, (int)gray.step);
        return TextResult::ok(collapseWhitespace(takeText(api_->GetUTF8Text())));
    } catch (const std::exception& e) {
        logDebug("Fast OCR") << "Frame rejected: " << e.what();
        return TextResult::failure(e.what());
    }
}

// Constructor
TesseractAccurateOcr::TesseractAccurateOcr(Config config)
    : config_(std::move(config)), api_(initApi(config_.tessdataPath, config_.language, config_.pageSegMode)) {}

// Destructor
TesseractAccurateOcr::~TesseractAccurateOcr() {
    if (api_) api_->End();
}

TextResult TesseractAccurateOcr::extract(const cv::Mat& image) {
    if (image.empty()) return TextResult::empty();

    try {
        cv::Mat gray = toGray(image);

        // Small glyphs lose strokes in the LSTM; upscale toward minTextHeight first
        if (config_.minTextHeight > 0 && gray.rows < config_.minTextHeight) {
            const double s = std::min(3.0, (double)config_.minTextHeight / (double)std::max(1, gray.rows));
            cv::resize(gray, gray, cv::Size(), s, s, cv::INTER_CUBIC);
        }

        cv::Mat denoised, binary;
        cv::bilateralFilter(gray, denoised, 7, 40, 40);
        cv::adaptiveThreshold(denoised, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 31, 10);

        std::lock_guard<std::mutex> lock(mutex_);
        api_->SetImage(binary.data, binary.cols, binary.rows, 1, (int)binary.step);

        if (config_.detectOrientation) {
            int degrees = 0;
            float orientConf = 0.0f;
            const char* script = nullptr;
            float scriptConf = 0.0f;
            if (api_->DetectOrientationScript(&degrees, &orientConf, &script, &scriptConf) && degrees != 0 &&
                orientConf >= config_.minOrientationConfidence) {
                logInfo("Accurate OCR") << "Text rotated " << degrees << " degrees, correcting";
                binary = uprightImage(binary, degrees);
                api_->SetImage(binary.data, binary.cols, binary.rows, 1, (int)binary.step);
            }
        }

        if (api_->Recognize(nullptr) != 0) {
            return TextResult::failure("Tesseract recognition failed");
        }

        std::string out;
        std::unique_ptr<tesseract::ResultIterator> it(api_->GetIterator());
        if (it) {
            const tesseract::PageIteratorLevel level = tesseract::RIL_TEXTLINE;
            do {
                const float conf = it->Confidence(level);
                const std::string line = collapseWhitespace(takeText(it->GetUTF8Text(level)));
                if (line.empty() || conf < config_.minLineConfidence) continue;
                if (!out.empty()) out.push_back(' ');
                out += line;
            } while (it->Next(level));
        }
        return TextResult::ok(out);
    } catch (const std::exception& e) {
        logError("Accurate OCR") << e.what();
        return TextResult::failure(e.what());
    }
}
