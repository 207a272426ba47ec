#include "ocr/ocr_engine.hpp"

#include <cctype>

unsigned FastOcr::extractWords(const cv::Mat& image) {
    TextResult result;
    try {
        result = extractText(image);
    } catch (const std::exception&) {
        return 0;
    }
    if (!result.hasText()) return 0;
    return countWords(result.text);
}

cv::Mat uprightImage(const cv::Mat& image, int clockwiseDegrees) {
    cv::Mat out;
    switch (((clockwiseDegrees % 360) + 360) % 360) {
        case 90:  cv::rotate(image, out, cv::ROTATE_90_COUNTERCLOCKWISE); return out;
        case 180: cv::rotate(image, out, cv::ROTATE_180); return out;
        case 270: cv::rotate(image, out, cv::ROTATE_90_CLOCKWISE); return out;
        default:  return image;
    }
}

unsigned countWords(const std::string& text) {
    unsigned words = 0;
    bool inWord = false;
    for (unsigned char ch : text) {
        const bool wordChar = std::isalnum(ch) || ch == '_' || ch >= 0x80;
        if (wordChar && !inWord) words++;
        inWord = wordChar;
    }
    return words;
}
