#include "VideoSource.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

bool isCameraIndex(const std::string& source) {
    return !source.empty() &&
           std::all_of(source.begin(), source.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

VideoSource::VideoSource(const std::string& source) : initialized(false), sequence(0) {
    try {
        if (isCameraIndex(source)) {
            cap.open(std::stoi(source));
        } else {
            cap.open(source);
        }
    } catch (const cv::Exception& e) {
        std::cerr << "Video: cannot open '" << source << "': " << e.what() << "\n";
    }
    initialized = cap.isOpened();
}

VideoSource::~VideoSource() {
    if (initialized) {
        cap.release();
    }
}

bool VideoSource::isOpened() const {
    return initialized && cap.isOpened();
}

bool VideoSource::read(Frame& frame) {
    if (!isOpened()) return false;
    cv::Mat image;
    if (!cap.read(image) || image.empty()) return false;
    frame.image = image;
    frame.size = image.size();
    frame.sequence = ++sequence;
    return true;
}
