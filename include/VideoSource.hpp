/**
 * @file VideoSource.hpp
 * @brief RAII wrapper around the camera or video file feeding the session
 * @date 2025
 */

#pragma once

#include <opencv2/videoio.hpp>
#include <cstdint>
#include <string>
#include "Session.hpp"

/**
 * @brief RAII wrapper for OpenCV VideoCapture that stamps frames with a sequence number
 */
class VideoSource {
private:
    cv::VideoCapture cap;
    bool initialized;
    uint64_t sequence;

public:
    /**
     * @param source Camera index ("0", "1", ...) or a video file / stream URL
     */
    explicit VideoSource(const std::string& source);
    ~VideoSource();

    // Non-copyable
    VideoSource(const VideoSource&) = delete;
    VideoSource& operator=(const VideoSource&) = delete;

    bool isOpened() const;

    /**
     * @brief Reads the next frame
     * @return false at end of stream or on a read error
     */
    bool read(Frame& frame);
};

/**
 * @brief True if source names a camera index rather than a file
 */
bool isCameraIndex(const std::string& source);
