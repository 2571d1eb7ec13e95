#pragma once

#include <QImage>
#include <QString>
#include <memory>

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    double duration = 0.0;  // seconds
    int64_t totalFrames = 0;
    QString codecName;
};

// Sequential frame reader over the best video stream of a file.
class VideoDecoder {
public:
    VideoDecoder();
    ~VideoDecoder();

    VideoDecoder(const VideoDecoder&) = delete;
    VideoDecoder& operator=(const VideoDecoder&) = delete;

    bool open(const QString& filePath);
    void close();
    bool isOpen() const { return m_isOpen; }

    // Null image at end of stream or on a decode error.
    QImage decodeNextFrame();

    // Positions the decoder so that the next decodeNextFrame() returns the frame with
    // the given index. Seeks to the preceding keyframe and decodes forward.
    // Returns false when the index lies past the end of the stream.
    bool seekToFrame(int64_t frameIndex);

    double currentTime() const { return m_currentTime; }
    int64_t currentFrameIndex() const { return m_currentFrame; }

    const VideoInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    bool seek(double seconds);
    int64_t frameIndexForTime(double seconds) const;

    bool m_isOpen = false;
    double m_currentTime = 0.0;
    int64_t m_currentFrame = -1;
    VideoInfo m_info;
    QString m_error;
    QImage m_pending;   // frame found by seekToFrame, returned by the next decodeNextFrame

#ifdef HAS_FFMPEG
    struct FFmpegContext;
    std::unique_ptr<FFmpegContext> m_ctx;
#endif
};
