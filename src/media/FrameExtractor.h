#pragma once

#include <QImage>
#include <QSize>
#include <QString>
#include <cstdint>
#include "VideoExportParams.h"

class CancellationToken;

class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void writeFrame(int64_t index, const QImage& frame) = 0;
};

// Writes frames as <dir>/frame_000000.png, frame_000001.png, ...
class DirectoryFrameSink : public FrameSink {
public:
    explicit DirectoryFrameSink(const QString& directory);

    void writeFrame(int64_t index, const QImage& frame) override;

    const QString& directory() const { return m_directory; }
    static QString framePath(const QString& directory, int64_t index);
    // printf-style pattern matching every framePath() name, e.g. frame_%06d.png
    static QString framePattern();

private:
    QString m_directory;
};

// Reads a frame range from a video and converts every frame to the client layout:
// crop -> rotate 180 -> resize to the screen -> left-pad with black to the canvas width.
class FrameExtractor {
public:
    FrameExtractor(const QSize& screenSize, int canvasWidth);

    // Returns the number of frames handed to the sink. A source shorter than the
    // requested range yields fewer frames without an error.
    // Throws AssetError: InvalidInput, FrameReadFailure, Cancelled.
    int64_t extract(const VideoExportParams& params, const CancellationToken& cancel, FrameSink& sink);

    QImage transformFrame(const QImage& frame, const QRect& cropBox) const;

private:
    QSize m_screenSize;
    int m_canvasWidth;
};
