#pragma once

#include <QRect>
#include <QString>
#include <cstdint>

// Source clip selection for a video export. The crop box is checked against the
// real frame size only once the source is opened.
struct VideoExportParams {
    QString sourcePath;
    QRect cropBox;          // x, y, w, h in source pixels
    int64_t startFrame = 0;
    int64_t endFrame = 0;   // exclusive
    double fps = 30.0;

    int64_t frameCount() const { return endFrame - startFrame; }
};
