#pragma once

#include <QString>
#include <cstdint>
#include "ExportTask.h"

class CancellationToken;
class ExportProgressSink;

// Percentages reported by one video task inside its 100 / n share of the batch.
// Values never decrease.
class VideoTaskProgress {
public:
    VideoTaskProgress(int taskIndex, int totalTasks, int64_t totalFrames);

    int base() const { return m_base; }
    // Interpolated position after the frame with the given 0-based index
    int frame(int64_t index);
    // Checkpoint reported before the encoder runs
    int encoding();

private:
    int m_base;
    int m_totalTasks;
    int64_t m_totalFrames;
    int m_last;
};

// Runs every task of a batch in order on the calling thread.
//
// Progress: task i starts at floor(i * 100 / n). Video tasks report inside their
// 100 / n share every FrameProgressInterval frames and once more before encoding.
// The first failing task ends the batch; outputs of earlier tasks stay on disk.
class ExportJob {
public:
    ExportJob(ExportBatch batch, ExportSettings settings);

    ExportOutcome run(const CancellationToken& cancel, ExportProgressSink* sink);

    const ExportBatch& batch() const { return m_batch; }

private:
    void executeTask(const ExportTask& task, int index, const CancellationToken& cancel);
    void writeImage(const ImageTask& task, const QString& outputPath);
    void writeVideo(const VideoTask& task, const QString& outputPath, int index,
                    const CancellationToken& cancel);
    // Failures are logged as ManifestWriteFailure and do not fail the batch
    void writeManifest();

    void reportProgress(int percent, const QString& message);

    ExportBatch m_batch;
    ExportSettings m_settings;
    ExportProgressSink* m_sink = nullptr;
    int m_totalTasks = 0;
};
