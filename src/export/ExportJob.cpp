#include "ExportJob.h"
#include "ExportProgressSink.h"
#include "AppConstants.h"
#include "CancellationToken.h"
#include "FrameExtractor.h"
#include "Log.h"
#include "PixelCodec.h"
#include "VideoEncoder.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QTemporaryDir>
#include <QTextStream>
#include <algorithm>
#include <functional>
#include <type_traits>

namespace {

// Writes frames to the temp directory and reports interpolated progress
// inside the owning task's share of the batch.
class ProgressFrameSink : public DirectoryFrameSink {
public:
    using ProgressFn = std::function<void(int64_t index)>;

    ProgressFrameSink(const QString& directory, ProgressFn progressFn)
        : DirectoryFrameSink(directory), m_progressFn(std::move(progressFn)) {}

    void writeFrame(int64_t index, const QImage& frame) override {
        DirectoryFrameSink::writeFrame(index, frame);
        if (index % AppConstants::FrameProgressInterval == 0)
            m_progressFn(index);
    }

private:
    ProgressFn m_progressFn;
};

} // namespace

// --- VideoTaskProgress ---

VideoTaskProgress::VideoTaskProgress(int taskIndex, int totalTasks, int64_t totalFrames)
    : m_base(taskIndex * 100 / totalTasks)
    , m_totalTasks(totalTasks)
    , m_totalFrames(totalFrames)
    , m_last(m_base)
{}

int VideoTaskProgress::frame(int64_t index) {
    const double share = 100.0 / m_totalTasks;
    const int percent = m_base + static_cast<int>(static_cast<double>(index) / m_totalFrames * share);
    m_last = std::max(m_last, percent);
    return m_last;
}

int VideoTaskProgress::encoding() {
    m_last = std::max(m_last, m_base + static_cast<int>(80.0 / m_totalTasks));
    return m_last;
}

// --- ExportJob ---

ExportJob::ExportJob(ExportBatch batch, ExportSettings settings)
    : m_batch(std::move(batch))
    , m_settings(std::move(settings))
{}

ExportOutcome ExportJob::run(const CancellationToken& cancel, ExportProgressSink* sink) {
    m_sink = sink;
    m_totalTasks = static_cast<int>(m_batch.tasks.size());

    if (m_totalTasks == 0) {
        return ExportOutcome::failed(std::nullopt, AssetErrorKind::InvalidInput, "No tasks to export");
    }

    if (!QDir().mkpath(m_batch.outputDir)) {
        return ExportOutcome::failed(std::nullopt, AssetErrorKind::IoFailure,
                                     QString("Cannot create output directory: %1").arg(m_batch.outputDir));
    }

    EPA_LOG_INFO("Exporting {} task(s) to {}", m_totalTasks, qUtf8Printable(m_batch.outputDir));

    int completed = 0;
    for (int i = 0; i < m_totalTasks; ++i) {
        const ExportTask& task = m_batch.tasks[static_cast<size_t>(i)];

        if (cancel.isCancelled()) {
            EPA_LOG_INFO("Export cancelled before task {} ({})", i + 1, exportTaskKindName(task.kind()));
            return ExportOutcome::cancelled(completed);
        }

        try {
            executeTask(task, i, cancel);
            ++completed;
        } catch (const AssetError& e) {
            if (e.kind() == AssetErrorKind::Cancelled) {
                EPA_LOG_INFO("Export cancelled during {}", exportTaskKindName(task.kind()));
                return ExportOutcome::cancelled(completed);
            }
            EPA_LOG_ERROR("Task {} failed [{}]: {}", exportTaskKindName(task.kind()),
                          assetErrorKindName(e.kind()), e.what());
            return ExportOutcome::failed(task.kind(), e.kind(), e.message());
        } catch (const std::exception& e) {
            // Unclassified failure, e.g. allocation; still fatal to the batch
            EPA_LOG_ERROR("Task {} failed: {}", exportTaskKindName(task.kind()), e.what());
            return ExportOutcome::failed(task.kind(), AssetErrorKind::None, QString::fromUtf8(e.what()));
        }
    }

    if (!m_batch.metadata.empty())
        writeManifest();

    reportProgress(100, "Export complete");
    EPA_LOG_INFO("Exported {} file(s) to {}", completed, qUtf8Printable(m_batch.outputDir));
    return ExportOutcome::completed(completed, m_batch.outputDir);
}

void ExportJob::executeTask(const ExportTask& task, int index, const CancellationToken& cancel) {
    const int baseProgress = index * 100 / m_totalTasks;
    const QString outputPath = QDir(m_batch.outputDir).filePath(task.outputRelativePath());

    EPA_LOG_INFO("Task {}/{}: {} -> {}", index + 1, m_totalTasks,
                 exportTaskKindName(task.kind()), qUtf8Printable(outputPath));
    reportProgress(baseProgress, QString("Exporting %1...").arg(task.outputRelativePath()));

    std::visit([&](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, ImageTask>) {
            writeImage(payload, outputPath);
        } else {
            writeVideo(payload, outputPath, index, cancel);
        }
    }, task.payload());
}

void ExportJob::writeImage(const ImageTask& task, const QString& outputPath) {
    const PixelCodec::PackLayout layout = task.kind == ExportTaskKind::Logo
        ? PixelCodec::PackLayout::Logo
        : PixelCodec::PackLayout::Standard;

    EPA_LOG_DEBUG("{} image {}x{}x{}", exportTaskKindName(task.kind),
                  task.buffer.width, task.buffer.height, task.buffer.channels);
    const QByteArray packed = PixelCodec::encode(task.buffer, layout);

    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        throw AssetError(AssetErrorKind::IoFailure,
                         QString("Cannot write %1: %2").arg(outputPath, file.errorString()));
    }
    if (file.write(packed) != packed.size() || !file.commit()) {
        throw AssetError(AssetErrorKind::IoFailure,
                         QString("Cannot write %1: %2").arg(outputPath, file.errorString()));
    }
}

void ExportJob::writeVideo(const VideoTask& task, const QString& outputPath, int index,
                           const CancellationToken& cancel) {
    const VideoExportParams& params = task.params;
    if (m_settings.encoder.encoderPath.isEmpty()) {
        throw AssetError(AssetErrorKind::EncoderUnavailable, "ffmpeg not found, cannot export video");
    }
    if (params.fps <= 0.0) {
        throw AssetError(AssetErrorKind::InvalidInput, QString("Invalid frame rate %1").arg(params.fps));
    }

    // Removed on every exit path when it goes out of scope
    QTemporaryDir frameDir(QDir(m_batch.outputDir).filePath(AppConstants::TempFramesTemplate));
    if (!frameDir.isValid()) {
        throw AssetError(AssetErrorKind::IoFailure,
                         QString("Cannot create frame directory: %1").arg(frameDir.errorString()));
    }

    const int64_t totalFrames = params.frameCount();
    VideoTaskProgress progress(index, m_totalTasks, totalFrames);

    ProgressFrameSink sink(frameDir.path(), [&](int64_t frameIndex) {
        reportProgress(progress.frame(frameIndex),
                       QString("Processing frame %1/%2...").arg(frameIndex).arg(totalFrames));
    });

    FrameExtractor extractor(m_settings.screenSize, m_settings.videoCanvasWidth);
    const int64_t produced = extractor.extract(params, cancel, sink);
    if (produced == 0) {
        throw AssetError(AssetErrorKind::FrameReadFailure,
                         QString("No frames could be read from %1 in range %2-%3")
                             .arg(params.sourcePath).arg(params.startFrame).arg(params.endFrame));
    }
    if (produced < totalFrames) {
        EPA_LOG_WARN("{}: only {} of {} frames available", exportTaskKindName(task.kind),
                     produced, totalFrames);
    }

    reportProgress(progress.encoding(), "Encoding video...");

    VideoEncoder encoder(m_settings.encoder);
    encoder.encode(frameDir.path(), params.fps, outputPath);
}

void ExportJob::writeManifest() {
    const QString path = QDir(m_batch.outputDir).filePath(AppConstants::ManifestFileName);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        EPA_LOG_WARN("[{}] Cannot write manifest {}: {}",
                     assetErrorKindName(AssetErrorKind::ManifestWriteFailure),
                     qUtf8Printable(path), qUtf8Printable(file.errorString()));
        return;
    }

    QTextStream out(&file);
    out.setEncoding(QStringConverter::Utf8);
    for (const auto& entry : m_batch.metadata) {
        out << entry.first << '=' << entry.second << '\n';
    }
    out.flush();

    if (out.status() != QTextStream::Ok) {
        EPA_LOG_WARN("[{}] Incomplete manifest {}",
                     assetErrorKindName(AssetErrorKind::ManifestWriteFailure), qUtf8Printable(path));
        return;
    }

    EPA_LOG_INFO("Wrote manifest {}", qUtf8Printable(path));
}

void ExportJob::reportProgress(int percent, const QString& message) {
    if (m_sink)
        m_sink->progress(percent, message);
}
