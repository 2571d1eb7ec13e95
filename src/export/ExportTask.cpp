#include "ExportTask.h"

const char* exportTaskKindName(ExportTaskKind kind) {
    switch (kind) {
    case ExportTaskKind::Logo:       return "logo";
    case ExportTaskKind::Overlay:    return "overlay";
    case ExportTaskKind::Display:    return "display";
    case ExportTaskKind::LoopVideo:  return "loop";
    case ExportTaskKind::IntroVideo: return "intro";
    }
    return "unknown";
}

QString defaultOutputFileName(ExportTaskKind kind) {
    switch (kind) {
    case ExportTaskKind::Logo:       return "logo.argb";
    case ExportTaskKind::Overlay:    return "overlay.argb";
    case ExportTaskKind::Display:    return "display.argb";
    case ExportTaskKind::LoopVideo:  return "loop.mp4";
    case ExportTaskKind::IntroVideo: return "intro.mp4";
    }
    return QString();
}

bool isVideoKind(ExportTaskKind kind) {
    return kind == ExportTaskKind::LoopVideo || kind == ExportTaskKind::IntroVideo;
}

// --- ExportTask ---

ExportTask::ExportTask(Payload payload, QString outputRelativePath)
    : m_payload(std::move(payload))
    , m_outputRelativePath(std::move(outputRelativePath))
{}

ExportTask ExportTask::image(ExportTaskKind kind, ImageBuffer buffer, const QString& outputRelativePath) {
    if (isVideoKind(kind)) {
        throw AssetError(AssetErrorKind::InvalidInput,
                         QString("Task kind '%1' needs video parameters").arg(exportTaskKindName(kind)));
    }
    const QString path = outputRelativePath.isEmpty() ? defaultOutputFileName(kind) : outputRelativePath;
    return ExportTask(ImageTask{kind, std::move(buffer)}, path);
}

ExportTask ExportTask::video(ExportTaskKind kind, VideoExportParams params, const QString& outputRelativePath) {
    if (!isVideoKind(kind)) {
        throw AssetError(AssetErrorKind::InvalidInput,
                         QString("Task kind '%1' needs an image").arg(exportTaskKindName(kind)));
    }
    const QString path = outputRelativePath.isEmpty() ? defaultOutputFileName(kind) : outputRelativePath;
    return ExportTask(VideoTask{kind, std::move(params)}, path);
}

ExportTaskKind ExportTask::kind() const {
    return std::visit([](const auto& task) { return task.kind; }, m_payload);
}

// --- ExportOutcome ---

ExportOutcome ExportOutcome::completed(int count, const QString& outputDir) {
    ExportOutcome outcome;
    outcome.status = Status::Completed;
    outcome.completedCount = count;
    outcome.outputDir = outputDir;
    return outcome;
}

ExportOutcome ExportOutcome::failed(std::optional<ExportTaskKind> kind, AssetErrorKind errorKind,
                                    const QString& reason) {
    ExportOutcome outcome;
    outcome.status = Status::Failed;
    outcome.failedKind = kind;
    outcome.errorKind = errorKind;
    outcome.reason = reason;
    return outcome;
}

ExportOutcome ExportOutcome::cancelled(int count) {
    ExportOutcome outcome;
    outcome.status = Status::Cancelled;
    outcome.completedCount = count;
    outcome.errorKind = AssetErrorKind::Cancelled;
    return outcome;
}

QString ExportOutcome::message() const {
    switch (status) {
    case Status::Completed:
        return QString("Exported %1 file(s) to %2").arg(completedCount).arg(outputDir);
    case Status::Cancelled:
        return "Export cancelled";
    case Status::Failed:
        if (failedKind)
            return QString("Export of %1 failed: %2").arg(exportTaskKindName(*failedKind), reason);
        return QString("Export failed: %1").arg(reason);
    }
    return QString();
}
