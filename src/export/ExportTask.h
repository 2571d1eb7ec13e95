#pragma once

#include <QSize>
#include <QString>
#include <optional>
#include <utility>
#include <variant>
#include <vector>
#include "AppConstants.h"
#include "AssetError.h"
#include "ImageBuffer.h"
#include "VideoEncoder.h"
#include "VideoExportParams.h"

enum class ExportTaskKind {
    Logo,
    Overlay,
    Display,
    LoopVideo,
    IntroVideo
};

const char* exportTaskKindName(ExportTaskKind kind);
QString defaultOutputFileName(ExportTaskKind kind);
bool isVideoKind(ExportTaskKind kind);

struct ImageTask {
    ExportTaskKind kind;
    ImageBuffer buffer;
};

struct VideoTask {
    ExportTaskKind kind;
    VideoExportParams params;
};

// One output file. The payload alternative fixes the execution strategy.
class ExportTask {
public:
    using Payload = std::variant<ImageTask, VideoTask>;

    // Throw AssetError(InvalidInput) when the kind does not fit the payload type.
    static ExportTask image(ExportTaskKind kind, ImageBuffer buffer,
                            const QString& outputRelativePath = QString());
    static ExportTask video(ExportTaskKind kind, VideoExportParams params,
                            const QString& outputRelativePath = QString());

    ExportTaskKind kind() const;
    const QString& outputRelativePath() const { return m_outputRelativePath; }
    const Payload& payload() const { return m_payload; }

private:
    ExportTask(Payload payload, QString outputRelativePath);

    Payload m_payload;
    QString m_outputRelativePath;
};

using Metadata = std::vector<std::pair<QString, QString>>;

struct ExportBatch {
    std::vector<ExportTask> tasks;
    QString outputDir;
    Metadata metadata;      // written as the manifest when non-empty
};

// Everything a job needs besides the batch itself.
struct ExportSettings {
    EncoderSettings encoder;
    QSize screenSize{AppConstants::ScreenWidth, AppConstants::ScreenHeight};
    int videoCanvasWidth = AppConstants::VideoCanvasWidth;
};

struct ExportOutcome {
    enum class Status { Completed, Failed, Cancelled };

    Status status = Status::Failed;
    int completedCount = 0;
    QString outputDir;
    std::optional<ExportTaskKind> failedKind;   // unset for batch-level failures
    AssetErrorKind errorKind = AssetErrorKind::None;
    QString reason;

    static ExportOutcome completed(int count, const QString& outputDir);
    static ExportOutcome failed(std::optional<ExportTaskKind> kind, AssetErrorKind errorKind,
                                const QString& reason);
    static ExportOutcome cancelled(int count);

    // Human readable one-liner for the completion or failure notification.
    QString message() const;
};
