#include <cassert>
#include <cstdio>
#include <atomic>
#include <vector>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QMutex>
#include <QMutexLocker>
#include <QSemaphore>
#include <QTemporaryDir>
#include "export/ExportJob.h"
#include "export/ExportProgressSink.h"
#include "export/ExportRunner.h"
#include "export/ExportService.h"
#include "media/FrameExtractor.h"
#include "media/VideoEncoder.h"
#include "util/CancellationToken.h"

// Records every notification. Optionally blocks inside the first progress call
// or cancels the runner from it.
class RecordingSink : public ExportProgressSink {
public:
    void progress(int percent, const QString& message) override {
        bool first = false;
        {
            QMutexLocker lock(&m_mutex);
            first = m_percents.empty();
            m_percents.push_back(percent);
            m_messages.push_back(message);
        }
        if (first && cancelTarget)
            cancelTarget->cancel();
        if (first && blockFirst) {
            entered.release();
            gate.acquire();
        }
    }

    void finished(const ExportOutcome& outcome) override {
        QMutexLocker lock(&m_mutex);
        m_outcomes.push_back(outcome);
    }

    std::vector<int> percents() const {
        QMutexLocker lock(&m_mutex);
        return m_percents;
    }

    std::vector<ExportOutcome> outcomes() const {
        QMutexLocker lock(&m_mutex);
        return m_outcomes;
    }

    bool blockFirst = false;
    ExportRunner* cancelTarget = nullptr;
    QSemaphore entered;
    QSemaphore gate;

private:
    mutable QMutex m_mutex;
    std::vector<int> m_percents;
    std::vector<QString> m_messages;
    std::vector<ExportOutcome> m_outcomes;
};

static ImageBuffer solidImage(int w, int h, uchar value) {
    ImageBuffer img(w, h, 3);
    img.data.fill(static_cast<char>(value));
    return img;
}

static ExportBatch threeImageBatch(const QString& outputDir) {
    ExportBatch batch;
    batch.outputDir = outputDir;
    batch.tasks.push_back(ExportTask::image(ExportTaskKind::Logo, solidImage(8, 8, 10)));
    batch.tasks.push_back(ExportTask::image(ExportTaskKind::Overlay, solidImage(36, 64, 20)));
    batch.tasks.push_back(ExportTask::image(ExportTaskKind::Display, solidImage(36, 64, 30)));
    return batch;
}

// Starts one more batch from inside finished()
class ChainingSink : public RecordingSink {
public:
    void finished(const ExportOutcome& outcome) override {
        RecordingSink::finished(outcome);
        if (runner && !nextDir.isEmpty()) {
            const QString dir = nextDir;
            nextDir.clear();
            chainedAccepted = runner->start(threeImageBatch(dir));
        }
    }

    ExportRunner* runner = nullptr;
    QString nextDir;
    std::atomic<bool> chainedAccepted{false};
};

static bool isNonDecreasing(const std::vector<int>& values) {
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i] < values[i - 1])
            return false;
    }
    return true;
}

static QString readText(const QString& path) {
    QFile file(path);
    bool opened = file.open(QIODevice::ReadOnly);
    assert(opened);
    return QString::fromUtf8(file.readAll());
}

void test_completed_batch_writes_files_and_manifest() {
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString out = QDir(tmp.path()).filePath("package");

    ExportBatch batch = threeImageBatch(out);
    batch.metadata = {{"name", "Texas"}, {"version", "2"}};

    RecordingSink sink;
    ExportRunner runner(&sink);
    assert(runner.state() == ExportRunnerState::Idle);
    assert(runner.start(std::move(batch)));
    runner.wait();

    assert(runner.state() == ExportRunnerState::Idle);
    auto outcome = runner.lastOutcome();
    assert(outcome.has_value());
    assert(outcome->status == ExportOutcome::Status::Completed);
    assert(outcome->completedCount == 3);
    assert(outcome->message() == QString("Exported 3 file(s) to %1").arg(out));

    assert(QFileInfo(QDir(out).filePath("logo.argb")).size() == 8 * 8 * 4);
    assert(QFileInfo(QDir(out).filePath("overlay.argb")).size() == 36 * 64 * 4);
    assert(QFileInfo(QDir(out).filePath("display.argb")).size() == 36 * 64 * 4);
    assert(readText(QDir(out).filePath("epconfig.txt")) == "name=Texas\nversion=2\n");

    auto percents = sink.percents();
    assert((percents == std::vector<int>{0, 33, 66, 100}));
    assert(sink.outcomes().size() == 1);

    printf("PASS: test_completed_batch_writes_files_and_manifest\n");
}

void test_no_manifest_without_metadata() {
    QTemporaryDir tmp;
    assert(tmp.isValid());

    RecordingSink sink;
    ExportRunner runner(&sink);
    assert(runner.start(threeImageBatch(tmp.path())));
    runner.wait();

    assert(runner.lastOutcome()->status == ExportOutcome::Status::Completed);
    assert(!QFileInfo::exists(QDir(tmp.path()).filePath("epconfig.txt")));

    printf("PASS: test_no_manifest_without_metadata\n");
}

void test_already_running_leaves_active_batch_alone() {
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString first = QDir(tmp.path()).filePath("first");
    const QString second = QDir(tmp.path()).filePath("second");

    RecordingSink sink;
    sink.blockFirst = true;
    ExportRunner runner(&sink);
    assert(runner.start(threeImageBatch(first)));

    sink.entered.acquire();
    assert(runner.isRunning());
    assert(!runner.start(threeImageBatch(second)));
    assert(runner.lastError() == AssetErrorKind::AlreadyRunning);
    assert(runner.isRunning());

    sink.gate.release();
    runner.wait();

    assert(runner.lastOutcome()->status == ExportOutcome::Status::Completed);
    assert(runner.lastOutcome()->completedCount == 3);
    assert(QFileInfo::exists(QDir(first).filePath("display.argb")));
    assert(!QFileInfo::exists(second));

    // Idle again, so a new batch is accepted
    assert(runner.start(threeImageBatch(second)));
    runner.wait();
    assert(QFileInfo::exists(QDir(second).filePath("display.argb")));

    printf("PASS: test_already_running_leaves_active_batch_alone\n");
}

void test_cancel_before_first_task() {
    QTemporaryDir tmp;
    assert(tmp.isValid());

    CancellationToken token;
    token.cancel();

    RecordingSink sink;
    ExportJob job(threeImageBatch(tmp.path()), ExportSettings{});
    ExportOutcome outcome = job.run(token, &sink);

    assert(outcome.status == ExportOutcome::Status::Cancelled);
    assert(outcome.completedCount == 0);
    assert(outcome.message() == "Export cancelled");
    assert(QDir(tmp.path()).entryList(QDir::Files).isEmpty());

    printf("PASS: test_cancel_before_first_task\n");
}

void test_cancel_between_tasks() {
    QTemporaryDir tmp;
    assert(tmp.isValid());

    RecordingSink sink;
    ExportRunner runner(&sink);
    sink.cancelTarget = &runner;

    ExportBatch batch = threeImageBatch(tmp.path());
    batch.metadata = {{"name", "x"}};
    assert(runner.start(std::move(batch)));
    runner.wait();

    auto outcome = runner.lastOutcome();
    assert(outcome->status == ExportOutcome::Status::Cancelled);
    assert(outcome->completedCount == 1);
    assert(QFileInfo::exists(QDir(tmp.path()).filePath("logo.argb")));
    assert(!QFileInfo::exists(QDir(tmp.path()).filePath("overlay.argb")));
    assert(!QFileInfo::exists(QDir(tmp.path()).filePath("epconfig.txt")));

    auto outcomes = sink.outcomes();
    assert(outcomes.size() == 1 && outcomes[0].status == ExportOutcome::Status::Cancelled);

    printf("PASS: test_cancel_between_tasks\n");
}

void test_failure_in_second_task() {
    QTemporaryDir tmp;
    assert(tmp.isValid());

    ExportSettings settings;
    // Any existing file passes the start() check; the task fails before the encoder runs
    settings.encoder.encoderPath = QCoreApplication::applicationFilePath();

    VideoExportParams params;
    params.sourcePath = QDir(tmp.path()).filePath("missing.mp4");
    params.cropBox = QRect(0, 0, 10, 10);
    params.startFrame = 0;
    params.endFrame = 10;
    params.fps = 30.0;

    ExportBatch batch;
    batch.outputDir = tmp.path();
    batch.tasks.push_back(ExportTask::image(ExportTaskKind::Logo, solidImage(4, 4, 1)));
    batch.tasks.push_back(ExportTask::video(ExportTaskKind::LoopVideo, params));
    batch.tasks.push_back(ExportTask::image(ExportTaskKind::Overlay, solidImage(4, 4, 2)));

    RecordingSink sink;
    ExportRunner runner(&sink, settings);
    assert(runner.start(std::move(batch)));
    runner.wait();

    auto outcome = runner.lastOutcome();
    assert(outcome->status == ExportOutcome::Status::Failed);
    assert(outcome->failedKind == ExportTaskKind::LoopVideo);
    assert(outcome->errorKind == AssetErrorKind::FrameReadFailure);
    assert(outcome->message().startsWith("Export of loop failed: "));

    assert(QFileInfo::exists(QDir(tmp.path()).filePath("logo.argb")));
    assert(!QFileInfo::exists(QDir(tmp.path()).filePath("loop.mp4")));
    assert(!QFileInfo::exists(QDir(tmp.path()).filePath("overlay.argb")));

    // No temp frame directory is left behind
    assert(QDir(tmp.path()).entryList(QStringList() << "temp_frames-*", QDir::Dirs).isEmpty());

    printf("PASS: test_failure_in_second_task\n");
}

void test_start_rejections() {
    QTemporaryDir tmp;
    assert(tmp.isValid());

    RecordingSink sink;
    ExportRunner runner(&sink);

    ExportBatch empty;
    empty.outputDir = tmp.path();
    assert(!runner.start(empty));
    assert(runner.lastError() == AssetErrorKind::InvalidInput);

    ExportBatch noDir = threeImageBatch(QString());
    assert(!runner.start(std::move(noDir)));
    assert(runner.lastError() == AssetErrorKind::InvalidInput);

    VideoExportParams params;
    params.sourcePath = "clip.mp4";
    params.cropBox = QRect(0, 0, 10, 10);
    params.endFrame = 5;
    ExportBatch video;
    video.outputDir = tmp.path();
    video.tasks.push_back(ExportTask::video(ExportTaskKind::IntroVideo, params));

    ExportSettings noEncoder;
    noEncoder.encoder.encoderPath = QDir(tmp.path()).filePath("no-such-ffmpeg");
    runner.setSettings(noEncoder);
    assert(!runner.start(std::move(video)));
    assert(runner.lastError() == AssetErrorKind::EncoderUnavailable);

    assert(runner.state() == ExportRunnerState::Idle);
    assert(sink.outcomes().empty());

    bool threw = false;
    try {
        ExportTask::image(ExportTaskKind::LoopVideo, solidImage(2, 2, 0));
    } catch (const AssetError& e) {
        threw = e.kind() == AssetErrorKind::InvalidInput;
    }
    assert(threw);

    printf("PASS: test_start_rejections\n");
}

void test_service_signals_and_requests() {
    QTemporaryDir tmp;
    assert(tmp.isValid());

    ExportService service;
    std::atomic<int> completed{0};
    QString completedMessage;
    QObject::connect(&service, &ExportService::exportCompleted, &service,
                     [&](const QString& message) {
        completedMessage = message;
        ++completed;
    }, Qt::DirectConnection);

    // Nothing requested
    assert(!service.exportAll(tmp.path(), std::nullopt));
    assert(service.lastError() == AssetErrorKind::InvalidInput);

    VideoExportParams params;
    assert(!service.exportVideo(tmp.path(), "sideways", params));
    assert(service.lastError() == AssetErrorKind::InvalidInput);

    assert(!service.setEncoderPath(QDir(tmp.path()).filePath("nope")));

    assert(service.exportLogo(tmp.path(), solidImage(16, 16, 99), {{"name", "Logo only"}}));
    service.wait();

    assert(completed == 1);
    assert(completedMessage == QString("Exported 1 file(s) to %1").arg(tmp.path()));
    assert(!service.isExporting());
    assert(QFileInfo(QDir(tmp.path()).filePath("logo.argb")).size() == 16 * 16 * 4);
    assert(readText(QDir(tmp.path()).filePath("epconfig.txt")) == "name=Logo only\n");

    printf("PASS: test_service_signals_and_requests\n");
}

void test_start_from_finished_is_accepted() {
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString first = QDir(tmp.path()).filePath("first");
    const QString second = QDir(tmp.path()).filePath("second");

    ChainingSink sink;
    ExportRunner runner(&sink);
    sink.runner = &runner;
    sink.nextDir = second;

    assert(runner.start(threeImageBatch(first)));
    runner.wait();

    assert(sink.chainedAccepted);
    assert(runner.lastError() == AssetErrorKind::None);
    assert(runner.state() == ExportRunnerState::Idle);

    auto outcomes = sink.outcomes();
    assert(outcomes.size() == 2);
    assert(outcomes[0].status == ExportOutcome::Status::Completed);
    assert(outcomes[1].status == ExportOutcome::Status::Completed);
    assert(outcomes[1].outputDir == second);
    assert(QFileInfo::exists(QDir(first).filePath("display.argb")));
    assert(QFileInfo::exists(QDir(second).filePath("display.argb")));

    printf("PASS: test_start_from_finished_is_accepted\n");
}

void test_service_export_from_completed_slot() {
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString first = QDir(tmp.path()).filePath("first");
    const QString second = QDir(tmp.path()).filePath("second");

    ExportService service;
    std::atomic<int> completed{0};
    std::atomic<int> failed{0};
    std::atomic<bool> chainedAccepted{false};

    QObject::connect(&service, &ExportService::exportFailed, &service,
                     [&](const QString&) { ++failed; }, Qt::DirectConnection);
    QObject::connect(&service, &ExportService::exportCompleted, &service,
                     [&](const QString&) {
        if (++completed == 1)
            chainedAccepted = service.exportLogo(second, solidImage(8, 8, 5));
    }, Qt::DirectConnection);

    assert(service.exportLogo(first, solidImage(8, 8, 4)));
    service.wait();

    assert(chainedAccepted);
    assert(completed == 2);
    assert(failed == 0);
    assert(!service.isExporting());
    assert(QFileInfo::exists(QDir(first).filePath("logo.argb")));
    assert(QFileInfo::exists(QDir(second).filePath("logo.argb")));

    printf("PASS: test_service_export_from_completed_slot\n");
}

void test_video_task_progress() {
    // Second of two tasks, 40 frames: share is 50 points starting at 50
    VideoTaskProgress progress(1, 2, 40);
    assert(progress.base() == 50);
    assert(progress.frame(0) == 50);
    assert(progress.frame(10) == 62);
    assert(progress.frame(20) == 75);
    assert(progress.frame(30) == 87);
    assert(progress.encoding() == 90);

    // Late frames already past the encoding checkpoint keep the higher value
    VideoTaskProgress single(0, 1, 11);
    assert(single.base() == 0);
    assert(single.frame(10) == 90);
    assert(single.encoding() == 90);
    assert(single.frame(0) == 90);

    // Three tasks: the third starts at 66 and encodes at 66 + 26
    VideoTaskProgress third(2, 3, 100);
    assert(third.base() == 66);
    assert(third.frame(50) == 82);
    assert(third.encoding() == 92);

    printf("PASS: test_video_task_progress\n");
}

void test_manifest_failure_keeps_batch_completed() {
    QTemporaryDir tmp;
    assert(tmp.isValid());
    QDir out(tmp.path());

    // A directory where the manifest file should go
    bool created = out.mkdir("epconfig.txt");
    assert(created);

    ExportBatch batch;
    batch.outputDir = tmp.path();
    batch.metadata = {{"name", "Blocked"}};
    batch.tasks.push_back(ExportTask::image(ExportTaskKind::Logo, solidImage(8, 8, 7)));

    RecordingSink sink;
    ExportRunner runner(&sink);
    assert(runner.start(std::move(batch)));
    runner.wait();

    auto outcome = runner.lastOutcome();
    assert(outcome->status == ExportOutcome::Status::Completed);
    assert(outcome->completedCount == 1);
    assert(QFileInfo(out.filePath("logo.argb")).size() == 8 * 8 * 4);
    assert(QFileInfo(out.filePath("epconfig.txt")).isDir());
    assert(sink.percents().back() == 100);

    printf("PASS: test_manifest_failure_keeps_batch_completed\n");
}

void test_encoder_failure_removes_temp_frames() {
#if defined(HAS_FFMPEG) && defined(Q_OS_UNIX)
    const QString ffmpeg = VideoEncoder::locate();
    if (ffmpeg.isEmpty()) {
        printf("SKIP: test_encoder_failure_removes_temp_frames (no ffmpeg executable)\n");
        return;
    }

    QTemporaryDir tmp;
    assert(tmp.isValid());
    QDir root(tmp.path());
    root.mkpath("frames");
    root.mkpath("package");

    // 24 frame source clip made with the real encoder
    DirectoryFrameSink frames(root.filePath("frames"));
    for (int i = 0; i < 24; ++i) {
        QImage frame(64, 48, QImage::Format_RGB32);
        frame.fill(qRgb(i * 10, 120, 240 - i * 10));
        frames.writeFrame(i, frame);
    }
    EncoderSettings real;
    real.encoderPath = ffmpeg;
    const QString clip = root.filePath("clip.mp4");
    try {
        VideoEncoder(real).encode(root.filePath("frames"), 10.0, clip);
    } catch (const AssetError& e) {
        printf("SKIP: test_encoder_failure_removes_temp_frames (cannot encode fixture: %s)\n", e.what());
        return;
    }

    // Encoder stand-in that only complains on stderr
    const QString script = root.filePath("failing-ffmpeg.sh");
    {
        QFile file(script);
        bool opened = file.open(QIODevice::WriteOnly);
        assert(opened);
        file.write("#!/bin/sh\n"
                   "i=0\n"
                   "while [ $i -lt 60 ]; do\n"
                   "  echo \"encoder diagnostic line $i\" >&2\n"
                   "  i=$((i+1))\n"
                   "done\n"
                   "exit 1\n");
    }
    bool executable = QFile::setPermissions(script,
        QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    assert(executable);

    ExportSettings settings;
    settings.encoder.encoderPath = script;

    VideoExportParams params;
    params.sourcePath = clip;
    params.cropBox = QRect(0, 0, 64, 48);
    params.startFrame = 0;
    params.endFrame = 20;
    params.fps = 10.0;

    const QString out = root.filePath("package");
    ExportBatch batch;
    batch.outputDir = out;
    batch.tasks.push_back(ExportTask::video(ExportTaskKind::LoopVideo, params));

    RecordingSink sink;
    ExportRunner runner(&sink, settings);
    assert(runner.start(std::move(batch)));
    runner.wait();

    auto outcome = runner.lastOutcome();
    assert(outcome->status == ExportOutcome::Status::Failed);
    assert(outcome->failedKind == ExportTaskKind::LoopVideo);
    assert(outcome->errorKind == AssetErrorKind::EncodeFailed);
    const QString prefix = "Encoding failed: ";
    assert(outcome->reason.startsWith(prefix));
    assert(outcome->reason.size() <= prefix.size() + 200);

    assert(QDir(out).entryList(QStringList() << "temp_frames-*", QDir::Dirs).isEmpty());
    assert(!QFileInfo::exists(QDir(out).filePath("loop.mp4")));

    // Frame steps then the encoding checkpoint, never going back
    auto percents = sink.percents();
    assert(percents.size() >= 3);
    assert(isNonDecreasing(percents));
    assert(percents.front() == 0);
    assert(percents.back() >= 80 && percents.back() < 100);

    printf("PASS: test_encoder_failure_removes_temp_frames\n");
#else
    printf("SKIP: test_encoder_failure_removes_temp_frames (no FFmpeg)\n");
#endif
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_completed_batch_writes_files_and_manifest();
    test_no_manifest_without_metadata();
    test_already_running_leaves_active_batch_alone();
    test_cancel_before_first_task();
    test_cancel_between_tasks();
    test_failure_in_second_task();
    test_start_rejections();
    test_service_signals_and_requests();
    test_start_from_finished_is_accepted();
    test_service_export_from_completed_slot();
    test_video_task_progress();
    test_manifest_failure_keeps_batch_completed();
    test_encoder_failure_removes_temp_frames();
    printf("All export runner tests passed.\n");
    return 0;
}
