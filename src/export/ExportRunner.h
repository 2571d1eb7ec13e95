#pragma once

#include <QMutex>
#include <QString>
#include <QThread>
#include <memory>
#include <optional>
#include <vector>
#include "CancellationToken.h"
#include "ExportTask.h"

class ExportJob;
class ExportProgressSink;
class ExportRunner;

enum class ExportRunnerState {
    Idle,
    Running
};

const char* exportRunnerStateName(ExportRunnerState state);

// Worker thread executing one batch for an ExportRunner.
class ExportThread : public QThread {
    Q_OBJECT
public:
    explicit ExportThread(ExportRunner* runner, QObject* parent = nullptr);

protected:
    void run() override;

private:
    ExportRunner* m_runner;
};

// Owns the background execution of one export batch at a time.
// Idle -> Running -> Idle. The terminal status is published in lastOutcome() and the
// runner is back to Idle before the sink's finished() is called, so the sink may
// start() the next batch from there.
class ExportRunner {
public:
    explicit ExportRunner(ExportProgressSink* sink, ExportSettings settings = ExportSettings{});
    ~ExportRunner();

    ExportRunner(const ExportRunner&) = delete;
    ExportRunner& operator=(const ExportRunner&) = delete;

    // Non-blocking. Returns false and sets lastError() to AlreadyRunning, InvalidInput
    // or EncoderUnavailable when the batch is rejected.
    bool start(ExportBatch batch);

    // Sets the cooperative stop flag. Safe from any thread, idempotent.
    // A running encoder process is always awaited.
    void cancel();

    // Blocks until every started batch has finished, including batches started
    // from the sink. Does not wait for the calling worker thread itself.
    void wait();

    ExportRunnerState state() const;
    bool isRunning() const;

    // Applies to the next start()
    void setSettings(const ExportSettings& settings);
    ExportSettings settings() const;

    AssetErrorKind lastError() const;
    QString errorString() const;
    std::optional<ExportOutcome> lastOutcome() const;

private:
    friend class ExportThread;
    void execute();
    void reject(AssetErrorKind kind, const QString& message);

    ExportProgressSink* m_sink;
    ExportSettings m_settings;

    mutable QMutex m_mutex;
    ExportRunnerState m_state = ExportRunnerState::Idle;
    AssetErrorKind m_lastError = AssetErrorKind::None;
    QString m_error;
    std::optional<ExportOutcome> m_lastOutcome;

    CancellationToken m_cancel;
    std::unique_ptr<ExportJob> m_job;
    // Workers that may still be running; finished ones are dropped on the next start()
    std::vector<std::shared_ptr<ExportThread>> m_threads;
};
