#include "ExportRunner.h"
#include "ExportJob.h"
#include "ExportProgressSink.h"
#include "Log.h"

#include <QFileInfo>
#include <algorithm>

const char* exportRunnerStateName(ExportRunnerState state) {
    switch (state) {
    case ExportRunnerState::Idle:      return "Idle";
    case ExportRunnerState::Running:   return "Running";
    }
    return "Unknown";
}

// --- ExportThread ---

ExportThread::ExportThread(ExportRunner* runner, QObject* parent)
    : QThread(parent), m_runner(runner) {}

void ExportThread::run() {
    m_runner->execute();
}

// --- ExportRunner ---

ExportRunner::ExportRunner(ExportProgressSink* sink, ExportSettings settings)
    : m_sink(sink)
    , m_settings(std::move(settings))
{}

ExportRunner::~ExportRunner() {
    cancel();
    wait();
}

bool ExportRunner::start(ExportBatch batch) {
    QMutexLocker lock(&m_mutex);

    if (m_state != ExportRunnerState::Idle) {
        reject(AssetErrorKind::AlreadyRunning, "An export is already running");
        return false;
    }
    if (batch.tasks.empty()) {
        reject(AssetErrorKind::InvalidInput, "Nothing to export");
        return false;
    }
    if (batch.outputDir.isEmpty()) {
        reject(AssetErrorKind::InvalidInput, "No output directory given");
        return false;
    }

    const bool needsEncoder = std::any_of(batch.tasks.begin(), batch.tasks.end(),
        [](const ExportTask& task) { return isVideoKind(task.kind()); });
    if (needsEncoder && !QFileInfo(m_settings.encoder.encoderPath).isFile()) {
        reject(AssetErrorKind::EncoderUnavailable, "ffmpeg not found, cannot export video");
        return false;
    }

    // A worker that is still unwinding (or is the caller) stays in the list
    m_threads.erase(std::remove_if(m_threads.begin(), m_threads.end(),
                                   [](const std::shared_ptr<ExportThread>& t) { return t->isFinished(); }),
                    m_threads.end());

    const auto taskCount = batch.tasks.size();
    const QString outputDir = batch.outputDir;

    m_cancel.reset();
    m_job = std::make_unique<ExportJob>(std::move(batch), m_settings);
    m_lastError = AssetErrorKind::None;
    m_error.clear();
    m_state = ExportRunnerState::Running;

    auto thread = std::make_shared<ExportThread>(this);
    m_threads.push_back(thread);
    thread->start();

    EPA_LOG_INFO("Started export of {} task(s) to {}", taskCount, qUtf8Printable(outputDir));
    return true;
}

void ExportRunner::cancel() {
    if (isRunning() && !m_cancel.isCancelled())
        EPA_LOG_INFO("Export cancellation requested");
    m_cancel.cancel();
}

void ExportRunner::wait() {
    // A batch started from the sink adds a worker while we wait; repeat until none is left
    for (;;) {
        std::vector<std::shared_ptr<ExportThread>> pending;
        {
            QMutexLocker lock(&m_mutex);
            for (const auto& thread : m_threads) {
                if (thread.get() != QThread::currentThread() && !thread->isFinished())
                    pending.push_back(thread);
            }
        }
        if (pending.empty())
            return;
        for (const auto& thread : pending)
            thread->wait();
    }
}

ExportRunnerState ExportRunner::state() const {
    QMutexLocker lock(&m_mutex);
    return m_state;
}

bool ExportRunner::isRunning() const {
    return state() == ExportRunnerState::Running;
}

void ExportRunner::setSettings(const ExportSettings& settings) {
    QMutexLocker lock(&m_mutex);
    m_settings = settings;
}

ExportSettings ExportRunner::settings() const {
    QMutexLocker lock(&m_mutex);
    return m_settings;
}

AssetErrorKind ExportRunner::lastError() const {
    QMutexLocker lock(&m_mutex);
    return m_lastError;
}

QString ExportRunner::errorString() const {
    QMutexLocker lock(&m_mutex);
    return m_error;
}

std::optional<ExportOutcome> ExportRunner::lastOutcome() const {
    QMutexLocker lock(&m_mutex);
    return m_lastOutcome;
}

void ExportRunner::execute() {
    std::unique_ptr<ExportJob> job;
    {
        QMutexLocker lock(&m_mutex);
        job = std::move(m_job);
    }

    const ExportOutcome outcome = job->run(m_cancel, m_sink);
    job.reset();

    {
        QMutexLocker lock(&m_mutex);
        m_lastOutcome = outcome;
        m_state = ExportRunnerState::Idle;
    }

    if (outcome.status == ExportOutcome::Status::Failed)
        EPA_LOG_ERROR("{}", qUtf8Printable(outcome.message()));
    else
        EPA_LOG_INFO("{}", qUtf8Printable(outcome.message()));

    if (m_sink)
        m_sink->finished(outcome);
}

void ExportRunner::reject(AssetErrorKind kind, const QString& message) {
    m_lastError = kind;
    m_error = message;
    EPA_LOG_WARN("Export rejected [{}]: {}", assetErrorKindName(kind), qUtf8Printable(message));
}
