#pragma once

#include <QString>

struct ExportOutcome;

// Receives export notifications. Calls arrive on the export worker thread.
class ExportProgressSink {
public:
    virtual ~ExportProgressSink() = default;

    virtual void progress(int percent, const QString& message) = 0;
    virtual void finished(const ExportOutcome& outcome) = 0;
};
