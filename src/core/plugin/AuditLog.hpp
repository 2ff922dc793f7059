#pragma once

#include <QMutex>
#include <QString>

namespace mine {

/// Append-only plugin audit trail, one line per event:
///   2026-01-15T10:30:00Z plugin=<name> action=<action> <detail>
/// Safe to share between threads. Write failures throw AuditError; the
/// trail is a security record, so callers decide how to surface them.
class AuditLog {
public:
    explicit AuditLog(const QString& filePath);

    void append(const QString& pluginName, const QString& action, const QString& detail);

    const QString& filePath() const { return filePath_; }

private:
    QString filePath_;
    QMutex mutex_;
};

} // namespace mine
