#include "AuditLog.hpp"
#include "PluginErrors.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace mine {

AuditLog::AuditLog(const QString& filePath)
    : filePath_(filePath)
{
}

void AuditLog::append(const QString& pluginName, const QString& action, const QString& detail)
{
    QString line = QStringLiteral("%1 plugin=%2 action=%3")
                       .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODate), pluginName, action);
    if (!detail.isEmpty())
        line += ' ' + detail;
    // One event per line, whatever the detail contains
    line.replace('\n', ' ');
    line += '\n';

    QMutexLocker lock(&mutex_);

    const QString dir = QFileInfo(filePath_).absolutePath();
    if (!QDir().mkpath(dir))
        throw AuditError(QStringLiteral("creating audit log directory %1 failed").arg(dir));

    QFile f(filePath_);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
        throw AuditError(QStringLiteral("opening audit log %1: %2").arg(filePath_, f.errorString()));

    const QByteArray bytes = line.toUtf8();
    if (f.write(bytes) != bytes.size() || !f.flush())
        throw AuditError(QStringLiteral("writing audit log %1: %2").arg(filePath_, f.errorString()));
}

} // namespace mine
