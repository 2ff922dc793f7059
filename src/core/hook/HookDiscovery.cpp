#include "HookDiscovery.hpp"
#include "HookError.hpp"
#include "HookRegistry.hpp"
#include "ScriptHookHandler.hpp"
#include <QDate>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace mine {

namespace {

bool splitStage(const QString& base, QString* pattern, Stage* stage)
{
    const int dot = base.lastIndexOf('.');
    if (dot < 0)
        return false;
    auto parsed = parseStage(base.mid(dot + 1));
    if (!parsed)
        return false;
    *pattern = base.left(dot);
    *stage = *parsed;
    return true;
}

QString starterScript(const QString& pattern, Stage stage)
{
    const Mode mode = defaultModeFor(stage);
    QString script = QStringLiteral(
        "#!/bin/sh\n"
        "# mine hook: %1 at %2 stage (%3 mode)\n"
        "# Created: %4\n"
        "#\n"
        "# Receives the command context as JSON on stdin:\n"
        "# {\n"
        "#   \"command\": \"todo.add\",\n"
        "#   \"args\": [\"buy milk\"],\n"
        "#   \"flags\": {\"priority\": \"high\"},\n"
        "#   \"timestamp\": \"2026-01-15T10:30:00Z\"\n"
        "# }\n"
        "#\n"
        "# Transform hooks print the modified context to stdout (or nothing to\n"
        "# leave it unchanged). Notify hooks perform side effects; output is ignored.\n"
        "\n"
        "CONTEXT=$(cat)\n"
        "\n"
        "# echo \"hook fired for: $CONTEXT\" >&2\n")
        .arg(pattern, stageName(stage), modeName(mode),
             QDate::currentDate().toString(Qt::ISODate));

    if (mode == Mode::Transform)
        script += QStringLiteral("\necho \"$CONTEXT\"\n");
    return script;
}

} // namespace

UserHook HookDiscovery::parseHookFilename(const QString& fileName)
{
    const int extDot = fileName.lastIndexOf('.');
    if (extDot < 0)
        throw HookDiscoveryError(QStringLiteral("invalid hook filename: %1").arg(fileName));

    UserHook hook;
    hook.name = fileName;

    // <pattern>.<stage>.<ext> first; fall back to an extensionless <pattern>.<stage>
    if (!splitStage(fileName.left(extDot), &hook.pattern, &hook.stage)
        && !splitStage(fileName, &hook.pattern, &hook.stage)) {
        throw HookDiscoveryError(QStringLiteral("invalid stage in hook filename: %1").arg(fileName));
    }

    if (hook.pattern.isEmpty())
        throw HookDiscoveryError(QStringLiteral("empty pattern in hook filename: %1").arg(fileName));
    return hook;
}

QList<UserHook> HookDiscovery::discover(const QString& hooksDir)
{
    QList<UserHook> results;
    QDir dir(hooksDir);

    if (!dir.exists()) {
        BOOST_LOG_TRIVIAL(debug) << "Hooks directory does not exist: " << hooksDir.toStdString();
        return results;
    }

    const auto entries = dir.entryInfoList(QDir::Files | QDir::Hidden, QDir::Name);
    for (const QFileInfo& info : entries) {
        UserHook hook;
        try {
            hook = parseHookFilename(info.fileName());
        } catch (const HookDiscoveryError& e) {
            BOOST_LOG_TRIVIAL(debug) << "Skipping " << info.fileName().toStdString() << ": " << e.what();
            continue;
        }

        if (!info.isExecutable()) {
            BOOST_LOG_TRIVIAL(debug) << "Skipping non-executable hook " << info.fileName().toStdString();
            continue;
        }

        hook.path = info.absoluteFilePath();
        results.append(hook);
    }

    std::sort(results.begin(), results.end(),
              [](const UserHook& a, const UserHook& b) { return a.name < b.name; });
    return results;
}

int HookDiscovery::registerUserHooks(HookRegistry& registry, const QString& hooksDir,
                                     std::chrono::milliseconds transformTimeout,
                                     std::chrono::milliseconds notifyTimeout)
{
    int registered = 0;
    for (const auto& uh : discover(hooksDir)) {
        Hook hook;
        hook.pattern = uh.pattern;
        hook.stage = uh.stage;
        hook.mode = uh.mode();
        hook.name = uh.name;
        hook.source = QStringLiteral("user");
        hook.handler = std::make_shared<ScriptHookHandler>(uh.path, hook.mode);
        hook.timeout = hook.mode == Mode::Transform ? transformTimeout : notifyTimeout;

        try {
            registry.registerHook(hook);
            ++registered;
        } catch (const HookRegistrationError& e) {
            BOOST_LOG_TRIVIAL(warning) << "Not registering user hook " << uh.name.toStdString()
                                       << ": " << e.what();
        }
    }

    BOOST_LOG_TRIVIAL(info) << "Registered " << registered << " user hook(s) from "
                            << hooksDir.toStdString();
    return registered;
}

QString HookDiscovery::createHookScript(const QString& hooksDir, const QString& pattern, Stage stage)
{
    if (pattern.isEmpty())
        throw HookDiscoveryError(QStringLiteral("pattern must not be empty"));
    if (pattern.contains('/') || pattern.contains('\\'))
        throw HookDiscoveryError(QStringLiteral("pattern \"%1\" must not contain path separators").arg(pattern));
    if (pattern.contains(QLatin1String("..")))
        throw HookDiscoveryError(QStringLiteral("pattern \"%1\" must not contain path traversal").arg(pattern));

    QDir dir(hooksDir);
    if (!dir.mkpath(QStringLiteral(".")))
        throw HookDiscoveryError(QStringLiteral("creating hooks dir %1 failed").arg(hooksDir));

    const QString fileName = QStringLiteral("%1.%2.sh").arg(pattern, stageName(stage));
    const QString path = dir.absoluteFilePath(fileName);

    // The resolved path must stay inside the hooks directory
    if (QFileInfo(path).absolutePath() != dir.absolutePath())
        throw HookDiscoveryError(QStringLiteral("hook path escapes hooks directory"));

    if (QFileInfo::exists(path))
        throw HookDiscoveryError(QStringLiteral("hook already exists: %1").arg(path));

    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::NewOnly))
        throw HookDiscoveryError(QStringLiteral("writing hook script %1: %2").arg(path, f.errorString()));
    const QByteArray script = starterScript(pattern, stage).toUtf8();
    if (f.write(script) != script.size())
        throw HookDiscoveryError(QStringLiteral("writing hook script %1: %2").arg(path, f.errorString()));
    f.close();

    if (!f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner
                          | QFileDevice::ReadGroup | QFileDevice::ExeGroup
                          | QFileDevice::ReadOther | QFileDevice::ExeOther)) {
        throw HookDiscoveryError(QStringLiteral("making %1 executable: %2").arg(path, f.errorString()));
    }
    return path;
}

QString HookDiscovery::testHook(const QString& scriptPath)
{
    QFileInfo info(scriptPath);
    if (!info.exists())
        throw HookDiscoveryError(QStringLiteral("hook not found: %1").arg(scriptPath));
    if (!info.isExecutable()) {
        throw HookDiscoveryError(QStringLiteral("hook not executable: %1 (run: chmod +x %1)")
                                     .arg(scriptPath));
    }

    const UserHook uh = parseHookFilename(info.fileName());
    const Mode mode = uh.mode();

    Context sample = Context::make(QStringLiteral("test.command"),
                                   {QStringLiteral("sample"), QStringLiteral("args")},
                                   {{QStringLiteral("flag1"), QStringLiteral("value1")}});

    ScriptHookHandler handler(info.absoluteFilePath(), mode);
    Context result = handler.invoke(sample, std::chrono::milliseconds(0));

    if (mode == Mode::Notify)
        return QStringLiteral("Notify hook executed successfully (no output expected)");
    return QString::fromUtf8(result.toJsonBytes());
}

} // namespace mine
