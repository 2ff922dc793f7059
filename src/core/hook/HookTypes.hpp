#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>
#include <chrono>
#include <optional>

namespace mine {

/// Where in a command's lifecycle a hook fires.
enum class Stage {
    Prevalidate,
    Preexec,
    Postexec,
    Notify
};

/// How a hook interacts with the pipeline.
enum class Mode {
    Transform,  // receives and returns a Context, may fail the command
    Notify      // receives a Context, output ignored, never fails the command
};

/// Pipeline execution order.
const QList<Stage>& allStages();

QString stageName(Stage stage);
QString modeName(Mode mode);
std::optional<Stage> parseStage(const QString& s);
std::optional<Mode> parseMode(const QString& s);

/// Notify stage pairs with notify mode, every other stage with transform.
Mode defaultModeFor(Stage stage);

constexpr std::chrono::milliseconds kDefaultTransformTimeout{5000};
constexpr std::chrono::milliseconds kDefaultNotifyTimeout{30000};
constexpr std::chrono::milliseconds kLifecycleTimeout{5000};

/// Data threaded through the hook pipeline for one command invocation.
struct Context {
    QString command;
    QStringList args;
    QMap<QString, QString> flags;
    QString timestamp;      // RFC3339, UTC
    QJsonValue result;      // Undefined until the command body has run

    bool hasResult() const { return !result.isUndefined() && !result.isNull(); }

    QJsonObject toJson() const;
    QByteArray toJsonBytes() const;

    /// Missing args/flags become empty; non-string flag values are stringified.
    static Context fromJson(const QJsonObject& obj);

    /// Fresh context stamped with the current UTC time.
    static Context make(const QString& command,
                        const QStringList& args = {},
                        const QMap<QString, QString>& flags = {});
};

bool operator==(const Context& a, const Context& b);
inline bool operator!=(const Context& a, const Context& b) { return !(a == b); }

/// Glob match of a dotted command name against a hook pattern.
///   "todo.add" matches only "todo.add"
///   "todo.*"   matches "todo.add", "todo.done", ...
///   "*"        matches everything
/// Also supports '?' and bracket classes ("[ad]", "[!x]", "[a-z]").
/// A malformed bracket expression never matches.
bool matchPattern(const QString& pattern, const QString& command);

/// Parse a duration string such as "500ms", "2s", "1m30s", "1.5s".
/// Units: ns, us, ms, s, m, h. Returns std::nullopt on malformed input
/// or a duration longer than INT_MAX milliseconds.
std::optional<std::chrono::milliseconds> parseDuration(const QString& text);

} // namespace mine
