#include "core/hook/HookTypes.hpp"
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>
#include <cmath>
#include <limits>

namespace mine {

const QList<Stage>& allStages()
{
    static const QList<Stage> stages = {
        Stage::Prevalidate, Stage::Preexec, Stage::Postexec, Stage::Notify
    };
    return stages;
}

QString stageName(Stage stage)
{
    switch (stage) {
        case Stage::Prevalidate: return QStringLiteral("prevalidate");
        case Stage::Preexec:     return QStringLiteral("preexec");
        case Stage::Postexec:    return QStringLiteral("postexec");
        case Stage::Notify:      return QStringLiteral("notify");
    }
    return {};
}

QString modeName(Mode mode)
{
    return mode == Mode::Transform ? QStringLiteral("transform") : QStringLiteral("notify");
}

std::optional<Stage> parseStage(const QString& s)
{
    for (Stage stage : allStages()) {
        if (stageName(stage) == s)
            return stage;
    }
    return std::nullopt;
}

std::optional<Mode> parseMode(const QString& s)
{
    if (s == QLatin1String("transform")) return Mode::Transform;
    if (s == QLatin1String("notify")) return Mode::Notify;
    return std::nullopt;
}

Mode defaultModeFor(Stage stage)
{
    return stage == Stage::Notify ? Mode::Notify : Mode::Transform;
}

// --- Context ---

QJsonObject Context::toJson() const
{
    QJsonObject flagsObj;
    for (auto it = flags.cbegin(); it != flags.cend(); ++it)
        flagsObj.insert(it.key(), it.value());

    QJsonObject obj;
    obj.insert("command", command);
    obj.insert("args", QJsonArray::fromStringList(args));
    obj.insert("flags", flagsObj);
    obj.insert("timestamp", timestamp);
    if (hasResult())
        obj.insert("result", result);
    return obj;
}

QByteArray Context::toJsonBytes() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

Context Context::fromJson(const QJsonObject& obj)
{
    Context ctx;
    ctx.command = obj.value("command").toString();
    ctx.timestamp = obj.value("timestamp").toString();

    for (const auto& v : obj.value("args").toArray())
        ctx.args.append(v.isString() ? v.toString() : v.toVariant().toString());

    const QJsonObject flagsObj = obj.value("flags").toObject();
    for (auto it = flagsObj.constBegin(); it != flagsObj.constEnd(); ++it) {
        const QJsonValue v = it.value();
        ctx.flags.insert(it.key(), v.isString() ? v.toString() : v.toVariant().toString());
    }

    if (obj.contains("result"))
        ctx.result = obj.value("result");
    return ctx;
}

Context Context::make(const QString& command,
                      const QStringList& args,
                      const QMap<QString, QString>& flags)
{
    Context ctx;
    ctx.command = command;
    ctx.args = args;
    ctx.flags = flags;
    ctx.timestamp = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    return ctx;
}

bool operator==(const Context& a, const Context& b)
{
    return a.command == b.command && a.args == b.args && a.flags == b.flags
        && a.timestamp == b.timestamp && a.hasResult() == b.hasResult()
        && (!a.hasResult() || a.result == b.result);
}

// --- Pattern matching ---

namespace {

// p[i] is '['. On success stores whether c is in the class and returns the
// index just past the closing ']'. Returns -1 for an unterminated class.
int matchBracket(const QString& p, int i, QChar c, bool* matched)
{
    ++i;
    bool negate = false;
    if (i < p.size() && (p[i] == '!' || p[i] == '^')) {
        negate = true;
        ++i;
    }

    bool found = false;
    while (i < p.size() && p[i] != ']') {
        QChar lo = p[i];
        if (lo == '\\' && i + 1 < p.size())
            lo = p[++i];
        QChar hi = lo;
        if (i + 2 < p.size() && p[i + 1] == '-' && p[i + 2] != ']') {
            i += 2;
            hi = p[i];
            if (hi == '\\' && i + 1 < p.size())
                hi = p[++i];
        }
        if (lo <= c && c <= hi)
            found = true;
        ++i;
    }
    if (i >= p.size())
        return -1;

    *matched = (found != negate);
    return i + 1;
}

} // namespace

bool matchPattern(const QString& pattern, const QString& command)
{
    int p = 0;
    int s = 0;
    int starP = -1;
    int starS = 0;

    while (s < command.size()) {
        if (p < pattern.size()) {
            QChar pc = pattern[p];
            if (pc == '*') {
                starP = p++;
                starS = s;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++s;
                continue;
            }
            if (pc == '[') {
                bool in = false;
                int next = matchBracket(pattern, p, command[s], &in);
                if (next < 0)
                    return false;
                if (in) {
                    p = next;
                    ++s;
                    continue;
                }
            } else {
                int width = 1;
                if (pc == '\\' && p + 1 < pattern.size()) {
                    pc = pattern[p + 1];
                    width = 2;
                }
                if (pc == command[s]) {
                    p += width;
                    ++s;
                    continue;
                }
            }
        }
        // Mismatch: let the last '*' absorb one more character
        if (starP < 0)
            return false;
        p = starP + 1;
        s = ++starS;
    }

    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}

std::optional<std::chrono::milliseconds> parseDuration(const QString& text)
{
    const QString s = text.trimmed();
    if (s.isEmpty())
        return std::nullopt;
    if (s == QLatin1String("0"))
        return std::chrono::milliseconds(0);

    static const QRegularExpression part(
        QStringLiteral("(\\d+(?:\\.\\d+)?|\\.\\d+)(ns|us|ms|s|m|h)"));

    double totalMs = 0.0;
    int consumed = 0;
    auto it = part.globalMatch(s);
    while (it.hasNext()) {
        auto m = it.next();
        if (m.capturedStart() != consumed)
            return std::nullopt;
        consumed = m.capturedEnd();

        bool ok = false;
        const double value = m.captured(1).toDouble(&ok);
        if (!ok)
            return std::nullopt;
        const QString unit = m.captured(2);
        if (unit == QLatin1String("ns"))      totalMs += value / 1e6;
        else if (unit == QLatin1String("us")) totalMs += value / 1e3;
        else if (unit == QLatin1String("ms")) totalMs += value;
        else if (unit == QLatin1String("s"))  totalMs += value * 1e3;
        else if (unit == QLatin1String("m"))  totalMs += value * 60e3;
        else                                  totalMs += value * 3600e3;
    }
    if (consumed != s.size())
        return std::nullopt;
    // QDeadlineTimer waits take int milliseconds
    if (!std::isfinite(totalMs) || totalMs > std::numeric_limits<int>::max())
        return std::nullopt;

    return std::chrono::milliseconds(static_cast<long long>(totalMs));
}

} // namespace mine
