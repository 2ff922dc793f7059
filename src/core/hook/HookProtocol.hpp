#pragma once

#include "core/hook/HookTypes.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <optional>

namespace mine {

/// Version of the JSON envelope exchanged with plugin binaries.
constexpr const char* MINE_PROTOCOL_VERSION = "1.0.0";

/// Major component of a dotted version ("1.0.0" -> "1").
QString protocolMajor(const QString& version);

/// Envelope written to a plugin's stdin.
struct Invocation {
    enum class Type { Hook, Command, Lifecycle };

    QString protocolVersion = QString::fromLatin1(MINE_PROTOCOL_VERSION);
    Type type = Type::Hook;
    QString stage;                  // hook
    QString mode;                   // hook
    QString event;                  // lifecycle
    QString command;                // command
    std::optional<Context> context; // hook
    QStringList args;               // command
    QMap<QString, QString> flags;   // command

    static Invocation forHook(Stage stage, Mode mode, const Context& ctx);
    static Invocation forCommand(const QString& command, const QStringList& args,
                                 const QMap<QString, QString>& flags = {});
    static Invocation forLifecycle(const QString& event);

    static QString typeName(Type type);

    /// Optional fields are omitted when empty.
    QJsonObject toJson() const;
    QByteArray serialize() const;
};

/// Reply a plugin writes to stdout for a transform hook.
struct Response {
    QString status;                 // "ok" or "error"
    std::optional<Context> context;
    QString error;
    QString code;

    bool isError() const { return status == QLatin1String("error"); }

    QJsonObject toJson() const;

    /// Returns std::nullopt if data is not a JSON object; *parseError (if
    /// given) then receives a description.
    static std::optional<Response> parse(const QByteArray& data, QString* parseError = nullptr);
};

/// Interpret the stdout of a transform hook.
/// Blank output passes `input` through unchanged. A Response with status
/// "error" throws HookError::Kind::Rejected; output that is not a JSON
/// object throws HookError::Kind::Malformed (stderrText attached). With
/// acceptBareContext, an object without a "status" field is read as the
/// replacement Context itself.
Context readTransformOutput(const QByteArray& output, const Context& input,
                            const QString& stderrText, bool acceptBareContext);

} // namespace mine
