#include "core/hook/HookProtocol.hpp"
#include "core/hook/HookError.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace mine {

QString protocolMajor(const QString& version)
{
    return version.section('.', 0, 0).trimmed();
}

Invocation Invocation::forHook(Stage stage, Mode mode, const Context& ctx)
{
    Invocation inv;
    inv.type = Type::Hook;
    inv.stage = stageName(stage);
    inv.mode = modeName(mode);
    inv.context = ctx;
    return inv;
}

Invocation Invocation::forCommand(const QString& command, const QStringList& args,
                                  const QMap<QString, QString>& flags)
{
    Invocation inv;
    inv.type = Type::Command;
    inv.command = command;
    inv.args = args;
    inv.flags = flags;
    return inv;
}

Invocation Invocation::forLifecycle(const QString& event)
{
    Invocation inv;
    inv.type = Type::Lifecycle;
    inv.event = event;
    return inv;
}

QString Invocation::typeName(Type type)
{
    switch (type) {
        case Type::Hook:      return QStringLiteral("hook");
        case Type::Command:   return QStringLiteral("command");
        case Type::Lifecycle: return QStringLiteral("lifecycle");
    }
    return {};
}

QJsonObject Invocation::toJson() const
{
    QJsonObject obj;
    obj.insert("protocol_version", protocolVersion);
    obj.insert("type", typeName(type));
    if (!stage.isEmpty()) obj.insert("stage", stage);
    if (!mode.isEmpty()) obj.insert("mode", mode);
    if (!event.isEmpty()) obj.insert("event", event);
    if (!command.isEmpty()) obj.insert("command", command);
    if (context) obj.insert("context", context->toJson());
    if (!args.isEmpty()) obj.insert("args", QJsonArray::fromStringList(args));
    if (!flags.isEmpty()) {
        QJsonObject flagsObj;
        for (auto it = flags.cbegin(); it != flags.cend(); ++it)
            flagsObj.insert(it.key(), it.value());
        obj.insert("flags", flagsObj);
    }
    return obj;
}

QByteArray Invocation::serialize() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

QJsonObject Response::toJson() const
{
    QJsonObject obj;
    obj.insert("status", status);
    if (context) obj.insert("context", context->toJson());
    if (!error.isEmpty()) obj.insert("error", error);
    if (!code.isEmpty()) obj.insert("code", code);
    return obj;
}

std::optional<Response> Response::parse(const QByteArray& data, QString* parseError)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError) {
        if (parseError) *parseError = err.errorString();
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (parseError) *parseError = QStringLiteral("response is not a JSON object");
        return std::nullopt;
    }

    const QJsonObject obj = doc.object();
    Response resp;
    resp.status = obj.value("status").toString();
    resp.error = obj.value("error").toString();
    resp.code = obj.value("code").toString();
    if (obj.value("context").isObject())
        resp.context = Context::fromJson(obj.value("context").toObject());
    return resp;
}

Context readTransformOutput(const QByteArray& output, const Context& input,
                            const QString& stderrText, bool acceptBareContext)
{
    const QByteArray trimmed = output.trimmed();
    if (trimmed.isEmpty())
        return input;

    QString parseError;
    auto resp = Response::parse(trimmed, &parseError);
    if (!resp) {
        throw HookError(HookError::Kind::Malformed,
                        QStringLiteral("parsing hook output: %1").arg(parseError),
                        stderrText);
    }

    if (acceptBareContext && resp->status.isEmpty()) {
        const QJsonObject obj = QJsonDocument::fromJson(trimmed).object();
        if (!obj.contains("status"))
            return Context::fromJson(obj);
    }

    if (resp->isError()) {
        throw HookError(HookError::Kind::Rejected,
                        QStringLiteral("hook reported error: %1").arg(resp->error),
                        stderrText, resp->code);
    }
    if (resp->status != QLatin1String("ok")) {
        throw HookError(HookError::Kind::Malformed,
                        QStringLiteral("unknown response status \"%1\"").arg(resp->status),
                        stderrText);
    }
    return resp->context ? *resp->context : input;
}

} // namespace mine
