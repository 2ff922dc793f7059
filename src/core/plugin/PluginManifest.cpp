#include "PluginManifest.hpp"
#include "PluginErrors.hpp"
#include "core/hook/HookTypes.hpp"
#include <toml++/toml.hpp>
#include <QFileInfo>
#include <QRegularExpression>

namespace mine {

namespace {

QString str(const toml::table& table, const char* key)
{
    return QString::fromStdString(table[key].value_or(std::string()));
}

QStringList strList(const toml::table& table, const char* key)
{
    QStringList out;
    if (const toml::array* arr = table[key].as_array()) {
        for (const toml::node& item : *arr) {
            if (auto value = item.value<std::string>())
                out.append(QString::fromStdString(*value));
        }
    }
    return out;
}

const toml::table& tableAt(const toml::node& node, const QString& field)
{
    const toml::table* table = node.as_table();
    if (!table)
        throw ManifestError(field, QStringLiteral("%1 must be a table").arg(field));
    return *table;
}

void require(const QString& value, const QString& field)
{
    if (value.isEmpty())
        throw ManifestError(field, QStringLiteral("%1 is required").arg(field));
}

} // namespace

bool PluginManifest::isValidPluginName(const QString& name)
{
    static const QRegularExpression re(QStringLiteral("^[a-z][a-z0-9]*(-[a-z0-9]+)*$"));
    return re.match(name).hasMatch();
}

void PluginManifest::validate() const
{
    require(name, QStringLiteral("plugin.name"));
    if (!isValidPluginName(name)) {
        throw ManifestError(QStringLiteral("plugin.name"),
                            QStringLiteral("plugin.name \"%1\" must be kebab-case "
                                           "(lowercase letters, digits, and hyphens)").arg(name));
    }
    require(version, QStringLiteral("plugin.version"));
    require(description, QStringLiteral("plugin.description"));
    require(author, QStringLiteral("plugin.author"));
    require(protocolVersion, QStringLiteral("plugin.protocol_version"));

    for (int i = 0; i < hooks.size(); ++i) {
        const HookDef& h = hooks[i];
        const QString prefix = QStringLiteral("hooks[%1]").arg(i);

        require(h.command, prefix + ".command");
        require(h.stage, prefix + ".stage");
        require(h.mode, prefix + ".mode");

        const auto stage = parseStage(h.stage);
        if (!stage)
            throw ManifestError(prefix + ".stage",
                                QStringLiteral("%1.stage \"%2\" is invalid").arg(prefix, h.stage));
        const auto mode = parseMode(h.mode);
        if (!mode)
            throw ManifestError(prefix + ".mode",
                                QStringLiteral("%1.mode \"%2\" is invalid").arg(prefix, h.mode));

        if (*stage == Stage::Notify && *mode != Mode::Notify)
            throw ManifestError(prefix + ".mode",
                                QStringLiteral("%1: notify stage requires notify mode, got \"%2\"")
                                    .arg(prefix, h.mode));
        if (*stage != Stage::Notify && *mode == Mode::Notify)
            throw ManifestError(prefix + ".stage",
                                QStringLiteral("%1: notify mode is only valid with notify stage, got stage \"%2\"")
                                    .arg(prefix, h.stage));
    }

    for (int i = 0; i < commands.size(); ++i) {
        const QString prefix = QStringLiteral("commands[%1]").arg(i);
        require(commands[i].name, prefix + ".name");
        require(commands[i].description, prefix + ".description");
    }
}

QString PluginManifest::entrypoint() const
{
    if (!entrypointOverride.isEmpty())
        return entrypointOverride;
    return QStringLiteral("mine-plugin-") + name;
}

PluginManifest PluginManifest::fromFile(const QString& filePath)
{
    PluginManifest m;

    if (!QFileInfo::exists(filePath))
        throw ManifestError(QStringLiteral("manifest"),
                            QStringLiteral("reading manifest %1: no such file").arg(filePath));

    toml::table root;
    try {
        root = toml::parse_file(filePath.toStdString());
    } catch (const toml::parse_error& e) {
        throw ManifestError(QStringLiteral("manifest"),
                            QStringLiteral("parsing manifest %1: %2 (line %3)")
                                .arg(filePath, QString::fromStdString(std::string(e.description())))
                                .arg(e.source().begin.line));
    }

    if (const toml::table* plugin = root["plugin"].as_table()) {
        m.name = str(*plugin, "name");
        m.version = str(*plugin, "version");
        m.description = str(*plugin, "description");
        m.author = str(*plugin, "author");
        m.license = str(*plugin, "license");
        m.minMineVersion = str(*plugin, "min_mine_version");
        m.protocolVersion = str(*plugin, "protocol_version");
        m.entrypointOverride = str(*plugin, "entrypoint");
    }

    if (const toml::array* hooks = root["hooks"].as_array()) {
        for (std::size_t i = 0; i < hooks->size(); ++i) {
            const toml::table& h = tableAt((*hooks)[i], QStringLiteral("hooks[%1]").arg(i));
            HookDef def;
            def.command = str(h, "command");
            def.stage = str(h, "stage");
            def.mode = str(h, "mode");
            def.timeout = str(h, "timeout");
            m.hooks.append(def);
        }
    }

    if (const toml::array* commands = root["commands"].as_array()) {
        for (std::size_t i = 0; i < commands->size(); ++i) {
            const toml::table& c = tableAt((*commands)[i], QStringLiteral("commands[%1]").arg(i));
            CommandDef def;
            def.name = str(c, "name");
            def.description = str(c, "description");
            def.args = str(c, "args");
            m.commands.append(def);
        }
    }

    if (const toml::table* perms = root["permissions"].as_table()) {
        m.permissions.network = (*perms)["network"].value_or(false);
        m.permissions.filesystem = strList(*perms, "filesystem");
        m.permissions.store = (*perms)["store"].value_or(false);
        m.permissions.configRead = (*perms)["config_read"].value_or(false);
        m.permissions.configWrite = (*perms)["config_write"].value_or(false);
        m.permissions.envVars = strList(*perms, "env_vars");
    }

    m.dirPath = QFileInfo(filePath).absolutePath();
    m.validate();
    return m;
}

} // namespace mine
