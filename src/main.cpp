#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <yaml-cpp/yaml.h>
#include "cli/Cli.hpp"
#include "cli/Logging.hpp"
#include "core/MineConfig.hpp"

namespace {

int usage(const QCommandLineParser& parser)
{
    qWarning().noquote() << parser.helpText();
    return 2;
}

// "--flag key=value" occurrences -> map; a bare "key" maps to "true"
QMap<QString, QString> parseFlags(const QStringList& values)
{
    QMap<QString, QString> flags;
    for (const auto& v : values) {
        const int eq = v.indexOf('=');
        if (eq < 0)
            flags.insert(v, QStringLiteral("true"));
        else
            flags.insert(v.left(eq), v.mid(eq + 1));
    }
    return flags;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("mine");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Hook and plugin engine for the mine CLI.\n\n"
        "  hook list | create <pattern> <stage> | test <file>\n"
        "  plugin list | info <name> | install <dir> | remove <name> | run <name> <command> [args...]\n"
        "  dispatch <command> [args...] [--flag key=value...]");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOpt({"c", "config"}, "Configuration file.", "file");
    QCommandLineOption verboseOpt({"v", "verbose"}, "Log debug output.");
    QCommandLineOption yesOpt({"y", "yes"}, "Install without asking for confirmation.");
    QCommandLineOption flagOpt("flag", "Command flag for dispatch (repeatable).", "key=value");
    parser.addOptions({configOpt, verboseOpt, yesOpt, flagOpt});
    parser.addPositionalArgument("group", "hook, plugin or dispatch");
    parser.addPositionalArgument("args", "Verb and its arguments.", "[args...]");

    parser.process(app);

    mine::MineConfig config;
    const QString configPath = parser.isSet(configOpt) ? parser.value(configOpt) : config.configFile();
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
        } catch (const YAML::Exception& e) {
            qWarning() << "Ignoring config" << configPath << ":" << e.what();
        }
    }

    mine::cli::initLogging(parser.isSet(verboseOpt) ? QStringLiteral("debug") : config.logLevel());

    const QStringList pos = parser.positionalArguments();
    if (pos.isEmpty())
        return usage(parser);

    const QString group = pos.at(0);
    const QString verb = pos.value(1);
    const QStringList rest = pos.mid(2);

    mine::cli::Cli cli(config);

    try {
        if (group == "hook") {
            if (verb.isEmpty() || verb == "list")
                return cli.hookList();
            if (verb == "create" && rest.size() == 2)
                return cli.hookCreate(rest.at(0), rest.at(1));
            if (verb == "test" && rest.size() == 1)
                return cli.hookTest(rest.at(0));
        } else if (group == "plugin") {
            if (verb.isEmpty() || verb == "list")
                return cli.pluginList();
            if (verb == "info" && rest.size() == 1)
                return cli.pluginInfo(rest.at(0));
            if (verb == "install" && rest.size() == 1)
                return cli.pluginInstall(rest.at(0), parser.isSet(yesOpt));
            if ((verb == "remove" || verb == "rm" || verb == "uninstall") && rest.size() == 1)
                return cli.pluginRemove(rest.at(0));
            if (verb == "run" && rest.size() >= 2)
                return cli.pluginRun(rest.at(0), rest.at(1), rest.mid(2));
        } else if (group == "dispatch") {
            if (!verb.isEmpty())
                return cli.dispatch(verb, rest, parseFlags(parser.values(flagOpt)));
        }
    } catch (const std::exception& e) {
        qCritical().noquote() << "Error:" << e.what();
        return 1;
    }

    return usage(parser);
}
