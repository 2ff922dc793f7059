#include "PluginStore.hpp"
#include "PluginErrors.hpp"
#include <yaml-cpp/yaml.h>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace mine {

namespace {

QString str(const YAML::Node& node, const char* key)
{
    return QString::fromStdString(node[key].as<std::string>(""));
}

void copyFile(const QString& from, const QString& to)
{
    // Reinstalling from the install directory itself
    if (QFile::exists(to) && QFileInfo(from).canonicalFilePath() == QFileInfo(to).canonicalFilePath())
        return;
    if (QFile::exists(to) && !QFile::remove(to))
        throw RegistryError(QStringLiteral("replacing %1 failed").arg(to));
    if (!QFile::copy(from, to))
        throw RegistryError(QStringLiteral("copying %1 to %2 failed").arg(from, to));
}

} // namespace

PluginStore::PluginStore(const QString& pluginsDir, const QString& registryFile)
    : pluginsDir_(pluginsDir), registryFile_(registryFile)
{
}

QList<PluginEntry> PluginStore::loadRegistry() const
{
    QList<PluginEntry> entries;
    if (!QFileInfo::exists(registryFile_))
        return entries;

    try {
        YAML::Node root = YAML::LoadFile(registryFile_.toStdString());
        if (!root["plugins"])
            return entries;
        if (!root["plugins"].IsSequence())
            throw RegistryError(QStringLiteral("parsing plugin registry %1: plugins is not a list")
                                    .arg(registryFile_));

        for (const auto& node : root["plugins"]) {
            PluginEntry e;
            e.name = str(node, "name");
            e.version = str(node, "version");
            e.source = str(node, "source");
            e.dir = str(node, "dir");
            e.installedAt = str(node, "installed_at");
            e.enabled = node["enabled"].as<bool>(true);
            entries.append(e);
        }
    } catch (const YAML::Exception& e) {
        throw RegistryError(QStringLiteral("parsing plugin registry %1: %2")
                                .arg(registryFile_, QString::fromStdString(e.what())));
    }
    return entries;
}

void PluginStore::saveRegistry(const QList<PluginEntry>& entries) const
{
    const QString dir = QFileInfo(registryFile_).absolutePath();
    if (!QDir().mkpath(dir))
        throw RegistryError(QStringLiteral("creating %1 failed").arg(dir));

    YAML::Emitter out;
    out << YAML::BeginMap << YAML::Key << "plugins" << YAML::Value << YAML::BeginSeq;
    for (const auto& e : entries) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << e.name.toStdString();
        out << YAML::Key << "version" << YAML::Value << e.version.toStdString();
        out << YAML::Key << "source" << YAML::Value << e.source.toStdString();
        out << YAML::Key << "dir" << YAML::Value << e.dir.toStdString();
        out << YAML::Key << "installed_at" << YAML::Value << e.installedAt.toStdString();
        out << YAML::Key << "enabled" << YAML::Value << e.enabled;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq << YAML::EndMap;

    QSaveFile f(registryFile_);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text))
        throw RegistryError(QStringLiteral("writing plugin registry %1: %2").arg(registryFile_, f.errorString()));
    f.write(out.c_str());
    f.write("\n");
    if (!f.commit())
        throw RegistryError(QStringLiteral("writing plugin registry %1: %2").arg(registryFile_, f.errorString()));
}

InstalledPlugin PluginStore::install(const QString& sourceDir, const QString& source)
{
    const QString manifestPath = QDir(sourceDir).filePath(kManifestFileName);
    const PluginManifest manifest = PluginManifest::fromFile(manifestPath);

    // Load before touching the filesystem so a broken registry changes nothing
    QList<PluginEntry> entries = loadRegistry();

    const QString pluginDir = QDir(pluginsDir_).filePath(manifest.name);
    if (!QDir().mkpath(pluginDir))
        throw RegistryError(QStringLiteral("creating plugin dir %1 failed").arg(pluginDir));

    copyFile(manifestPath, QDir(pluginDir).filePath(kManifestFileName));

    const QFileInfo srcBin(QDir(sourceDir).filePath(manifest.entrypoint()));
    if (srcBin.isFile() && srcBin.isExecutable()) {
        const QString destBin = QDir(pluginDir).filePath(manifest.entrypoint());
        copyFile(srcBin.absoluteFilePath(), destBin);
        const auto mode = QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner
                        | QFileDevice::ReadGroup | QFileDevice::ExeGroup
                        | QFileDevice::ReadOther | QFileDevice::ExeOther;
        if (!QFile::setPermissions(destBin, mode))
            throw RegistryError(QStringLiteral("making %1 executable failed").arg(destBin));
    } else {
        BOOST_LOG_TRIVIAL(debug) << "No executable " << manifest.entrypoint().toStdString()
                                 << " in " << sourceDir.toStdString()
                                 << ", it must be placed in " << pluginDir.toStdString();
    }

    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const PluginEntry& e) { return e.name == manifest.name; }),
                  entries.end());

    PluginEntry entry;
    entry.name = manifest.name;
    entry.version = manifest.version;
    entry.source = source;
    entry.dir = pluginDir;
    entry.installedAt = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    entry.enabled = true;
    entries.append(entry);

    saveRegistry(entries);

    BOOST_LOG_TRIVIAL(info) << "Installed plugin " << manifest.name.toStdString()
                            << " v" << manifest.version.toStdString();

    InstalledPlugin installed;
    installed.manifest = PluginManifest::fromFile(QDir(pluginDir).filePath(kManifestFileName));
    installed.dir = pluginDir;
    installed.source = source;
    installed.installedAt = entry.installedAt;
    installed.enabled = true;
    return installed;
}

void PluginStore::remove(const QString& name)
{
    QList<PluginEntry> entries = loadRegistry();

    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const PluginEntry& e) { return e.name == name; });
    if (it == entries.end())
        throw PluginNotFoundError(name);

    const QString pluginDir = it->dir;
    entries.erase(it);

    if (!pluginDir.isEmpty() && QFileInfo::exists(pluginDir)) {
        if (!QDir(pluginDir).removeRecursively())
            throw RegistryError(QStringLiteral("removing %1 failed").arg(pluginDir));
    }

    saveRegistry(entries);
    BOOST_LOG_TRIVIAL(info) << "Removed plugin " << name.toStdString();
}

QList<InstalledPlugin> PluginStore::list() const
{
    QList<InstalledPlugin> plugins;

    for (const auto& entry : loadRegistry()) {
        InstalledPlugin p;
        p.dir = entry.dir;
        p.source = entry.source;
        p.installedAt = entry.installedAt;
        p.enabled = entry.enabled;

        try {
            p.manifest = PluginManifest::fromFile(QDir(entry.dir).filePath(kManifestFileName));
        } catch (const ManifestError& e) {
            BOOST_LOG_TRIVIAL(warning) << "Plugin " << entry.name.toStdString()
                                       << " has a broken manifest: " << e.what();
            p.manifest = PluginManifest{};
            p.manifest.name = entry.name;
            p.manifest.version = entry.version;
            p.manifest.dirPath = entry.dir;
            p.degraded = true;
            p.error = QString::fromStdString(e.what());
        }
        plugins.append(p);
    }
    return plugins;
}

InstalledPlugin PluginStore::get(const QString& name) const
{
    for (const auto& p : list()) {
        if (p.manifest.name == name)
            return p;
    }
    throw PluginNotFoundError(name);
}

QList<PluginEntry> PluginStore::entries() const
{
    return loadRegistry();
}

} // namespace mine
