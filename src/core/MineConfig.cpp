#include "core/MineConfig.hpp"
#include <QDir>
#include <QStringList>
#include <fstream>
#include <stdexcept>

namespace mine {

namespace {

// Mappings recurse; sequences and scalars in the overlay replace the base.
YAML::Node mergeOver(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (!base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        merged[key] = merged[key] ? mergeOver(merged[key], it->second)
                                  : YAML::Clone(it->second);
    }
    return merged;
}

QString xdgDir(const char* envName, const QString& homeRelative)
{
    QString base = qEnvironmentVariable(envName);
    if (base.isEmpty())
        base = QDir::homePath() + "/" + homeRelative;
    return base + "/mine";
}

QVariant scalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());
    if (s == QLatin1String("true")) return true;
    if (s == QLatin1String("false")) return false;

    bool ok = false;
    int i = s.toInt(&ok);
    if (ok) return i;
    double d = s.toDouble(&ok);
    if (ok) return d;
    return s;
}

} // namespace

MineConfig::MineConfig()
{
    initDefaults();
}

void MineConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["paths"]["config_dir"] = "";
    root_["paths"]["data_dir"] = "";

    root_["hooks"]["transform_timeout_ms"] = 5000;
    root_["hooks"]["notify_timeout_ms"] = 30000;
    root_["hooks"]["lifecycle_timeout_ms"] = 5000;
    root_["hooks"]["notify_max_concurrent"] = 4;
    root_["hooks"]["drain_timeout_ms"] = 30000;

    root_["plugins"]["strict_protocol"] = false;

    root_["logging"]["level"] = "warning";
}

void MineConfig::load(const QString& filePath)
{
    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    initDefaults();
    root_ = mergeOver(root_, loaded);
}

void MineConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_ << '\n';
    fout.close();
    if (!fout)
        throw std::runtime_error("writing config " + filePath.toStdString() + " failed");
}

// --- Paths ---

QString MineConfig::configDir() const
{
    auto v = QString::fromStdString(root_["paths"]["config_dir"].as<std::string>(""));
    return v.isEmpty() ? xdgDir("XDG_CONFIG_HOME", ".config") : v;
}

void MineConfig::setConfigDir(const QString& v)
{
    root_["paths"]["config_dir"] = v.toStdString();
}

QString MineConfig::dataDir() const
{
    auto v = QString::fromStdString(root_["paths"]["data_dir"].as<std::string>(""));
    return v.isEmpty() ? xdgDir("XDG_DATA_HOME", ".local/share") : v;
}

void MineConfig::setDataDir(const QString& v)
{
    root_["paths"]["data_dir"] = v.toStdString();
}

QString MineConfig::pluginsDir() const
{
    return dataDir() + "/plugins";
}

QString MineConfig::registryFile() const
{
    return configDir() + "/plugins.yaml";
}

QString MineConfig::hooksDir() const
{
    return configDir() + "/hooks";
}

QString MineConfig::auditLogFile() const
{
    return dataDir() + "/plugin-audit.log";
}

QString MineConfig::configFile() const
{
    return configDir() + "/config.yaml";
}

// --- Hooks ---

int MineConfig::transformTimeoutMs() const
{
    return root_["hooks"]["transform_timeout_ms"].as<int>(5000);
}

void MineConfig::setTransformTimeoutMs(int v)
{
    root_["hooks"]["transform_timeout_ms"] = v;
}

int MineConfig::notifyTimeoutMs() const
{
    return root_["hooks"]["notify_timeout_ms"].as<int>(30000);
}

void MineConfig::setNotifyTimeoutMs(int v)
{
    root_["hooks"]["notify_timeout_ms"] = v;
}

int MineConfig::lifecycleTimeoutMs() const
{
    return root_["hooks"]["lifecycle_timeout_ms"].as<int>(5000);
}

int MineConfig::notifyMaxConcurrent() const
{
    return root_["hooks"]["notify_max_concurrent"].as<int>(4);
}

int MineConfig::drainTimeoutMs() const
{
    return root_["hooks"]["drain_timeout_ms"].as<int>(30000);
}

// --- Plugins ---

bool MineConfig::strictProtocol() const
{
    return root_["plugins"]["strict_protocol"].as<bool>(false);
}

void MineConfig::setStrictProtocol(bool v)
{
    root_["plugins"]["strict_protocol"] = v;
}

// --- Logging ---

QString MineConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("warning"));
}

QVariant MineConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }
    return scalarToVariant(node);
}

} // namespace mine
