#include <QtTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include "core/hook/HookDiscovery.hpp"
#include "core/hook/HookError.hpp"
#include "core/hook/HookRegistry.hpp"

using namespace std::chrono_literals;

namespace {

void writeFile(const QString& path, const QByteArray& content, bool executable)
{
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(content);
    f.close();
    if (executable)
        QVERIFY(f.setPermissions(f.permissions() | QFileDevice::ExeOwner));
}

} // namespace

class TestHookDiscovery : public QObject {
    Q_OBJECT
private slots:
    void testParseFilename_data();
    void testParseFilename();
    void testParseFilenameInvalid_data();
    void testParseFilenameInvalid();
    void testDiscover();
    void testDiscoverMissingDir();
    void testRegisterUserHooks();
    void testCreateHookScript();
    void testCreateHookScriptRejects();
    void testTestHookTransform();
    void testTestHookNotify();
    void testTestHookNotExecutable();
};

void TestHookDiscovery::testParseFilename_data()
{
    QTest::addColumn<QString>("fileName");
    QTest::addColumn<QString>("pattern");
    QTest::addColumn<QString>("stage");

    QTest::newRow("simple") << "todo.add.preexec.sh" << "todo.add" << "preexec";
    QTest::newRow("wildcard") << "todo.*.notify.py" << "todo.*" << "notify";
    QTest::newRow("global") << "*.postexec.sh" << "*" << "postexec";
    QTest::newRow("no extension") << "todo.add.prevalidate" << "todo.add" << "prevalidate";
    QTest::newRow("single segment") << "focus.preexec.rb" << "focus" << "preexec";
}

void TestHookDiscovery::testParseFilename()
{
    QFETCH(QString, fileName);
    QFETCH(QString, pattern);
    QFETCH(QString, stage);

    const auto hook = mine::HookDiscovery::parseHookFilename(fileName);
    QCOMPARE(hook.pattern, pattern);
    QCOMPARE(mine::stageName(hook.stage), stage);
    QCOMPARE(hook.name, fileName);
}

void TestHookDiscovery::testParseFilenameInvalid_data()
{
    QTest::addColumn<QString>("fileName");

    QTest::newRow("no dots") << "README";
    QTest::newRow("bad stage") << "todo.add.sometime.sh";
    QTest::newRow("empty pattern") << ".preexec.sh";
    QTest::newRow("stage only") << "preexec.sh";
}

void TestHookDiscovery::testParseFilenameInvalid()
{
    QFETCH(QString, fileName);
    QVERIFY_EXCEPTION_THROWN(mine::HookDiscovery::parseHookFilename(fileName),
                             mine::HookDiscoveryError);
}

void TestHookDiscovery::testDiscover()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("todo.add.preexec.sh"), "#!/bin/sh\n", true);
    writeFile(tmp.filePath("*.notify.sh"), "#!/bin/sh\n", true);
    writeFile(tmp.filePath("todo.done.postexec.sh"), "#!/bin/sh\n", false);   // not executable
    writeFile(tmp.filePath("notes.txt"), "hello\n", true);                    // bad name
    QDir(tmp.path()).mkdir("todo.x.preexec.d");                               // directory

    const auto hooks = mine::HookDiscovery::discover(tmp.path());
    QCOMPARE(hooks.size(), 2);
    QCOMPARE(hooks[0].name, QString("*.notify.sh"));
    QCOMPARE(hooks[0].mode(), mine::Mode::Notify);
    QCOMPARE(hooks[1].name, QString("todo.add.preexec.sh"));
    QCOMPARE(hooks[1].mode(), mine::Mode::Transform);
    QCOMPARE(hooks[1].path, QDir(tmp.path()).absoluteFilePath("todo.add.preexec.sh"));
}

void TestHookDiscovery::testDiscoverMissingDir()
{
    QVERIFY(mine::HookDiscovery::discover("/nonexistent/mine/hooks").isEmpty());
}

void TestHookDiscovery::testRegisterUserHooks()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("todo.add.preexec.sh"), "#!/bin/sh\n", true);
    writeFile(tmp.filePath("todo.*.notify.sh"), "#!/bin/sh\n", true);

    mine::HookRegistry registry;
    const int n = mine::HookDiscovery::registerUserHooks(registry, tmp.path(), 1500ms, 9000ms);
    QCOMPARE(n, 2);

    const auto pre = registry.resolve("todo.add", mine::Stage::Preexec);
    QCOMPARE(pre.size(), 1);
    QCOMPARE(pre[0].source, QString("user"));
    QCOMPARE(pre[0].mode, mine::Mode::Transform);
    QCOMPARE(static_cast<qint64>(pre[0].timeout.count()), qint64(1500));
    QCOMPARE(pre[0].handler->target(), QDir(tmp.path()).absoluteFilePath("todo.add.preexec.sh"));

    const auto notify = registry.resolve("todo.done", mine::Stage::Notify);
    QCOMPARE(notify.size(), 1);
    QCOMPARE(static_cast<qint64>(notify[0].timeout.count()), qint64(9000));

    // A second pass conflicts with every hook; conflicts are skipped, not fatal
    QCOMPARE(mine::HookDiscovery::registerUserHooks(registry, tmp.path(), 1500ms, 9000ms), 0);
    QCOMPARE(registry.count(), 2);
}

void TestHookDiscovery::testCreateHookScript()
{
    QTemporaryDir tmp;
    const QString dir = tmp.filePath("hooks");

    const QString path = mine::HookDiscovery::createHookScript(dir, "todo.*", mine::Stage::Notify);
    QCOMPARE(QFileInfo(path).fileName(), QString("todo.*.notify.sh"));
    QVERIFY(QFileInfo(path).isExecutable());

    QFile f(path);
    QVERIFY(f.open(QIODevice::ReadOnly));
    QVERIFY(f.readLine().startsWith("#!/bin/sh"));

    // Scaffolded script is discoverable as-is
    const auto hooks = mine::HookDiscovery::discover(dir);
    QCOMPARE(hooks.size(), 1);
    QCOMPARE(hooks[0].pattern, QString("todo.*"));

    QVERIFY_EXCEPTION_THROWN(mine::HookDiscovery::createHookScript(dir, "todo.*", mine::Stage::Notify),
                             mine::HookDiscoveryError);
}

void TestHookDiscovery::testCreateHookScriptRejects()
{
    QTemporaryDir tmp;
    QVERIFY_EXCEPTION_THROWN(mine::HookDiscovery::createHookScript(tmp.path(), "", mine::Stage::Preexec),
                             mine::HookDiscoveryError);
    QVERIFY_EXCEPTION_THROWN(mine::HookDiscovery::createHookScript(tmp.path(), "../evil", mine::Stage::Preexec),
                             mine::HookDiscoveryError);
    QVERIFY_EXCEPTION_THROWN(mine::HookDiscovery::createHookScript(tmp.path(), "a/b", mine::Stage::Preexec),
                             mine::HookDiscoveryError);
    QVERIFY_EXCEPTION_THROWN(mine::HookDiscovery::createHookScript(tmp.path(), "a\\b", mine::Stage::Preexec),
                             mine::HookDiscoveryError);
    QVERIFY_EXCEPTION_THROWN(mine::HookDiscovery::createHookScript(tmp.path(), "todo..add", mine::Stage::Preexec),
                             mine::HookDiscoveryError);
    QVERIFY(QDir(tmp.path()).entryList(QDir::Files).isEmpty());
}

void TestHookDiscovery::testTestHookTransform()
{
    QTemporaryDir tmp;
    const QString path = mine::HookDiscovery::createHookScript(tmp.path(), "todo.add", mine::Stage::Preexec);

    // The starter transform script echoes its input back
    const QString output = mine::HookDiscovery::testHook(path);
    const QJsonObject obj = QJsonDocument::fromJson(output.toUtf8()).object();
    QCOMPARE(obj.value("command").toString(), QString("test.command"));
    QCOMPARE(obj.value("flags").toObject().value("flag1").toString(), QString("value1"));
}

void TestHookDiscovery::testTestHookNotify()
{
    QTemporaryDir tmp;
    const QString path = mine::HookDiscovery::createHookScript(tmp.path(), "todo.add", mine::Stage::Notify);
    QVERIFY(mine::HookDiscovery::testHook(path).contains("Notify hook executed"));
}

void TestHookDiscovery::testTestHookNotExecutable()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("todo.add.preexec.sh"), "#!/bin/sh\n", false);
    QVERIFY_EXCEPTION_THROWN(mine::HookDiscovery::testHook(tmp.filePath("todo.add.preexec.sh")),
                             mine::HookDiscoveryError);
    QVERIFY_EXCEPTION_THROWN(mine::HookDiscovery::testHook(tmp.filePath("missing.preexec.sh")),
                             mine::HookDiscoveryError);
}

QTEST_MAIN(TestHookDiscovery)
#include "test_hook_discovery.moc"
