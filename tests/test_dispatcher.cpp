#include <QtTest>
#include <QElapsedTimer>
#include <QThread>
#include <QMutex>
#include <QTemporaryDir>
#include "core/hook/Dispatcher.hpp"
#include "core/hook/HookDiscovery.hpp"
#include "core/hook/HookError.hpp"
#include "core/hook/HookRegistry.hpp"
#include "core/hook/ScriptHookHandler.hpp"
#include "core/plugin/AuditLog.hpp"
#include <atomic>

using namespace std::chrono_literals;

namespace {

/// Shared call log, written from the dispatcher's worker threads too.
struct CallLog {
    QMutex mutex;
    QStringList calls;

    void add(const QString& s)
    {
        QMutexLocker lock(&mutex);
        calls << s;
    }

    QStringList snapshot()
    {
        QMutexLocker lock(&mutex);
        return calls;
    }
};

/// Appends its tag to args and records the call.
class TaggingHandler : public mine::IHookHandler {
public:
    TaggingHandler(const QString& tag, CallLog& log) : tag_(tag), log_(log) {}

    mine::Context invoke(const mine::Context& ctx, std::chrono::milliseconds) override
    {
        log_.add(tag_);
        mine::Context out = ctx;
        out.args << tag_;
        return out;
    }
    QString target() const override { return tag_; }

private:
    QString tag_;
    CallLog& log_;
};

/// Sleeps, then records the call; tracks how many run at once.
class SlowHandler : public mine::IHookHandler {
public:
    SlowHandler(const QString& tag, CallLog& log, std::atomic<int>& running, std::atomic<int>& peak)
        : tag_(tag), log_(log), running_(running), peak_(peak) {}

    mine::Context invoke(const mine::Context& ctx, std::chrono::milliseconds) override
    {
        const int now = ++running_;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {}
        QThread::msleep(150);
        --running_;
        log_.add(tag_);
        return ctx;
    }
    QString target() const override { return tag_; }

private:
    QString tag_;
    CallLog& log_;
    std::atomic<int>& running_;
    std::atomic<int>& peak_;
};

mine::Hook makeHook(const QString& pattern, mine::Stage stage, const QString& name,
                    std::shared_ptr<mine::IHookHandler> handler,
                    std::chrono::milliseconds timeout = 0ms)
{
    mine::Hook h;
    h.pattern = pattern;
    h.stage = stage;
    h.mode = mine::defaultModeFor(stage);
    h.name = name;
    h.source = QStringLiteral("user");
    h.handler = std::move(handler);
    h.timeout = timeout;
    return h;
}

QString writeScript(const QString& path, const QByteArray& body)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly))
        return {};
    f.write("#!/bin/sh\n" + body);
    f.close();
    if (!f.setPermissions(f.permissions() | QFileDevice::ExeOwner))
        return {};
    return path;
}

// Adds flags.tags = "inbox" unless a tags flag is already present.
const QByteArray kTagScript =
    "input=$(cat)\n"
    "case \"$input\" in\n"
    "  *'\"tags\"'*) exit 0 ;;\n"
    "esac\n"
    "printf '%s\\n' \"$input\" | sed 's/\"flags\":{}/\"flags\":{\"tags\":\"inbox\"}/'\n";

} // namespace

class TestDispatcher : public QObject {
    Q_OBJECT
private slots:
    void testFastPathRunsBody();
    void testStagesInOrder();
    void testDeterministicOrder();
    void testMalformedOutputFailsFast();
    void testStageErrorMessage();
    void testBodyNotRunAfterPrevalidateFailure();
    void testNotifyFailureIsolatedAndAudited();
    void testNotifyDoesNotBlock();
    void testNotifyQueuedBeyondPoolBound();
    void testTagScenario();
    void testTimeout();
    void testRunStageNotifyReturnsInput();
};

void TestDispatcher::testFastPathRunsBody()
{
    mine::HookRegistry registry;
    mine::Dispatcher dispatcher(registry);

    int bodyRuns = 0;
    auto out = dispatcher.run("todo.add", mine::Context::make("todo.add"), [&](mine::Context& ctx) {
        ++bodyRuns;
        ctx.result = QStringLiteral("done");
    });
    QCOMPARE(bodyRuns, 1);
    QCOMPARE(out.result.toString(), QString("done"));
}

void TestDispatcher::testStagesInOrder()
{
    CallLog log;
    mine::HookRegistry registry;
    registry.registerHook(makeHook("todo.*", mine::Stage::Postexec, "post",
                                   std::make_shared<TaggingHandler>("post", log)));
    registry.registerHook(makeHook("todo.*", mine::Stage::Prevalidate, "prevalidate",
                                   std::make_shared<TaggingHandler>("prevalidate", log)));
    registry.registerHook(makeHook("todo.*", mine::Stage::Preexec, "pre",
                                   std::make_shared<TaggingHandler>("pre", log)));
    registry.registerHook(makeHook("todo.*", mine::Stage::Notify, "notify",
                                   std::make_shared<TaggingHandler>("notify", log)));

    mine::Dispatcher dispatcher(registry);
    QStringList seenByBody;
    auto out = dispatcher.run("todo.add", mine::Context::make("todo.add"), [&](mine::Context& ctx) {
        seenByBody = ctx.args;
        log.add("body");
    });
    QVERIFY(dispatcher.drain(5000));

    QCOMPARE(seenByBody, (QStringList{"prevalidate", "pre"}));
    QCOMPARE(out.args, (QStringList{"prevalidate", "pre", "post"}));
    QCOMPARE(log.snapshot(), (QStringList{"prevalidate", "pre", "body", "post", "notify"}));
}

void TestDispatcher::testDeterministicOrder()
{
    CallLog log;
    mine::HookRegistry registry;
    // Registered out of name order on purpose
    registry.registerHook(makeHook("todo.add", mine::Stage::Preexec, "b-second",
                                   std::make_shared<TaggingHandler>("b", log)));
    registry.registerHook(makeHook("todo.*", mine::Stage::Preexec, "a-first",
                                   std::make_shared<TaggingHandler>("a", log)));
    registry.registerHook(makeHook("*", mine::Stage::Preexec, "c-third",
                                   std::make_shared<TaggingHandler>("c", log)));

    mine::Dispatcher dispatcher(registry);
    for (int i = 0; i < 10; ++i) {
        auto out = dispatcher.runStage("todo.add", mine::Stage::Preexec, mine::Context::make("todo.add"));
        QCOMPARE(out.args, (QStringList{"a", "b", "c"}));
    }
    QCOMPARE(log.snapshot().size(), 30);
}

void TestDispatcher::testMalformedOutputFailsFast()
{
    QTemporaryDir tmp;
    const QString bad = writeScript(tmp.filePath("bad.sh"), "cat >/dev/null\necho 'this is not json'\n");

    CallLog log;
    mine::HookRegistry registry;
    registry.registerHook(makeHook("todo.add", mine::Stage::Preexec, "a-malformed",
                                   std::make_shared<mine::ScriptHookHandler>(bad, mine::Mode::Transform)));
    registry.registerHook(makeHook("todo.add", mine::Stage::Preexec, "b-after",
                                   std::make_shared<TaggingHandler>("after", log)));

    mine::Dispatcher dispatcher(registry);
    try {
        dispatcher.runStage("todo.add", mine::Stage::Preexec, mine::Context::make("todo.add"));
        QFAIL("expected DispatchError");
    } catch (const mine::DispatchError& e) {
        QCOMPARE(e.kind(), mine::HookError::Kind::Malformed);
        QCOMPARE(e.hookName(), QString("a-malformed"));
        QCOMPARE(e.stage(), mine::Stage::Preexec);
    }
    QVERIFY(log.snapshot().isEmpty());
}

void TestDispatcher::testStageErrorMessage()
{
    QTemporaryDir tmp;
    const QString failing = writeScript(tmp.filePath("fail.sh"), "cat >/dev/null\necho 'boom' >&2\nexit 2\n");

    mine::HookRegistry registry;
    registry.registerHook(makeHook("todo.add", mine::Stage::Postexec, "failing",
                                   std::make_shared<mine::ScriptHookHandler>(failing, mine::Mode::Transform)));

    mine::Dispatcher dispatcher(registry);
    bool bodyRan = false;
    try {
        dispatcher.run("todo.add", mine::Context::make("todo.add"),
                       [&](mine::Context&) { bodyRan = true; });
        QFAIL("expected DispatchError");
    } catch (const mine::DispatchError& e) {
        const QString msg = QString::fromUtf8(e.what());
        QVERIFY2(msg.startsWith("hook postexec failed: "), qPrintable(msg));
        QVERIFY2(msg.contains("boom"), qPrintable(msg));
        QCOMPARE(e.kind(), mine::HookError::Kind::ProcessFailed);
    }
    // Side effects of the body are not rolled back
    QVERIFY(bodyRan);
}

void TestDispatcher::testBodyNotRunAfterPrevalidateFailure()
{
    mine::HookRegistry registry;
    registry.registerHook(makeHook("todo.add", mine::Stage::Prevalidate, "missing",
                                   std::make_shared<mine::ScriptHookHandler>("/nonexistent/hook.sh",
                                                                             mine::Mode::Transform)));

    mine::Dispatcher dispatcher(registry);
    bool bodyRan = false;
    QVERIFY_EXCEPTION_THROWN(dispatcher.run("todo.add", mine::Context::make("todo.add"),
                                            [&](mine::Context&) { bodyRan = true; }),
                             mine::DispatchError);
    QVERIFY(!bodyRan);
}

void TestDispatcher::testNotifyFailureIsolatedAndAudited()
{
    QTemporaryDir tmp;
    const QString failing = writeScript(tmp.filePath("todo.*.notify.sh"), "cat >/dev/null\nexit 3\n");
    mine::AuditLog audit(tmp.filePath("data/plugin-audit.log"));

    mine::HookRegistry registry;
    registry.registerHook(makeHook("todo.*", mine::Stage::Notify, "todo.*.notify.sh",
                                   std::make_shared<mine::ScriptHookHandler>(failing, mine::Mode::Notify)));

    mine::Dispatcher dispatcher(registry, &audit, 2);
    bool bodyRan = false;
    auto out = dispatcher.run("todo.add", mine::Context::make("todo.add"),
                              [&](mine::Context& ctx) {
                                  bodyRan = true;
                                  ctx.result = QStringLiteral("ok");
                              });
    QVERIFY(bodyRan);
    QCOMPARE(out.result.toString(), QString("ok"));

    QVERIFY(dispatcher.drain(10000));
    QCOMPARE(dispatcher.pendingNotifications(), 0);

    QFile f(audit.filePath());
    QVERIFY(f.open(QIODevice::ReadOnly));
    const QString content = QString::fromUtf8(f.readAll());
    QVERIFY2(content.contains("plugin=user action=notify-failed"), qPrintable(content));
    QVERIFY(content.contains("hook=todo.*.notify.sh"));
    QVERIFY(content.contains("command=todo.add"));
}

void TestDispatcher::testNotifyDoesNotBlock()
{
    QTemporaryDir tmp;
    const QString slow = writeScript(tmp.filePath("slow.sh"), "cat >/dev/null\nexec sleep 1\n");

    mine::HookRegistry registry;
    registry.registerHook(makeHook("todo.*", mine::Stage::Notify, "slow",
                                   std::make_shared<mine::ScriptHookHandler>(slow, mine::Mode::Notify)));

    mine::Dispatcher dispatcher(registry);
    QElapsedTimer timer;
    timer.start();
    dispatcher.run("todo.add", mine::Context::make("todo.add"), [](mine::Context&) {});
    QVERIFY2(timer.elapsed() < 800, qPrintable(QString::number(timer.elapsed())));

    QVERIFY(dispatcher.drain(10000));
    QCOMPARE(dispatcher.pendingNotifications(), 0);
}

void TestDispatcher::testNotifyQueuedBeyondPoolBound()
{
    CallLog log;
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    mine::HookRegistry registry;
    for (const char* tag : {"a", "b", "c"}) {
        registry.registerHook(makeHook("todo.*", mine::Stage::Notify, tag,
                                       std::make_shared<SlowHandler>(tag, log, running, peak)));
    }

    mine::Dispatcher dispatcher(registry, nullptr, 1);
    dispatcher.run("todo.add", mine::Context::make("todo.add"), [](mine::Context&) {});

    // Three 150ms hooks on one thread cannot all finish within 50ms
    QVERIFY(!dispatcher.drain(50));
    QVERIFY(dispatcher.pendingNotifications() > 0);

    QVERIFY(dispatcher.drain(10000));
    QCOMPARE(dispatcher.pendingNotifications(), 0);
    QCOMPARE(log.snapshot().size(), 3);
    QCOMPARE(peak.load(), 1);
}

void TestDispatcher::testTagScenario()
{
    QTemporaryDir tmp;
    QVERIFY(!writeScript(tmp.filePath("todo.*.preexec.sh"), kTagScript).isEmpty());

    mine::HookRegistry registry;
    QCOMPARE(mine::HookDiscovery::registerUserHooks(registry, tmp.path(), 5000ms, 5000ms), 1);
    mine::Dispatcher dispatcher(registry);

    QMap<QString, QString> seen;
    auto body = [&](mine::Context& ctx) { seen = ctx.flags; };

    dispatcher.run("todo.add", mine::Context::make("todo.add", {"buy milk"}), body);
    QCOMPARE(seen.size(), 1);
    QCOMPARE(seen.value("tags"), QString("inbox"));

    dispatcher.run("todo.add", mine::Context::make("todo.add", {"buy milk"}, {{"tags", "work"}}), body);
    QCOMPARE(seen.size(), 1);
    QCOMPARE(seen.value("tags"), QString("work"));

    // Other command groups are untouched
    dispatcher.run("focus.start", mine::Context::make("focus.start"), body);
    QVERIFY(seen.isEmpty());
}

void TestDispatcher::testTimeout()
{
    QTemporaryDir tmp;
    const QString slow = writeScript(tmp.filePath("slow.sh"), "exec sleep 2\n");

    mine::HookRegistry registry;
    registry.registerHook(makeHook("todo.add", mine::Stage::Preexec, "slow",
                                   std::make_shared<mine::ScriptHookHandler>(slow, mine::Mode::Transform),
                                   50ms));
    mine::Dispatcher dispatcher(registry);

    QElapsedTimer timer;
    timer.start();
    try {
        dispatcher.run("todo.add", mine::Context::make("todo.add"), [](mine::Context&) {});
        QFAIL("expected DispatchError");
    } catch (const mine::DispatchError& e) {
        QCOMPARE(e.kind(), mine::HookError::Kind::Timeout);
        QCOMPARE(e.stage(), mine::Stage::Preexec);
    }
    const qint64 elapsed = timer.elapsed();
    QVERIFY2(elapsed >= 40 && elapsed < 500, qPrintable(QString::number(elapsed)));
}

void TestDispatcher::testRunStageNotifyReturnsInput()
{
    CallLog log;
    mine::HookRegistry registry;
    registry.registerHook(makeHook("*", mine::Stage::Notify, "n",
                                   std::make_shared<TaggingHandler>("n", log)));
    mine::Dispatcher dispatcher(registry);

    const auto ctx = mine::Context::make("todo.add");
    QCOMPARE(dispatcher.runStage("todo.add", mine::Stage::Notify, ctx), ctx);
    QVERIFY(dispatcher.drain(5000));
    QCOMPARE(log.snapshot(), QStringList{"n"});
}

QTEST_MAIN(TestDispatcher)
#include "test_dispatcher.moc"
