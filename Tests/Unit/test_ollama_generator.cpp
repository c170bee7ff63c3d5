#include <QtTest/QtTest>
#include "core/generation/ollama_generator.h"
#include "Support/http_responder.h"

#include <QElapsedTimer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTcpServer>

using dq::GenerationResult;
using dq::test::HttpResponder;
using namespace std::chrono_literals;

namespace {

dq::OllamaGenerator makeGenerator(const QString& baseUrl)
{
    dq::OllamaConfig config;
    config.baseUrl = baseUrl;
    config.model = QStringLiteral("llama3.2:latest");
    config.probeTimeout = 2000ms;
    return dq::OllamaGenerator(config);
}

// Port that was bound a moment ago and is now closed.
quint16 closedPort()
{
    QTcpServer server;
    if (!server.listen(QHostAddress::LocalHost, 0)) {
        return 0;
    }
    const quint16 port = server.serverPort();
    server.close();
    return port;
}

} // anonymous namespace

class TestOllamaGenerator : public QObject {
    Q_OBJECT

private slots:
    // ── Request shape ──────────────────────────────────────────
    void testDescribeTrimsTrailingSlash();
    void testRequestBody();
    void testNotConfigured();

    // ── Generate ───────────────────────────────────────────────
    void testGenerateSuccess();
    void testHttpErrorCarriesServerMessage();
    void testInvalidJson();
    void testMissingResponseField();
    void testTimeout();
    void testConnectionRefused();

    // ── Probe ──────────────────────────────────────────────────
    void testAvailableWhenTagsAnswer();
    void testUnavailableOnServerError();
    void testUnavailableWhenNothingListens();
    void testAvailableModels();
};

void TestOllamaGenerator::testDescribeTrimsTrailingSlash()
{
    const dq::OllamaGenerator generator = makeGenerator(QStringLiteral("http://localhost:11434//"));
    QCOMPARE(generator.config().baseUrl, QStringLiteral("http://localhost:11434"));
    QCOMPARE(generator.describe(), QStringLiteral("ollama:llama3.2:latest@http://localhost:11434"));
}

void TestOllamaGenerator::testRequestBody()
{
    dq::OllamaConfig config;
    config.model = QStringLiteral("phi3");
    config.temperature = 0.5;
    config.topP = 0.8;
    config.maxTokens = 64;
    const dq::OllamaGenerator generator(config);

    const QJsonObject body =
        QJsonDocument::fromJson(generator.buildRequestBody(QStringLiteral("Why?"))).object();
    QCOMPARE(body.value(QStringLiteral("model")).toString(), QStringLiteral("phi3"));
    QCOMPARE(body.value(QStringLiteral("prompt")).toString(), QStringLiteral("Why?"));
    QCOMPARE(body.value(QStringLiteral("stream")).toBool(true), false);

    const QJsonObject options = body.value(QStringLiteral("options")).toObject();
    QCOMPARE(options.value(QStringLiteral("temperature")).toDouble(), 0.5);
    QCOMPARE(options.value(QStringLiteral("top_p")).toDouble(), 0.8);
    QCOMPARE(options.value(QStringLiteral("num_predict")).toInt(), 64);
}

void TestOllamaGenerator::testNotConfigured()
{
    dq::OllamaConfig config;
    config.model.clear();
    dq::OllamaGenerator generator(config);

    const GenerationResult result = generator.generate(QStringLiteral("prompt"), 1000ms);
    QVERIFY(result.status == GenerationResult::Status::NotConfigured);
    QVERIFY(!result.text.has_value());
    QVERIFY(result.errorMessage.has_value());
}

void TestOllamaGenerator::testGenerateSuccess()
{
    HttpResponder server;
    QVERIFY(server.listen());
    server.route("POST", "/api/generate",
                 {200, QByteArrayLiteral("{\"model\":\"llama3.2:latest\",\"response\":\"Cats are mammals.\",\"done\":true}"), false});

    dq::OllamaGenerator generator = makeGenerator(server.baseUrl());
    const GenerationResult result = generator.generate(QStringLiteral("Are cats mammals?"), 5000ms);

    QVERIFY(result.status == GenerationResult::Status::Success);
    QCOMPARE(result.text.value_or(QString()), QStringLiteral("Cats are mammals."));
    QVERIFY(!result.errorMessage.has_value());

    QCOMPARE(static_cast<int>(server.requests().size()), 1);
    const QJsonObject sent = QJsonDocument::fromJson(server.requests().first().body).object();
    QCOMPARE(sent.value(QStringLiteral("prompt")).toString(), QStringLiteral("Are cats mammals?"));
}

void TestOllamaGenerator::testHttpErrorCarriesServerMessage()
{
    HttpResponder server;
    QVERIFY(server.listen());
    server.route("POST", "/api/generate",
                 {500, QByteArrayLiteral("{\"error\":\"model not loaded\"}"), false});

    dq::OllamaGenerator generator = makeGenerator(server.baseUrl());
    const GenerationResult result = generator.generate(QStringLiteral("q"), 5000ms);

    QVERIFY(result.status == GenerationResult::Status::HttpError);
    QVERIFY(!result.text.has_value());
    QCOMPARE(result.errorMessage.value_or(QString()), QStringLiteral("HTTP 500: model not loaded"));
}

void TestOllamaGenerator::testInvalidJson()
{
    HttpResponder server;
    QVERIFY(server.listen());
    server.route("POST", "/api/generate", {200, QByteArrayLiteral("<html>oops</html>"), false});

    dq::OllamaGenerator generator = makeGenerator(server.baseUrl());
    const GenerationResult result = generator.generate(QStringLiteral("q"), 5000ms);

    QVERIFY(result.status == GenerationResult::Status::InvalidResponse);
    QVERIFY(!result.text.has_value());
    QVERIFY(result.errorMessage.has_value());
}

void TestOllamaGenerator::testMissingResponseField()
{
    HttpResponder server;
    QVERIFY(server.listen());
    server.route("POST", "/api/generate", {200, QByteArrayLiteral("{\"done\":true}"), false});

    dq::OllamaGenerator generator = makeGenerator(server.baseUrl());
    const GenerationResult result = generator.generate(QStringLiteral("q"), 5000ms);

    QVERIFY(result.status == GenerationResult::Status::InvalidResponse);
    QCOMPARE(result.errorMessage.value_or(QString()), QStringLiteral("missing \"response\" field"));
}

void TestOllamaGenerator::testTimeout()
{
    HttpResponder server;
    QVERIFY(server.listen());
    server.route("POST", "/api/generate", {200, QByteArray(), true});

    dq::OllamaGenerator generator = makeGenerator(server.baseUrl());
    QElapsedTimer elapsed;
    elapsed.start();
    const GenerationResult result = generator.generate(QStringLiteral("q"), 300ms);

    QVERIFY(result.status == GenerationResult::Status::Timeout);
    QVERIFY(!result.text.has_value());
    QCOMPARE(result.errorMessage.value_or(QString()), QStringLiteral("no response within 300 ms"));
    QVERIFY(elapsed.elapsed() < 5000);
}

void TestOllamaGenerator::testConnectionRefused()
{
    const quint16 port = closedPort();
    QVERIFY(port != 0);

    dq::OllamaGenerator generator =
        makeGenerator(QStringLiteral("http://127.0.0.1:%1").arg(port));
    const GenerationResult result = generator.generate(QStringLiteral("q"), 5000ms);

    QVERIFY(result.status == GenerationResult::Status::NetworkError);
    QVERIFY(!result.text.has_value());
    QVERIFY(result.errorMessage.has_value());
}

void TestOllamaGenerator::testAvailableWhenTagsAnswer()
{
    HttpResponder server;
    QVERIFY(server.listen());
    server.route("GET", "/api/tags", {200, QByteArrayLiteral("{\"models\":[]}"), false});

    dq::OllamaGenerator generator = makeGenerator(server.baseUrl());
    QVERIFY(generator.isAvailable());
}

void TestOllamaGenerator::testUnavailableOnServerError()
{
    HttpResponder server;
    QVERIFY(server.listen());
    server.route("GET", "/api/tags", {503, QByteArrayLiteral("{}"), false});

    dq::OllamaGenerator generator = makeGenerator(server.baseUrl());
    QVERIFY(!generator.isAvailable());
}

void TestOllamaGenerator::testUnavailableWhenNothingListens()
{
    const quint16 port = closedPort();
    QVERIFY(port != 0);

    dq::OllamaGenerator generator =
        makeGenerator(QStringLiteral("http://127.0.0.1:%1").arg(port));
    QVERIFY(!generator.isAvailable());
    QVERIFY(generator.availableModels().isEmpty());
}

void TestOllamaGenerator::testAvailableModels()
{
    HttpResponder server;
    QVERIFY(server.listen());
    server.route("GET", "/api/tags",
                 {200, QByteArrayLiteral("{\"models\":[{\"name\":\"llama3.2:latest\"},{\"name\":\"mistral:7b\"},{}]}"), false});

    dq::OllamaGenerator generator = makeGenerator(server.baseUrl());
    QCOMPARE(generator.availableModels(),
             (QStringList{QStringLiteral("llama3.2:latest"), QStringLiteral("mistral:7b")}));
}

QTEST_MAIN(TestOllamaGenerator)
#include "test_ollama_generator.moc"
