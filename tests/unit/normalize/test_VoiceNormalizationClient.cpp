#include <QNetworkProxy>
#include <QTcpServer>
#include <QTcpSocket>
#include <QtTest>
#include "normalize/VoiceNormalizationClient.hpp"

using namespace rs;

namespace {

// One canned HTTP response per connection; captures the last request
class FakeRvcServer {
public:
    FakeRvcServer(int status, QByteArray body, bool respond = true)
        : status_(status), body_(std::move(body)), respond_(respond) {
        server_.listen(QHostAddress::LocalHost, 0);
        QObject::connect(&server_, &QTcpServer::newConnection, [this] { accept(); });
    }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(server_.serverPort()) + "/";
    }

    QByteArray request;

private:
    void accept() {
        while (QTcpSocket* socket = server_.nextPendingConnection()) {
            auto buffer = std::make_shared<QByteArray>();
            QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket, buffer] {
                buffer->append(socket->readAll());
                const qsizetype headerEnd = buffer->indexOf("\r\n\r\n");
                if (headerEnd < 0) {
                    return;
                }
                qsizetype length = 0;
                for (const QByteArray& line : buffer->left(headerEnd).split('\n')) {
                    if (line.toLower().startsWith("content-length:")) {
                        length = line.mid(15).trimmed().toLongLong();
                    }
                }
                if (buffer->size() < headerEnd + 4 + length) {
                    return;
                }
                request = *buffer;
                if (!respond_) {
                    return;
                }
                QByteArray reply = "HTTP/1.1 " + QByteArray::number(status_) + " Status\r\n" +
                                   "Content-Type: application/octet-stream\r\n" +
                                   "Content-Length: " + QByteArray::number(body_.size()) +
                                   "\r\nConnection: close\r\n\r\n" + body_;
                socket->write(reply);
                socket->disconnectFromHost();
            });
        }
    }

    QTcpServer server_;
    int status_;
    QByteArray body_;
    bool respond_;
};

NormalizationOptions optionsFor(const std::string& url) {
    NormalizationOptions opts;
    opts.apiUrl = url;
    opts.modelName = "narrator";
    opts.f0Method = "rmvpe";
    opts.indexRate = 0.66;
    opts.timeoutMs = 5000;
    return opts;
}

} // namespace

class TestVoiceNormalizationClient : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        QNetworkProxy::setApplicationProxy(QNetworkProxy::NoProxy);
    }

    void testEndpoint() {
        QCOMPARE(VoiceNormalizationClient::endpointFor("http://localhost:8001"),
                 QString("http://localhost:8001/voice2voice"));
        QCOMPARE(VoiceNormalizationClient::endpointFor("http://localhost:8001///"),
                 QString("http://localhost:8001/voice2voice"));
    }

    void testSuccessfulConversion() {
        FakeRvcServer server(200, QByteArray("RIFFconverted"));
        VoiceNormalizationClient client;

        std::vector<u8> wav{'R', 'I', 'F', 'F', 1, 2, 3, 4};
        auto out = client.convert(wav, optionsFor(server.url()));
        QVERIFY(out.isOk());
        QCOMPARE(QByteArray(reinterpret_cast<const char*>(out->data()),
                            static_cast<qsizetype>(out->size())),
                 QByteArray("RIFFconverted"));

        QVERIFY(server.request.startsWith("POST /voice2voice "));
        QVERIFY(server.request.contains("multipart/form-data"));
        QVERIFY(server.request.contains("name=\"input_file\"; filename=\"input.wav\""));
        QVERIFY(server.request.contains("audio/wav"));
        QVERIFY(server.request.contains("name=\"model_name\""));
        QVERIFY(server.request.contains("narrator"));
        QVERIFY(server.request.contains("name=\"f0method\""));
        QVERIFY(server.request.contains("name=\"index_rate\""));
        QVERIFY(server.request.contains("0.66"));
    }

    void testOptionalFieldsOmitted() {
        FakeRvcServer server(200, QByteArray("ok"));
        VoiceNormalizationClient client;

        auto opts = optionsFor(server.url());
        opts.f0Method.reset();
        opts.indexRate.reset();
        QVERIFY(client.convert({1, 2}, opts).isOk());
        QVERIFY(!server.request.contains("name=\"f0method\""));
        QVERIFY(!server.request.contains("name=\"index_rate\""));
    }

    void testServerErrorCarriesBody() {
        FakeRvcServer server(500, QByteArray("model narrator not found"));
        VoiceNormalizationClient client;

        auto out = client.convert({1, 2, 3}, optionsFor(server.url()));
        QVERIFY(out.isErr());
        QVERIFY(out.error().code == ErrorCode::Normalization);
        QVERIFY(out.error().message.find("500") != std::string::npos);
        QVERIFY(out.error().message.find("model narrator not found") != std::string::npos);
    }

    void testTimeout() {
        FakeRvcServer server(200, QByteArray(), false);
        VoiceNormalizationClient client;

        auto opts = optionsFor(server.url());
        opts.timeoutMs = 300;
        auto out = client.convert({1}, opts);
        QVERIFY(out.isErr());
        QVERIFY(out.error().code == ErrorCode::Normalization);
        QVERIFY(out.error().message.find("timed out") != std::string::npos);
    }

    void testUnreachable() {
        quint16 port = 0;
        {
            QTcpServer probe;
            probe.listen(QHostAddress::LocalHost, 0);
            port = probe.serverPort();
        }
        VoiceNormalizationClient client;
        auto out = client.convert({1}, optionsFor("http://127.0.0.1:" + std::to_string(port)));
        QVERIFY(out.isErr());
        QVERIFY(out.error().code == ErrorCode::Normalization);
    }

    void testNotConfigured() {
        VoiceNormalizationClient client;
        NormalizationOptions opts;
        auto out = client.convert({1}, opts);
        QVERIFY(out.isErr());
        QVERIFY(out.error().code == ErrorCode::Normalization);
    }

    void testOptionsFromConfig() {
        NormalizationConfig cfg;
        cfg.apiUrl = "http://rvc:8001";
        cfg.modelName = "narrator";
        cfg.indexRate = 3.0;
        auto opts = NormalizationOptions::fromConfig(cfg);
        QCOMPARE(opts.f0Method.value_or(""), std::string("rmvpe"));
        QCOMPARE(opts.indexRate.value_or(0.0), 1.0);
        QCOMPARE(opts.timeoutMs, 120000u);
    }
};

int runTestVoiceNormalizationClient(int argc, char** argv) {
    TestVoiceNormalizationClient tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_VoiceNormalizationClient.moc"
