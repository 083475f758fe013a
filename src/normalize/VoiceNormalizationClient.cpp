#include "VoiceNormalizationClient.hpp"
#include <QCoreApplication>
#include <QEventLoop>
#include <QHttpMultiPart>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <algorithm>
#include <memory>
#include "core/Logger.hpp"

namespace rs {

namespace {

QHttpPart textPart(const char* name, const QByteArray& value) {
    QHttpPart part;
    part.setHeader(QNetworkRequest::ContentDispositionHeader,
                   QString("form-data; name=\"%1\"").arg(name));
    part.setBody(value);
    return part;
}

} // namespace

NormalizationOptions NormalizationOptions::fromConfig(const NormalizationConfig& cfg) {
    NormalizationOptions opts;
    opts.apiUrl = cfg.apiUrl;
    opts.modelName = cfg.modelName;
    if (!cfg.f0Method.empty()) {
        opts.f0Method = cfg.f0Method;
    }
    opts.indexRate = std::clamp(cfg.indexRate, 0.0, 1.0);
    opts.timeoutMs = cfg.timeoutMs;
    return opts;
}

VoiceNormalizationClient::VoiceNormalizationClient(QObject* parent)
    : QObject(parent), manager_(new QNetworkAccessManager(this)) {
}

VoiceNormalizationClient::~VoiceNormalizationClient() = default;

QString VoiceNormalizationClient::endpointFor(const std::string& apiUrl) {
    QString base = QString::fromStdString(apiUrl).trimmed();
    while (base.endsWith('/')) {
        base.chop(1);
    }
    return base + "/voice2voice";
}

Result<std::vector<u8>> VoiceNormalizationClient::convert(
        const std::vector<u8>& wav,
        const NormalizationOptions& options) {
    if (options.apiUrl.empty() || options.modelName.empty()) {
        return Result<std::vector<u8>>::err(ErrorCode::Normalization,
                                            "Voice conversion is not configured");
    }
    if (!QCoreApplication::instance()) {
        return Result<std::vector<u8>>::err(ErrorCode::Normalization,
                                            "Voice conversion needs a QCoreApplication");
    }

    auto* multi = new QHttpMultiPart(QHttpMultiPart::FormDataType);

    QHttpPart file;
    file.setHeader(QNetworkRequest::ContentDispositionHeader,
                   QString("form-data; name=\"input_file\"; filename=\"input.wav\""));
    file.setHeader(QNetworkRequest::ContentTypeHeader, QString("audio/wav"));
    file.setBody(QByteArray(reinterpret_cast<const char*>(wav.data()),
                            static_cast<qsizetype>(wav.size())));
    multi->append(file);

    multi->append(textPart("model_name", QByteArray::fromStdString(options.modelName)));
    if (options.f0Method) {
        multi->append(textPart("f0method", QByteArray::fromStdString(*options.f0Method)));
    }
    if (options.indexRate) {
        multi->append(textPart("index_rate", QByteArray::number(*options.indexRate)));
    }

    const QString url = endpointFor(options.apiUrl);
    QNetworkRequest request{QUrl(url)};
    std::unique_ptr<QNetworkReply> reply(manager_->post(request, multi));
    multi->setParent(reply.get());

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(static_cast<int>(options.timeoutMs));
    loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        return Result<std::vector<u8>>::err(
                ErrorCode::Normalization,
                "Voice conversion timed out after " + std::to_string(options.timeoutMs) +
                        " ms");
    }

    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    const QByteArray body = reply->readAll();

    if (!statusAttr.isValid()) {
        return Result<std::vector<u8>>::err(
                ErrorCode::Normalization,
                "Voice conversion request failed: " + reply->errorString().toStdString());
    }

    const int status = statusAttr.toInt();
    if (status < 200 || status >= 300) {
        std::string detail = body.isEmpty()
                                     ? reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute)
                                               .toString()
                                               .toStdString()
                                     : body.left(512).toStdString();
        return Result<std::vector<u8>>::err(
                ErrorCode::Normalization,
                "Voice conversion failed (" + std::to_string(status) + "): " + detail);
    }

    LOG_DEBUG("Voice conversion returned {} bytes from {}", body.size(), url.toStdString());
    return Result<std::vector<u8>>::ok(std::vector<u8>(body.begin(), body.end()));
}

} // namespace rs
