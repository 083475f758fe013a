#include "MediaFetcher.hpp"
#include <QCoreApplication>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <memory>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace rs {

Result<std::vector<u8>> MediaFetcher::fetch(const MediaSource& source) const {
    auto fail = [&](std::string msg) {
        Error e(ErrorCode::AssetLoad, std::move(msg));
        e.forAsset(source.describe());
        return Result<std::vector<u8>>::err(std::move(e));
    };

    if (source.empty()) {
        return fail("Empty media source");
    }

    if (source.inMemory()) {
        return Result<std::vector<u8>>::ok(*source.bytes());
    }

    if (source.isRemote()) {
        return httpGet(source.uri());
    }

    auto bytes = file::readBytes(source.localPath());
    if (!bytes) {
        return fail(bytes.error().message);
    }
    return bytes;
}

Result<std::vector<u8>> MediaFetcher::httpGet(const std::string& url) const {
    auto fail = [&](std::string msg) {
        Error e(ErrorCode::AssetLoad, std::move(msg));
        e.forAsset(url);
        return Result<std::vector<u8>>::err(std::move(e));
    };

    if (!QCoreApplication::instance()) {
        return fail("HTTP fetch needs a QCoreApplication");
    }

    QNetworkAccessManager manager;
    QNetworkRequest request(QUrl(QString::fromStdString(url)));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    std::unique_ptr<QNetworkReply> reply(manager.get(request));

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(static_cast<int>(timeoutMs_));
    loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        return fail("Timed out after " + std::to_string(timeoutMs_) + " ms");
    }

    const int status =
            reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (reply->error() != QNetworkReply::NoError) {
        return fail("HTTP " + std::to_string(status) + ": " +
                    reply->errorString().toStdString());
    }

    QByteArray body = reply->readAll();
    LOG_DEBUG("Fetched {} bytes from {}", body.size(), url);
    return Result<std::vector<u8>>::ok(
            std::vector<u8>(body.begin(), body.end()));
}

} // namespace rs
