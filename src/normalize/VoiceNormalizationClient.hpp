/**
 * @file VoiceNormalizationClient.hpp
 * @brief HTTP client for an RVC voice2voice endpoint.
 *
 * Issues a multipart/form-data POST to {apiUrl}/voice2voice with the parts
 * input_file (input.wav), model_name and optionally f0method and index_rate,
 * and waits for the reply on a local event loop. Requires a
 * QCoreApplication on the calling thread.
 *
 * @section Dependencies
 * - Qt Network (QNetworkAccessManager, QHttpMultiPart)
 */

#pragma once
#include <QNetworkAccessManager>
#include <QObject>
#include "VoiceConverter.hpp"

namespace rs {

class VoiceNormalizationClient : public QObject, public VoiceConverter {
    Q_OBJECT

public:
    explicit VoiceNormalizationClient(QObject* parent = nullptr);
    ~VoiceNormalizationClient() override;

    Result<std::vector<u8>> convert(const std::vector<u8>& wav,
                                    const NormalizationOptions& options) override;

    // "{apiUrl without trailing slash}/voice2voice"
    static QString endpointFor(const std::string& apiUrl);

private:
    QNetworkAccessManager* manager_;
};

} // namespace rs
