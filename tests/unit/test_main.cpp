/**
 * @file test_main.cpp
 * @brief Test suite entry point using Qt Test.
 */
#include <QCoreApplication>
#include <QtTest>

int runTestLogger(int argc, char** argv);
int runTestConfigParsers(int argc, char** argv);
int runTestPcmEncoder(int argc, char** argv);
int runTestAudioGraph(int argc, char** argv);
int runTestAudioExtractor(int argc, char** argv);
int runTestDurationResolver(int argc, char** argv);
int runTestFFmpegMedia(int argc, char** argv);
int runTestCompositeRenderer(int argc, char** argv);
int runTestCodecNegotiator(int argc, char** argv);
int runTestFFmpegCaptureSink(int argc, char** argv);
int runTestVoiceNormalizationClient(int argc, char** argv);
int runTestManifestLoader(int argc, char** argv);
int runTestSegmentSynchronizer(int argc, char** argv);
int runTestExportEngine(int argc, char** argv);

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    int status = 0;
    status |= runTestLogger(argc, argv);
    status |= runTestConfigParsers(argc, argv);
    status |= runTestPcmEncoder(argc, argv);
    status |= runTestAudioGraph(argc, argv);
    status |= runTestAudioExtractor(argc, argv);
    status |= runTestDurationResolver(argc, argv);
    status |= runTestFFmpegMedia(argc, argv);
    status |= runTestCompositeRenderer(argc, argv);
    status |= runTestCodecNegotiator(argc, argv);
    status |= runTestFFmpegCaptureSink(argc, argv);
    status |= runTestVoiceNormalizationClient(argc, argv);
    status |= runTestManifestLoader(argc, argv);
    status |= runTestSegmentSynchronizer(argc, argv);
    status |= runTestExportEngine(argc, argv);

    return status;
}
