#include <QtTest>
#include <cstring>
#include "audio/PcmEncoder.hpp"

using namespace rs;

namespace {
u32 le32(const std::vector<u8>& b, usize at) {
    return b[at] | (b[at + 1] << 8) | (b[at + 2] << 16) | (static_cast<u32>(b[at + 3]) << 24);
}
u16 le16(const std::vector<u8>& b, usize at) {
    return static_cast<u16>(b[at] | (b[at + 1] << 8));
}
} // namespace

class TestPcmEncoder : public QObject {
    Q_OBJECT

private slots:
    void testHeaderLayout() {
        std::vector<i16> samples{0, 1, -1, 32767, -32768, 100};
        auto wav = PcmEncoder::encode(samples, 2, 48000);
        QVERIFY(wav.isOk());

        const auto& b = *wav;
        QCOMPARE(b.size(), PcmEncoder::kHeaderSize + samples.size() * 2);
        QVERIFY(std::memcmp(b.data(), "RIFF", 4) == 0);
        QCOMPARE(le32(b, 4), u32(36 + samples.size() * 2));
        QVERIFY(std::memcmp(b.data() + 8, "WAVE", 4) == 0);
        QVERIFY(std::memcmp(b.data() + 12, "fmt ", 4) == 0);
        QCOMPARE(le32(b, 16), 16u);
        QCOMPARE(le16(b, 20), u16(1));
        QCOMPARE(le16(b, 22), u16(2));
        QCOMPARE(le32(b, 24), 48000u);
        QCOMPARE(le32(b, 28), 48000u * 2 * 2);
        QCOMPARE(le16(b, 32), u16(4));
        QCOMPARE(le16(b, 34), u16(16));
        QVERIFY(std::memcmp(b.data() + 36, "data", 4) == 0);
        QCOMPARE(le32(b, 40), u32(samples.size() * 2));

        // Little-endian int16 payload
        QCOMPARE(le16(b, 44 + 2 * 3), u16(0x7FFF));
        QCOMPARE(le16(b, 44 + 2 * 4), u16(0x8000));
    }

    void testEmptyInput() {
        auto wav = PcmEncoder::encode(std::span<const i16>(), 1, 8000);
        QVERIFY(wav.isOk());
        QCOMPARE(wav->size(), PcmEncoder::kHeaderSize);
        QCOMPARE(le32(*wav, 40), 0u);
    }

    void testRejectsBadArguments() {
        std::vector<i16> samples{1, 2, 3};
        QVERIFY(PcmEncoder::encode(samples, 0, 48000).isErr());
        QVERIFY(PcmEncoder::encode(samples, 2, 0).isErr());
        auto odd = PcmEncoder::encode(samples, 2, 48000);
        QVERIFY(odd.isErr());
        QVERIFY(odd.error().code == ErrorCode::InvalidInput);
    }

    void testDeterministic() {
        std::vector<i16> samples(480, 1234);
        auto a = PcmEncoder::encode(samples, 1, 48000);
        auto b = PcmEncoder::encode(samples, 1, 48000);
        QVERIFY(a.isOk() && b.isOk());
        QVERIFY(*a == *b);
    }

    void testDecodeReadsBack() {
        std::vector<i16> samples{10, -10, 20, -20};
        auto wav = PcmEncoder::encode(samples, 2, 22050);
        QVERIFY(wav.isOk());

        auto pcm = PcmEncoder::decode(*wav);
        QVERIFY(pcm.isOk());
        QCOMPARE(pcm->channels, 2u);
        QCOMPARE(pcm->sampleRate, 22050u);
        QCOMPARE(pcm->frames(), size_t(2));
        QVERIFY(pcm->samples == samples);
    }

    void testDecodeSkipsUnknownChunks() {
        std::vector<i16> samples{7, 8};
        auto wav = *PcmEncoder::encode(samples, 1, 8000);
        // Insert a LIST chunk between fmt and data
        std::vector<u8> list{'L', 'I', 'S', 'T', 3, 0, 0, 0, 'a', 'b', 'c', 0};
        wav.insert(wav.begin() + 36, list.begin(), list.end());

        auto pcm = PcmEncoder::decode(wav);
        QVERIFY(pcm.isOk());
        QVERIFY(pcm->samples == samples);
    }

    void testDecodeRejectsGarbage() {
        std::vector<u8> junk{'O', 'g', 'g', 'S', 0, 0, 0, 0, 0, 0, 0, 0};
        QVERIFY(PcmEncoder::decode(junk).isErr());
    }

    void testFloatConversion() {
        QCOMPARE(PcmEncoder::floatToPcm16(0.0f), i16(0));
        QCOMPARE(PcmEncoder::floatToPcm16(1.0f), i16(32767));
        QCOMPARE(PcmEncoder::floatToPcm16(-1.0f), i16(-32768));
        QCOMPARE(PcmEncoder::floatToPcm16(2.5f), i16(32767));
        QCOMPARE(PcmEncoder::floatToPcm16(-7.0f), i16(-32768));
    }

    void testToMediaSource() {
        std::vector<i16> samples(8, 0);
        auto src = PcmEncoder::toMediaSource(samples, 1, 8000);
        QVERIFY(src.isOk());
        QVERIFY(src->inMemory());
        QCOMPARE(src->mimeType(), std::string("audio/wav"));
        QCOMPARE(src->bytes()->size(), PcmEncoder::kHeaderSize + 16);
    }
};

int runTestPcmEncoder(int argc, char** argv) {
    TestPcmEncoder tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_PcmEncoder.moc"
