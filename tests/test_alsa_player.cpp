#include "AlsaPlayer.hpp"

#include <gtest/gtest.h>
#include <sndfile.hh>

#include <thread>
#include <vector>

#include "support/temp_dir.hpp"

namespace {

// ALSA's "null" plugin accepts any stream and discards it.
constexpr const char* kNullDevice = "null";

class AlsaPlayerTest : public TempDirTest {
   protected:
    static AudioConfig NullAudio() {
        AudioConfig config;
        config.device = kNullDevice;
        config.track_gap = std::chrono::milliseconds(5);
        config.error_backoff = std::chrono::milliseconds(10);
        return config;
    }

    // Writes a short 16-bit stereo WAV of silence.
    std::filesystem::path WriteWav(const std::string& name, int frames = 4410) {
        const auto path = root / name;
        SndfileHandle file(path.string(), SFM_WRITE, SF_FORMAT_WAV | SF_FORMAT_PCM_16, 2, 44100);
        std::vector<short> silence(static_cast<std::size_t>(frames) * 2, 0);
        file.writef(silence.data(), frames);
        return path;
    }
};

}  // namespace

TEST_F(AlsaPlayerTest, EmptyTrackListIsRefused) {
    AlsaPlayer player(NullAudio(), 1.0);

    EXPECT_FALSE(player.Start({}, false));
    EXPECT_FALSE(player.is_playing());
}

TEST_F(AlsaPlayerTest, StartThenStopReleasesPlayback) {
    AlsaPlayer player(NullAudio(), 0.5);
    TrackList tracks = {WriteWav("01.wav"), WriteWav("02.wav")};

    ASSERT_TRUE(player.Start(tracks, false));
    EXPECT_TRUE(player.is_playing());

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    player.Stop();
    EXPECT_FALSE(player.is_playing());
}

TEST_F(AlsaPlayerTest, SecondStopIsNoOp) {
    AlsaPlayer player(NullAudio(), 1.0);
    ASSERT_TRUE(player.Start({WriteWav("01.wav")}, true));

    player.Stop();
    player.Stop();
    EXPECT_FALSE(player.is_playing());
}

TEST_F(AlsaPlayerTest, StopWithoutStartIsNoOp) {
    AlsaPlayer player(NullAudio(), 1.0);
    player.Stop();
    EXPECT_FALSE(player.is_playing());
}

TEST_F(AlsaPlayerTest, StartAgainAfterStopReacquiresDevice) {
    AlsaPlayer player(NullAudio(), 1.0);
    TrackList tracks = {WriteWav("01.wav")};

    ASSERT_TRUE(player.Start(tracks, false));
    player.Stop();
    EXPECT_FALSE(player.is_playing());

    ASSERT_TRUE(player.Start(tracks, true));
    EXPECT_TRUE(player.is_playing());
    player.Stop();
    EXPECT_FALSE(player.is_playing());
}

TEST_F(AlsaPlayerTest, StartWhilePlayingReplacesSession) {
    AlsaPlayer player(NullAudio(), 1.0);

    ASSERT_TRUE(player.Start({WriteWav("a.wav")}, false));
    ASSERT_TRUE(player.Start({WriteWav("b.wav")}, false));
    EXPECT_TRUE(player.is_playing());

    player.Stop();
    EXPECT_FALSE(player.is_playing());
}

TEST_F(AlsaPlayerTest, UndecodableTracksKeepRetryingUntilStopped) {
    AlsaPlayer player(NullAudio(), 1.0);
    TrackList tracks = {Touch("broken.wav", "not audio"), root / "missing.wav"};

    ASSERT_TRUE(player.Start(tracks, false));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_TRUE(player.is_playing());

    player.Stop();
    EXPECT_FALSE(player.is_playing());
}

TEST_F(AlsaPlayerTest, UnknownDeviceFailsStartWithoutBlocking) {
    AudioConfig config = NullAudio();
    config.device = "tagtune_no_such_device";
    AlsaPlayer player(config, 1.0);

    EXPECT_FALSE(player.Start({WriteWav("01.wav")}, false));
    EXPECT_FALSE(player.is_playing());
}
