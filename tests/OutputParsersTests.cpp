#include <gtest/gtest.h>

#include "layers/protocol/OutputParsers.h"
#include "layers/protocol/PolledState.h"
#include "layers/protocol/protocol_layer.h"

using namespace protocol;

//==============================================================================
// Power
//==============================================================================

TEST(OutputParsersTests, PowerAwakeIsOn) {
    const auto result = parsePower("Power Manager State:\n  mDirty=0x0\n  mWakefulness=Awake\n  mWakefulnessChanging=false\n");
    ASSERT_TRUE(isParsed(result));
    EXPECT_TRUE(std::get<bool>(result));
}

TEST(OutputParsersTests, PowerAsleepAndDozingAreOff) {
    EXPECT_FALSE(std::get<bool>(parsePower("  mWakefulness=Asleep\n")));
    EXPECT_FALSE(std::get<bool>(parsePower("  mWakefulness=Dozing\n")));
}

TEST(OutputParsersTests, PowerFallsBackToDisplayPowerState) {
    const auto on = parsePower("Display Power: state=ON\n");
    const auto off = parsePower("\r\nDisplay Power: state=OFF\r\n");
    ASSERT_TRUE(isParsed(on));
    ASSERT_TRUE(isParsed(off));
    EXPECT_TRUE(std::get<bool>(on));
    EXPECT_FALSE(std::get<bool>(off));
}

TEST(OutputParsersTests, PowerWithoutMarkerIsParseFailure) {
    EXPECT_FALSE(isParsed(parsePower("")));
    EXPECT_FALSE(isParsed(parsePower("Can't find service: power\n")));
}

//==============================================================================
// Playback
//==============================================================================

TEST(OutputParsersTests, PlaybackStateThreeMeansPlaying) {
    const std::string raw =
        "Sessions Stack - have 2 sessions:\n"
        "    state=PlaybackState {state=2, position=0}\n"
        "    state=PlaybackState {state=3, position=5000}\n";
    const auto result = parsePlayback(raw);
    ASSERT_TRUE(isParsed(result));
    EXPECT_TRUE(std::get<bool>(result));
}

TEST(OutputParsersTests, PausedSessionsMeanNotPlaying) {
    const auto result = parsePlayback("    state=PlaybackState {state=2, position=0}\n");
    ASSERT_TRUE(isParsed(result));
    EXPECT_FALSE(std::get<bool>(result));
}

TEST(OutputParsersTests, NoPlaybackStateIsParseFailure) {
    EXPECT_FALSE(isParsed(parsePlayback("Sessions Stack - have 0 sessions:\n")));
}

//==============================================================================
// Properties
//==============================================================================

TEST(OutputParsersTests, AndroidVersionTakesFirstVersionLine) {
    const auto result = parseAndroidVersion("\n  7.1.2  \n");
    ASSERT_TRUE(isParsed(result));
    EXPECT_EQ(std::get<std::string>(result), "7.1.2");
    EXPECT_FALSE(isParsed(parseAndroidVersion("unknown\n")));
}

TEST(OutputParsersTests, ApiLevelMustBeInRange) {
    const auto result = parseApiLevel("28\n");
    ASSERT_TRUE(isParsed(result));
    EXPECT_EQ(std::get<std::int64_t>(result), 28);

    EXPECT_FALSE(isParsed(parseApiLevel("0\n")));
    EXPECT_FALSE(isParsed(parseApiLevel("1001\n")));
    EXPECT_FALSE(isParsed(parseApiLevel("error: closed\n")));
}

//==============================================================================
// Foreground app
//==============================================================================

TEST(OutputParsersTests, ForegroundFromCurrentFocus) {
    const auto result = parseForegroundApp(
        "  mCurrentFocus=Window{3f2b9c u0 com.amazon.tv.launcher/com.amazon.tv.launcher.ui.HomeActivity_vNext}\n"
        "  mFocusedApp=AppWindowToken{1 token=Token{2 ActivityRecord{3 u0 com.other/.X t4}}}\n");
    ASSERT_TRUE(isParsed(result));
    EXPECT_EQ(std::get<std::string>(result), "com.amazon.tv.launcher");
}

TEST(OutputParsersTests, ForegroundFallsBackToFocusedApp) {
    const auto result = parseForegroundApp(
        "  mCurrentFocus=null\n"
        "  mFocusedApp=AppWindowToken{1 token=Token{2 ActivityRecord{3 u0 org.xbmc.kodi/.Splash t4}}}\n");
    ASSERT_TRUE(isParsed(result));
    EXPECT_EQ(std::get<std::string>(result), "org.xbmc.kodi");
}

TEST(OutputParsersTests, ForegroundFallsBackToResumedActivity) {
    const auto result = parseForegroundApp("    mResumedActivity: ActivityRecord{5 u0 com.google.android.youtube.tv/.Shell t7}\n");
    ASSERT_TRUE(isParsed(result));
    EXPECT_EQ(std::get<std::string>(result), "com.google.android.youtube.tv");
}

TEST(OutputParsersTests, ForegroundWithoutMarkerIsParseFailure) {
    EXPECT_FALSE(isParsed(parseForegroundApp("  mCurrentFocus=null\n")));
}

//==============================================================================
// Accumulation
//==============================================================================

TEST(OutputParsersTests, FailedFieldKeepsPreviousValue) {
    PolledState state;
    state.power = true;

    std::string reason;
    EXPECT_FALSE(applyDiagnosticOutput(DiagnosticField::Power, "garbage", state, reason));
    EXPECT_FALSE(reason.empty());
    ASSERT_TRUE(state.power.has_value());
    EXPECT_TRUE(*state.power);

    EXPECT_TRUE(applyDiagnosticOutput(DiagnosticField::Power, "mWakefulness=Asleep", state, reason));
    EXPECT_FALSE(*state.power);
}

TEST(OutputParsersTests, FirstDiffReportsEveryFieldWithNullForUnknown) {
    PolledState next;
    next.power = true;

    const auto changes = diffStates(nullptr, next);
    ASSERT_EQ(changes.size(), 5u);
    EXPECT_EQ(changes[0].name, "power");
    EXPECT_EQ(changes[0].value, boost::json::value(true));
    EXPECT_EQ(changes[1].name, "audioPlaying");
    EXPECT_TRUE(changes[1].value.is_null());
}

TEST(OutputParsersTests, DiffReportsOnlyChangedFields) {
    PolledState previous;
    previous.power = true;
    previous.apiLevel = 28;

    PolledState next = previous;
    next.power = false;

    const auto changes = diffStates(&previous, next);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].name, "power");
    EXPECT_EQ(changes[0].value, boost::json::value(false));
}

//==============================================================================
// Command vocabulary
//==============================================================================

TEST(OutputParsersTests, ControlCommandStrings) {
    std::string line;
    std::string error;

    ASSERT_TRUE(buildShellCommand({"d", CommandKind::KeyEvent, "KEYCODE_HOME", {}}, line, error));
    EXPECT_EQ(line, "input keyevent KEYCODE_HOME");
    ASSERT_TRUE(buildShellCommand({"d", CommandKind::KeyEvent, "3", {}}, line, error));
    EXPECT_EQ(line, "input keyevent 3");
    ASSERT_TRUE(buildShellCommand({"d", CommandKind::LaunchApp, "com.netflix.ninja", {}}, line, error));
    EXPECT_EQ(line, "monkey -p com.netflix.ninja -c android.intent.category.LAUNCHER 1");
    ASSERT_TRUE(buildShellCommand({"d", CommandKind::StopApp, "com.netflix.ninja", {}}, line, error));
    EXPECT_EQ(line, "am force-stop com.netflix.ninja");
    ASSERT_TRUE(buildShellCommand({"d", CommandKind::SendText, "hi there;", {}}, line, error));
    EXPECT_EQ(line, "input text hi%sthere\\;");
}

TEST(OutputParsersTests, InvalidArgumentsAreRejected) {
    std::string line;
    std::string error;
    EXPECT_FALSE(buildShellCommand({"d", CommandKind::KeyEvent, "HOME; reboot", {}}, line, error));
    EXPECT_FALSE(buildShellCommand({"d", CommandKind::KeyEvent, "-1", {}}, line, error));
    EXPECT_FALSE(buildShellCommand({"d", CommandKind::LaunchApp, "com.x && reboot", {}}, line, error));
    EXPECT_FALSE(buildShellCommand({"d", CommandKind::LaunchApp, ".hidden", {}}, line, error));
    EXPECT_FALSE(buildShellCommand({"d", CommandKind::SendText, "", {}}, line, error));
    EXPECT_FALSE(buildShellCommand({"d", CommandKind::Shell, "", {}}, line, error));
}

TEST(OutputParsersTests, LaunchOutputWithoutActivityIsFailure) {
    std::string error;
    EXPECT_TRUE(controlOutputIndicatesFailure(CommandKind::LaunchApp,
                                              "** No activities found to run, monkey aborted.\n", error));
    EXPECT_FALSE(controlOutputIndicatesFailure(CommandKind::LaunchApp, "Events injected: 1\n", error));
}
