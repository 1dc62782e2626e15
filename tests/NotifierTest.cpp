#include "sampleconv/common/Notifier.hpp"

#include "sampleconv/common/Logger.hpp"

#include "NkiTestHelpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <system_error>

namespace sampleconv::common {

TEST(NotifierTest, KnownKeysRenderAsEnglishText) {
    EXPECT_EQ(messageText(msg::kNkiUnknownFileId), "Unknown NKI file id");
    EXPECT_EQ(renderMessage(msg::kNotifyStoring, "/out/Piano.sfz"), "Storing: /out/Piano.sfz");
    EXPECT_EQ(renderMessage(msg::kNotifyProgressDone, ""), "Done.");
}

TEST(NotifierTest, UnknownKeyRendersAsItself) {
    EXPECT_EQ(messageText("IDS_SOMETHING_ELSE"), "IDS_SOMETHING_ELSE");
}

TEST(NotifierTest, ConsoleNotifierCountsErrors) {
    ConsoleNotifier notifier;
    notifier.log(msg::kNotifyDetecting, "a.nki");
    notifier.logError(msg::kNkiMonolithNotSupported, "b.nki");
    notifier.logError(msg::kNotifyErrLoadFile, "c.nki");
    EXPECT_EQ(notifier.errorCount(), 2);
}

TEST(NotifierTest, ConsoleNotifierMirrorsIntoLogFile) {
    const auto logPath = test_helpers::uniqueTempPath("sampleconv-log", "txt");
    auto cleanup = [&]() {
        Logger::shutdown();
        std::error_code ec;
        std::filesystem::remove(logPath, ec);
    };

    ASSERT_TRUE(Logger::init(logPath));
    EXPECT_TRUE(Logger::isOpen());

    ConsoleNotifier notifier;
    notifier.log(msg::kNotifyStoring, "Piano.sfz");
    notifier.logError(msg::kNotifyErrSampleCopy, "c4.wav");
    Logger::shutdown();
    EXPECT_FALSE(Logger::isOpen());

    const std::string text = test_helpers::readTextFile(logPath);
    EXPECT_NE(text.find("[INFO ]"), std::string::npos);
    EXPECT_NE(text.find("Storing: Piano.sfz"), std::string::npos);
    EXPECT_NE(text.find("[ERROR]"), std::string::npos);
    EXPECT_NE(text.find("Could not copy sample: c4.wav"), std::string::npos);

    cleanup();
}

}  // namespace sampleconv::common
