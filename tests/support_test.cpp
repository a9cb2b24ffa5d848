#include <gtest/gtest.h>

#include "parkspot/api/jsonl_event_reporter.hpp"
#include "parkspot/logging.hpp"
#include "parkspot/time_utils.hpp"

#include <QDebug>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace parkspot;
namespace fs = std::filesystem;

TEST(TimeUtilsTest, FormatsUtcWithMilliseconds) {
    const auto tp = TimeUtils::fromEpochMs(1751464991250LL);
    EXPECT_EQ(TimeUtils::toIso8601Utc(tp), "2025-07-02T14:03:11.250Z");
    EXPECT_EQ(TimeUtils::toEpochMs(tp), 1751464991250LL);
    EXPECT_EQ(TimeUtils::toIso8601Utc(TimeUtils::fromEpochMs(0)), "1970-01-01T00:00:00.000Z");
}

TEST(JsonlEventReporterTest, WritesOneObjectPerEvent) {
    std::ostringstream out;
    JsonlEventReporter reporter(out);

    Event arrival;
    arrival.type = EventType::Arrival;
    arrival.occurred_at = TimeUtils::fromEpochMs(1751464991250LL);
    arrival.distance_cm = 6.04;
    Event departure = arrival;
    departure.type = EventType::Departure;
    departure.distance_cm = 120.0;

    Acknowledgement ack;
    ReportError err;
    ASSERT_TRUE(reporter.report(arrival, ack, err));
    EXPECT_TRUE(ack.success);
    ASSERT_TRUE(ack.event_id.has_value());
    EXPECT_EQ(*ack.event_id, 1);
    EXPECT_EQ(ack.event_time, "2025-07-02T14:03:11.250Z");
    ASSERT_TRUE(reporter.report(departure, ack, err));
    EXPECT_EQ(reporter.count(), 2);

    std::istringstream lines(out.str());
    std::string line;
    ASSERT_TRUE(std::getline(lines, line));
    const json first = json::parse(line);
    EXPECT_EQ(first["event_type"], "arrival");
    EXPECT_EQ(first["id"], 1);
    EXPECT_DOUBLE_EQ(first["distance_cm"].get<double>(), 6.0);
    ASSERT_TRUE(std::getline(lines, line));
    const json second = json::parse(line);
    EXPECT_EQ(second["event_type"], "departure");
    EXPECT_EQ(second["id"], 2);
    EXPECT_FALSE(std::getline(lines, line));
}

TEST(LoggingTest, ParsesKnownLevels) {
    QtMsgType t = QtInfoMsg;
    EXPECT_TRUE(logging::parseLevel("DEBUG", t));
    EXPECT_EQ(t, QtDebugMsg);
    EXPECT_TRUE(logging::parseLevel("ERROR", t));
    EXPECT_EQ(t, QtCriticalMsg);
    EXPECT_FALSE(logging::parseLevel("debug", t));
    EXPECT_FALSE(logging::parseLevel("TRACE", t));
}

TEST(LoggingTest, WritesFormattedLinesAboveLevel) {
    const fs::path file = fs::temp_directory_path() / "parkspot_logging_test.log";
    fs::remove(file);

    std::string why;
    ASSERT_TRUE(logging::install("WARNING", file.string(), &why)) << why;
    qInfo() << "[Test] below threshold";
    qWarning() << "[Test] sensor reading attempt" << 2 << "failed";
    logging::uninstall();
    logging::installDefault();

    std::ifstream ifs(file);
    std::string line;
    ASSERT_TRUE(std::getline(ifs, line));
    // "2025-07-02 14:03:11,250 - WARNING - [Test] ..."
    ASSERT_GT(line.size(), 23u);
    EXPECT_EQ(line[10], ' ');
    EXPECT_EQ(line[19], ',');
    EXPECT_NE(line.find(" - WARNING - [Test] sensor reading attempt 2 failed"), std::string::npos);
    EXPECT_FALSE(std::getline(ifs, line));
    fs::remove(file);
}

TEST(LoggingTest, UnwritableFileIsReported) {
    std::string why;
    EXPECT_FALSE(logging::install("INFO", "/nonexistent/dir/parkspot.log", &why));
    EXPECT_FALSE(why.empty());
    EXPECT_FALSE(logging::install("LOUD", "", &why));
    logging::installDefault();
}
