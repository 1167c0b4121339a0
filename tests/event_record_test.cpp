#include <gtest/gtest.h>
#include "event_record.hpp"

using namespace eventposter;

TEST(EventRecordTest, ParseTitleTrimsDropsEmptyAndUpperCases) {
    std::vector<std::string> lines = parseTitle("  Reunión\n\n EXATEC \r\nBonn \n   ");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "REUNIÓN");
    EXPECT_EQ(lines[1], "EXATEC");
    EXPECT_EQ(lines[2], "BONN");

    EXPECT_TRUE(parseTitle("\n \n").empty());
}

TEST(EventRecordTest, FormatsIsoDate) {
    EXPECT_EQ(formatDate("2025-10-26"), "26.10.2025");
    EXPECT_EQ(formatDate("2025-1-5"), "05.01.2025");
    EXPECT_EQ(formatDate(" 26.10.2025 "), "26.10.2025");
    EXPECT_EQ(formatDate("next Friday"), "next Friday");
}

TEST(EventRecordTest, FormatsTime) {
    EXPECT_EQ(formatTime("7:05"), "07:05");
    EXPECT_EQ(formatTime("19:00:00"), "19:00");
    EXPECT_EQ(formatTime("19:00"), "19:00");
    EXPECT_EQ(formatTime("TBA"), "TBA");
    EXPECT_EQ(formatTime("19:0"), "19:0");
}

TEST(EventRecordTest, FromInputNormalizesFields) {
    EventRecord r = EventRecord::fromInput("19:00:00", "2025-10-26", "Reunión\nEXATEC", " Bonn ",
                                           " Markt 1 ", "  ", 0);
    EXPECT_EQ(r.time, "19:00");
    EXPECT_EQ(r.date, "26.10.2025");
    ASSERT_EQ(r.title.size(), 2u);
    EXPECT_EQ(r.venue, "Bonn");
    EXPECT_EQ(r.address, "Markt 1");
    EXPECT_TRUE(r.background_query.empty());
    EXPECT_EQ(r.page, 1);
}

TEST(EventRecordTest, DatetimeSegmentsWithAndWithoutIcons) {
    EventRecord r = EventRecord::fromInput("19:00", "2025-10-26", "X", "", "", "", 1);

    auto icons = datetimeSegments(r, true, " | ");
    ASSERT_EQ(icons.size(), 2u);
    EXPECT_EQ(icons[0].icon, "clock");
    EXPECT_EQ(icons[0].text, "19:00");
    EXPECT_EQ(icons[1].icon, "calendar");
    EXPECT_EQ(icons[1].text, "26.10.2025");

    auto plain = datetimeSegments(r, false, " | ");
    ASSERT_EQ(plain.size(), 1u);
    EXPECT_TRUE(plain[0].icon.empty());
    EXPECT_EQ(plain[0].text, "19:00 | 26.10.2025");

    r.time.clear();
    plain = datetimeSegments(r, false, " | ");
    ASSERT_EQ(plain.size(), 1u);
    EXPECT_EQ(plain[0].text, "26.10.2025");
}

TEST(EventRecordTest, PlanVariantsWithQueryUsesConsecutivePages) {
    EventRecord r = EventRecord::fromInput("19:00", "2025-10-26", "Party", "Bonn", "", "office party", 1);
    auto plan = planVariants(r, 3, true);
    ASSERT_EQ(plan.size(), 3u);
    for (size_t i = 0; i < plan.size(); ++i) {
        EXPECT_EQ(plan[i].query, "office party");
        EXPECT_EQ(plan[i].page, static_cast<int>(i) + 1);
        EXPECT_EQ(plan[i].label, "Version " + std::to_string(i + 1));
    }
}

TEST(EventRecordTest, PlanVariantsDerivesQueriesFromTitleAndVenue) {
    EventRecord r = EventRecord::fromInput("19:00", "2025-10-26", "Reunión\nEXATEC", "Bonn", "", "", 1);
    auto plan = planVariants(r, 7, true);
    ASSERT_EQ(plan.size(), 5u);
    EXPECT_EQ(plan[0].query, "REUNIÓN");
    EXPECT_EQ(plan[1].query, "celebration REUNIÓN");
    EXPECT_EQ(plan[2].query, "event venue Bonn");
    EXPECT_EQ(plan[3].query, "event decoration");
    EXPECT_EQ(plan[4].query, "party Bonn");
    for (const auto& v : plan) EXPECT_EQ(v.page, 1);

    EXPECT_EQ(planVariants(r, 2, true).size(), 2u);
}

TEST(EventRecordTest, PlanVariantsWithoutQueryOrDerivationIsSingleFallback) {
    EventRecord r = EventRecord::fromInput("19:00", "2025-10-26", "Reunión", "Bonn", "", "", 1);
    auto plan = planVariants(r, 5, false);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_TRUE(plan[0].query.empty());
}

TEST(EventRecordTest, OutputFileNameUsesDateDigits) {
    EventRecord r = EventRecord::fromInput("19:00", "2025-10-26", "X", "", "", "", 1);
    EXPECT_EQ(outputFileName(r, 2), "event_20251026_v2.png");

    r.date = "Oct 26";
    EXPECT_EQ(outputFileName(r, 1), "event_26_v1.png");

    r.date.clear();
    EXPECT_EQ(outputFileName(r, 1), "event_undated_v1.png");
}
