#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "seatbook/notify/jsonl_notifier.hpp"
#include "seatbook/notify/notification_messages.hpp"

using namespace seatbook;
using nlohmann::json;

namespace {

Event sampleEvent() {
    Event e;
    e.id = 7;
    e.name = "Professor Sahab";
    e.date = "2025-06-01";
    e.time = "19:30";
    e.description = "A comedy play";
    e.venue = "Town Hall";
    e.total_seats = 15;
    e.registration_closed = true;
    return e;
}

} // namespace

TEST(NotificationMessagesTest, BookingConfirmedListsSeatsAndAdmitCount) {
    json m = messages::bookingConfirmed("a@x.com", {"A1", "A3"}, "Asha", "2025-06-01");

    EXPECT_EQ(m["type"], "booking_confirmed");
    EXPECT_EQ(m["email"], "a@x.com");
    EXPECT_EQ(m["name"], "Asha");
    EXPECT_EQ(m["date"], "2025-06-01");
    EXPECT_EQ(m["seats"], json::array({"A1", "A3"}));
    EXPECT_EQ(m["admit"], 2);
    EXPECT_TRUE(m.contains("timestamp"));
}

TEST(NotificationMessagesTest, RosterReadyCarriesEventAndRows) {
    std::vector<BookingRow> rows = {{"A1", "Asha", "a@x.com", "N/A"},
                                    {"A2", "Ravi", "r@x.com", "9876543210"}};
    json m = messages::rosterReady(sampleEvent(), rows, "owner@example.com");

    EXPECT_EQ(m["type"], "roster_ready");
    EXPECT_EQ(m["recipient"], "owner@example.com");
    EXPECT_EQ(m["event"]["id"], 7);
    EXPECT_EQ(m["event"]["registration_closed"], true);
    EXPECT_EQ(m["booking_count"], 2);
    ASSERT_EQ(m["bookings"].size(), 2u);
    EXPECT_EQ(m["bookings"][1]["phone"], "9876543210");
}

TEST(NotificationMessagesTest, SeatAvailabilityStatus) {
    SeatAvailability free_seat;
    free_seat.seat.seat_id = "B4";
    free_seat.seat.row = "B";
    free_seat.seat.column = 4;
    free_seat.seat.price = 200;

    json j = messages::toJson(free_seat);
    EXPECT_EQ(j["status"], "available");
    EXPECT_TRUE(j["booked_by"].is_null());

    SeatAvailability taken = free_seat;
    taken.booked = true;
    taken.booked_by = BookingEntry{"2025-06-01", "Asha", "a@x.com", "", "booked"};
    j = messages::toJson(taken);
    EXPECT_EQ(j["status"], "booked");
    EXPECT_EQ(j["booked_by"]["email"], "a@x.com");
    EXPECT_FALSE(j["booked_by"].contains("phone"));
}

TEST(JsonlNotifierTest, AppendsOneLinePerNotification) {
    auto dir = std::filesystem::temp_directory_path() / "seatbook_jsonl_notifier_test";
    std::filesystem::remove_all(dir);
    auto path = (dir / "outbox" / "notifications.jsonl").string();

    {
        JsonlNotifier notifier(path, "owner@example.com");
        notifier.notifyBookingConfirmed("a@x.com", {"A1"}, "Asha", "2025-06-01");
        notifier.notifyRosterReady(sampleEvent(), {{"A1", "Asha", "a@x.com", "N/A"}});
    }

    std::ifstream in(path);
    std::string line;
    std::vector<json> lines;
    while (std::getline(in, line)) {
        lines.push_back(json::parse(line));
    }
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["type"], "booking_confirmed");
    EXPECT_EQ(lines[1]["type"], "roster_ready");
    EXPECT_EQ(lines[1]["recipient"], "owner@example.com");

    std::filesystem::remove_all(dir);
}
