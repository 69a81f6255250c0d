#include "test_support.hpp"

#include <algorithm>

using namespace seatbook;
using namespace seatbook::test;

class ReservationEngineTest : public ServiceFixture {};

// =============================================================================
// Successful batches
// =============================================================================

TEST_F(ReservationEngineTest, BooksBatchAndRecordsLedgerEntries) {
    Event show = createShow();

    auto outcome = engine->book(show.id, {request("A1"), request("A2")}, guest);

    EXPECT_EQ(outcome.event_id, show.id);
    EXPECT_EQ(outcome.date, kShowDate);
    EXPECT_EQ(outcome.attempts, 1);
    ASSERT_EQ(outcome.seats.size(), 2u);

    auto seats = seatsOf(show.id);
    for (const char* id : {"A1", "A2"}) {
        const BookingEntry* entry = seat(seats, id).bookingOn(kShowDate);
        ASSERT_NE(entry, nullptr) << id;
        EXPECT_EQ(entry->name, "Asha");
        EXPECT_EQ(entry->email, "a@x.com");
        EXPECT_EQ(entry->status, "booked");
    }
    EXPECT_EQ(seat(seats, "A3").bookingOn(kShowDate), nullptr);
}

TEST_F(ReservationEngineTest, PhoneIsStoredWhenGiven) {
    Event show = createShow();
    auto r = request("B3");
    r.phone = "+91 9876543210";

    engine->book(show.id, {r}, guest);

    const BookingEntry* entry = seat(seatsOf(show.id), "B3").bookingOn(kShowDate);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->phone, "+91 9876543210");
}

TEST_F(ReservationEngineTest, GroupsConfirmationsByEmail) {
    Event show = createShow();

    auto outcome = engine->book(show.id,
                                {request("A1", "Asha", "a@x.com"),
                                 request("A2", "Ravi", "r@x.com"),
                                 request("A3", "Asha", "a@x.com")},
                                guest);

    ASSERT_EQ(outcome.groups.size(), 2u);
    EXPECT_EQ(outcome.groups[0].email, "a@x.com");
    EXPECT_EQ(outcome.groups[0].seat_ids, (std::vector<std::string>{"A1", "A3"}));
    EXPECT_EQ(outcome.groups[1].email, "r@x.com");
    EXPECT_EQ(outcome.groups[1].seat_ids, (std::vector<std::string>{"A2"}));

    ASSERT_EQ(notifier.confirmations.size(), 2u);
    EXPECT_EQ(notifier.confirmations[0].seat_ids, (std::vector<std::string>{"A1", "A3"}));
    EXPECT_EQ(notifier.confirmations[0].date, kShowDate);
    EXPECT_EQ(notifier.confirmations[1].name, "Ravi");
}

TEST_F(ReservationEngineTest, NotifierFailureDoesNotUndoBooking) {
    Event show = createShow();
    notifier.fail_confirmations = true;

    EXPECT_NO_THROW(engine->book(show.id, {request("A1")}, guest));
    EXPECT_NE(seat(seatsOf(show.id), "A1").bookingOn(kShowDate), nullptr);
}

TEST_F(ReservationEngineTest, OneFailingRecipientDoesNotBlockOthers) {
    Event show = createShow();
    notifier.fail_for_email = "a@x.com";

    engine->book(show.id, {request("A1", "Asha", "a@x.com"), request("A2", "Ravi", "r@x.com")}, guest);

    ASSERT_EQ(notifier.confirmations.size(), 1u);
    EXPECT_EQ(notifier.confirmations[0].email, "r@x.com");
}

// =============================================================================
// Rejections: nothing is written
// =============================================================================

TEST_F(ReservationEngineTest, ConflictOnAlreadyBookedSeatLeavesBatchUnwritten) {
    Event show = createShow();
    engine->book(show.id, {request("A2", "Ravi", "r@x.com")}, guest);

    try {
        engine->book(show.id, {request("A1"), request("A2"), request("A3")}, guest);
        FAIL() << "expected conflict";
    } catch (const ReservationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Conflict);
        EXPECT_EQ(e.seatIds(), (std::vector<std::string>{"A2"}));
        EXPECT_NE(std::string(e.what()).find("A2"), std::string::npos);
    }

    auto seats = seatsOf(show.id);
    EXPECT_EQ(seat(seats, "A1").bookingOn(kShowDate), nullptr);
    EXPECT_EQ(seat(seats, "A3").bookingOn(kShowDate), nullptr);
    EXPECT_EQ(seat(seats, "A2").bookingOn(kShowDate)->email, "r@x.com");
}

TEST_F(ReservationEngineTest, DuplicateSeatInBatchIsConflict) {
    Event show = createShow();

    EXPECT_EQ(errorCodeOf([&] { engine->book(show.id, {request("A1"), request("A1")}, guest); }),
              ErrorCode::Conflict);
    EXPECT_EQ(seat(seatsOf(show.id), "A1").bookingOn(kShowDate), nullptr);
}

TEST_F(ReservationEngineTest, EmptyBatchIsInvalid) {
    Event show = createShow();
    EXPECT_EQ(errorCodeOf([&] { engine->book(show.id, {}, guest); }), ErrorCode::InvalidInput);
}

TEST_F(ReservationEngineTest, MissingRequiredFieldIsInvalid) {
    Event show = createShow();
    auto r = request("A1");
    r.email.clear();

    EXPECT_EQ(errorCodeOf([&] { engine->book(show.id, {r}, guest); }), ErrorCode::InvalidInput);
}

TEST_F(ReservationEngineTest, MalformedSeatIdIsInvalid) {
    Event show = createShow();
    for (const char* bad : {"a1", "A0", "AA1", "1A", "A100"}) {
        EXPECT_EQ(errorCodeOf([&] { engine->book(show.id, {request(bad)}, guest); }),
                  ErrorCode::InvalidInput) << bad;
    }
}

TEST_F(ReservationEngineTest, UnknownEventIsNotFound) {
    createShow();
    EXPECT_EQ(errorCodeOf([&] { engine->book(4242, {request("A1")}, guest); }), ErrorCode::NotFound);
}

TEST_F(ReservationEngineTest, SeatOutsideInventoryIsNotFoundAndListed) {
    Event show = createShow(kShowDate, 15);

    try {
        engine->book(show.id, {request("A1"), request("C1"), request("Z9")}, guest);
        FAIL() << "expected not found";
    } catch (const ReservationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
        EXPECT_EQ(e.seatIds(), (std::vector<std::string>{"C1", "Z9"}));
    }
    EXPECT_EQ(seat(seatsOf(show.id), "A1").bookingOn(kShowDate), nullptr);
}

TEST_F(ReservationEngineTest, BookingDateMustMatchEventDate) {
    Event show = createShow();

    auto code = errorCodeOf([&] {
        engine->book(show.id, {request("A1"), request("A2", "Asha", "a@x.com", "2025-06-02")}, guest);
    });
    EXPECT_EQ(code, ErrorCode::InvalidInput);
    EXPECT_EQ(seat(seatsOf(show.id), "A1").bookingOn(kShowDate), nullptr);
}

TEST_F(ReservationEngineTest, SameDayBookingIsRefused) {
    Event show = createShow();
    today = kShowDate;

    EXPECT_EQ(errorCodeOf([&] { engine->book(show.id, {request("A1")}, guest); }),
              ErrorCode::InvalidInput);
}

TEST_F(ReservationEngineTest, ClosedRegistrationRefusesGuests) {
    Event show = createShow();
    lifecycle->closeRegistration(show.id, admin);

    EXPECT_EQ(errorCodeOf([&] { engine->book(show.id, {request("A1")}, guest); }),
              ErrorCode::Conflict);
}

TEST_F(ReservationEngineTest, ClosedRegistrationAdmitsAdminOverride) {
    Event show = createShow();
    lifecycle->closeRegistration(show.id, admin);

    EXPECT_NO_THROW(engine->book(show.id, {request("A1")}, admin));
    EXPECT_NE(seat(seatsOf(show.id), "A1").bookingOn(kShowDate), nullptr);
}

TEST_F(ReservationEngineTest, AdminOverrideCanBeDisabled) {
    config.admin_override_after_close = false;
    SetUp();
    Event show = createShow();
    lifecycle->closeRegistration(show.id, admin);

    EXPECT_EQ(errorCodeOf([&] { engine->book(show.id, {request("A1")}, admin); }),
              ErrorCode::Conflict);
}

// =============================================================================
// Inventory recovery
// =============================================================================

TEST_F(ReservationEngineTest, MissingInventoryIsRegeneratedBeforeFirstBooking) {
    Event show = createShow(kShowDate, 15);
    {
        SeatDatabase::Transaction tx(*db);
        db->deleteSeats(tx, show.id);
        tx.commit();
    }
    ASSERT_TRUE(seatsOf(show.id).empty());

    engine->book(show.id, {request("B5")}, guest);

    auto seats = seatsOf(show.id);
    EXPECT_EQ(seats.size(), 15u);
    EXPECT_NE(seat(seats, "B5").bookingOn(kShowDate), nullptr);
}

// =============================================================================
// Availability reads
// =============================================================================

TEST_F(ReservationEngineTest, SeatMapShowsBookedAndAvailableSeats) {
    Event show = createShow(kShowDate, 12);
    engine->book(show.id, {request("A2")}, guest);

    auto map = engine->seatAvailability(kShowDate);
    ASSERT_EQ(map.size(), 12u);
    EXPECT_EQ(map[0].seat.seat_id, "A1");
    EXPECT_FALSE(map[0].booked);
    EXPECT_FALSE(map[0].booked_by.has_value());
    EXPECT_TRUE(map[1].booked);
    ASSERT_TRUE(map[1].booked_by.has_value());
    EXPECT_EQ(map[1].booked_by->email, "a@x.com");
    EXPECT_EQ(map[11].seat.seat_id, "B2");
}

TEST_F(ReservationEngineTest, SeatMapForSelectedSeats) {
    createShow();
    auto map = engine->seatAvailability(kShowDate, {"B1", "A3"});
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map[0].seat.seat_id, "A3");
    EXPECT_EQ(map[1].seat.seat_id, "B1");
}

TEST_F(ReservationEngineTest, SeatMapRejectsUnknownSeatsAndDates) {
    createShow();
    EXPECT_EQ(errorCodeOf([&] { engine->seatAvailability(kShowDate, {"A1", "Z1"}); }),
              ErrorCode::NotFound);
    EXPECT_EQ(errorCodeOf([&] { engine->seatAvailability(kShowDate, {"Q"}); }),
              ErrorCode::InvalidInput);
    EXPECT_EQ(errorCodeOf([&] { engine->seatAvailability("2030-01-01"); }), ErrorCode::NotFound);
    EXPECT_EQ(errorCodeOf([&] { engine->seatAvailability(kToday); }), ErrorCode::InvalidInput);
}

TEST_F(ReservationEngineTest, SeatMapNeverRegeneratesInventory) {
    Event show = createShow();
    {
        SeatDatabase::Transaction tx(*db);
        db->deleteSeats(tx, show.id);
        tx.commit();
    }

    EXPECT_TRUE(engine->seatAvailability(kShowDate).empty());
    EXPECT_TRUE(seatsOf(show.id).empty());
}
