#include "test_support.hpp"

#include <atomic>
#include <thread>

using namespace seatbook;
using namespace seatbook::test;

class ConcurrencyTest : public ServiceFixture {};

// Two batches sharing seat A2: exactly one commits, the other leaves no trace
TEST_F(ConcurrencyTest, OverlappingBatchesNeverBothCommitSharedSeat) {
    for (int round = 0; round < 20; ++round) {
        SetUp();
        Event show = createShow();

        std::atomic<int> committed{0};
        std::atomic<int> conflicts{0};
        auto run = [&](std::vector<BookingRequest> batch) {
            try {
                engine->book(show.id, batch, guest);
                ++committed;
            } catch (const ReservationError& e) {
                if (e.code() == ErrorCode::Conflict) ++conflicts;
            }
        };

        std::thread first(run, std::vector<BookingRequest>{request("A1", "Asha", "a@x.com"),
                                                           request("A2", "Asha", "a@x.com")});
        std::thread second(run, std::vector<BookingRequest>{request("A2", "Ravi", "r@x.com"),
                                                            request("A3", "Ravi", "r@x.com")});
        first.join();
        second.join();

        ASSERT_EQ(committed.load(), 1) << "round " << round;
        ASSERT_EQ(conflicts.load(), 1) << "round " << round;

        auto seats = seatsOf(show.id);
        const BookingEntry* a2 = seat(seats, "A2").bookingOn(kShowDate);
        ASSERT_NE(a2, nullptr);
        if (a2->email == "a@x.com") {
            EXPECT_NE(seat(seats, "A1").bookingOn(kShowDate), nullptr);
            EXPECT_EQ(seat(seats, "A3").bookingOn(kShowDate), nullptr);
        } else {
            EXPECT_EQ(seat(seats, "A1").bookingOn(kShowDate), nullptr);
            EXPECT_NE(seat(seats, "A3").bookingOn(kShowDate), nullptr);
        }
    }
}

TEST_F(ConcurrencyTest, DisjointBatchesAllCommit) {
    Event show = createShow(kShowDate, 30);

    std::vector<std::thread> workers;
    std::atomic<int> committed{0};
    for (int row = 0; row < 3; ++row) {
        workers.emplace_back([&, row] {
            std::string letter(1, static_cast<char>('A' + row));
            std::string email = letter + "@x.com";
            engine->book(show.id, {request(letter + "1", letter, email),
                                   request(letter + "2", letter, email)}, guest);
            ++committed;
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(committed.load(), 3);
    EXPECT_EQ(notifier.confirmations.size(), 3u);
}

TEST_F(ConcurrencyTest, ManyContendersForOneSeatYieldOneWinner) {
    Event show = createShow();

    std::atomic<int> committed{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&, i] {
            std::string email = "u" + std::to_string(i) + "@x.com";
            try {
                engine->book(show.id, {request("B1", "User", email)}, guest);
                ++committed;
            } catch (const ReservationError& e) {
                EXPECT_EQ(e.code(), ErrorCode::Conflict);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(committed.load(), 1);
    EXPECT_NE(seat(seatsOf(show.id), "B1").bookingOn(kShowDate), nullptr);
}
