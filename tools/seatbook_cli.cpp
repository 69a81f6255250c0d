#include "db_core/SeatDatabase.h"
#include "db_core/SeatInitializer.h"
#include "seatbook/Config.h"
#include "seatbook/TimeUtils.h"
#include "seatbook/errors.hpp"
#include "seatbook/lifecycle/lifecycle_controller.hpp"
#include "seatbook/notify/jsonl_notifier.hpp"
#include "seatbook/notify/notification_messages.hpp"
#include "seatbook/registry/event_registry.hpp"
#include "seatbook/reservation/reservation_engine.hpp"
#include "seatbook/validation.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace seatbook;
using json = nlohmann::json;

namespace {

void usage() {
    std::cerr <<
        "usage: seatbook_cli <config.yml> <command> [args]\n"
        "  init\n"
        "  create-event <name> <YYYY-MM-DD> <HH:MM> <venue> <seats> <description>\n"
        "  delete-event <event_id>\n"
        "  show-event <event_id>\n"
        "  upcoming | past | recent\n"
        "  seats <YYYY-MM-DD> [seat_id...]\n"
        "  book <event_id> <YYYY-MM-DD> <name> <email> <seat_id>... [--phone <n>] [--admin]\n"
        "  close <event_id>\n"
        "  roster <event_id>\n"
        "  ensure-seats <event_id> <capacity>\n";
}

EventId parseId(const std::string& text) {
    try {
        std::size_t used = 0;
        long long id = std::stoll(text, &used);
        if (used == text.size() && id > 0) return id;
    } catch (const std::logic_error&) {
        // not a number, reported below
    }
    throw ReservationError::invalidInput("Invalid event ID: " + text);
}

int parseCount(const std::string& text) {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used == text.size()) return value;
    } catch (const std::logic_error&) {
        // not a number, reported below
    }
    throw ReservationError::invalidInput("Expected an integer: " + text);
}

void print(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

json eventList(const std::vector<Event>& events) {
    json items = json::array();
    for (const auto& e : events) items.push_back(messages::toJson(e));
    return items;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage();
        return 2;
    }

    const std::vector<std::string> args(argv + 3, argv + argc);
    const std::string command = argv[2];

    try {
        ServiceConfig config = ServiceConfig::fromYaml(argv[1]);
        SeatDatabase db(config.db_path, config.busy_timeout_ms);
        if (!db.initialize()) return 1;

        JsonlNotifier notifier(config.notifications_jsonl, config.roster_recipient);
        SeatInitializer initializer(db, config.seat_price);
        EventRegistry registry(db, initializer, config, &TimeUtils::todayDate);
        ReservationEngine engine(db, initializer, notifier, config, &TimeUtils::todayDate);
        LifecycleController lifecycle(db, notifier);

        // The operator running this tool is trusted
        Requester operator_{true, "cli"};

        if (command == "init") {
            std::cout << "Database ready: " << db.path() << std::endl;
        } else if (command == "create-event" && args.size() == 6) {
            NewEvent fields{args[0], args[1], args[2], args[5], args[3], parseCount(args[4])};
            print(messages::toJson(registry.createEvent(fields)));
        } else if (command == "delete-event" && args.size() == 1) {
            registry.deleteEvent(parseId(args[0]));
            std::cout << "Event and associated seats deleted" << std::endl;
        } else if (command == "show-event" && args.size() == 1) {
            print(messages::toJson(registry.getEvent(parseId(args[0]))));
        } else if (command == "upcoming" && args.empty()) {
            print(eventList(registry.listUpcoming()));
        } else if (command == "past" && args.empty()) {
            print(eventList(registry.listPast()));
        } else if (command == "recent" && args.empty()) {
            print(eventList(registry.listRecent()));
        } else if (command == "seats" && !args.empty()) {
            if (!TimeUtils::isIsoDate(args[0])) {
                throw ReservationError::invalidInput("Invalid date format. Use YYYY-MM-DD");
            }
            std::vector<std::string> ids(args.begin() + 1, args.end());
            auto seats = ids.empty() ? engine.seatAvailability(args[0])
                                     : engine.seatAvailability(args[0], ids);
            json items = json::array();
            for (const auto& s : seats) items.push_back(messages::toJson(s));
            print(items);
        } else if (command == "book" && args.size() >= 5) {
            Requester requester{false, "cli"};
            std::string phone;
            std::vector<std::string> seat_ids;
            for (std::size_t i = 4; i < args.size(); ++i) {
                if (args[i] == "--admin") {
                    requester.is_admin = true;
                } else if (args[i] == "--phone" && i + 1 < args.size()) {
                    phone = args[++i];
                } else {
                    seat_ids.push_back(args[i]);
                }
            }
            if (!TimeUtils::isIsoDate(args[1])) {
                throw ReservationError::invalidInput("Invalid booking date format. Use YYYY-MM-DD");
            }
            if (!isValidEmail(args[3])) {
                throw ReservationError::invalidInput("Invalid email format");
            }
            if (!phone.empty() && !isValidPhone(phone)) {
                throw ReservationError::invalidInput(
                    "Invalid phone number format. Use 10 digits or +[country code][10 digits]");
            }

            std::vector<BookingRequest> batch;
            for (const auto& id : seat_ids) {
                batch.push_back({id, args[2], args[3], phone, args[1]});
            }
            BookingOutcome outcome = engine.book(parseId(args[0]), batch, requester);
            std::cout << "Seats booked successfully: " << seat_ids.size()
                      << " seat(s) for " << outcome.date << std::endl;
        } else if (command == "close" && args.size() == 1) {
            CloseSummary summary = lifecycle.closeRegistration(parseId(args[0]), operator_);
            std::cout << "Registration closed successfully (" << summary.roster.size()
                      << " bookings, " << summary.notifications_failed
                      << " notification failures)" << std::endl;
        } else if (command == "roster" && args.size() == 1) {
            json rows = json::array();
            for (const auto& row : registry.eventBookings(parseId(args[0]))) {
                rows.push_back(messages::toJson(row));
            }
            print(rows);
        } else if (command == "ensure-seats" && args.size() == 2) {
            int generated = registry.ensureSeats(parseId(args[0]), parseCount(args[1]));
            std::cout << "Seats generated: " << generated << std::endl;
        } else {
            usage();
            return 2;
        }
    } catch (const ReservationError& e) {
        std::cerr << errorCodeName(e.code()) << ": " << e.what() << std::endl;
        return e.isClientFault() ? 3 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
