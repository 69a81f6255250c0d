#include <QCoreApplication>
#include <QHostAddress>
#include <ws/ws_hub.hpp>

#include "db_core/SeatDatabase.h"
#include "db_core/SeatInitializer.h"
#include "seatbook/Config.h"
#include "seatbook/TimeUtils.h"
#include "seatbook/lifecycle/lifecycle_controller.hpp"
#include "seatbook/log.hpp"
#include "seatbook/notify/jsonl_notifier.hpp"
#include "seatbook/registry/event_registry.hpp"
#include "seatbook/reservation/reservation_engine.hpp"

#include <exception>

using namespace seatbook;

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    const std::string config_path = argc > 1 ? argv[1] : "config/seatbook.yml";

    try {
        ServiceConfig config = ServiceConfig::fromYaml(config_path);

        SeatDatabase db(config.db_path, config.busy_timeout_ms);
        if (!db.initialize()) return 1;

        JsonlNotifier outbox(config.notifications_jsonl, config.roster_recipient);
        WsHub hub(config, &outbox);

        SeatInitializer initializer(db, config.seat_price);
        EventRegistry registry(db, initializer, config, &TimeUtils::todayDate);
        ReservationEngine engine(db, initializer, hub, config, &TimeUtils::todayDate);
        LifecycleController lifecycle(db, hub);
        hub.attach(&registry, &engine, &lifecycle);

        if (!hub.start(static_cast<quint16>(config.ws_port),
                       QHostAddress(QString::fromStdString(config.ws_host)))) {
            return 1;
        }
        return app.exec();
    } catch (const std::exception& e) {
        log::error("ws", "Service startup failed", {{"reason", e.what()}});
        return 1;
    }
}
