#include <ws/ws_hub.hpp>

#include <QDebug>
#include <QMetaObject>

#include "seatbook/errors.hpp"
#include "seatbook/lifecycle/lifecycle_controller.hpp"
#include "seatbook/notify/notification_messages.hpp"
#include "seatbook/registry/event_registry.hpp"
#include "seatbook/reservation/reservation_engine.hpp"
#include "seatbook/TimeUtils.h"
#include "seatbook/validation.hpp"

#include <utility>

using nlohmann::json;

namespace seatbook {

namespace {

json errorReply(const std::string& request, ErrorCode code, const std::string& message) {
    return {
        {"type", "error"},
        {"request", request},
        {"code", errorCodeName(code)},
        {"message", message}
    };
}

std::string stringField(const json& obj, const char* key) {
    if (!obj.contains(key) || obj.at(key).is_null()) return {};
    if (!obj.at(key).is_string()) {
        throw ReservationError::invalidInput(std::string(key) + " must be a string");
    }
    return obj.at(key).get<std::string>();
}

EventId eventIdField(const json& obj) {
    if (!obj.contains("event_id") || !obj.at("event_id").is_number_integer()) {
        throw ReservationError::invalidInput("Invalid event ID");
    }
    return obj.at("event_id").get<EventId>();
}

} // namespace

WsHub::WsHub(const ServiceConfig& config, INotifier* forward, QObject* parent)
    : QObject(parent),
    config_(config),
    forward_(forward),
    server_(QStringLiteral("SeatBook-WS"), QWebSocketServer::NonSecureMode, this)
{
}

void WsHub::attach(EventRegistry* registry, ReservationEngine* engine, LifecycleController* lifecycle) {
    registry_ = registry;
    engine_ = engine;
    lifecycle_ = lifecycle;
}

bool WsHub::start(quint16 port, const QHostAddress& host) {
    if (!server_.listen(host, port)) {
        qWarning() << "[WS] Hub start failed on" << host.toString() << ":" << port;
        return false;
    }
    connect(&server_, &QWebSocketServer::newConnection, this, &WsHub::onNewConnection);
    qDebug() << "[WS] Hub listening on" << host.toString() << ":" << port;
    emit started();
    return true;
}

void WsHub::onNewConnection() {
    auto* socket = server_.nextPendingConnection();
    if (!socket) return;

    clients_ << socket;

    connect(socket, &QWebSocket::textMessageReceived, this, [this, socket](const QString& message) {
        onSocketText(socket, message);
    });

    connect(socket, &QWebSocket::disconnected, this, [this, socket] {
        clients_.remove(socket);
        roles_.remove(socket);
        socket->deleteLater();
    });
}

void WsHub::onSocketText(QWebSocket* socket, const QString& message) {
    json request;
    try {
        request = json::parse(message.toStdString());
    } catch (const json::parse_error& e) {
        qWarning() << "[WS] Invalid JSON received:" << e.what();
        send(socket, errorReply("", ErrorCode::InvalidInput, "Invalid JSON"));
        return;
    }
    if (!request.is_object()) {
        send(socket, errorReply("", ErrorCode::InvalidInput, "Expected a JSON object"));
        return;
    }

    send(socket, handleCommand(socket, request));
}

json WsHub::handleCommand(QWebSocket* socket, const json& request) {
    const std::string type = request.contains("type") && request.at("type").is_string()
        ? request.at("type").get<std::string>() : std::string();
    const bool is_admin = roles_.value(socket) == QStringLiteral("admin");
    Requester requester{is_admin, socket->peerAddress().toString().toStdString()};

    try {
        if (type == "hello") {
            auto role = QString::fromStdString(stringField(request, "role"));
            if (role == QStringLiteral("admin") &&
                !config_.adminRoleAllowed(socket->peerAddress().isLoopback())) {
                qWarning() << "[WS] Admin role refused for" << socket->peerAddress().toString();
                role = QStringLiteral("guest");
            }
            roles_[socket] = role;
            qDebug() << "[WS] Client connected with role:" << role;
            return {{"type", "hello_ack"}, {"role", role.toStdString()}, {"status", "ok"}};
        }
        if (!registry_ || !engine_ || !lifecycle_) {
            return errorReply(type, ErrorCode::Internal, "Service not ready");
        }
        if (type == "list_events")        return listEvents(request, is_admin);
        if (type == "seat_map")           return seatMap(request);
        if (type == "book")               return book(request, requester);
        if (type == "close_registration") return closeRegistration(request, requester);

        qDebug() << "[WS] Received unknown message type:" << QString::fromStdString(type);
        return errorReply(type, ErrorCode::InvalidInput, "Unknown message type");
    } catch (const ReservationError& e) {
        return errorReply(type, e.code(), e.what());
    } catch (const json::exception& e) {
        return errorReply(type, ErrorCode::InvalidInput, e.what());
    }
}

json WsHub::listEvents(const json& request, bool is_admin) {
    const std::string scope = request.value("scope", "upcoming");
    std::vector<Event> events;
    if (scope == "upcoming") {
        events = registry_->listUpcoming();
    } else if (scope == "recent") {
        events = registry_->listRecent();
    } else if (scope == "past") {
        if (!is_admin) throw ReservationError::forbidden("Forbidden: Admin access required");
        events = registry_->listPast();
    } else {
        throw ReservationError::invalidInput("Unknown scope: " + scope);
    }

    json items = json::array();
    for (const auto& event : events) {
        items.push_back(messages::toJson(event));
    }
    return {{"type", "events"}, {"scope", scope}, {"events", items}};
}

json WsHub::seatMap(const json& request) {
    const std::string date = stringField(request, "date");
    if (!TimeUtils::isIsoDate(date)) {
        throw ReservationError::invalidInput("Invalid date format. Use YYYY-MM-DD");
    }

    std::vector<SeatAvailability> seats;
    if (request.contains("seat_ids")) {
        seats = engine_->seatAvailability(date, request.at("seat_ids").get<std::vector<std::string>>());
    } else {
        seats = engine_->seatAvailability(date);
    }

    json items = json::array();
    for (const auto& seat : seats) {
        items.push_back(messages::toJson(seat));
    }
    return {{"type", "seat_map"}, {"date", date}, {"seats", items}};
}

json WsHub::book(const json& request, const Requester& requester) {
    const EventId event_id = eventIdField(request);
    if (!request.contains("bookings") || !request.at("bookings").is_array()) {
        throw ReservationError::invalidInput("bookings array and eventId are required");
    }

    std::vector<BookingRequest> batch;
    for (const auto& item : request.at("bookings")) {
        BookingRequest b;
        b.seat_id = stringField(item, "seat_id");
        b.name = stringField(item, "name");
        b.email = stringField(item, "email");
        b.phone = stringField(item, "phone");
        b.booking_date = stringField(item, "booking_date");

        if (!b.booking_date.empty() && !TimeUtils::isIsoDate(b.booking_date)) {
            throw ReservationError::invalidInput("Invalid booking date format. Use YYYY-MM-DD");
        }
        if (!b.email.empty() && !isValidEmail(b.email)) {
            throw ReservationError::invalidInput("Invalid email format for seat " + b.seat_id);
        }
        if (!b.phone.empty() && !isValidPhone(b.phone)) {
            throw ReservationError::invalidInput("Invalid phone number format for seat " + b.seat_id);
        }
        batch.push_back(b);
    }

    // Runs on the event loop; retry sleeps are bounded by ServiceConfig::kMaxRetrySleepMs
    BookingOutcome outcome = engine_->book(event_id, batch, requester);

    json seats = json::array();
    for (const auto& seat : outcome.seats) {
        seats.push_back(seat.seat_id);
    }
    return {{"type", "booked"}, {"event_id", outcome.event_id}, {"date", outcome.date}, {"seats", seats}};
}

json WsHub::closeRegistration(const json& request, const Requester& requester) {
    CloseSummary summary = lifecycle_->closeRegistration(eventIdField(request), requester);
    return {
        {"type", "registration_closed"},
        {"event", messages::toJson(summary.event)},
        {"booking_count", summary.roster.size()},
        {"notifications_failed", summary.notifications_failed}
    };
}

// ---------------------------------------------------------------------------
// INotifier

void WsHub::notifyBookingConfirmed(const std::string& email,
                                   const std::vector<std::string>& seat_ids,
                                   const std::string& occupant_name,
                                   const std::string& date) {
    post(messages::bookingConfirmed(email, seat_ids, occupant_name, date));
    if (forward_) {
        forward_->notifyBookingConfirmed(email, seat_ids, occupant_name, date);
    }
}

void WsHub::notifyRosterReady(const Event& event, const std::vector<BookingRow>& rows) {
    post(messages::rosterReady(event, rows, config_.roster_recipient), QStringLiteral("admin"));
    if (forward_) {
        forward_->notifyRosterReady(event, rows);
    }
}

// May be called from any thread; sockets are only touched on the hub's thread
void WsHub::post(const json& message, const QString& onlyRole) {
    const QString text = QString::fromStdString(message.dump());
    QMetaObject::invokeMethod(this, [this, text, onlyRole] {
        broadcast(text, onlyRole);
    }, Qt::QueuedConnection);
}

void WsHub::send(QWebSocket* socket, const json& message) {
    socket->sendTextMessage(QString::fromStdString(message.dump()));
}

void WsHub::broadcast(const QString& message, const QString& onlyRole) {
    for (auto* client : clients_) {
        if (!onlyRole.isEmpty()) {
            if (roles_.value(client) != onlyRole) continue;
        }
        client->sendTextMessage(message);
    }
}

} // namespace seatbook
