#pragma once
#include <QObject>
#include <QHash>
#include <QHostAddress>
#include <QSet>
#include <QString>

#include <QtWebSockets/QWebSocketServer>
#include <QtWebSockets/QWebSocket>

#include <nlohmann/json.hpp>
#include <string>

#include "seatbook/Config.h"
#include "seatbook/notify/notifier.hpp"

namespace seatbook {

class EventRegistry;
class LifecycleController;
class ReservationEngine;

/**
 * WebSocket front of the booking service.
 *
 * Clients announce themselves with {"type":"hello","role":"admin"|"guest"}.
 * The admin role is only granted to loopback peers unless
 * ws.admin_loopback_only is turned off; others are downgraded to guest.
 * Commands: list_events, seat_map, book, close_registration; each gets a
 * reply on the same socket. As a notifier it broadcasts booking_confirmed
 * to every client and roster_ready to admin clients only, and forwards both
 * to an optional second sink (the mail outbox).
 */
class WsHub : public QObject, public INotifier {
    Q_OBJECT
public:
    WsHub(const ServiceConfig& config, INotifier* forward = nullptr, QObject* parent = nullptr);

    void attach(EventRegistry* registry, ReservationEngine* engine, LifecycleController* lifecycle);
    bool start(quint16 port, const QHostAddress& host = QHostAddress::LocalHost);

    void notifyBookingConfirmed(const std::string& email,
                                const std::vector<std::string>& seat_ids,
                                const std::string& occupant_name,
                                const std::string& date) override;

    void notifyRosterReady(const Event& event,
                           const std::vector<BookingRow>& rows) override;

signals:
    void started();

private slots:
    void onNewConnection();
    void onSocketText(QWebSocket* sock, const QString& text);

private:
    nlohmann::json handleCommand(QWebSocket* sock, const nlohmann::json& request);
    nlohmann::json listEvents(const nlohmann::json& request, bool is_admin);
    nlohmann::json seatMap(const nlohmann::json& request);
    nlohmann::json book(const nlohmann::json& request, const Requester& requester);
    nlohmann::json closeRegistration(const nlohmann::json& request, const Requester& requester);

    void send(QWebSocket* sock, const nlohmann::json& message);
    void broadcast(const QString& msg, const QString& onlyRole = QString());
    void post(const nlohmann::json& message, const QString& onlyRole = QString());

    ServiceConfig config_;
    INotifier* forward_;
    EventRegistry* registry_ = nullptr;
    ReservationEngine* engine_ = nullptr;
    LifecycleController* lifecycle_ = nullptr;

    QWebSocketServer server_;
    QSet<QWebSocket*> clients_;
    QHash<QWebSocket*, QString> roles_; // socket -> "admin" / "guest" / ""
};

} // namespace seatbook
