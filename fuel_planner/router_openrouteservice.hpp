#ifndef ROUTER_OPENROUTESERVICE_HPP
#define ROUTER_OPENROUTESERVICE_HPP

#include "router_service.hpp"

#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QString>


class RouterOpenRouteService : public RouterService {
  Q_OBJECT
public:
  explicit RouterOpenRouteService(QObject *parent = nullptr);

  /// Calculate the driving path between two locations.
  /** Sends a request to the "directions" endpoint of OpenRouteService and
    * converts the returned GeoJSON coordinates (longitude first) into a
    * polyline in (latitude, longitude) order.
    */
  bool route(
    const QGeoCoordinate& start,
    const QGeoCoordinate& end,
    RoutePath& path,
    QString& why
  ) override;

  /// Find the coordinates of an address within the USA.
  bool geocode(
    const QString& address,
    QGeoCoordinate& coordinate,
    QString& why
  ) override;

  QString name() const override;

  /// Read again the API key (usually in response to external edits).
  void reloadKey();

  /// Tell if an API key is available.
  inline bool hasKey() const { return !api_key_.isEmpty(); }

  /// Fetch and return the API key for OpenRouteService.
  /** The key is read from the ORS_API_KEY environment variable, if set, or
    * from a file in the application data directory.
    * @return The key, if successfully read. If any issues occurred (such as
    *   missing or corrupt file) return an empty string.
    */
  static QString key();

private:
  static const QString API_KEY_FILENAME; ///< Name of the file where to locate the API key.
  static const QString BASE_URL; ///< Root of all OpenRouteService endpoints.
  QString api_key_; ///< API key used to send requests to OpenRouteService.
  QNetworkAccessManager* network_manager_ = nullptr; ///< Used to send HTTPS requests.

  /// Wait for a reply and parse its body as JSON.
  /** @param reply The pending reply. It is scheduled for deletion.
    * @param timeout_ms Time after which the request is aborted.
    * @param[out] json The parsed document.
    * @param[out] why Reason of the failure, if false is returned.
    */
  bool waitForJson(QNetworkReply* reply, int timeout_ms, QJsonDocument& json, QString& why);
};

#endif // ROUTER_OPENROUTESERVICE_HPP
