#include "router_openrouteservice.hpp"

#include <QDebug>
#include <QEventLoop>
#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QNetworkRequest>
#include <QStandardPaths>
#include <QTextStream>
#include <QTimer>
#include <QUrl>
#include <QUrlQuery>


const QString RouterOpenRouteService::API_KEY_FILENAME = "open_route_service_api_key";
const QString RouterOpenRouteService::BASE_URL = "https://api.openrouteservice.org";

// Conversion factors for the units used by OpenRouteService.
constexpr double METERS_PER_MILE = 1609.34;
constexpr double SECONDS_PER_HOUR = 3600.0;

// Request timeouts, in milliseconds.
constexpr int DIRECTIONS_TIMEOUT_MS = 15000;
constexpr int GEOCODING_TIMEOUT_MS = 10000;


QString RouterOpenRouteService::key() {
  // The environment takes precedence over the file.
  QString env_key = qEnvironmentVariable("ORS_API_KEY").trimmed();
  if(!env_key.isEmpty()) {
    return env_key;
  }

  // Locate the file where the API key is expected to be. Return an empty key
  // if the file is missing.
  QString api_key_path = QStandardPaths::locate(QStandardPaths::AppDataLocation, API_KEY_FILENAME);
  if(api_key_path.isEmpty()) {
    qDebug() << QString(
      "Could not retrieve API key for OpenRouteService from file '%1' - expected to be in one of the following locations:\n%2"
    ).arg(
      API_KEY_FILENAME,
      QStandardPaths::standardLocations(QStandardPaths::AppDataLocation).join("\n")
    );
    return "";
  }

  // Try to open the located file. Return an empty key on failure.
  QFile api_file(api_key_path);
  if(!api_file.open(QIODevice::ReadOnly)) {
    qDebug() << "Failed reading API key: could not open file" << api_key_path;
    return "";
  }

  // Create a stream to read from the file; if the file is empty, exit.
  QTextStream in(&api_file);
  if(in.atEnd()) {
    qDebug() << "Failed reading API key: file" << api_key_path << "appears to be empty.";
    return "";
  }

  // Read and return the API key.
  QString api_key = in.readLine().trimmed();
  qDebug() << "Loaded API key";
  return api_key;
}


RouterOpenRouteService::RouterOpenRouteService(
  QObject *parent
) : RouterService(parent)
{
  // Create a new Network Manager to send HTTPS requests.
  network_manager_ = new QNetworkAccessManager(this);

  // Load the API key for OpenRouteService.
  reloadKey();
}


void RouterOpenRouteService::reloadKey() {
  api_key_ = key();
  if(api_key_.isEmpty()) {
    qWarning() << "API key for OpenRouteService is empty!";
  }
}


QString RouterOpenRouteService::name() const {
  return "openrouteservice";
}


bool RouterOpenRouteService::waitForJson(
  QNetworkReply* reply,
  int timeout_ms,
  QJsonDocument& json,
  QString& why
)
{
  // Allow Qt to do its magic in terms of memory management!
  reply->deleteLater();

  // After the HTTPS request has been sent we need to wait for its response.
  // A local event loop is spawned and quits either when the reply is
  // finished or when the timer fires, whichever comes first.
  if(!reply->isFinished()) {
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(timeout_ms);
    loop.exec();

    if(!reply->isFinished()) {
      reply->abort();
      why = QString("No response from OpenRouteService within %1 s").arg(timeout_ms / 1000);
      qWarning() << why;
      return false;
    }
  }

  if(reply->error() != QNetworkReply::NoError) {
    why = QString("OpenRouteService request failed: %1").arg(reply->errorString());
    qWarning() << why;
    return false;
  }

  // Try to parse the JSON returned by OpenRouteService, and exit on failure.
  QJsonParseError error;
  json = QJsonDocument::fromJson(reply->readAll(), &error);

  if(error.error != QJsonParseError::NoError) {
    why = QString("Failed to parse response: %1").arg(error.errorString());
    qWarning() << why;
    return false;
  }
  return true;
}


bool RouterOpenRouteService::route(
  const QGeoCoordinate& start,
  const QGeoCoordinate& end,
  RoutePath& path,
  QString& why
)
{
  // Exit immediately if we do not have an API key.
  if(api_key_.isEmpty()) {
    why = "Missing API key, cannot calculate paths";
    return false;
  }

  if(!start.isValid() || !end.isValid()) {
    why = "Bad inputs passed to RouterOpenRouteService::route()";
    return false;
  }

  // Create the request. WARNING: OpenRouteService expects coordinates as
  // (LONG.,LAT.).
  // See https://openrouteservice.org/dev/#/api-docs/v2/directions/{profile}/get
  QUrl url(BASE_URL + "/v2/directions/driving-car");
  QUrlQuery query;
  query.addQueryItem("api_key", api_key_);
  query.addQueryItem("start", QString("%1,%2").arg(QString::number(start.longitude(), 'f', 6), QString::number(start.latitude(), 'f', 6)));
  query.addQueryItem("end", QString("%1,%2").arg(QString::number(end.longitude(), 'f', 6), QString::number(end.latitude(), 'f', 6)));
  url.setQuery(query);

  // Send the request and wait for the reply.
  QJsonDocument json_doc;
  if(!waitForJson(network_manager_->get(QNetworkRequest(url)), DIRECTIONS_TIMEOUT_MS, json_doc, why)) {
    return false;
  }

  QJsonObject feature = json_doc.object().value("features").toArray().at(0).toObject();
  QJsonValue coordinates_json_value = feature.value("geometry").toObject().value("coordinates");
  QJsonArray coordinates_array = coordinates_json_value.toArray();

  if(coordinates_json_value.isNull() || !coordinates_json_value.isArray()) {
    why = "Could not retrieve 'features/0/geometry/coordinates' as an array from parsed GEOJson.";
    return false;
  }

  if(coordinates_array.empty()) {
    why = "Array 'features/0/geometry/coordinates' from parsed GEOJson is empty.";
    return false;
  }

  path.points.clear();
  path.points.reserve(coordinates_array.size());
  for(const auto& value : coordinates_array) {
    QJsonArray c = value.toArray();
    path.points.append(QGeoCoordinate(c.at(1).toDouble(), c.at(0).toDouble()));
  }

  QJsonObject summary = feature.value("properties").toObject().value("summary").toObject();
  path.distance_miles = summary.value("distance").toDouble() / METERS_PER_MILE;
  path.duration_hours = summary.value("duration").toDouble() / SECONDS_PER_HOUR;
  return true;
}


bool RouterOpenRouteService::geocode(
  const QString& address,
  QGeoCoordinate& coordinate,
  QString& why
)
{
  if(api_key_.isEmpty()) {
    why = QString("Missing API key, cannot geocode '%1'").arg(address);
    return false;
  }

  // See https://openrouteservice.org/dev/#/api-docs/geocode/search/get
  QUrl url(BASE_URL + "/geocode/search");
  QUrlQuery query;
  query.addQueryItem("api_key", api_key_);
  query.addQueryItem("text", address);
  query.addQueryItem("boundary.country", "USA");
  query.addQueryItem("size", "1");
  url.setQuery(query);

  QJsonDocument json_doc;
  if(!waitForJson(network_manager_->get(QNetworkRequest(url)), GEOCODING_TIMEOUT_MS, json_doc, why)) {
    return false;
  }

  QJsonArray features = json_doc.object().value("features").toArray();
  if(features.isEmpty()) {
    why = QString("Could not geocode address: %1").arg(address);
    return false;
  }

  QJsonArray c = features.at(0).toObject().value("geometry").toObject().value("coordinates").toArray();
  QGeoCoordinate result(c.at(1).toDouble(), c.at(0).toDouble());
  if(c.size() < 2 || !result.isValid()) {
    why = QString("Invalid coordinates returned while geocoding: %1").arg(address);
    return false;
  }

  coordinate = result;
  return true;
}
