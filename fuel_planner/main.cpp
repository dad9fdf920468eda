#include "fuel_planner.hpp"
#include "fuel_request.hpp"
#include "math_utilities.hpp"
#include "route_path.hpp"
#include "router_openrouteservice.hpp"
#include "router_service.hpp"
#include "spatial_index.hpp"
#include "station_csv_reader.hpp"
#include "station_database.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <memory>
#include <stdexcept>


// Exit codes.
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;


// Helper function: print a JSON document on the standard output.
static void print(const QJsonObject& json) {
  QTextStream out(stdout);
  out << QJsonDocument(json).toJson(QJsonDocument::Indented);
}


// Helper function: print an error document on the standard output.
static void printError(const QString& why) {
  print(QJsonObject{{"success", false}, {"error", why}});
}


// Helper function: read the stations from a SQLite database or a CSV file.
static bool loadStations(const QString& path, QList<StationRecord>& records, QString& why) {
  if(path.isEmpty() || path.endsWith(".db", Qt::CaseInsensitive)) {
    why = StationDatabase::loadDatabase(path);
    if(!why.isEmpty()) {
      return false;
    }
    StationDatabase database;
    if(!database.allStations(records)) {
      why = "Failed to access database";
      return false;
    }
    return true;
  }

  return StationCsvReader::read(path, records, why);
}


// Helper function: load a polyline saved as rows of "latitude longitude".
static bool loadRoute(const QString& path, RoutePath& route, QString& why) {
  Eigen::ArrayXXd coordinates;
  try {
    coordinates = math_utilities::loadArray(path.toStdString());
  }
  catch(const std::runtime_error& e) {
    why = QString("Failed to load route: %1").arg(e.what());
    return false;
  }

  route.points.clear();
  route.distance_miles = 0.0;
  for(Eigen::Index i=0; i<coordinates.rows(); i++) {
    QGeoCoordinate point(coordinates(i, 0), coordinates(i, 1));
    if(!point.isValid()) {
      why = QString("Invalid coordinates at row %1 of '%2'").arg(i+1).arg(path);
      return false;
    }
    if(!route.points.isEmpty()) {
      const QGeoCoordinate& previous = route.points.back();
      route.distance_miles += math_utilities::haversineDistance(
        previous.latitude(), previous.longitude(), point.latitude(), point.longitude()
      );
    }
    route.points.append(point);
  }
  route.duration_hours = route.distance_miles / RouterService::AVERAGE_SPEED_MPH;
  return true;
}


int main(int argc, char *argv[]) {
  qRegisterMetaType<FuelRequest>();
  qRegisterMetaType<RoutePath>();
  QCoreApplication a(argc, argv);
  QCoreApplication::setApplicationName("fuel_planner");

  QCommandLineParser parser;
  parser.setApplicationDescription("Plan cost-effective fuel stops along a road-trip.");
  parser.addHelpOption();
  QCommandLineOption stations_option("stations", "Station feed: a SQLite database (.db) or a CSV file.", "file");
  QCommandLineOption start_option("start", "Departure, as \"lat,lon\" or as an address.", "location");
  QCommandLineOption end_option("end", "Arrival, as \"lat,lon\" or as an address.", "location");
  QCommandLineOption range_option("range", "Range of the vehicle with a full tank, in miles.", "miles", "500");
  QCommandLineOption mpg_option("mpg", "Fuel efficiency, in miles per gallon.", "mpg", "10");
  QCommandLineOption route_option("route-file", "Optimize a saved polyline instead of calling the router.", "file");
  QCommandLineOption demo_option("demo", "Use straight-line routes, without any external service.");
  QCommandLineOption health_option("health", "Print the state of the service and exit.");
  parser.addOptions({stations_option, start_option, end_option, range_option, mpg_option, route_option, demo_option, health_option});
  parser.process(a);

  // Read the numeric parameters first, to fail early on typos.
  FuelRequest request;
  bool range_ok = false, mpg_ok = false;
  request.max_range = parser.value(range_option).toDouble(&range_ok);
  request.mpg = parser.value(mpg_option).toDouble(&mpg_ok);
  if(!range_ok || !mpg_ok) {
    qCritical().noquote() << "Options --range and --mpg must be numbers\n\n" + parser.helpText();
    return EXIT_USAGE;
  }

  const bool health = parser.isSet(health_option);
  const bool from_file = parser.isSet(route_option);
  request.start = parser.value(start_option);
  request.end = parser.value(end_option);
  if(!health && !from_file && (request.start.isEmpty() || request.end.isEmpty())) {
    qCritical().noquote() << "Options --start and --end are required\n\n" + parser.helpText();
    return EXIT_USAGE;
  }

  // Select the router: fall back to "demo mode" if no API key is available.
  std::unique_ptr<RouterService> router;
  if(!parser.isSet(demo_option) && !RouterOpenRouteService::key().isEmpty()) {
    router = std::make_unique<RouterOpenRouteService>();
  }
  else {
    qWarning() << "Running in demo mode: routes are straight lines and locations must be given as 'lat,lon'";
    router = std::make_unique<RouterService>();
  }

  // Load the stations and build the index.
  QString why;
  QList<StationRecord> records;
  auto index = std::make_shared<SpatialIndex>();
  if(loadStations(parser.value(stations_option), records, why)) {
    index->build(records);
  }
  else {
    qWarning().noquote() << "Failed to load stations:" << why;
  }

  FuelPlanner planner(router.get(), index);

  if(health) {
    QJsonObject report = planner.health();
    print(report);
    return report.value("status").toString() == "healthy" ? EXIT_OK : EXIT_FAILED;
  }

  if(!why.isEmpty()) {
    printError(why);
    return EXIT_FAILED;
  }

  int exit_code = EXIT_FAILED;
  QObject::connect(&planner, &FuelPlanner::solved, [&](const QJsonObject& response) {
    print(response);
    exit_code = EXIT_OK;
  });
  QObject::connect(&planner, &FuelPlanner::failed, [&](const QString& reason) {
    qWarning().noquote() << reason;
    printError(reason);
    exit_code = EXIT_FAILED;
  });

  if(from_file) {
    RoutePath route;
    if(!loadRoute(parser.value(route_option), route, why)) {
      printError(why);
      return EXIT_FAILED;
    }
    // Report the extremities of the polyline if no location was given.
    if(request.start.isEmpty() && !route.points.isEmpty()) {
      request.start = QString("%1,%2").arg(route.points.front().latitude()).arg(route.points.front().longitude());
    }
    if(request.end.isEmpty() && !route.points.isEmpty()) {
      request.end = QString("%1,%2").arg(route.points.back().latitude()).arg(route.points.back().longitude());
    }
    planner.solvePath(request, route);
  }
  else {
    planner.solve(request);
  }

  return exit_code;
}
