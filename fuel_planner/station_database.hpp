#ifndef STATION_DATABASE_HPP
#define STATION_DATABASE_HPP

#include "station.hpp"

#include <memory>

#include <QList>
#include <QObject>
#include <QSqlQuery>
#include <QString>


/// Read access to a SQLite database of fuel stations.
/** The database must contain a table named "Stations" with (at least) the
  * columns id, name, city, state, price, latitude and longitude. Queries are
  * run on the default connection, which is set up by loadDatabase().
  */
class StationDatabase : public QObject {
  Q_OBJECT

public:
  /// Load the database from a file.
  /** @param path Location of the database. If empty, a file named
    *   "stations.db" is searched in the application data directories.
    * @return An empty string if the database was loaded successfully,
    *   otherwise a string explaining what went wrong.
    */
  static QString loadDatabase(const QString& path = QString());

  /// Auxiliary class to specify a set of filters when requesting data.
  class Filter {
  public:
    Filter() = default;
    QSqlQuery compile() const;
    bool setGPSRange(
      double min_latitude,
      double max_latitude,
      double min_longitude,
      double max_longitude
    );
    bool setPriceRange(double min_price, double max_price);
  private:
    std::unique_ptr<double> min_latitude = nullptr;
    std::unique_ptr<double> max_latitude = nullptr;
    std::unique_ptr<double> min_longitude = nullptr;
    std::unique_ptr<double> max_longitude = nullptr;
    std::unique_ptr<double> min_price = nullptr;
    std::unique_ptr<double> max_price = nullptr;
  };

  /// Create a new StationDatabase.
  explicit inline StationDatabase(QObject* parent = nullptr) : QObject(parent) { }

  /// Retrieve all stations from the database, given some conditions.
  /** Records are returned as text, exactly as stored; they are parsed and
    * validated by SpatialIndex::build().
    * @param[in] filter A StationDatabase::Filter instance that sets
    *   conditions on the records to be fetched.
    * @param[out] records List to be filled with the matching rows.
    * @return The method returns false if there was an issue accessing the
    *   database. It will return true if data could be retrieved. Note that if
    *   no station matches the given filter, the method returns true as this is
    *   not a database access issue. In this case, the output list will simply
    *   have zero-size.
    */
  bool findStations(const Filter& filter, QList<StationRecord>& records);

  /// Retrieve all stations from the database.
  /** @see findStations().
    */
  inline bool allStations(QList<StationRecord>& records) {
    return findStations(Filter(), records);
  }
};

#endif // STATION_DATABASE_HPP
