#ifndef STATION_HPP
#define STATION_HPP

#include <QGeoCoordinate>
#include <QMetaType>
#include <QString>


/// A fuel station, as stored in the spatial index.
struct Station {
  QString id; ///< Identifier given by the feed. It can be empty.
  QString name; ///< Display name.
  QString city; ///< City the station is located in.
  QString state; ///< State the station is located in.
  double price = 0.0; ///< Price per gallon.
  QGeoCoordinate location; ///< GPS coordinates of the station.

  /// Default constructor, needed by Qt's metatype system.
  Station() = default;

  /// Create a new station.
  Station(
    const QString& id,
    const QString& name,
    const QString& city,
    const QString& state,
    double price,
    const QGeoCoordinate& location
  ) : id(id), name(name), city(city), state(state), price(price), location(location) {}

  /// Tell if the station can be stored in the spatial index.
  /** @param[out] why Reason why the station is not valid, if false is
    *   returned.
    */
  bool isValid(QString& why) const;
};

Q_DECLARE_METATYPE(Station);


/// A raw row coming from a station feed, with all fields stored as text.
/** Feeds (SQLite database, CSV file) map their own columns onto this record.
  * Parsing and validation happen only when the record is converted into a
  * Station, so that a single malformed row can be skipped without aborting a
  * bulk load.
  */
struct StationRecord {
  QString id;
  QString name;
  QString city;
  QString state;
  QString price;
  QString latitude;
  QString longitude;

  /// Parse the record.
  /** Rows with missing, non-numeric, zero or out-of-range coordinates are
    * rejected, as well as rows whose price is missing, non-numeric or
    * negative. An empty name is replaced by "Unknown".
    * @param[out] station The parsed station, valid only if true is returned.
    * @param[out] why Reason why the record was rejected.
    * @return true if the record could be converted.
    */
  bool toStation(Station& station, QString& why) const;
};

#endif // STATION_HPP
