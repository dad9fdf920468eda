#ifndef STATION_CSV_READER_HPP
#define STATION_CSV_READER_HPP

#include "station.hpp"

#include <QList>
#include <QString>
#include <QStringList>


/// Reader for station feeds exported as comma-separated values.
/** The first line must be a header. Columns are matched by name, ignoring
  * case and surrounding spaces; both the column names of the OPIS price
  * export ("OPIS Truckstop ID", "Truckstop Name", "Retail Price", ...) and
  * short names ("id", "name", "price", "lat", "lon", ...) are recognized.
  * Missing columns result in empty fields. A quoted field can span several
  * lines.
  */
class StationCsvReader {
public:
  /// Read all rows of a CSV file.
  /** @param path Location of the file.
    * @param[out] records The rows of the file, in file order.
    * @param[out] why Reason of the failure, if false is returned.
    * @return false if the file cannot be read or it has no header.
    */
  static bool read(const QString& path, QList<StationRecord>& records, QString& why);

  /// Split a row into fields.
  /** Fields can be enclosed in double quotes, in which case they can contain
    * commas and line breaks; a doubled quote inside a quoted field stands for
    * a single quote.
    */
  static QStringList parseLine(const QString& line);
};

#endif // STATION_CSV_READER_HPP
