#include "station_database.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QSet>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QSqlRecord>
#include <QStandardPaths>


bool StationDatabase::findStations(
  const Filter& filter,
  QList<StationRecord>& records
)
{
  records.clear();

  // Given the filter, obtain the corresponding query.
  QSqlQuery query = filter.compile();
  qDebug() << "Running query:" << query.lastQuery();

  // Execute the query, and exit on failure.
  if(!query.exec()) {
    qDebug() << "Failed to run query:" << query.lastError().text();
    return false;
  }

  if(!query.next()) {
    // If the first call to query.next() returns false, then there are no
    // records matching the filter! Return "true" since this is not an error.
    qDebug() << "Query appears to be empty";
    return true;
  }

  // Fetch the number of records - which is a field contained in each record!
  records.reserve(query.value("query_size").toInt());

  do {
    StationRecord r;
    r.id = query.value("id").toString();
    r.name = query.value("name").toString();
    r.city = query.value("city").toString();
    r.state = query.value("state").toString();
    r.price = query.value("price").toString();
    r.latitude = query.value("latitude").toString();
    r.longitude = query.value("longitude").toString();
    records.append(r);
  } while(query.next());

  qDebug() << "Fetched" << records.size() << "records";
  return true;
}


// Helper function that can determine if a databse has the expected structure.
static bool openAndValidate(
  QSqlDatabase& db,
  const QString& table_name,
  const QSet<QString>& required_columns
)
{
  // Check that we can access the given file.
  if(!db.open())
    return false;

  // Does the DB contain the required table?
  if(!db.tables().contains(table_name)) {
    db.close();
    return false;
  }

  // Does the table contain the expected columns?
  QSqlRecord r = db.record(table_name);
  QSet<QString> existing_columns;
  for(int i=0; i<r.count(); i++) {
    existing_columns << r.fieldName(i).toLower();
  }
  if(!existing_columns.contains(required_columns)) {
    db.close();
    return false;
  }

  return true;
}


QString StationDatabase::loadDatabase(const QString& path) {
  // Sanity check to be able to use SQLite.
  if(!QSqlDatabase::drivers().contains("QSQLITE")) {
    return "Unable to load database: missing SQLITE driver";
  }

  QString db_path = path;
  if(db_path.isEmpty()) {
    // Try to locate the database.
    QString db_filename("stations.db");
    db_path = QStandardPaths::locate(QStandardPaths::AppDataLocation, db_filename);

    // Give up if the database is not in one of the "AppData" directories.
    if(db_path.isEmpty()) {
      return QString(
        "Could not locate database file '%1' - expected to be in one of the following locations:\n%2"
      ).arg(
          db_filename,
          QStandardPaths::standardLocations(QStandardPaths::AppDataLocation).join("\n")
      );
    }
  }
  // SQLite would silently create an empty database otherwise.
  else if(!QFileInfo::exists(db_path)) {
    return QString("Database file '%1' does not exist").arg(db_path);
  }

  // Drop a previously loaded database, if any.
  if(QSqlDatabase::contains(QSqlDatabase::defaultConnection)) {
    QSqlDatabase::removeDatabase(QSqlDatabase::defaultConnection);
  }

  // We located the required DB file: let's use it.
  QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE");
  db.setDatabaseName(db_path);

  // Try to open the database and check that there are the required table.
  QSet<QString> expected_columns{"id", "name", "city", "state", "price", "latitude", "longitude"};
  if(!openAndValidate(db, "Stations", expected_columns)) {
    // Remove the database from the list of connections.
    QString connection = db.connectionName();
    db = QSqlDatabase();
    QSqlDatabase::removeDatabase(connection);
    return QString("The database '%1' is incompatible, it does not have the required tables and columns").arg(db_path);
  }

  // Ok, the database was open!
  qInfo() << "Loaded station database" << db_path;
  return QString();
}
