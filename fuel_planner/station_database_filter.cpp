#include "station_database.hpp"

#include <QMap>
#include <QStringList>
#include <QVariant>


QSqlQuery StationDatabase::Filter::compile() const
{
  QStringList conditions;
  QMap<QString, QVariant> bindings;

  // A column is constrained only if both extremities are set. Equal
  // extremities become an equality, anything else a BETWEEN clause.
  auto constrain = [&](const QString& column, const std::unique_ptr<double>& low, const std::unique_ptr<double>& high)
  {
    if(low == nullptr || high == nullptr) {
      return;
    }

    if(*low == *high) {
      conditions.append(QString("%1 = :%1").arg(column));
      bindings[":" + column] = *low;
      return;
    }

    conditions.append(QString("%1 BETWEEN :%1_min AND :%1_max").arg(column));
    bindings[":" + column + "_min"] = *low;
    bindings[":" + column + "_max"] = *high;
  };

  constrain("latitude", min_latitude, max_latitude);
  constrain("longitude", min_longitude, max_longitude);
  constrain("price", min_price, max_price);

  QString selection = "SELECT * FROM Stations";
  if(!conditions.isEmpty()) {
    selection += " WHERE " + conditions.join(" AND ");
  }
  selection += " ORDER BY rowid";

  // QSqlQuery::size() is not supported by SQLite, hence every row carries the
  // number of selected rows in the "query_size" column.
  QSqlQuery query;
  query.prepare(
    "WITH filtered_stations AS (" + selection + ") "
    "SELECT *, (SELECT COUNT(*) FROM filtered_stations) AS query_size FROM filtered_stations;"
  );

  for(auto it = bindings.cbegin(); it != bindings.cend(); ++it) {
    query.bindValue(it.key(), it.value());
  }

  return query;
}


bool StationDatabase::Filter::setGPSRange(
  double min_latitude,
  double max_latitude,
  double min_longitude,
  double max_longitude
  )
{
  if(min_latitude > max_latitude || min_longitude > max_longitude)
    return false;

  this->min_latitude = std::make_unique<double>(min_latitude);
  this->max_latitude = std::make_unique<double>(max_latitude);
  this->min_longitude = std::make_unique<double>(min_longitude);
  this->max_longitude = std::make_unique<double>(max_longitude);
  return true;
}


bool StationDatabase::Filter::setPriceRange(
  double min_price,
  double max_price
  )
{
  if(min_price > max_price || min_price < 0)
    return false;

  this->min_price = std::make_unique<double>(min_price);
  this->max_price = std::make_unique<double>(max_price);
  return true;
}
