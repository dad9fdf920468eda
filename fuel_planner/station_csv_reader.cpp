#include "station_csv_reader.hpp"

#include <QDebug>
#include <QFile>
#include <QTextStream>


// Helper function: position of the first header matching one of the given
// names, or -1.
static int findColumn(const QStringList& header, const QStringList& names) {
  for(const QString& name : names) {
    int i = header.indexOf(name.toLower());
    if(i >= 0) {
      return i;
    }
  }
  return -1;
}


// Helper function: read one row, which spans several lines if a quoted field
// contains line breaks. Doubled quotes do not change the parity of the count.
static QString readRow(QTextStream& in) {
  QString row = in.readLine();
  while(row.count(QChar('"')) % 2 != 0 && !in.atEnd()) {
    row += '\n' + in.readLine();
  }
  return row;
}


QStringList StationCsvReader::parseLine(const QString& line) {
  QStringList fields;
  QString field;
  bool quoted = false;

  for(int i=0; i<line.size(); i++) {
    const QChar c = line[i];
    if(quoted) {
      if(c == '"') {
        // Either an escaped quote or the end of the quoted section.
        if(i+1 < line.size() && line[i+1] == '"') {
          field += '"';
          i++;
        }
        else {
          quoted = false;
        }
      }
      else {
        field += c;
      }
    }
    else if(c == '"') {
      quoted = true;
    }
    else if(c == ',') {
      fields.append(field);
      field.clear();
    }
    else {
      field += c;
    }
  }

  fields.append(field);
  return fields;
}


bool StationCsvReader::read(
  const QString& path,
  QList<StationRecord>& records,
  QString& why
)
{
  records.clear();

  QFile file(path);
  if(!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
    why = QString("Could not open CSV file '%1': %2").arg(path, file.errorString());
    return false;
  }

  QTextStream in(&file);
  if(in.atEnd()) {
    why = QString("CSV file '%1' is empty").arg(path);
    return false;
  }

  // Normalize header names, dropping a possible byte-order mark.
  QStringList header = parseLine(readRow(in));
  for(QString& h : header) {
    h.remove(QChar(0xFEFF));
    h = h.trimmed().toLower();
  }
  if(header.size() == 1 && header.front().isEmpty()) {
    why = QString("CSV file '%1' has no header").arg(path);
    return false;
  }

  const int id_col = findColumn(header, {"OPIS Truckstop ID", "id"});
  const int name_col = findColumn(header, {"Truckstop Name", "name"});
  const int city_col = findColumn(header, {"City"});
  const int state_col = findColumn(header, {"State"});
  const int price_col = findColumn(header, {"Retail Price", "price"});
  const int lat_col = findColumn(header, {"latitude", "lat"});
  const int lon_col = findColumn(header, {"longitude", "lon"});

  if(lat_col < 0 || lon_col < 0) {
    qWarning() << "CSV file" << path << "has no coordinate columns, all rows will be skipped";
  }

  while(!in.atEnd()) {
    QString line = readRow(in);
    if(line.trimmed().isEmpty()) {
      continue;
    }

    QStringList fields = parseLine(line);
    auto field = [&fields](int col) {
      return (col >= 0 && col < fields.size()) ? fields[col].trimmed() : QString();
    };

    StationRecord r;
    r.id = field(id_col);
    r.name = field(name_col);
    r.city = field(city_col);
    r.state = field(state_col);
    r.price = field(price_col);
    r.latitude = field(lat_col);
    r.longitude = field(lon_col);
    records.append(r);
  }

  qDebug() << "Read" << records.size() << "rows from" << path;
  return true;
}
