#include "math_utilities.hpp"

#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

#include <stdexcept>

using namespace math_utilities;


TEST(HaversineTests, haversineDistance_SwappedPoints_IsSymmetric) {
  double ab = haversineDistance(34.0522, -118.2437, 37.7749, -122.4194);
  double ba = haversineDistance(37.7749, -122.4194, 34.0522, -118.2437);
  EXPECT_DOUBLE_EQ(ab, ba);
}

TEST(HaversineTests, haversineDistance_SamePoint_IsZero) {
  EXPECT_DOUBLE_EQ(haversineDistance(35.5, -120.0, 35.5, -120.0), 0.0);
  EXPECT_DOUBLE_EQ(haversineDistance(-89.0, 179.0, -89.0, 179.0), 0.0);
}

TEST(HaversineTests, haversineDistance_LosAngelesToSanFrancisco_IsAbout347Miles) {
  double d = haversineDistance(34.0522, -118.2437, 37.7749, -122.4194);
  EXPECT_NEAR(d, 347.44, 0.01);
}

TEST(HaversineTests, haversineDistance_AntipodalPoints_IsHalfCircumference) {
  double d = haversineDistance(0.0, 0.0, 0.0, 180.0);
  EXPECT_NEAR(d, PI * EARTH_RADIUS_MILES, 1e-6);
}

TEST(HaversineTests, haversineDistance_Arrays_MatchScalarVersion) {
  Eigen::ArrayXd lat1(3), lon1(3), lat2(3), lon2(3);
  lat1 << 34.0, 40.7, -33.9;
  lon1 << -118.0, -74.0, 151.2;
  lat2 << 36.1, 41.9, -37.8;
  lon2 << -115.2, -87.6, 144.9;

  Eigen::ArrayXd d = haversineDistance(lat1, lon1, lat2, lon2);
  Eigen::ArrayXd d0 = haversineDistance(lat1, lon1, 35.0, -100.0);
  ASSERT_EQ(d.size(), 3);
  ASSERT_EQ(d0.size(), 3);
  for(Eigen::Index i=0; i<3; i++) {
    EXPECT_NEAR(d(i), haversineDistance(lat1(i), lon1(i), lat2(i), lon2(i)), 1e-9);
    EXPECT_NEAR(d0(i), haversineDistance(lat1(i), lon1(i), 35.0, -100.0), 1e-9);
  }
}


TEST(DegreeConversionTests, latitude_variation_OneDegreeArc_IsOneDegree) {
  EXPECT_NEAR(latitude_variation(EARTH_RADIUS_MILES * TO_RAD), 1.0, 1e-12);
}

TEST(DegreeConversionTests, longitude_variation_AtEquator_MatchesLatitudeVariation) {
  EXPECT_NEAR(longitude_variation(100.0, 0.0), latitude_variation(100.0), 1e-9);
}

TEST(DegreeConversionTests, longitude_variation_HigherLatitude_IsWider) {
  EXPECT_GT(longitude_variation(100.0, 60.0), longitude_variation(100.0, 30.0));
  EXPECT_GT(longitude_variation(100.0, -60.0), longitude_variation(100.0, 0.0));
}

TEST(DegreeConversionTests, longitude_variation_CircleAroundPole_CoversAllLongitudes) {
  EXPECT_DOUBLE_EQ(longitude_variation(50.0, 89.9), 180.0);
  EXPECT_DOUBLE_EQ(longitude_variation(50.0, -89.9), 180.0);
}

TEST(DegreeConversionTests, longitude_variation_PointOnCircle_IsWithinVariation) {
  // The farthest longitude reachable along the circle must not exceed the
  // variation, otherwise box queries would miss stations.
  const double lat = 45.0;
  const double radius = 200.0;
  double dlon = longitude_variation(radius, lat);
  for(double l = 40.0; l <= 50.0; l += 0.01) {
    if(haversineDistance(lat, 0.0, l, dlon * 1.0001) <= radius) {
      ADD_FAILURE() << "Point at latitude " << l << " beyond the longitude variation is inside the circle";
      break;
    }
  }
}


TEST(ArgsortTests, argsort_RepeatedValues_KeepsOriginalOrder) {
  Eigen::ArrayXd values(5);
  values << 3.0, 1.0, 2.0, 1.0, 0.5;
  std::vector<Eigen::Index> expected{4, 1, 3, 2, 0};
  EXPECT_EQ(argsort(values), expected);
}

TEST(ArgsortTests, argsort_EmptyArray_ReturnsEmpty) {
  Eigen::ArrayXd values(0);
  EXPECT_TRUE(argsort(values).empty());
}


class LoadArrayTests : public ::testing::Test {
protected:
  QTemporaryDir dir_;

  std::string write(const QString& name, const QString& content) {
    QString path = dir_.filePath(name);
    QFile file(path);
    EXPECT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Text));
    QTextStream out(&file);
    out << content;
    return path.toStdString();
  }
};

TEST_F(LoadArrayTests, loadArray_SavetxtOutput_ReadsAllRows) {
  ASSERT_TRUE(dir_.isValid());
  std::string path = write("route.txt",
    "# latitude longitude\n"
    "3.405220000000000169e+01 -1.182437000000000040e+02\n"
    "\n"
    "34.5,-118.0\n"
    "  35.0\t-119.0\n"
  );

  Eigen::ArrayXXd a = loadArray(path);
  ASSERT_EQ(a.rows(), 3);
  ASSERT_EQ(a.cols(), 2);
  EXPECT_DOUBLE_EQ(a(0, 0), 34.0522);
  EXPECT_DOUBLE_EQ(a(0, 1), -118.2437);
  EXPECT_DOUBLE_EQ(a(1, 0), 34.5);
  EXPECT_DOUBLE_EQ(a(2, 1), -119.0);
}

TEST_F(LoadArrayTests, loadArray_MissingFile_Throws) {
  ASSERT_TRUE(dir_.isValid());
  EXPECT_THROW(loadArray(dir_.filePath("missing.txt").toStdString()), std::runtime_error);
}

TEST_F(LoadArrayTests, loadArray_MalformedLine_Throws) {
  ASSERT_TRUE(dir_.isValid());
  std::string path = write("bad.txt", "34.0 -118.0\n34.5 north\n");
  EXPECT_THROW(loadArray(path), std::runtime_error);
}
