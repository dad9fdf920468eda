#include "math_utilities.hpp"
#include "route_optimizer.hpp"
#include "spatial_index.hpp"

#include <gtest/gtest.h>


static Station makeStation(const QString& id, double lat, double lon, double price) {
  return Station(id, id, "", "", price, QGeoCoordinate(lat, lon));
}


// Straight route heading north along the -100 meridian, from latitude 30 to
// 36 in steps of 0.1 degrees (about 6.9 miles). With the default interval of
// 50 miles, waypoints are emitted every 8 points (about 55.3 miles).
static QList<QGeoCoordinate> northboundRoute() {
  QList<QGeoCoordinate> points;
  for(int i=0; i<=60; i++) {
    points.append(QGeoCoordinate((300 + i) / 10.0, -100.0));
  }
  return points;
}

// Length of a leg between consecutive waypoints of northboundRoute().
static const double LEG = math_utilities::haversineDistance(30.0, -100.0, 30.8, -100.0);


class RouteOptimizerTests : public ::testing::Test {
protected:
  OptimizerConfig config_;
  SpatialIndex index_;

  void SetUp() override {
    config_.max_range = 200.0;
    config_.mpg = 10.0;
  }

  OptimizationResult optimize(const RouteOptimizer& optimizer, const QList<QGeoCoordinate>& route, double total_distance) {
    OptimizationResult result;
    QString why;
    EXPECT_TRUE(optimizer.optimize(route, total_distance, index_, result, why)) << why.toStdString();
    return result;
  }

  // Stations around the waypoints at latitude 32.4, 34.0 and 35.6.
  QList<Station> corridorStations() const {
    return {
      makeStation("A1", 32.4, -100.05, 3.60),
      makeStation("A2", 32.5, -100.0, 3.40),
      makeStation("A3", 32.4, -101.0, 2.00), // Cheap, but too far away.
      makeStation("B1", 34.0, -100.1, 3.50),
      makeStation("C2", 35.6, -100.125, 3.20),
      makeStation("C1", 35.6, -99.875, 3.20)
    };
  }
};


TEST_F(RouteOptimizerTests, sampleRoute_NorthboundRoute_KeepsExtremities) {
  QList<QGeoCoordinate> points = northboundRoute();
  QList<QGeoCoordinate> waypoints = RouteOptimizer::sampleRoute(points, 50.0);

  ASSERT_EQ(waypoints.size(), 9);
  EXPECT_EQ(waypoints.front(), points.front());
  EXPECT_EQ(waypoints.back(), points.back());
  for(int i=1; i<8; i++) {
    EXPECT_EQ(waypoints[i], points[8*i]);
  }
}

TEST_F(RouteOptimizerTests, sampleRoute_DiagonalRoute_OutputIsSubsetOfInput) {
  QList<QGeoCoordinate> points;
  for(int i=0; i<100; i++) {
    points.append(QGeoCoordinate(0.5 * i, 0.5 * i));
  }

  QList<QGeoCoordinate> waypoints = RouteOptimizer::sampleRoute(points, 10.0);
  EXPECT_LE(waypoints.size(), points.size());
  EXPECT_EQ(waypoints.front(), points.front());
  EXPECT_EQ(waypoints.back(), points.back());
  for(const auto& w : waypoints) {
    EXPECT_TRUE(points.contains(w));
  }

  // Every leg is longer than the interval, so nothing is dropped.
  EXPECT_EQ(waypoints.size(), points.size());
}

TEST_F(RouteOptimizerTests, sampleRoute_LastPointOnInterval_IsNotDuplicated) {
  QList<QGeoCoordinate> points{QGeoCoordinate(30.0, -100.0), QGeoCoordinate(31.0, -100.0)};
  QList<QGeoCoordinate> waypoints = RouteOptimizer::sampleRoute(points, 10.0);
  ASSERT_EQ(waypoints.size(), 2);
  EXPECT_EQ(waypoints[1], points[1]);
}

TEST_F(RouteOptimizerTests, sampleRoute_ShortInputs_AreReturnedUnchanged) {
  EXPECT_TRUE(RouteOptimizer::sampleRoute({}, 50.0).isEmpty());
  QList<QGeoCoordinate> one{QGeoCoordinate(30.0, -100.0)};
  EXPECT_EQ(RouteOptimizer::sampleRoute(one, 50.0), one);
}


TEST_F(RouteOptimizerTests, optimize_ShortCaliforniaTrip_NeedsNoStops) {
  index_.build(QList<Station>{makeStation("1", 35.37, -119.02, 3.50)});
  RouteOptimizer optimizer;  // Defaults: 500 miles, 10 mpg.

  QList<QGeoCoordinate> route{
    QGeoCoordinate(34.0522, -118.2437),
    QGeoCoordinate(34.5, -118.0),
    QGeoCoordinate(35.0, -119.0)
  };
  OptimizationResult result = optimize(optimizer, route, 150.0);

  EXPECT_TRUE(result.stops.isEmpty());
  EXPECT_DOUBLE_EQ(result.total_cost, 0.0);
  EXPECT_DOUBLE_EQ(result.total_gallons, 0.0);
  EXPECT_DOUBLE_EQ(result.total_distance, 150.0);
  EXPECT_DOUBLE_EQ(result.averagePrice(), 0.0);
  EXPECT_TRUE(result.serviceable);
}

TEST_F(RouteOptimizerTests, optimize_DegenerateRoutes_NeedNoStops) {
  index_.build(corridorStations());
  RouteOptimizer optimizer(config_);

  OptimizationResult empty = optimize(optimizer, {}, 0.0);
  EXPECT_TRUE(empty.stops.isEmpty());
  EXPECT_TRUE(empty.serviceable);

  OptimizationResult single = optimize(optimizer, {QGeoCoordinate(30.0, -100.0)}, 0.0);
  EXPECT_TRUE(single.stops.isEmpty());
  EXPECT_EQ(single.waypoints, 1);
}

TEST_F(RouteOptimizerTests, optimize_LongRoute_PicksCheapestReachableStations) {
  index_.build(corridorStations());
  RouteOptimizer optimizer(config_);

  OptimizationResult result = optimize(optimizer, northboundRoute(), 414.6);
  ASSERT_TRUE(result.serviceable);
  ASSERT_EQ(result.stops.size(), 3);
  EXPECT_EQ(result.waypoints, 9);

  // A2 beats the closer A1 on price, and A3 is out of the search radius.
  EXPECT_EQ(result.stops[0].station_id, "A2");
  EXPECT_EQ(result.stops[1].station_id, "B1");
  // C1 and C2 have the same price and distance: the smallest ID wins.
  EXPECT_EQ(result.stops[2].station_id, "C1");

  EXPECT_NEAR(result.stops[0].miles_from_start, 3 * LEG, 1e-6);
  EXPECT_NEAR(result.stops[1].miles_from_start, 5 * LEG, 1e-6);
  EXPECT_NEAR(result.stops[2].miles_from_start, 7 * LEG, 1e-6);

  // Each stop fills the tank to 80% of 200 miles at 10 mpg.
  for(const auto& stop : result.stops) {
    EXPECT_DOUBLE_EQ(stop.gallons, 16.0);
    EXPECT_DOUBLE_EQ(stop.cost, 16.0 * stop.price);
  }
  EXPECT_DOUBLE_EQ(result.total_gallons, 48.0);
  EXPECT_NEAR(result.total_cost, 16.0 * (3.40 + 3.50 + 3.20), 1e-9);
  EXPECT_NEAR(result.averagePrice(), (3.40 + 3.50 + 3.20) / 3.0, 1e-9);
  EXPECT_DOUBLE_EQ(result.total_distance, 414.6);
  EXPECT_GE(result.computation_ms, 0.0);
}

TEST_F(RouteOptimizerTests, optimize_SameInputs_GiveSamePlan) {
  index_.build(corridorStations());
  RouteOptimizer optimizer(config_);

  OptimizationResult first = optimize(optimizer, northboundRoute(), 414.6);
  OptimizationResult second = optimize(optimizer, northboundRoute(), 414.6);
  ASSERT_EQ(first.stops.size(), second.stops.size());
  for(int i=0; i<first.stops.size(); i++) {
    EXPECT_EQ(first.stops[i].station_id, second.stops[i].station_id);
    EXPECT_DOUBLE_EQ(first.stops[i].miles_from_start, second.stops[i].miles_from_start);
  }
  EXPECT_DOUBLE_EQ(first.total_cost, second.total_cost);
}

TEST_F(RouteOptimizerTests, optimize_NothingInDetourRadius_ExpandsSearch) {
  // The only station near the first refuel point is about 27.6 miles away:
  // beyond the 20 miles detour, within the expanded radius.
  index_.build(QList<Station>{
    makeStation("A4", 32.0, -100.0, 3.40),
    makeStation("B1", 34.0, -100.1, 3.50),
    makeStation("C1", 35.6, -99.875, 3.20)
  });
  RouteOptimizer optimizer(config_);

  OptimizationResult result = optimize(optimizer, northboundRoute(), 414.6);
  ASSERT_TRUE(result.serviceable);
  ASSERT_EQ(result.stops.size(), 3);
  EXPECT_EQ(result.stops[0].station_id, "A4");
  EXPECT_EQ(result.stops[1].station_id, "B1");
  EXPECT_EQ(result.stops[2].station_id, "C1");
}

TEST_F(RouteOptimizerTests, optimize_NoReachableStation_ReturnsFlaggedPartialPlan) {
  index_.build(QList<Station>{
    makeStation("A1", 32.4, -100.05, 3.60),
    makeStation("A2", 32.5, -100.0, 3.40)
  });
  RouteOptimizer optimizer(config_);

  OptimizationResult result = optimize(optimizer, northboundRoute(), 414.6);
  EXPECT_FALSE(result.serviceable);
  ASSERT_EQ(result.stops.size(), 1);
  EXPECT_EQ(result.stops[0].station_id, "A2");
  EXPECT_DOUBLE_EQ(result.total_gallons, 16.0);

  // The walk stops at latitude 34.0, before heading to the 7th waypoint.
  EXPECT_EQ(result.shortfall.waypoint, 6);
  EXPECT_DOUBLE_EQ(result.shortfall.location.latitude(), 34.0);
  EXPECT_NEAR(result.shortfall.miles_from_start, 5 * LEG, 1e-6);
  EXPECT_NEAR(result.shortfall.remaining_range, 160.0 - 2 * LEG, 1e-6);
  EXPECT_NEAR(result.shortfall.search_radius, 160.0 - 2 * LEG, 1e-6);
}

TEST_F(RouteOptimizerTests, optimize_EmptyIndex_IsNotServiceable) {
  index_.build(QList<Station>());
  RouteOptimizer optimizer(config_);

  OptimizationResult result = optimize(optimizer, northboundRoute(), 414.6);
  EXPECT_FALSE(result.serviceable);
  EXPECT_TRUE(result.stops.isEmpty());
  EXPECT_EQ(result.shortfall.waypoint, 4);
}


TEST_F(RouteOptimizerTests, optimize_MultiWaypointRouteWithinRange_NeedsNoStops) {
  // About 414.6 miles over 9 waypoints, less than 500 miles minus the buffer.
  index_.build(corridorStations());
  RouteOptimizer optimizer;

  OptimizationResult result = optimize(optimizer, northboundRoute(), 414.6);
  EXPECT_TRUE(result.serviceable);
  EXPECT_EQ(result.waypoints, 9);
  EXPECT_TRUE(result.stops.isEmpty());
  EXPECT_DOUBLE_EQ(result.total_cost, 0.0);
  EXPECT_DOUBLE_EQ(result.total_gallons, 0.0);
}

TEST_F(RouteOptimizerTests, optimize_LegLongerThanRefill_IsNotServiceable) {
  index_.build(QList<Station>{makeStation("S1", 30.1, -100.0, 3.10)});
  RouteOptimizer optimizer(config_);

  // A single leg of about 310.9 miles: the station is found, but 160 miles
  // after the refill are not enough.
  QList<QGeoCoordinate> route{QGeoCoordinate(30.0, -100.0), QGeoCoordinate(34.5, -100.0)};
  const double leg = math_utilities::haversineDistance(30.0, -100.0, 34.5, -100.0);

  OptimizationResult result = optimize(optimizer, route, leg);
  EXPECT_FALSE(result.serviceable);
  ASSERT_EQ(result.stops.size(), 1);
  EXPECT_EQ(result.stops[0].station_id, "S1");
  EXPECT_DOUBLE_EQ(result.stops[0].miles_from_start, 0.0);

  const FuelShortfall& s = result.shortfall;
  EXPECT_TRUE(s.beyond_refill);
  EXPECT_EQ(s.waypoint, 1);
  EXPECT_DOUBLE_EQ(s.location.latitude(), 30.0);
  EXPECT_DOUBLE_EQ(s.miles_from_start, 0.0);
  EXPECT_DOUBLE_EQ(s.remaining_range, 160.0);
  EXPECT_DOUBLE_EQ(s.search_radius, 20.0);
  EXPECT_NEAR(s.segment_distance, leg, 1e-9);
  EXPECT_GT(s.segment_distance, 310.0);
}

TEST_F(RouteOptimizerTests, optimize_StationShortfall_IsNotBeyondRefill) {
  index_.build(QList<Station>());
  RouteOptimizer optimizer(config_);

  OptimizationResult result = optimize(optimizer, northboundRoute(), 414.6);
  EXPECT_FALSE(result.serviceable);
  EXPECT_FALSE(result.shortfall.beyond_refill);
  EXPECT_NEAR(result.shortfall.segment_distance, LEG, 1e-6);
  EXPECT_GE(result.shortfall.search_radius, 0.0);
}


TEST(RouteOptimizerConfigTests, optimize_InvalidConfig_Fails) {
  SpatialIndex index;
  index.build(QList<Station>{makeStation("1", 30.1, -100.0, 3.10)});
  QList<QGeoCoordinate> route{QGeoCoordinate(30.0, -100.0), QGeoCoordinate(31.0, -100.0)};

  OptimizerConfig config;
  config.mpg = 0.0;
  OptimizationResult result;
  QString why;
  EXPECT_FALSE(RouteOptimizer(config).isValid(why));
  EXPECT_FALSE(RouteOptimizer(config).optimize(route, 69.1, index, result, why));
  EXPECT_TRUE(why.contains("mpg"));

  config = OptimizerConfig();
  config.max_range = -10.0;
  EXPECT_FALSE(RouteOptimizer(config).optimize(route, 69.1, index, result, why));
  EXPECT_TRUE(why.contains("max_range"));

  // The safety buffer would swallow the whole refill.
  config = OptimizerConfig();
  config.max_range = 30.0;
  EXPECT_FALSE(RouteOptimizer(config).optimize(route, 69.1, index, result, why));
  EXPECT_TRUE(why.contains("safety_buffer"));

  EXPECT_TRUE(RouteOptimizer().optimize(route, 69.1, index, result, why));
  EXPECT_TRUE(result.serviceable);
}
