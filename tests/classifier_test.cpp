#include "core/DeviceClassifier.hpp"
#include "core/DeviceScanner.hpp"
#include "core/ItemClassifier.hpp"

#include "FakeTransferAdapter.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

using namespace cubecycle::core;
using cubecycle::io::ConnectionPoint;
using cubecycle::io::ItemDescriptor;
using cubecycle::test::FakeTransferAdapter;

//---DeviceScanner------------------------------------------------------------

TEST(DeviceScanner, ReportsOnlySidesWithPositiveSize) {
  FakeTransferAdapter adapter;
  adapter.attach(ConnectionPoint::North, 1, "Charger");
  adapter.attach(ConnectionPoint::South, 0, "Empty Frame");
  adapter.attach(ConnectionPoint::East, 2, "Energy Cube");
  std::ostringstream console;

  auto scan = DeviceScanner(adapter, console).scan();

  ASSERT_EQ(scan.size(), 2u);
  EXPECT_TRUE(scan.count(ConnectionPoint::North));
  EXPECT_TRUE(scan.count(ConnectionPoint::East));
  EXPECT_FALSE(scan.count(ConnectionPoint::South));
  EXPECT_EQ(scan.at(ConnectionPoint::East).slotCount, 2);
  EXPECT_EQ(adapter.sizeQueries.size(), 6u);
}

TEST(DeviceScanner, EmitsOneLinePerDiscoveredSide) {
  FakeTransferAdapter adapter;
  adapter.attach(ConnectionPoint::Up, 1, "Charger");
  adapter.attach(ConnectionPoint::West, 2, "Basic Energy Cube");
  std::ostringstream console;

  DeviceScanner(adapter, console).scan();

  EXPECT_EQ(console.str(), "Detecting inventories...\n"
                           "  up: Charger\n"
                           "  west: Basic Energy Cube\n");
}

TEST(DeviceScanner, MissingNameFallsBackToUnknown) {
  FakeTransferAdapter adapter;
  adapter.attach(ConnectionPoint::Down, 9, std::nullopt);
  std::ostringstream console;

  auto scan = DeviceScanner(adapter, console).scan();

  ASSERT_EQ(scan.size(), 1u);
  EXPECT_EQ(scan.at(ConnectionPoint::Down).displayName, "Unknown");
}

TEST(DeviceScanner, FaultOnOneSideDoesNotHideOthers) {
  FakeTransferAdapter adapter;
  adapter.attach(ConnectionPoint::North, 1, "Charger");
  adapter.attach(ConnectionPoint::South, 1, "Energy Cube");
  adapter.throwOnSizeFor = ConnectionPoint::North;
  std::ostringstream console;

  auto scan = DeviceScanner(adapter, console).scan();

  ASSERT_EQ(scan.size(), 1u);
  EXPECT_TRUE(scan.count(ConnectionPoint::South));
}

TEST(DeviceScanner, FailedNameLookupKeepsSideAsUnknown) {
  FakeTransferAdapter adapter;
  adapter.attach(ConnectionPoint::North, 9, "Charger");
  adapter.throwOnNameFor = ConnectionPoint::North;
  std::ostringstream console;

  auto scan = DeviceScanner(adapter, console).scan();

  ASSERT_EQ(scan.count(ConnectionPoint::North), 1u);
  EXPECT_EQ(scan.at(ConnectionPoint::North).slotCount, 9);
  EXPECT_EQ(scan.at(ConnectionPoint::North).displayName, DeviceScanner::kUnknownName);
  EXPECT_NE(console.str().find("  north: Unknown"), std::string::npos);
}

//---DeviceClassifier---------------------------------------------------------

namespace {
  ScanResult scanOf(std::initializer_list<std::pair<ConnectionPoint, const char*>> entries) {
    ScanResult result;
    for (const auto& [point, name] : entries)
      result.emplace(point, InventoryDescriptor{ point, 1, name });
    return result;
  }
} // namespace

TEST(DeviceClassifier, DetectsChargerAndCubeByName) {
  auto roles = DeviceClassifier::byDisplayName().classify(
      scanOf({ { ConnectionPoint::North, "tile.Charger" }, { ConnectionPoint::East, "Elite Energy Cube" } }));

  EXPECT_EQ(roles.source, ConnectionPoint::North);
  EXPECT_EQ(roles.sink, ConnectionPoint::East);
  EXPECT_TRUE(roles.resolved());
}

TEST(DeviceClassifier, MatchingIsCaseInsensitive) {
  auto roles = DeviceClassifier::byDisplayName().classify(
      scanOf({ { ConnectionPoint::Up, "CHARGER" }, { ConnectionPoint::Down, "mekanism:CUBE" } }));

  EXPECT_EQ(roles.source, ConnectionPoint::Up);
  EXPECT_EQ(roles.sink, ConnectionPoint::Down);
}

TEST(DeviceClassifier, LastMatchInScanOrderWins) {
  auto roles = DeviceClassifier::byDisplayName().classify(
      scanOf({ { ConnectionPoint::Down, "Charger" },
               { ConnectionPoint::North, "Energy Storage" },
               { ConnectionPoint::West, "Charger Mk2" },
               { ConnectionPoint::East, "Energy Cube" } }));

  EXPECT_EQ(roles.source, ConnectionPoint::West);
  EXPECT_EQ(roles.sink, ConnectionPoint::East);
}

TEST(DeviceClassifier, MissingRolesStayEmpty) {
  auto roles = DeviceClassifier::byDisplayName().classify(
      scanOf({ { ConnectionPoint::South, "Chest" } }));

  EXPECT_FALSE(roles.source.has_value());
  EXPECT_FALSE(roles.sink.has_value());
  EXPECT_FALSE(roles.resolved());
}

TEST(DeviceClassifier, SameSideForBothRolesIsNotResolved) {
  auto roles = DeviceClassifier::byDisplayName().classify(
      scanOf({ { ConnectionPoint::South, "Energy Charger" } }));

  EXPECT_EQ(roles.source, ConnectionPoint::South);
  EXPECT_EQ(roles.sink, ConnectionPoint::South);
  EXPECT_FALSE(roles.resolved());
}

TEST(DeviceClassifier, ClassifyIsIdempotent) {
  auto classifier = DeviceClassifier::byDisplayName();
  auto scan = scanOf({ { ConnectionPoint::Up, "Charger" },
                       { ConnectionPoint::North, "Energy Cube" },
                       { ConnectionPoint::East, "Ultimate Energy Cube" } });

  auto first = classifier.classify(scan);
  auto second = classifier.classify(scan);

  EXPECT_EQ(first.source, second.source);
  EXPECT_EQ(first.sink, second.sink);
}

TEST(DeviceClassifier, AcceptsCustomPredicates) {
  DeviceClassifier bySlots([](const InventoryDescriptor& d) { return d.slotCount == 1; },
                           [](const InventoryDescriptor& d) { return d.slotCount == 2; });
  ScanResult scan;
  scan.emplace(ConnectionPoint::Up, InventoryDescriptor{ ConnectionPoint::Up, 2, "A" });
  scan.emplace(ConnectionPoint::Down, InventoryDescriptor{ ConnectionPoint::Down, 1, "B" });

  auto roles = bySlots.classify(scan);

  EXPECT_EQ(roles.source, ConnectionPoint::Down);
  EXPECT_EQ(roles.sink, ConnectionPoint::Up);
}

TEST(DeviceClassifier, RejectsEmptyPredicate) {
  EXPECT_THROW(DeviceClassifier(nullptr, [](const InventoryDescriptor&) { return true; }),
               std::invalid_argument);
}

//---ItemClassifier-----------------------------------------------------------

TEST(ItemClassifier, EmptySlotIsNotTracked) {
  ItemClassifier classifier(TrackedItemProfile::energyCube());
  EXPECT_FALSE(classifier.matchesTrackedType(std::nullopt));
}

TEST(ItemClassifier, ExactInternalIdMatches) {
  ItemClassifier classifier(TrackedItemProfile::energyCube());
  EXPECT_TRUE(classifier.matchesTrackedType(ItemDescriptor{ "mekanism:energycube", std::nullopt }));
}

TEST(ItemClassifier, LabelFallbackNeedsEveryToken) {
  ItemClassifier classifier(TrackedItemProfile::energyCube());

  EXPECT_TRUE(classifier.matchesTrackedType(ItemDescriptor{ "other:thing", "Advanced ENERGY Cube" }));
  EXPECT_FALSE(classifier.matchesTrackedType(ItemDescriptor{ "other:thing", "Energy Tablet" }));
  EXPECT_FALSE(classifier.matchesTrackedType(ItemDescriptor{ "other:thing", std::nullopt }));
}

TEST(ItemClassifier, BatteryUpgradeVariantUsesLabelOnly) {
  ItemClassifier classifier(TrackedItemProfile::batteryUpgrade());

  EXPECT_TRUE(classifier.matchesTrackedType(ItemDescriptor{ "opencomputers:upgrade", "Battery Upgrade (Tier 3)" }));
  EXPECT_FALSE(classifier.matchesTrackedType(ItemDescriptor{ "opencomputers:upgrade", "Inventory Upgrade" }));
  EXPECT_FALSE(classifier.matchesTrackedType(ItemDescriptor{ "mekanism:energycube", std::nullopt }));
}

TEST(ItemClassifier, ProfileLookupByName) {
  EXPECT_EQ(TrackedItemProfile::byName("energy_cube").internalId, "mekanism:energycube");
  EXPECT_EQ(TrackedItemProfile::byName("battery_upgrade").labelTokens.size(), 2u);
  EXPECT_THROW(TrackedItemProfile::byName("diamond"), std::invalid_argument);
}
