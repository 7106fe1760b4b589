#include "../src/boot/device_resolver.hpp"
#include "fakes.hpp"
#include "test_framework.hpp"

using namespace rdinit;
using namespace rdinit::testing;

namespace {

DeviceSpec uuid(const std::string& value) {
    auto spec = DeviceSpec::parse("UUID=" + value);
    RD_ASSERT(spec.has_value(), "bad test UUID");
    return *spec;
}

}  // namespace

void test_device_appears_after_three_seconds() {
    FakePlatform platform;
    FakeProbe probe(platform);
    probe.add("UUID", "1111", "/dev/sda1", 3);

    DeviceResolver resolver(platform, probe, 30);
    auto device = resolver.resolve(uuid("1111"), BootStage::RootAcquired);
    RD_ASSERT(device.ok(), "device should resolve");
    RD_ASSERT_EQ(device.value(), "/dev/sda1");
    RD_ASSERT_EQ(platform.now, 3u);
}

void test_device_timeout_reports_snapshot() {
    FakePlatform platform;
    FakeProbe probe(platform);
    probe.add("UUID", "1111", "/dev/sda1");

    DeviceResolver resolver(platform, probe, 30);
    auto device = resolver.resolve(uuid("deadbeef"), BootStage::RootAcquired);
    RD_ASSERT(!device.ok(), "unknown UUID must fail");
    RD_ASSERT_EQ(platform.now, 30u);

    const Failure& failure = device.failure();
    RD_ASSERT(failure.kind == FailureKind::DeviceNotFound, "wrong failure kind");
    RD_ASSERT(failure.stage == BootStage::RootAcquired, "stage comes from the caller");
    RD_ASSERT_EQ(failure.snapshot.size(), 1u);
    RD_ASSERT(failure.snapshot[0].find("/dev/sda1") != std::string::npos,
              "snapshot lists visible devices: " << failure.snapshot[0]);
}

void test_empty_snapshot_is_explicit() {
    FakePlatform platform;
    FakeProbe probe(platform);

    DeviceResolver resolver(platform, probe, 2);
    auto device = resolver.resolve(uuid("cafe"), BootStage::RootAcquired);
    RD_ASSERT(!device.ok(), "nothing to find");
    RD_ASSERT_EQ(device.failure().snapshot.size(), 1u);
    RD_ASSERT_EQ(device.failure().snapshot[0], "(no block devices visible)");
}

void test_path_spec_and_cache() {
    FakePlatform platform;
    FakeProbe probe(platform);
    platform.block_devices.insert("/dev/vda2");

    DeviceResolver resolver(platform, probe, 5);
    auto spec = DeviceSpec::path("/dev/vda2");
    auto first = resolver.resolve(spec, BootStage::RootAcquired);
    RD_ASSERT(first.ok(), "existing node resolves");
    RD_ASSERT_EQ(platform.now, 0u);

    // Answered from cache even though the node is gone
    platform.block_devices.clear();
    auto second = resolver.resolve(spec, BootStage::RootAcquired);
    RD_ASSERT(second.ok(), "cached result");
    RD_ASSERT_EQ(second.value(), "/dev/vda2");
    RD_ASSERT(resolver.cached(spec).has_value(), "cache entry present");
}

void test_first_of_duplicate_labels_wins() {
    FakePlatform platform;
    FakeProbe probe(platform);
    probe.add("LABEL", "root", "/dev/sdb1");
    probe.add("LABEL", "root", "/dev/sdc1");

    DeviceResolver resolver(platform, probe, 30);
    auto device = resolver.resolve(*DeviceSpec::parse("LABEL=root"), BootStage::RootAcquired);
    RD_ASSERT(device.ok(), "duplicate labels still resolve");
    RD_ASSERT_EQ(device.value(), "/dev/sdb1");
}

void test_wait_forever_outlasts_timeout() {
    FakePlatform platform;
    FakeProbe probe(platform);
    probe.add("UUID", "slow", "/dev/sdd1", 120);

    DeviceResolver resolver(platform, probe, 30);
    resolver.set_wait_forever(true);
    auto device = resolver.resolve(uuid("slow"), BootStage::RootAcquired);
    RD_ASSERT(device.ok(), "rootwait keeps polling");
    RD_ASSERT_EQ(platform.now, 120u);
}

RD_TEST_CASE(test_device_appears_after_three_seconds, "Resolver: device appears at tick 3");
RD_TEST_CASE(test_device_timeout_reports_snapshot, "Resolver: timeout carries snapshot");
RD_TEST_CASE(test_empty_snapshot_is_explicit, "Resolver: empty snapshot placeholder");
RD_TEST_CASE(test_path_spec_and_cache, "Resolver: path spec and cache");
RD_TEST_CASE(test_first_of_duplicate_labels_wins, "Resolver: duplicate labels");
RD_TEST_CASE(test_wait_forever_outlasts_timeout, "Resolver: rootwait");
