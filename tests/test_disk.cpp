#include "minitest.hpp"
#include "fixture.hpp"
#include "collectors/DiskCollector.hpp"

using namespace sysvet;
using namespace sysvet::model;
using sysvet::collectors::DiskCollector;
using sysvet::collectors::MountDiskSource;

TEST(mounts_parse_and_unescape) {
  auto m = MountDiskSource::parse_mounts(
    "/dev/sda1 / ext4 rw,relatime 0 0\n"
    "proc /proc proc rw 0 0\n"
    "/dev/sdb1 /mnt/My\\040Disk vfat rw 0 0\n"
    "\n"
    "broken-line\n");
  ASSERT_EQ(m.size(), size_t{3});
  ASSERT_EQ(m[0].device, std::string("/dev/sda1"));
  ASSERT_EQ(m[0].fstype, std::string("ext4"));
  ASSERT_EQ(m[2].mountpoint, std::string("/mnt/My Disk"));
  ASSERT_TRUE(MountDiskSource::is_pseudo_fs("tmpfs"));
  ASSERT_TRUE(MountDiskSource::is_pseudo_fs("squashfs"));
  ASSERT_FALSE(MountDiskSource::is_pseudo_fs("xfs"));
}

TEST(smart_health_verdicts) {
  ASSERT_EQ(MountDiskSource::parse_smart_health(
    "=== START OF READ SMART DATA SECTION ===\nSMART overall-health self-assessment test result: PASSED\n"),
    std::optional<bool>(false));
  ASSERT_EQ(MountDiskSource::parse_smart_health("SMART overall-health self-assessment test result: FAILED!\n"),
            std::optional<bool>(true));
  ASSERT_EQ(MountDiskSource::parse_smart_health("SMART Health Status: OK\n"), std::optional<bool>(false));
  ASSERT_EQ(MountDiskSource::parse_smart_health("SMART Health Status: FAILURE PREDICTION THRESHOLD EXCEEDED\n"),
            std::optional<bool>(true));
  ASSERT_FALSE(MountDiskSource::parse_smart_health("Smartctl open device: /dev/sda failed: Permission denied\n").has_value());
}

TEST(backing_disk_follows_partition_link) {
  FixtureRoot fx("disk_block");
  fx.write("/sys/devices/pci0/nvme/nvme0n1/nvme0n1p2/partition", "2\n");
  fx.mkdir("/sys/devices/pci0/nvme/nvme0n1/queue");
  fx.link("/sys/class/block/nvme0n1p2", "../../devices/pci0/nvme/nvme0n1/nvme0n1p2");
  fx.link("/sys/class/block/nvme0n1", "../../devices/pci0/nvme/nvme0n1");
  ASSERT_EQ(MountDiskSource::backing_disk("nvme0n1p2"), std::string("nvme0n1"));
  ASSERT_EQ(MountDiskSource::backing_disk("nvme0n1"), std::string("nvme0n1"));
  ASSERT_EQ(MountDiskSource::backing_disk("sdz9"), std::string("sdz9"));
}

TEST(disk_fixture_read_counts_temp_files) {
  FixtureRoot fx("disk");
  fx.write("/proc/self/mounts",
           "/dev/sda1 / ext4 rw 0 0\n"
           "proc /proc proc rw 0 0\n"
           "tmpfs /run tmpfs rw 0 0\n"
           "/dev/sda1 /srv/bind ext4 rw 0 0\n");
  fx.write("/tmp/a", std::string(1000, 'x'));
  fx.write("/tmp/sub/b", std::string(24, 'y'));
  fx.mkdir("/var/tmp");

  app::ScanConfig cfg;
  cfg.smartctl = "/nonexistent/smartctl";
  MountDiskSource src;
  DiskSnapshot snap;
  ASSERT_TRUE(src.read(cfg, snap, {}));
  ASSERT_EQ(snap.volumes.size(), size_t{1});
  const auto& v = snap.volumes[0];
  ASSERT_EQ(v.mountpoint, std::string("/"));
  ASSERT_EQ(v.disk, std::string("sda1"));
  ASSERT_EQ(v.temp_bytes, uint64_t{1024});
  ASSERT_EQ(v.temp_files, uint64_t{2});
  ASSERT_FALSE(v.failure_predicted.has_value());
  ASSERT_TRUE(v.total_bytes > 0);
  bool noted = false;
  for (const auto& n : snap.notes) noted = noted || n.find("not available") != std::string::npos;
  ASSERT_TRUE(noted);

  auto r = DiskCollector(std::make_unique<MountDiskSource>()).collect(cfg, {});
  ASSERT_TRUE(r.evaluated());
  ASSERT_EQ(r.findings.size(), size_t{1});
  ASSERT_EQ(r.findings[0].identifier, std::string("/"));
  ASSERT_TRUE(is_unknown(r.findings[0].metrics, "failure_predicted"));
  ASSERT_EQ(number(r.findings[0].metrics, "temp_bytes"), std::optional<double>(1024.0));
}

TEST(temp_on_second_mount_of_a_device_counts) {
  FixtureRoot fx("disk_subvol");
  fx.write("/proc/self/mounts",
           "/dev/sda2 / btrfs rw,subvol=/@ 0 0\n"
           "/dev/sda2 /var btrfs rw,subvol=/@/var 0 0\n");
  fx.write("/var/tmp/big", std::string(4096, 'v'));
  app::ScanConfig cfg;
  cfg.smartctl = "/nonexistent/smartctl";
  cfg.temp_paths = {"/var/tmp"};
  MountDiskSource src;
  DiskSnapshot snap;
  ASSERT_TRUE(src.read(cfg, snap, {}));
  ASSERT_EQ(snap.volumes.size(), size_t{1});
  ASSERT_EQ(snap.volumes[0].mountpoint, std::string("/"));
  ASSERT_EQ(snap.volumes[0].temp_bytes, uint64_t{4096});
  ASSERT_EQ(snap.volumes[0].temp_files, uint64_t{1});
  for (const auto& n : snap.notes) ASSERT_TRUE(n.find("no volume found") == std::string::npos);
}

TEST(memory_backed_tmp_is_its_own_volume) {
  FixtureRoot fx("disk_tmpfs");
  fx.write("/proc/self/mounts", "/dev/sda1 / ext4 rw 0 0\ntmpfs /tmp tmpfs rw 0 0\n");
  fx.write("/tmp/big", std::string(10, 'z'));
  app::ScanConfig cfg;
  cfg.smartctl = "/nonexistent/smartctl";
  cfg.temp_paths = {"/tmp/"};
  MountDiskSource src;
  DiskSnapshot snap;
  ASSERT_TRUE(src.read(cfg, snap, {}));
  ASSERT_EQ(snap.volumes.size(), size_t{2});
  ASSERT_EQ(snap.volumes[0].temp_bytes, uint64_t{0});
  ASSERT_EQ(snap.volumes[1].mountpoint, std::string("/tmp"));
  ASSERT_EQ(snap.volumes[1].fstype, std::string("tmpfs"));
  ASSERT_EQ(snap.volumes[1].temp_bytes, uint64_t{10});
  ASSERT_EQ(snap.volumes[1].failure_predicted, std::optional<bool>(false));
}

TEST(smartctl_failure_verdict_is_critical) {
  FixtureRoot fx("disk_smart");
  fx.write("/proc/self/mounts", "/dev/sda1 / ext4 rw 0 0\n");
  fx.write("/sys/devices/ata/sda/sda1/partition", "1\n");
  fx.link("/sys/class/block/sda1", "../../devices/ata/sda/sda1");
  fx.write("/bin/fake-smartctl", "#!/bin/sh\necho 'SMART overall-health self-assessment test result: FAILED!'\n");
  fs::permissions(fx.path("/bin/fake-smartctl"), fs::perms::owner_all);
  app::ScanConfig cfg;
  cfg.smartctl = fx.path("/bin/fake-smartctl").string();
  cfg.temp_paths.clear();
  auto r = DiskCollector(std::make_unique<MountDiskSource>()).collect(cfg, {});
  ASSERT_TRUE(r.evaluated());
  ASSERT_EQ(r.findings.size(), size_t{1});
  ASSERT_EQ(number(r.findings[0].metrics, "failure_predicted"), std::optional<double>(1.0));
  ASSERT_EQ(r.findings[0].severity, Severity::Critical);
}

TEST(no_block_volumes_is_unavailable) {
  FixtureRoot fx("disk_none");
  fx.write("/proc/self/mounts", "proc /proc proc rw 0 0\noverlay / overlay rw 0 0\n");
  auto r = DiskCollector(std::make_unique<MountDiskSource>()).collect(app::ScanConfig{}, {});
  ASSERT_TRUE(r.failure.has_value());
  ASSERT_EQ(r.failure->kind, FailureKind::DomainUnavailable);
}

TEST(volume_metrics) {
  DiskSnapshot snap;
  Volume full;
  full.mountpoint = "/home";
  full.fstype = "btrfs";
  full.total_bytes = 100;
  full.avail_bytes = 3;
  full.failure_predicted = false;
  Volume odd;
  odd.mountpoint = "/boot";
  odd.failure_predicted = false;
  snap.volumes = {full, odd};
  auto f = DiskCollector::to_findings(snap);
  ASSERT_EQ(f.size(), size_t{2});
  ASSERT_EQ(f[0].severity, Severity::Critical);
  ASSERT_NEAR(*number(f[0].metrics, "free_percent"), 3.0, 1e-9);
  ASSERT_EQ(*text(f[0].metrics, "fstype"), std::string("btrfs"));
  ASSERT_TRUE(is_unknown(f[1].metrics, "free_percent"));
  ASSERT_TRUE(f[1].indeterminate);
}
