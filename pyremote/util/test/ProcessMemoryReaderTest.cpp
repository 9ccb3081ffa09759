// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <gtest/gtest.h>

#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "pyremote/util/pid_info/ProcessMemoryReader.h"

namespace pyremote::pid_info {

namespace fs = std::filesystem;

static const char kMarker[] = "pyremote-marker";

TEST(ProcessMemoryReaderTest, ReadsOwnMemory) {
  ProcessMemoryReader reader(::getpid());
  EXPECT_TRUE(reader.isAlive());
  EXPECT_EQ(reader.getPid(), ::getpid());

  char buf[sizeof(kMarker)] = {};
  auto ret = reader.read(
      reinterpret_cast<uintptr_t>(kMarker), buf, sizeof(buf));
  ASSERT_EQ(ret, static_cast<ssize_t>(sizeof(kMarker)));
  EXPECT_STREQ(buf, kMarker);

  EXPECT_EQ(reader.read(reinterpret_cast<uintptr_t>(kMarker), buf, 0), 0);
}

TEST(ProcessMemoryReaderTest, UnmappedAddressFails) {
  ProcessMemoryReader reader(::getpid());
  uint64_t value = 0;
  EXPECT_EQ(reader.read(0x10, &value, sizeof(value)), -EFAULT);
}

TEST(ProcessMemoryReaderTest, FindsOwnMapping) {
  ProcessMemoryReader reader(::getpid());
  const auto address = reinterpret_cast<uintptr_t>(kMarker);
  auto mapping = reader.findMapping(address);
  ASSERT_TRUE(mapping.has_value());
  EXPECT_LE(mapping->startAddr, address);
  EXPECT_GT(mapping->endAddr, address);
  EXPECT_TRUE(mapping->readable);

  EXPECT_FALSE(reader.findMapping(0x10).has_value());
}

TEST(ProcessMemoryReaderTest, OwnDataIsReadable) {
  ProcessMemoryReader reader(::getpid());
  EXPECT_TRUE(reader.isReadableAddress(reinterpret_cast<uintptr_t>(kMarker)));
  EXPECT_FALSE(reader.isReadableAddress(0x10));
}

TEST(ProcessMemoryReaderTest, ParsesMapLines) {
  MemoryMapping mapping;
  ASSERT_TRUE(ProcessMemoryReader::readMemoryMapLine(
      "7f1c2a000000-7f1c2a021000 r-xp 00002000 fd:01 1234567"
      "                    /usr/lib/libpython3.11.so.1.0",
      mapping));
  EXPECT_EQ(mapping.startAddr, 0x7f1c2a000000u);
  EXPECT_EQ(mapping.endAddr, 0x7f1c2a021000u);
  EXPECT_EQ(mapping.fileOffset, 0x2000u);
  EXPECT_TRUE(mapping.readable);
  EXPECT_FALSE(mapping.writable);
  EXPECT_TRUE(mapping.executable);
  EXPECT_FALSE(mapping.shared);
  EXPECT_EQ(mapping.devMajor, 0xfdu);
  EXPECT_EQ(mapping.devMinor, 0x01u);
  EXPECT_EQ(mapping.inode, 1234567u);
  EXPECT_EQ(mapping.name, "/usr/lib/libpython3.11.so.1.0");

  ASSERT_TRUE(ProcessMemoryReader::readMemoryMapLine(
      "7ffd1000-7ffd2000 rw-s 00000000 00:00 0", mapping));
  EXPECT_TRUE(mapping.writable);
  EXPECT_TRUE(mapping.shared);
  EXPECT_EQ(mapping.name, "");

  EXPECT_FALSE(ProcessMemoryReader::readMemoryMapLine("garbage", mapping));
  EXPECT_FALSE(ProcessMemoryReader::readMemoryMapLine(
      "7ffd1000-7ffd2000 rw 00000000 00:00 0", mapping));
}

class MockProcfsTest : public ::testing::Test {
 protected:
  static constexpr pid_t kPid = 4242;

  void SetUp() override {
    rootDir_ = fs::temp_directory_path() /
        ("pyremote_procfs_" + std::to_string(::getpid()));
    fs::create_directories(rootDir_ / "proc" / std::to_string(kPid));
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(rootDir_, ec);
  }

  void writeMaps(const std::string& contents) {
    std::ofstream maps(rootDir_ / "proc" / std::to_string(kPid) / "maps");
    maps << contents;
  }

  fs::path rootDir_;
};

TEST_F(MockProcfsTest, IteratesMappings) {
  writeMaps(
      "00400000-00401000 r-xp 00000000 08:01 100 /usr/bin/python3.10\n"
      "00601000-00602000 rw-p 00001000 08:01 100 /usr/bin/python3.10\n"
      "7f0000000000-7f0000100000 rw-p 00000000 00:00 0 [heap]\n");
  ProcessMemoryReader reader(kPid, rootDir_.string());
  EXPECT_EQ(
      reader.getProcfsPath("maps"),
      rootDir_ / "proc" / std::to_string(kPid) / "maps");

  std::vector<std::string> names;
  EXPECT_TRUE(reader.iterateAllMemoryMappings([&](const MemoryMapping& m) {
    names.push_back(m.name);
    return IterControl::CONTINUE;
  }));
  EXPECT_EQ(
      names,
      (std::vector<std::string>{
          "/usr/bin/python3.10", "/usr/bin/python3.10", "[heap]"}));

  auto heap = reader.findMapping(0x7f0000000800);
  ASSERT_TRUE(heap.has_value());
  EXPECT_EQ(heap->name, "[heap]");
  EXPECT_FALSE(reader.findMapping(0x500000).has_value());
}

TEST_F(MockProcfsTest, ChecksAddressIsReadable) {
  writeMaps(
      "00400000-00401000 r--p 00000000 08:01 100 /usr/bin/python3.11\n"
      "00401000-00402000 ---p 00000000 00:00 0\n"
      "7f0000000000-7f0000100000 rw-p 00000000 00:00 0 [heap]\n");
  ProcessMemoryReader reader(kPid, rootDir_.string());

  EXPECT_TRUE(reader.isReadableAddress(0x400010));
  EXPECT_TRUE(reader.isReadableAddress(0x7f00000fffff));
  EXPECT_FALSE(reader.isReadableAddress(0x401000));
  EXPECT_FALSE(reader.isReadableAddress(0x500000));
}

TEST_F(MockProcfsTest, StopsWhenCallbackBreaks) {
  writeMaps(
      "00400000-00401000 r-xp 00000000 08:01 100 /usr/bin/python3.9\n"
      "00601000-00602000 rw-p 00001000 08:01 100 /usr/bin/python3.9\n");
  ProcessMemoryReader reader(kPid, rootDir_.string());

  size_t visited = 0;
  EXPECT_TRUE(reader.iterateAllMemoryMappings([&](const MemoryMapping&) {
    ++visited;
    return IterControl::BREAK;
  }));
  EXPECT_EQ(visited, 1u);
}

TEST_F(MockProcfsTest, MalformedMapsFail) {
  writeMaps("not a mapping\n");
  ProcessMemoryReader reader(kPid, rootDir_.string());
  EXPECT_FALSE(reader.iterateAllMemoryMappings(
      [](const MemoryMapping&) { return IterControl::CONTINUE; }));
}

TEST_F(MockProcfsTest, MissingProcessIsNotAlive) {
  ProcessMemoryReader reader(kPid + 1, rootDir_.string());
  EXPECT_FALSE(reader.isAlive());
  EXPECT_FALSE(reader.iterateAllMemoryMappings(
      [](const MemoryMapping&) { return IterControl::CONTINUE; }));
}

} // namespace pyremote::pid_info
