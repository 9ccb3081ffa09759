// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "pyremote/python/include/FieldReader.h"
#include "pyremote/python/layouts/PyLayouts.h"
#include "pyremote/python/test/FakeAddressSpace.h"
#include "pyremote/python/test/FakePython.h"

namespace pyremote::python {

using fake::FakeAddressSpace;
using fake::FakePython;

class FieldReaderTest : public ::testing::Test {
 protected:
  FieldReaderTest()
      : layout_(kPy39Layout),
        python_(layout_, memory_),
        reader_(layout_, memory_, options_) {}

  LayoutDescriptor layout_;
  FakeAddressSpace memory_;
  WalkerOptions options_;
  FakePython python_;
  FieldReader reader_;
};

TEST_F(FieldReaderTest, ReadsUnsignedAndPointerFields) {
  Address frame = python_.allocate(StructKind::Frame);
  Address thread = python_.thread(frame, 0x1234abcd);

  auto threadId = reader_.readUnsigned(thread, Field::ThreadState_thread_id);
  ASSERT_TRUE(threadId.ok());
  EXPECT_EQ(*threadId, 0x1234abcdu);

  auto value = reader_.readField(thread, Field::ThreadState_frame);
  ASSERT_TRUE(value.ok());
  ASSERT_TRUE(std::holds_alternative<uint64_t>(*value));
  EXPECT_EQ(std::get<uint64_t>(*value), frame);
}

TEST_F(FieldReaderTest, SignExtendsSignedFields) {
  Address code = python_.code("f", "f.py", 1);
  Address frame = python_.frame(code, 0, -1);

  auto value = reader_.readField(frame, Field::Frame_lasti);
  ASSERT_TRUE(value.ok());
  ASSERT_TRUE(std::holds_alternative<int64_t>(*value));
  EXPECT_EQ(std::get<int64_t>(*value), -1);

  EXPECT_EQ(*reader_.readSigned(frame, Field::Frame_lasti), -1);
  auto asUnsigned = reader_.readUnsigned(frame, Field::Frame_lasti);
  ASSERT_FALSE(asUnsigned.ok());
  EXPECT_EQ(asUnsigned.error(), ReadError::OutOfRange);
}

TEST_F(FieldReaderTest, ExtractsBitFlags) {
  Address str = python_.compactString(U"été", 2);

  EXPECT_EQ(*reader_.readUnsigned(str, Field::String_state_kind), 2u);
  EXPECT_EQ(*reader_.readUnsigned(str, Field::String_state_compact), 1u);
  EXPECT_EQ(*reader_.readUnsigned(str, Field::String_state_ascii), 0u);
  EXPECT_EQ(*reader_.readUnsigned(str, Field::String_state_ready), 1u);
  EXPECT_EQ(*reader_.readUnsigned(str, Field::String_state_interned), 0u);
}

TEST_F(FieldReaderTest, DecodesStringFields) {
  Address code = python_.code("handle_request", "/srv/app.py", 12);

  auto value = reader_.readField(code, Field::Code_name);
  ASSERT_TRUE(value.ok());
  ASSERT_TRUE(std::holds_alternative<std::string>(*value));
  EXPECT_EQ(std::get<std::string>(*value), "handle_request");
}

TEST_F(FieldReaderTest, ReadsCharArrays) {
  layout_.set(Field::Code_code_adaptive, charArrayAt(16, 4));
  Address obj = memory_.allocate(32);
  const uint8_t data[] = {'a', 'b', 0, 'c'};
  memory_.write(obj + 16, data, sizeof(data));

  auto value = reader_.readField(obj, Field::Code_code_adaptive);
  ASSERT_TRUE(value.ok());
  ASSERT_TRUE(std::holds_alternative<std::vector<uint8_t>>(*value));
  EXPECT_EQ(
      std::get<std::vector<uint8_t>>(*value),
      (std::vector<uint8_t>{'a', 'b', 0, 'c'}));
}

TEST_F(FieldReaderTest, InlineDataYieldsAddress) {
  Address bytes = python_.bytes({1, 2, 3});
  auto value = reader_.readUnsigned(bytes, Field::Bytes_data);
  ASSERT_TRUE(value.ok());
  EXPECT_EQ(*value, bytes + 32);
}

TEST_F(FieldReaderTest, ReportsUnsupportedFields) {
  Address thread = python_.thread(0, 1);
  auto value = reader_.readField(thread, Field::ThreadState_cframe);
  ASSERT_FALSE(value.ok());
  EXPECT_EQ(value.error(), ReadError::UnsupportedField);

  auto snapshot = reader_.readStruct(thread, StructKind::CFrame);
  ASSERT_FALSE(snapshot.ok());
  EXPECT_EQ(snapshot.error(), ReadError::UnsupportedField);
}

TEST_F(FieldReaderTest, ReportsUnmappedAddresses) {
  EXPECT_EQ(
      reader_.readField(0, Field::Frame_back).error(), ReadError::Unmapped);
  EXPECT_EQ(
      reader_.readField(0x10, Field::Frame_back).error(), ReadError::Unmapped);

  Address frame = python_.allocate(StructKind::Frame);
  ASSERT_TRUE(reader_.readField(frame, Field::Frame_back).ok());
  memory_.unmap(frame);
  EXPECT_EQ(
      reader_.readField(frame, Field::Frame_back).error(),
      ReadError::Unmapped);
}

TEST_F(FieldReaderTest, ShortReadIsOutOfRange) {
  // Frame_code is 8 bytes at offset 32, only 4 of them are mapped.
  Address frame = memory_.allocate(36);
  auto value = reader_.readField(frame, Field::Frame_code);
  ASSERT_FALSE(value.ok());
  EXPECT_EQ(value.error(), ReadError::OutOfRange);

  auto snapshot = reader_.readStruct(frame, StructKind::Frame);
  ASSERT_FALSE(snapshot.ok());
  EXPECT_EQ(snapshot.error(), ReadError::OutOfRange);
}

TEST_F(FieldReaderTest, SnapshotReadsStructureOnce) {
  Address frame = python_.allocate(StructKind::Frame);
  Address thread = python_.thread(frame, 77);

  const size_t before = memory_.readCount();
  auto snapshot = reader_.readStruct(thread, StructKind::ThreadState);
  ASSERT_TRUE(snapshot.ok());
  EXPECT_EQ(memory_.readCount(), before + 1);

  EXPECT_EQ(snapshot->address(), thread);
  EXPECT_EQ(*snapshot->getUnsigned(Field::ThreadState_thread_id), 77u);
  EXPECT_EQ(*snapshot->getPointer(Field::ThreadState_frame), frame);
  EXPECT_EQ(*snapshot->getPointer(Field::ThreadState_next), 0u);
  EXPECT_EQ(memory_.readCount(), before + 1);

  // Fields of other structures are not part of the snapshot.
  EXPECT_EQ(
      snapshot->getUnsigned(Field::Frame_back).error(), ReadError::OutOfRange);
}

TEST_F(FieldReaderTest, SnapshotSignExtends) {
  Address code = python_.code("f", "f.py", -5);
  auto snapshot = reader_.readStruct(code, StructKind::Code);
  ASSERT_TRUE(snapshot.ok());
  EXPECT_EQ(*snapshot->getSigned(Field::Code_firstlineno), -5);
  EXPECT_EQ(
      snapshot->getUnsigned(Field::Code_firstlineno).error(),
      ReadError::OutOfRange);
}

TEST_F(FieldReaderTest, RawReadsAreBounded) {
  const size_t before = memory_.readCount();
  auto raw =
      reader_.readRaw(FakeAddressSpace::kBaseAddress, kMaxRawReadSize + 1);
  ASSERT_FALSE(raw.ok());
  EXPECT_EQ(raw.error(), ReadError::OutOfRange);
  EXPECT_EQ(memory_.readCount(), before);

  Address blob = memory_.allocate(3);
  memory_.write(blob, "xyz", 3);
  auto ok = reader_.readRaw(blob, 3);
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(*ok, (std::vector<uint8_t>{'x', 'y', 'z'}));
}

} // namespace pyremote::python
