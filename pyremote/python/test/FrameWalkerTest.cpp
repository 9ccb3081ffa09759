// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <vector>

#include "pyremote/python/include/FrameWalker.h"
#include "pyremote/python/layouts/PyLayouts.h"
#include "pyremote/python/test/FakeAddressSpace.h"
#include "pyremote/python/test/FakePython.h"

namespace pyremote::python {

using fake::FakeAddressSpace;
using fake::FakePython;

// Line table mapping byte offsets [4, 12) to the first line + 2.
static std::vector<uint8_t> plusTwoFromOffsetFour(LineTableFormat format) {
  switch (format) {
    case LineTableFormat::Lnotab:
    case LineTableFormat::LnotabSigned:
      return {4, 2};
    case LineTableFormat::Linetable310:
      return {4, 1, 8, 1};
    case LineTableFormat::LocationTable311:
      return {0xE9, 0x02, 0xEB, 0x02};
  }
  return {};
}

static std::vector<std::string> functionNames(const CallStack& stack) {
  std::vector<std::string> names;
  for (const auto& frame : stack.frames) {
    names.push_back(frame.functionName);
  }
  return names;
}

class FrameWalkerTest : public ::testing::TestWithParam<PyLayoutId> {
 protected:
  FrameWalkerTest()
      : layout_(getLayout(GetParam())),
        python_(layout_, memory_),
        reader_(layout_, memory_, options_),
        walker_(reader_) {}

  static ThreadStateHandle threadAt(Address frame) {
    ThreadStateHandle thread;
    thread.address = 0x1000;
    thread.threadId = 42;
    thread.frame = frame;
    return thread;
  }

  // main -> foo -> bar, returns the innermost frame.
  Address threeFrames() {
    Address entry = python_.frame(python_.code("main", "app.py", 1), 0);
    Address foo = python_.frame(python_.code("foo", "lib.py", 10), entry);
    return python_.frame(python_.code("bar", "lib.py", 20), foo);
  }

  const LayoutDescriptor& layout_;
  FakeAddressSpace memory_;
  WalkerOptions options_;
  FakePython python_;
  FieldReader reader_;
  FrameWalker walker_;
};

TEST_P(FrameWalkerTest, WalksInnermostFirst) {
  auto stack = walker_.walk(threadAt(threeFrames()));

  EXPECT_EQ(stack.status, StackStatus::Complete);
  EXPECT_EQ(stack.threadId, 42u);
  EXPECT_EQ(stack.threadState, 0x1000u);
  ASSERT_EQ(stack.frames.size(), 3u);
  EXPECT_EQ(
      functionNames(stack), (std::vector<std::string>{"bar", "foo", "main"}));
  EXPECT_EQ(stack.frames[0].fileName, "lib.py");
  EXPECT_EQ(stack.frames[0].lineNumber, 20);
  EXPECT_EQ(stack.frames[1].lineNumber, 10);
  EXPECT_EQ(stack.frames[2].fileName, "app.py");
  EXPECT_EQ(stack.frames[2].lineNumber, 1);
  for (size_t ii = 0; ii < stack.frames.size(); ++ii) {
    EXPECT_EQ(stack.frames[ii].depth, ii);
    EXPECT_TRUE(stack.frames[ii].resolved);
  }
}

TEST_P(FrameWalkerTest, ResolvesLineFromInstructionOffset) {
  Address code = python_.code(
      "handler", "srv.py", 30, plusTwoFromOffsetFour(layout_.lineTableFormat));
  Address frame = python_.frame(code, 0, 6);

  auto handle = walker_.readFrame(frame);
  ASSERT_TRUE(handle.ok());
  EXPECT_EQ(handle->instructionOffset, 6);
  EXPECT_EQ(handle->code, code);

  auto stack = walker_.walk(threadAt(frame));
  ASSERT_EQ(stack.frames.size(), 1u);
  EXPECT_EQ(stack.frames[0].lineNumber, 32);
  EXPECT_EQ(stack.status, StackStatus::Complete);
}

TEST_P(FrameWalkerTest, NotStartedFrameIsOnFirstLine) {
  Address code = python_.code(
      "gen", "gen.py", 50, plusTwoFromOffsetFour(layout_.lineTableFormat));
  Address frame = python_.frame(code, 0, -1);

  auto handle = walker_.readFrame(frame);
  ASSERT_TRUE(handle.ok());
  EXPECT_LT(handle->instructionOffset, 0);

  auto stack = walker_.walk(threadAt(frame));
  ASSERT_EQ(stack.frames.size(), 1u);
  EXPECT_EQ(stack.frames[0].lineNumber, 50);
}

TEST_P(FrameWalkerTest, IdleThreadHasEmptyStack) {
  auto stack = walker_.walk(threadAt(0));
  EXPECT_TRUE(stack.frames.empty());
  EXPECT_EQ(stack.status, StackStatus::Complete);
}

TEST_P(FrameWalkerTest, StopsAtCycle) {
  Address code = python_.code("loop", "loop.py", 1);
  Address outer = python_.frame(code, 0);
  Address inner = python_.frame(code, outer);
  python_.setField(outer, Field::Frame_back, inner);

  auto stack = walker_.walk(threadAt(inner));
  EXPECT_EQ(stack.status, StackStatus::CycleDetected);
  EXPECT_EQ(stack.frames.size(), 2u);
}

TEST_P(FrameWalkerTest, TruncatesAtMaxDepth) {
  options_.maxStackDepth = 2;
  auto stack = walker_.walk(threadAt(threeFrames()));
  EXPECT_EQ(stack.status, StackStatus::DepthExceeded);
  EXPECT_EQ(functionNames(stack), (std::vector<std::string>{"bar", "foo"}));
}

TEST_P(FrameWalkerTest, ExactlyMaxDepthIsComplete) {
  options_.maxStackDepth = 3;
  auto stack = walker_.walk(threadAt(threeFrames()));
  EXPECT_EQ(stack.status, StackStatus::Complete);
  EXPECT_EQ(stack.frames.size(), 3u);
}

TEST_P(FrameWalkerTest, UnreadableFrameEndsWalk) {
  Address entry = python_.frame(python_.code("main", "app.py", 1), 0);
  Address foo = python_.frame(python_.code("foo", "app.py", 5), entry);
  memory_.unmap(entry);

  auto stack = walker_.walk(threadAt(foo));
  EXPECT_EQ(stack.status, StackStatus::Partial);
  EXPECT_EQ(functionNames(stack), (std::vector<std::string>{"foo"}));
}

TEST_P(FrameWalkerTest, UnreadableCodeGetsPlaceholder) {
  Address entry = python_.frame(python_.code("main", "app.py", 1), 0);
  Address lost = python_.code("lost", "app.py", 5);
  Address foo = python_.frame(lost, entry);
  memory_.unmap(lost);

  auto stack = walker_.walk(threadAt(foo));
  EXPECT_EQ(stack.status, StackStatus::Partial);
  ASSERT_EQ(stack.frames.size(), 2u);
  EXPECT_FALSE(stack.frames[0].resolved);
  EXPECT_EQ(stack.frames[0].functionName, "<unresolved>");
  EXPECT_EQ(stack.frames[0].fileName, "<unresolved>");
  EXPECT_EQ(stack.frames[0].lineNumber, 0);
  EXPECT_EQ(stack.frames[0].depth, 0u);
  EXPECT_TRUE(stack.frames[1].resolved);
  EXPECT_EQ(stack.frames[1].functionName, "main");
}

TEST_P(FrameWalkerTest, UnreadableNameIsSubstituted) {
  Address code = python_.code("f", "f.py", 3);
  python_.setField(code, Field::Code_name, 0x10);

  auto stack = walker_.walk(threadAt(python_.frame(code, 0)));
  EXPECT_EQ(stack.status, StackStatus::Partial);
  ASSERT_EQ(stack.frames.size(), 1u);
  EXPECT_TRUE(stack.frames[0].resolved);
  EXPECT_EQ(stack.frames[0].functionName, "<unresolved>");
  EXPECT_EQ(stack.frames[0].fileName, "f.py");
  EXPECT_EQ(stack.frames[0].lineNumber, 3);
}

TEST_P(FrameWalkerTest, UnavailableThreadFrameIsPartial) {
  auto thread = threadAt(0);
  thread.frameUnavailable = true;
  auto stack = walker_.walk(thread);
  EXPECT_TRUE(stack.frames.empty());
  EXPECT_EQ(stack.status, StackStatus::Partial);
}

TEST_P(FrameWalkerTest, CancelledWalkIsPartial) {
  std::atomic<bool> cancelled{true};
  FrameWalker walker(reader_, &cancelled);
  auto stack = walker.walk(threadAt(threeFrames()));
  EXPECT_TRUE(stack.frames.empty());
  EXPECT_EQ(stack.status, StackStatus::Partial);
}

TEST_P(FrameWalkerTest, MissingFieldThrows) {
  Address frame = threeFrames();
  LayoutDescriptor broken = layout_;
  broken.set(Field::Frame_code, FieldSpec{});
  FieldReader reader(broken, memory_, options_);
  FrameWalker walker(reader);

  EXPECT_THROW(walker.walk(threadAt(frame)), UnsupportedFieldError);
}

INSTANTIATE_TEST_SUITE_P(
    AllLayouts,
    FrameWalkerTest,
    ::testing::Values(
        PyLayoutId::Py33,
        PyLayoutId::Py36,
        PyLayoutId::Py39,
        PyLayoutId::Py310,
        PyLayoutId::Py311),
    [](const ::testing::TestParamInfo<PyLayoutId>& info) {
      std::string name = layoutName(info.param);
      for (auto& c : name) {
        if (c == '-') {
          c = '_';
        }
      }
      return name;
    });

TEST(FrameWalkerStatusTest, StatusNames) {
  EXPECT_STREQ(stackStatusName(StackStatus::Complete), "Complete");
  EXPECT_STREQ(stackStatusName(StackStatus::Partial), "Partial");
  EXPECT_STREQ(stackStatusName(StackStatus::CycleDetected), "CycleDetected");
  EXPECT_STREQ(stackStatusName(StackStatus::DepthExceeded), "DepthExceeded");
}

} // namespace pyremote::python
