#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "core/event_queue.h"

using namespace dscope;

namespace
{
InputEvent KeyPress(Key k)
{
    return MakeEvent(KeyDown{k, Modifiers{}, false});
}

InputEvent KeyRelease(Key k)
{
    return MakeEvent(KeyUp{k, Modifiers{}});
}

InputEvent Move(float x, float y)
{
    return MakeEvent(PointerMove{x, y});
}

InputEvent Button(PointerButton b, bool pressed)
{
    PointerButtonEvent e;
    e.button = b;
    e.pressed = pressed;
    return MakeEvent(e);
}
} // namespace

TEST(EventQueue, DrainReturnsEventsInPushOrderWithIncreasingSeq)
{
    EventQueue q(16);
    q.Push(Move(1, 1));
    q.Push(KeyPress(Key::A));
    q.Push(MakeEvent(TextInput{"a"}));
    q.Push(KeyRelease(Key::A));

    const std::vector<InputEvent> out = q.Drain();
    ASSERT_EQ(out.size(), 4u);
    EXPECT_NE(out[0].As<PointerMove>(), nullptr);
    EXPECT_NE(out[1].As<KeyDown>(), nullptr);
    EXPECT_NE(out[2].As<TextInput>(), nullptr);
    EXPECT_NE(out[3].As<KeyUp>(), nullptr);
    for (size_t i = 1; i < out.size(); ++i)
        EXPECT_GT(out[i].seq, out[i - 1].seq);

    EXPECT_EQ(q.Size(), 0u);
    EXPECT_TRUE(q.Drain().empty());
}

TEST(EventQueue, SequenceNumbersAreNeverReusedAcrossDrains)
{
    EventQueue q(4);
    const std::uint64_t a = q.Push(Move(0, 0));
    (void)q.Drain();
    const std::uint64_t b = q.Push(Move(0, 0));
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
}

TEST(EventQueue, CapacityIsClampedToMinimum)
{
    EventQueue q(0);
    EXPECT_EQ(q.Capacity(), EventQueue::kMinCapacity);
}

TEST(EventQueue, CapacityTwoKeepsKeyPairOverPointerMove)
{
    EventQueue q(2);
    q.Push(KeyPress(Key::A));
    q.Push(Move(5, 5));
    q.Push(KeyRelease(Key::A));

    const std::vector<InputEvent> out = q.Drain();
    ASSERT_EQ(out.size(), 2u);
    ASSERT_NE(out[0].As<KeyDown>(), nullptr);
    ASSERT_NE(out[1].As<KeyUp>(), nullptr);
    EXPECT_EQ(out[0].seq, 1u);
    EXPECT_EQ(out[1].seq, 3u);
    EXPECT_EQ(q.DroppedCount(), 1u);
    EXPECT_EQ(q.ForcedDropCount(), 0u);
}

TEST(EventQueue, OverflowEvictsOldestNonPressReleaseFirst)
{
    EventQueue q(3);
    q.Push(Move(1, 0));                            // seq 1
    q.Push(Button(PointerButton::Left, true));     // seq 2
    q.Push(Move(2, 0));                            // seq 3
    q.Push(Button(PointerButton::Left, false));    // seq 4 -> evicts seq 1

    const std::vector<InputEvent> out = q.Drain();
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].seq, 2u);
    EXPECT_EQ(out[1].seq, 3u);
    EXPECT_EQ(out[2].seq, 4u);
    EXPECT_EQ(q.DroppedCount(), 1u);
}

TEST(EventQueue, OverflowEvictsOldestCompletePairAsUnit)
{
    EventQueue q(4);
    q.Push(KeyPress(Key::A));   // 1
    q.Push(KeyRelease(Key::A)); // 2
    q.Push(KeyPress(Key::B));   // 3
    q.Push(KeyRelease(Key::B)); // 4
    q.Push(KeyPress(Key::C));   // 5 -> evicts pair (1, 2)

    const std::vector<InputEvent> out = q.Drain();
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].seq, 3u);
    EXPECT_EQ(out[1].seq, 4u);
    EXPECT_EQ(out[2].seq, 5u);
    EXPECT_EQ(q.DroppedCount(), 2u);
    EXPECT_EQ(q.ForcedDropCount(), 0u);
}

TEST(EventQueue, PairMatchingRespectsKeyIdentity)
{
    EventQueue q(3);
    q.Push(KeyPress(Key::A));   // 1 (never released)
    q.Push(KeyPress(Key::B));   // 2
    q.Push(KeyRelease(Key::B)); // 3
    q.Push(KeyRelease(Key::A)); // 4 -> evicts pair (2, 3)

    const std::vector<InputEvent> out = q.Drain();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].seq, 1u);
    EXPECT_EQ(out[1].seq, 4u);
}

TEST(EventQueue, ForcedDropWhenNoCompletePairExists)
{
    EventQueue q(2);
    q.Push(KeyPress(Key::A)); // 1
    q.Push(KeyPress(Key::B)); // 2
    q.Push(KeyPress(Key::C)); // 3 -> forced pop of 1

    const std::vector<InputEvent> out = q.Drain();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].seq, 2u);
    EXPECT_EQ(out[1].seq, 3u);
    EXPECT_EQ(q.DroppedCount(), 1u);
    EXPECT_EQ(q.ForcedDropCount(), 1u);
}

TEST(EventQueue, ConcurrentProducersKeepStrictOrder)
{
    EventQueue q(100000);
    constexpr int kPerThread = 2000;

    std::thread t1([&] {
        for (int i = 0; i < kPerThread; ++i)
            q.Push(Move((float)i, 0));
    });
    std::thread t2([&] {
        for (int i = 0; i < kPerThread; ++i)
            q.Push(MakeEvent(Scroll{0.0f, 1.0f}));
    });
    t1.join();
    t2.join();

    const std::vector<InputEvent> out = q.Drain();
    ASSERT_EQ(out.size(), (size_t)(2 * kPerThread));
    for (size_t i = 1; i < out.size(); ++i)
        ASSERT_GT(out[i].seq, out[i - 1].seq);
    EXPECT_EQ(q.DroppedCount(), 0u);
}
