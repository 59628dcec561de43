/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <vector>

#include "gfx/frame_loop.hpp"
#include "gfx/frame_resources.hpp"
#include "util/checks.hpp"

namespace {

constexpr uint32_t kSlots = 2;

// Simulated GPU: a submitted fence stays unsignaled until someone waits on it.
class FakeGpu : public FrameDriver {
public:
    explicit FakeGpu(uint32_t images) : image_count(images), image_fence(images, -1) {}

    void wait_for_slot(uint32_t slot) override {
        waits.push_back(slot);
        fence_signaled[slot] = true;
    }

    AcquireResult acquire_image(uint32_t slot) override {
        (void)slot;
        AcquireResult r{};
        if (!acquire_script.empty()) {
            r.status = acquire_script.front();
            acquire_script.pop_front();
        }
        if (!image_script.empty()) {
            r.image_index = image_script.front();
            image_script.pop_front();
        } else {
            r.image_index = next_image;
            next_image = (next_image + 1) % image_count;
        }
        return r;
    }

    void prepare_image(uint32_t slot, uint32_t image) override {
        (void)slot;
        prepares++;
        const int owner = image_fence.at(image);
        if (owner >= 0) {
            EXPECT_TRUE(fence_signaled[owner]) << "image " << image << " written while still in flight";
        }
    }

    void submit(uint32_t slot, uint32_t image) override {
        EXPECT_TRUE(fence_signaled[slot]) << "slot " << slot << " reset before its fence signaled";
        fence_signaled[slot] = false;
        image_fence.at(image) = static_cast<int>(slot);
        submits++;

        const auto outstanding = std::count(fence_signaled.begin(), fence_signaled.end(), false);
        max_outstanding = std::max<long>(max_outstanding, outstanding);
    }

    PresentStatus present(uint32_t slot, uint32_t image) override {
        (void)image;
        presents++;
        if (loop) {
            states_seen_at_present.push_back(loop->slot_state(slot));
        }
        if (!present_script.empty()) {
            PresentStatus s = present_script.front();
            present_script.pop_front();
            return s;
        }
        return PresentStatus::Success;
    }

    std::optional<uint32_t> recreate_swapchain() override {
        recreates++;
        if (loop) {
            states_seen_at_recreate.push_back(loop->slot_state(loop->current_slot()));
        }
        if (defer_recreate) {
            return std::nullopt;
        }
        // Device wait-idle: every fence completes.
        std::fill(fence_signaled.begin(), fence_signaled.end(), true);
        image_count = recreate_image_count;
        image_fence.assign(image_count, -1);
        next_image = 0;
        framebuffers = image_count;
        per_image_sets = image_count;
        check_swapchain_bundle(image_count, framebuffers, per_image_sets);
        return image_count;
    }

    uint32_t image_count;
    uint32_t framebuffers = 0;
    uint32_t per_image_sets = 0;
    uint32_t recreate_image_count = 3;
    bool defer_recreate = false;

    std::vector<bool> fence_signaled = std::vector<bool>(kSlots, true);
    std::vector<int> image_fence;
    uint32_t next_image = 0;

    std::deque<AcquireStatus> acquire_script;
    std::deque<uint32_t> image_script;
    std::deque<PresentStatus> present_script;

    const FrameLoop *loop = nullptr;
    std::vector<SlotState> states_seen_at_present;
    std::vector<SlotState> states_seen_at_recreate;

    std::vector<uint32_t> waits;
    int prepares = 0;
    int submits = 0;
    int presents = 0;
    int recreates = 0;
    long max_outstanding = 0;
};

struct Harness {
    explicit Harness(uint32_t images) : gpu(images), loop(kSlots) {
        loop.reset(images);
        gpu.loop = &loop;
    }

    FrameOutcome frame(bool resize = false, bool recreate_on_suboptimal = true) {
        return loop.render(gpu, resize, recreate_on_suboptimal);
    }

    FakeGpu gpu;
    FrameLoop loop;
};

} // namespace

//=============================================================================
// Steady state
//=============================================================================

TEST(FrameLoopTest, CounterCyclesThroughSlots) {
    Harness h(3);
    EXPECT_EQ(h.loop.current_slot(), 0u);
    EXPECT_EQ(h.frame(), FrameOutcome::Presented);
    EXPECT_EQ(h.loop.current_slot(), 1u);
    EXPECT_EQ(h.frame(), FrameOutcome::Presented);
    EXPECT_EQ(h.loop.current_slot(), 0u);
    EXPECT_EQ(h.gpu.submits, 2);
    EXPECT_EQ(h.gpu.presents, 2);
}

TEST(FrameLoopTest, AtMostTwoFramesOutstanding) {
    Harness h(3);
    for (int i = 0; i < 100; i++) {
        h.frame();
    }
    EXPECT_EQ(h.gpu.submits, 100);
    EXPECT_EQ(h.gpu.max_outstanding, 2);
}

TEST(FrameLoopTest, SlotsReturnToIdle) {
    Harness h(3);
    h.frame();
    for (uint32_t s = 0; s < kSlots; s++) {
        EXPECT_EQ(h.loop.slot_state(s), SlotState::Idle);
    }
}

TEST(FrameLoopTest, SlotStateFollowsFrameProgress) {
    Harness h(3);
    h.gpu.present_script = {PresentStatus::OutOfDate};
    h.frame();
    h.gpu.acquire_script = {AcquireStatus::OutOfDate};
    h.frame();

    EXPECT_EQ(h.gpu.states_seen_at_present, (std::vector<SlotState>{SlotState::Submitted}));
    EXPECT_EQ(h.gpu.states_seen_at_recreate, (std::vector<SlotState>{SlotState::Presenting, SlotState::Idle}));
}

TEST(FrameLoopTest, RecordsImageOwner) {
    Harness h(3);
    h.frame();
    h.frame();
    EXPECT_EQ(h.loop.image_owner(0), 0u);
    EXPECT_EQ(h.loop.image_owner(1), 1u);
    EXPECT_EQ(h.loop.image_owner(2), FrameLoop::kNoSlot);
}

//=============================================================================
// Image reuse
//=============================================================================

TEST(FrameLoopTest, ReusedImageWaitsForOwningSlot) {
    // Single-image chain: frame 1 gets the image frame 0 is still rendering to.
    Harness h(1);
    h.frame();
    h.frame();
    EXPECT_EQ(h.gpu.waits, (std::vector<uint32_t>{0, 1, 0}));
    EXPECT_EQ(h.loop.image_owner(0), 1u);
}

TEST(FrameLoopTest, OwnImageNeedsNoSecondWait) {
    Harness h(3);
    h.gpu.image_script = {0, 1, 0};
    h.frame();
    h.frame();
    h.frame();
    EXPECT_EQ(h.gpu.waits, (std::vector<uint32_t>{0, 1, 0}));
}

TEST(FrameLoopTest, OutOfOrderAcquireNeverTouchesBusyImage) {
    Harness h(3);
    h.gpu.image_script = {2, 0, 2, 1, 1, 0, 2, 2, 0, 1};
    for (int i = 0; i < 10; i++) {
        h.frame();
    }
    EXPECT_EQ(h.gpu.prepares, 10);
}

//=============================================================================
// Invalidation
//=============================================================================

TEST(FrameLoopTest, OutOfDateAcquireRecreatesOnceWithoutSubmit) {
    Harness h(3);
    h.frame();
    const int submits = h.gpu.submits;
    const int presents = h.gpu.presents;

    h.gpu.recreate_image_count = 4;
    h.gpu.acquire_script = {AcquireStatus::OutOfDate};
    EXPECT_EQ(h.frame(), FrameOutcome::SkippedOutOfDate);

    EXPECT_EQ(h.gpu.recreates, 1);
    EXPECT_EQ(h.gpu.submits, submits);
    EXPECT_EQ(h.gpu.presents, presents);
    EXPECT_EQ(h.loop.current_slot(), 1u);
    ASSERT_EQ(h.loop.image_count(), 4u);
    for (uint32_t i = 0; i < 4; i++) {
        EXPECT_EQ(h.loop.image_owner(i), FrameLoop::kNoSlot);
    }
}

TEST(FrameLoopTest, SuboptimalAcquireStillRenders) {
    Harness h(3);
    h.gpu.acquire_script = {AcquireStatus::Suboptimal};
    EXPECT_EQ(h.frame(), FrameOutcome::Presented);
    EXPECT_EQ(h.gpu.submits, 1);
    EXPECT_EQ(h.gpu.recreates, 0);
}

TEST(FrameLoopTest, OutOfDatePresentRecreatesAndAdvances) {
    Harness h(3);
    h.gpu.present_script = {PresentStatus::OutOfDate};
    EXPECT_EQ(h.frame(), FrameOutcome::PresentedAndRecreated);
    EXPECT_EQ(h.gpu.recreates, 1);
    EXPECT_EQ(h.loop.current_slot(), 1u);
}

TEST(FrameLoopTest, SuboptimalPresentFollowsPolicy) {
    Harness on(3);
    on.gpu.present_script = {PresentStatus::Suboptimal};
    EXPECT_EQ(on.frame(false, true), FrameOutcome::PresentedAndRecreated);
    EXPECT_EQ(on.gpu.recreates, 1);

    Harness off(3);
    off.gpu.present_script = {PresentStatus::Suboptimal};
    EXPECT_EQ(off.frame(false, false), FrameOutcome::Presented);
    EXPECT_EQ(off.gpu.recreates, 0);
}

TEST(FrameLoopTest, ResizeRequestRecreatesAfterPresent) {
    Harness h(3);
    EXPECT_EQ(h.frame(true), FrameOutcome::PresentedAndRecreated);
    EXPECT_EQ(h.gpu.presents, 1);
    EXPECT_EQ(h.gpu.recreates, 1);
}

TEST(FrameLoopTest, BackToBackRecreationStaysUsable) {
    Harness h(3);
    h.frame();
    h.gpu.recreate_image_count = 2;
    EXPECT_TRUE(h.loop.recreate(h.gpu));
    h.gpu.recreate_image_count = 5;
    EXPECT_TRUE(h.loop.recreate(h.gpu));
    EXPECT_EQ(h.loop.image_count(), 5u);
    EXPECT_EQ(h.gpu.framebuffers, 5u);
    EXPECT_EQ(h.gpu.per_image_sets, 5u);

    for (int i = 0; i < 12; i++) {
        EXPECT_EQ(h.frame(), FrameOutcome::Presented);
    }
    EXPECT_LE(h.gpu.max_outstanding, 2);
}

TEST(FrameLoopTest, DeferredRecreationKeepsOwnership) {
    Harness h(3);
    h.frame();
    h.gpu.defer_recreate = true;
    h.gpu.acquire_script = {AcquireStatus::OutOfDate};
    EXPECT_EQ(h.frame(), FrameOutcome::SkippedOutOfDate);

    EXPECT_EQ(h.loop.image_count(), 3u);
    EXPECT_EQ(h.loop.image_owner(0), 0u);
    EXPECT_FALSE(h.loop.recreate(h.gpu));
}

TEST(FrameLoopTest, DeferredPresentRecreationIsReported) {
    Harness h(3);
    h.gpu.defer_recreate = true;
    EXPECT_EQ(h.frame(true), FrameOutcome::PresentedRecreateDeferred);
    EXPECT_EQ(h.gpu.recreates, 1);
    EXPECT_EQ(h.loop.current_slot(), 1u);
    EXPECT_EQ(h.loop.image_owner(0), 0u);
}

//=============================================================================
// Swapchain bundle
//=============================================================================

TEST(SwapchainBundleTest, MatchingCountsAccepted) { EXPECT_NO_THROW(check_swapchain_bundle(3, 3, 3)); }

TEST(SwapchainBundleTest, FramebufferMismatchRejected) {
    try {
        check_swapchain_bundle(3, 2, 3);
        FAIL() << "expected GfxError";
    } catch (const GfxError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::ResourceCreationFailed);
    }
}

TEST(SwapchainBundleTest, PerImageMismatchRejected) { EXPECT_THROW(check_swapchain_bundle(4, 4, 3), GfxError); }

TEST(SwapchainBundleTest, EmptyChainRejected) { EXPECT_THROW(check_swapchain_bundle(0, 0, 0), GfxError); }

//=============================================================================
// Misuse
//=============================================================================

TEST(FrameLoopTest, AcquiredIndexOutOfRangeThrows) {
    Harness h(3);
    h.gpu.image_script = {7};
    EXPECT_THROW(h.frame(), GfxError);
    EXPECT_EQ(h.gpu.submits, 0);
}

TEST(FrameLoopTest, NeedsAtLeastOneSlot) { EXPECT_THROW(FrameLoop(0), std::invalid_argument); }
