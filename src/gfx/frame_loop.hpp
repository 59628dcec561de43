/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

enum class AcquireStatus { Success, Suboptimal, OutOfDate };
enum class PresentStatus { Success, Suboptimal, OutOfDate };

struct AcquireResult {
    AcquireStatus status = AcquireStatus::Success;
    uint32_t image_index = 0;
};

enum class FrameOutcome { Presented, PresentedAndRecreated, PresentedRecreateDeferred, SkippedOutOfDate };

// Acquiring: waiting on the slot fence or the acquire. Submitted: work queued, present in progress.
// Presenting: presented, swapchain invalidation being handled.
enum class SlotState { Idle, Acquiring, Submitted, Presenting };

// GPU side of one frame. App implements it over Vulkan; tests implement it over a simulated queue.
class FrameDriver {
public:
    virtual ~FrameDriver() = default;

    // Blocks until the slot's in-flight fence is signaled.
    virtual void wait_for_slot(uint32_t slot) = 0;
    virtual AcquireResult acquire_image(uint32_t slot) = 0;
    // Called once the image is known to be idle; per-image host data may be written here.
    virtual void prepare_image(uint32_t slot, uint32_t image) = 0;
    // Resets the slot's fence and submits the image's command buffer with it.
    virtual void submit(uint32_t slot, uint32_t image) = 0;
    virtual PresentStatus present(uint32_t slot, uint32_t image) = 0;
    // Returns the new image count, or nullopt if the rebuild had to be deferred.
    virtual std::optional<uint32_t> recreate_swapchain() = 0;
};

// Acquire / submit / present protocol for up to `slots` frames in flight.
class FrameLoop {
public:
    static constexpr uint32_t kNoSlot = UINT32_MAX;

    explicit FrameLoop(uint32_t slots);

    // Starts tracking a fresh swapchain with `image_count` images, none in flight.
    void reset(uint32_t image_count);

    FrameOutcome render(FrameDriver &drv, bool resize_requested, bool recreate_on_suboptimal);
    // Returns false if the driver deferred the rebuild.
    bool recreate(FrameDriver &drv);

    uint32_t slot_count() const { return static_cast<uint32_t>(states_.size()); }
    uint32_t current_slot() const { return frame_; }
    SlotState slot_state(uint32_t slot) const { return states_.at(slot); }

    uint32_t image_count() const { return static_cast<uint32_t>(images_in_flight_.size()); }
    // Slot whose fence last claimed the image, or kNoSlot.
    uint32_t image_owner(uint32_t image) const { return images_in_flight_.at(image); }

private:
    uint32_t frame_ = 0;
    std::vector<SlotState> states_;
    std::vector<uint32_t> images_in_flight_;
};
