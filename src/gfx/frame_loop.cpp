/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <format>
#include <stdexcept>

#include "gfx/frame_loop.hpp"
#include "util/checks.hpp"
#include "util/log.hpp"

FrameLoop::FrameLoop(uint32_t slots) : states_(slots, SlotState::Idle) {
    if (slots == 0) {
        throw std::invalid_argument("FrameLoop needs at least one slot");
    }
}

void FrameLoop::reset(uint32_t image_count) { images_in_flight_.assign(image_count, kNoSlot); }

bool FrameLoop::recreate(FrameDriver &drv) {
    std::optional<uint32_t> n = drv.recreate_swapchain();
    if (!n) {
        // Old chain is still alive, so its ownership records stay valid.
        return false;
    }
    reset(*n);
    return true;
}

FrameOutcome FrameLoop::render(FrameDriver &drv, bool resize_requested, bool recreate_on_suboptimal) {
    const uint32_t f = frame_;

    states_[f] = SlotState::Acquiring;
    drv.wait_for_slot(f);

    const AcquireResult acq = drv.acquire_image(f);
    if (acq.status == AcquireStatus::OutOfDate) {
        states_[f] = SlotState::Idle;
        recreate(drv);
        return FrameOutcome::SkippedOutOfDate;
    }
    if (acq.image_index >= images_in_flight_.size()) {
        states_[f] = SlotState::Idle;
        throw GfxError(ErrorKind::Vulkan,
                       std::format("acquired image {} but the swapchain has {}", acq.image_index,
                                   images_in_flight_.size()));
    }
    if (acq.status == AcquireStatus::Suboptimal) {
        log_debug("acquire reported a suboptimal swapchain; rendering anyway");
    }

    const uint32_t img = acq.image_index;
    const uint32_t owner = images_in_flight_[img];
    if (owner != kNoSlot && owner != f) {
        drv.wait_for_slot(owner);
    }
    images_in_flight_[img] = f;

    drv.prepare_image(f, img);
    drv.submit(f, img);
    states_[f] = SlotState::Submitted;

    const PresentStatus ps = drv.present(f, img);
    states_[f] = SlotState::Presenting;

    FrameOutcome outcome = FrameOutcome::Presented;
    if (ps == PresentStatus::OutOfDate || (ps == PresentStatus::Suboptimal && recreate_on_suboptimal) ||
        resize_requested) {
        outcome = recreate(drv) ? FrameOutcome::PresentedAndRecreated : FrameOutcome::PresentedRecreateDeferred;
    }
    states_[f] = SlotState::Idle;

    frame_ = (frame_ + 1) % slot_count();
    return outcome;
}
