/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobq/context.hpp"
#include "jobq/errors.hpp"
#include "jobq/job.hpp"
#include "jobq/logger.hpp"
#include "jobq/storage.hpp"
#include <algorithm>

namespace jobq {

JobContext::JobContext(Storage& storage, const Job& job)
    : storage_(storage),
      id_(job.id),
      metadata_(job.extra_metadata),
      trackProgress_(job.track_progress),
      progress_(job.percentage_progress) {
}

void JobContext::updateProgress(double fraction) {
    if (!trackProgress_) {
        return;
    }

    double next = std::clamp(fraction, 0.0, 1.0);
    if (next <= progress_) {
        return;
    }

    JobUpdate update;
    update.progress = next;
    update.expected = {State::Running};
    if (storage_.update(id_, update)) {
        progress_ = next;
        LOG_TRACE("Job " + id_ + " progress " + std::to_string(next));
    }
}

void JobContext::updateProgress(double progress, double total) {
    if (total <= 0.0) {
        return;
    }
    updateProgress(progress / total);
}

bool JobContext::cancelRequested() {
    if (cancelObserved_.load()) {
        return true;
    }
    auto job = storage_.get(id_);
    if (job && job->state == State::Canceling) {
        cancelObserved_.store(true);
        LOG_DEBUG("Job " + id_ + " observed cancel request");
        return true;
    }
    return false;
}

void JobContext::checkForCancel() {
    if (cancelRequested()) {
        throw JobCancelled();
    }
}

}
