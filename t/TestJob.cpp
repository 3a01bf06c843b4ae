/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "TestUtil.hpp"

#include "jobq/errors.hpp"
#include "jobq/job.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace jobq;

static const State kAllStates[] = {
    State::Scheduled, State::Queued, State::Running, State::Canceling,
    State::Canceled, State::Completed, State::Failed,
};

TEST(JobState, TerminalStates)
{
    EXPECT_FALSE(isTerminal(State::Scheduled));
    EXPECT_FALSE(isTerminal(State::Queued));
    EXPECT_FALSE(isTerminal(State::Running));
    EXPECT_FALSE(isTerminal(State::Canceling));
    EXPECT_TRUE(isTerminal(State::Canceled));
    EXPECT_TRUE(isTerminal(State::Completed));
    EXPECT_TRUE(isTerminal(State::Failed));
}

TEST(JobState, NoTransitionOutOfTerminalState)
{
    for (State from : {State::Canceled, State::Completed, State::Failed}) {
        for (State to : kAllStates) {
            EXPECT_FALSE(canTransition(from, to))
                << stateToString(from) << " -> " << stateToString(to);
        }
    }
}

TEST(JobState, Transitions)
{
    EXPECT_TRUE(canTransition(State::Scheduled, State::Queued));
    EXPECT_TRUE(canTransition(State::Queued, State::Running));
    EXPECT_TRUE(canTransition(State::Queued, State::Canceled));
    EXPECT_TRUE(canTransition(State::Running, State::Completed));
    EXPECT_TRUE(canTransition(State::Running, State::Failed));
    EXPECT_TRUE(canTransition(State::Running, State::Canceling));
    EXPECT_TRUE(canTransition(State::Canceling, State::Canceled));
    EXPECT_TRUE(canTransition(State::Canceling, State::Completed));
    EXPECT_TRUE(canTransition(State::Canceling, State::Failed));

    EXPECT_FALSE(canTransition(State::Queued, State::Completed));
    EXPECT_FALSE(canTransition(State::Scheduled, State::Running));
    EXPECT_FALSE(canTransition(State::Canceling, State::Running));
    EXPECT_FALSE(canTransition(State::Queued, State::Canceling));
}

TEST(JobState, Names)
{
    for (State state : kAllStates) {
        auto parsed = stateFromString(stateToString(state));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, state);
    }
    EXPECT_FALSE(stateFromString("running").has_value());
    EXPECT_FALSE(stateFromString("").has_value());
}

TEST(Job, SummaryMergesMetadata)
{
    Job job;
    job.id = "abc";
    job.state = State::Running;
    job.percentage_progress = 0.25;
    job.cancellable = true;
    job.extra_metadata = {{"type", "DISKIMPORT"}, {"channel_id", "c1"}, {"started_by", 7}};

    auto summary = job.summary();
    EXPECT_EQ(summary["id"], "abc");
    EXPECT_EQ(summary["status"], "RUNNING");
    EXPECT_DOUBLE_EQ(summary["percentage"].get<double>(), 0.25);
    EXPECT_EQ(summary["cancellable"], true);
    EXPECT_EQ(summary["exception"], "");
    EXPECT_EQ(summary["traceback"], "");
    EXPECT_EQ(summary["type"], "DISKIMPORT");
    EXPECT_EQ(summary["channel_id"], "c1");
    EXPECT_EQ(summary["started_by"], 7);
}

TEST(Job, EmptySummary)
{
    auto summary = emptySummary();
    EXPECT_EQ(summary["status"], "SCHEDULED");
    EXPECT_EQ(summary["percentage"], 0);
    EXPECT_TRUE(summary["id"].is_null());
    EXPECT_TRUE(summary["type"].is_null());
    EXPECT_EQ(summary["cancellable"], false);
}

TEST(Job, RecordKeepsAllFields)
{
    Job job;
    job.id = "1_2_3";
    job.sequence = 42;
    job.function = "copy";
    job.args = {"/src", "/dst"};
    job.kwargs = {{"node_ids", {"a", "b"}}};
    job.state = State::Failed;
    job.percentage_progress = 0.5;
    job.cancellable = true;
    job.track_progress = true;
    job.exception = "boom";
    job.traceback = "  #0 std::runtime_error: boom\n";
    job.extra_metadata = {{"type", "DISKEXPORT"}};
    job.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));

    Job copy = fromJson(toJson(job));
    EXPECT_EQ(copy.id, job.id);
    EXPECT_EQ(copy.sequence, 42u);
    EXPECT_EQ(copy.function, "copy");
    EXPECT_EQ(copy.args, job.args);
    EXPECT_EQ(copy.kwargs, job.kwargs);
    EXPECT_EQ(copy.state, State::Failed);
    EXPECT_DOUBLE_EQ(copy.percentage_progress, 0.5);
    EXPECT_TRUE(copy.cancellable);
    EXPECT_TRUE(copy.track_progress);
    EXPECT_EQ(copy.exception, "boom");
    EXPECT_EQ(copy.traceback, job.traceback);
    EXPECT_EQ(copy.extra_metadata, job.extra_metadata);
    EXPECT_EQ(copy.created_at, job.created_at);
}

TEST(Job, MalformedRecordIsStorageError)
{
    Job job;
    job.id = "x";
    job.function = "f";
    auto json = toJson(job);

    json["state"] = "EXPLODED";
    EXPECT_THROW((void)fromJson(json), StorageError);

    json.erase("state");
    EXPECT_THROW((void)fromJson(json), StorageError);
}

TEST(JobUpdate, ExpectedStates)
{
    JobUpdate update;
    EXPECT_TRUE(update.matches(State::Completed));

    update.expected = {State::Queued, State::Scheduled};
    EXPECT_TRUE(update.matches(State::Queued));
    EXPECT_TRUE(update.matches(State::Scheduled));
    EXPECT_FALSE(update.matches(State::Running));
}

TEST(JobUpdate, AppliesOnlyNamedFields)
{
    Job job;
    job.state = State::Running;
    job.percentage_progress = 0.3;
    job.exception = "kept";

    JobUpdate update;
    update.progress = 1.7;
    update.applyTo(job);

    EXPECT_EQ(job.state, State::Running);
    EXPECT_DOUBLE_EQ(job.percentage_progress, 1.0);
    EXPECT_EQ(job.exception, "kept");
}

TEST(JobId, GeneratedIdsAreUniqueAndValid)
{
    std::set<JobId> ids;
    for (int i = 0; i < 1000; ++i) {
        JobId id = generateJobId();
        EXPECT_TRUE(isValidJobId(id)) << id;
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST(JobId, Validation)
{
    EXPECT_TRUE(isValidJobId("abc-DEF_123.4"));
    EXPECT_FALSE(isValidJobId(""));
    EXPECT_FALSE(isValidJobId(".hidden"));
    EXPECT_FALSE(isValidJobId("../escape"));
    EXPECT_FALSE(isValidJobId("a/b"));
    EXPECT_FALSE(isValidJobId("with space"));
    EXPECT_FALSE(isValidJobId(std::string(200, 'a')));
}
