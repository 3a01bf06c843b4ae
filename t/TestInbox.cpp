/*
 * jobq - Background Job Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "TestUtil.hpp"

#include "jobq/inbox.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace jobq;
using jobq::test::TempDir;

namespace {

Request
submitRequest(const std::string& id)
{
    Request request;
    request.kind = RequestKind::Submit;
    request.jobId = id;
    request.function = "copy";
    request.args = {"/a", "/b"};
    request.kwargs = {{"overwrite", true}};
    request.cancellable = true;
    request.trackProgress = true;
    request.extraMetadata = {{"type", "DISKIMPORT"}};
    return request;
}

std::size_t
countFiles(const std::filesystem::path& dir)
{
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            ++count;
        }
    }
    return count;
}

}

TEST(Inbox, PostThenTake)
{
    TempDir dir;
    Inbox inbox(dir.path());
    ASSERT_TRUE(inbox.isReady());

    auto posted = inbox.post(submitRequest("job-7"));
    ASSERT_TRUE(posted) << posted.message;
    EXPECT_FALSE(posted.requestId.empty());
    EXPECT_EQ(inbox.pendingCount(), 1u);
    EXPECT_TRUE(std::filesystem::is_empty(dir.path() / "requests" / "writing"));

    auto paths = inbox.scan();
    ASSERT_EQ(paths.size(), 1u);
    auto request = inbox.take(paths[0]);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->kind, RequestKind::Submit);
    EXPECT_EQ(request->jobId, "job-7");
    EXPECT_EQ(request->function, "copy");
    EXPECT_EQ(request->args, nlohmann::json::array({"/a", "/b"}));
    EXPECT_EQ(request->kwargs["overwrite"], true);
    EXPECT_TRUE(request->cancellable);
    EXPECT_TRUE(request->trackProgress);
    EXPECT_EQ(request->extraMetadata["type"], "DISKIMPORT");

    EXPECT_EQ(inbox.pendingCount(), 0u);
    EXPECT_FALSE(inbox.take(paths[0]).has_value());
}

TEST(Inbox, ScanIsOldestFirst)
{
    TempDir dir;
    Inbox inbox(dir.path());

    std::vector<std::string> posted;
    for (int i = 0; i < 20; ++i) {
        Request request;
        request.kind = RequestKind::Cancel;
        request.jobId = "job-" + std::to_string(i);
        auto result = inbox.post(request);
        ASSERT_TRUE(result);
        posted.push_back(result.requestId);
    }

    auto paths = inbox.scan();
    ASSERT_EQ(paths.size(), posted.size());
    for (std::size_t i = 0; i < paths.size(); ++i) {
        EXPECT_EQ(paths[i].stem().string(), posted[i]);
        auto request = inbox.take(paths[i]);
        ASSERT_TRUE(request.has_value());
        EXPECT_EQ(request->jobId, "job-" + std::to_string(i));
    }
}

TEST(Inbox, PendingSubmitUntilTaken)
{
    TempDir dir;
    Inbox inbox(dir.path());
    EXPECT_FALSE(inbox.hasPendingSubmit("job-9"));

    Request cancel;
    cancel.kind = RequestKind::Cancel;
    cancel.jobId = "job-9";
    ASSERT_TRUE(inbox.post(cancel));
    EXPECT_FALSE(inbox.hasPendingSubmit("job-9"));

    ASSERT_TRUE(inbox.post(submitRequest("job-9")));
    EXPECT_TRUE(inbox.hasPendingSubmit("job-9"));
    EXPECT_FALSE(inbox.hasPendingSubmit("job-10"));

    // A staged request has not been published yet but is already on its way
    std::ofstream(dir.path() / "requests" / "writing" / "staged.json")
        << toJson(submitRequest("job-11")).dump();
    EXPECT_TRUE(inbox.hasPendingSubmit("job-11"));

    for (const auto& path : inbox.scan()) {
        (void)inbox.take(path);
    }
    EXPECT_FALSE(inbox.hasPendingSubmit("job-9"));
}

TEST(Inbox, MalformedRequestsAreRejected)
{
    TempDir dir;
    Inbox inbox(dir.path());
    auto ready = dir.path() / "requests" / "ready";

    std::ofstream(ready / "1.json") << "{ not json";
    std::ofstream(ready / "2.json") << R"({"kind":"explode","job_id":"x"})";
    std::ofstream(ready / "3.json") << R"({"kind":"cancel","job_id":"../etc"})";
    std::ofstream(ready / "4.json") << R"({"kind":"submit","job_id":"ok"})";

    for (const auto& path : inbox.scan()) {
        EXPECT_FALSE(inbox.take(path).has_value()) << path;
    }
    EXPECT_EQ(inbox.pendingCount(), 0u);
    EXPECT_EQ(countFiles(dir.path() / "requests" / "rejected"), 4u);
}

TEST(Inbox, MissingInboxIsNotCreatedOnRequest)
{
    TempDir dir;
    Inbox inbox(dir.path(), false);
    EXPECT_FALSE(inbox.isReady());
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "requests"));

    auto result = inbox.post(submitRequest("job-1"));
    EXPECT_FALSE(result);
    EXPECT_FALSE(result.message.empty());
    EXPECT_TRUE(inbox.scan().empty());

    Inbox created(dir.path());
    Inbox existing(dir.path(), false);
    EXPECT_TRUE(existing.isReady());
}

TEST(Request, KindNames)
{
    for (auto kind : {RequestKind::Submit, RequestKind::Cancel, RequestKind::Clear,
                      RequestKind::ClearAll, RequestKind::Empty}) {
        auto parsed = requestKindFromString(requestKindToString(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(requestKindFromString("purge").has_value());
}

TEST(Request, Validation)
{
    EXPECT_THROW((void)requestFromJson(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW((void)requestFromJson({{"job_id", "x"}}), std::invalid_argument);
    EXPECT_THROW((void)requestFromJson({{"kind", "clear"}}), std::invalid_argument);
    EXPECT_THROW((void)requestFromJson({{"kind", "submit"}, {"job_id", "x"}, {"function", "copy"},
                                        {"args", 3}}),
                 std::invalid_argument);
    EXPECT_THROW((void)requestFromJson({{"kind", "submit"}, {"job_id", "x"}, {"function", "copy"},
                                        {"extra_metadata", "DISKIMPORT"}}),
                 std::invalid_argument);

    auto clearAll = requestFromJson({{"kind", "clear_all"}});
    EXPECT_EQ(clearAll.kind, RequestKind::ClearAll);
    EXPECT_TRUE(clearAll.jobId.empty());

    auto empty = requestFromJson({{"kind", "empty"}});
    EXPECT_EQ(empty.kind, RequestKind::Empty);
}
