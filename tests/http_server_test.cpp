#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>

#include "services/web_services/http/http_server.hpp"
#include "services/web_services/http/worker_pool.hpp"

namespace api = devinv::services::web_services::api;
namespace http = devinv::services::web_services::http;

TEST(WorkerPoolTest, RunsQueuedJobsBeforeStopping) {
  http::WorkerPool pool(3);
  pool.Start();

  std::atomic<int> done{0};
  for (int i = 0; i < 50; ++i) {
    ASSERT_TRUE(pool.Submit([&done] { ++done; }));
  }
  pool.Stop();

  EXPECT_EQ(done.load(), 50);
  EXPECT_FALSE(pool.Submit([] {}));
}

TEST(WorkerPoolTest, ThrowingJobDoesNotKillWorker) {
  http::WorkerPool pool(1);
  pool.Start();

  std::atomic<bool> ran{false};
  ASSERT_TRUE(pool.Submit([] { throw std::runtime_error("boom"); }));
  ASSERT_TRUE(pool.Submit([&ran] { ran = true; }));
  pool.Stop();

  EXPECT_TRUE(ran.load());
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
  http::WorkerPool pool(0);
  EXPECT_EQ(pool.Size(), 1u);
}

TEST(ResponseMailboxTest, LargeBodyArrivesIntact) {
  http::ResponseMailbox box;
  box.Open(7);

  std::string body = "[";
  while (body.size() < 96 * 1024) body += "{\"name\":\"router\",\"ip_address\":\"10.0.0.1\"},";
  body.back() = ']';

  ASSERT_TRUE(box.Put(7, api::HttpResponse{200, body}));
  EXPECT_EQ(box.Pending(), 1u);

  api::HttpResponse out;
  ASSERT_TRUE(box.Take(7, out));
  EXPECT_EQ(out.status, 200);
  EXPECT_EQ(out.body.size(), body.size());
  EXPECT_EQ(out.body, body);

  EXPECT_FALSE(box.Take(7, out));
  EXPECT_EQ(box.Pending(), 0u);
}

TEST(ResponseMailboxTest, ClosedConnectionDropsResponse) {
  http::ResponseMailbox box;
  box.Open(1);
  ASSERT_TRUE(box.Put(1, api::HttpResponse{201, "{}"}));
  box.Close(1);

  api::HttpResponse out;
  EXPECT_FALSE(box.Take(1, out));
  EXPECT_EQ(box.Pending(), 0u);

  EXPECT_FALSE(box.Put(1, api::HttpResponse{201, "{}"}));
  EXPECT_FALSE(box.Put(2, api::HttpResponse{200, "{}"}));
  EXPECT_EQ(box.Pending(), 0u);
}

TEST(ResponseMailboxTest, KeepsConnectionsApart) {
  http::ResponseMailbox box;
  box.Open(1);
  box.Open(2);
  ASSERT_TRUE(box.Put(2, api::HttpResponse{404, "{\"error\":\"Device not found\"}"}));

  api::HttpResponse out;
  EXPECT_FALSE(box.Take(1, out));
  ASSERT_TRUE(box.Take(2, out));
  EXPECT_EQ(out.status, 404);
}
