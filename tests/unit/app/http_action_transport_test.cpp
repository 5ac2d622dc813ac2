#include <slatewatch/app/action_dispatcher.hpp>
#include <slatewatch/app/config.hpp>
#include "support/local_http_server.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

namespace sa = slatewatch::app;
namespace sc = slatewatch::core;
namespace st = slatewatch::test;
using namespace std::chrono_literals;

namespace {

struct Received {
  std::string method;
  std::string body;
  std::string content_type;
  std::string authorization;
  std::string custom;
};

}  // namespace

class HttpActionTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto record = [this](const httplib::Request& req, httplib::Response& res) {
      std::lock_guard lock(mu_);
      last_.method = req.method;
      last_.body = req.body;
      last_.content_type = req.get_header_value("Content-Type");
      last_.authorization = req.get_header_value("Authorization");
      last_.custom = req.get_header_value("X-Watcher");
      res.set_content("ok", "text/plain");
    };
    http_.server().Post("/hook", record);
    http_.server().Put("/hook", record);
    http_.server().Get("/hook", record);
    http_.server().Post("/broken", [](const httplib::Request&, httplib::Response& res) {
      res.status = 500;
    });
    http_.server().Post("/slow", [](const httplib::Request&, httplib::Response& res) {
      std::this_thread::sleep_for(500ms);
      res.set_content("late", "text/plain");
    });
    ASSERT_TRUE(http_.start());
  }

  Received last() {
    std::lock_guard lock(mu_);
    return last_;
  }

  st::LocalHttpServer http_;
  std::mutex mu_;
  Received last_;
  sa::HttpActionTransport transport_;
};

TEST_F(HttpActionTransportTest, PostsBodyWithHeadersAndBasicAuth) {
  sa::ActionTarget t;
  t.url = http_.url("/hook");
  t.method = "POST";
  t.headers = {{"X-Watcher", "slate"}, {"content-type", "application/vnd.slate+json"}};
  t.auth = sa::BasicAuth{"dev", "secret"};

  auto result = transport_.deliver(t, R"({"state":"present"})", 1000ms);
  ASSERT_TRUE(result.has_value());
  const auto got = last();
  EXPECT_EQ(got.method, "POST");
  EXPECT_EQ(got.body, R"({"state":"present"})");
  EXPECT_EQ(got.content_type, "application/vnd.slate+json");
  EXPECT_EQ(got.authorization, "Basic ZGV2OnNlY3JldA==");
  EXPECT_EQ(got.custom, "slate");
}

TEST_F(HttpActionTransportTest, HonorsMethod) {
  sa::ActionTarget t;
  t.url = http_.url("/hook");
  t.method = "PUT";
  ASSERT_TRUE(transport_.deliver(t, "{}", 1000ms).has_value());
  EXPECT_EQ(last().method, "PUT");

  t.method = "GET";
  ASSERT_TRUE(transport_.deliver(t, "", 1000ms).has_value());
  EXPECT_EQ(last().method, "GET");
}

TEST_F(HttpActionTransportTest, ServerErrorIsDeliveryError) {
  sa::ActionTarget t;
  t.url = http_.url("/broken");
  auto result = transport_.deliver(t, "{}", 1000ms);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::WatchError::ActionDeliveryError);
}

TEST_F(HttpActionTransportTest, SlowTargetTimesOut) {
  sa::ActionTarget t;
  t.url = http_.url("/slow");
  const auto started = std::chrono::steady_clock::now();
  auto result = transport_.deliver(t, "{}", 100ms);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::WatchError::ActionDeliveryError);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 450ms);
}

TEST_F(HttpActionTransportTest, MalformedUrlIsDeliveryError) {
  sa::ActionTarget t;
  t.url = "not a url";
  auto result = transport_.deliver(t, "{}", 100ms);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::WatchError::ActionDeliveryError);
}
