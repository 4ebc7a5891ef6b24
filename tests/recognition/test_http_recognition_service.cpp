#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "diffline/recognition/http_recognition_service.hpp"
#include "diffline/utils/time.hpp"

using namespace diffline;
using namespace diffline::recognition;

class HttpRecognitionServiceTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }
};

TEST_F(HttpRecognitionServiceTest, SubmitBodyCarriesContextAndImage) {
    SubmitRequest request;
    request.wording = "Total";
    request.imageData = "data:image/png;base64,AAAA";
    request.imageName = "line-3.png";
    RecognitionContext context{"conv-1"};

    const auto body = toSubmitJson(request, context);

    EXPECT_EQ(body["taskType"], "dify-ocr");
    EXPECT_EQ(body["conversationId"], "conv-1");
    EXPECT_EQ(body["inputData"]["wording"], "Total");
    EXPECT_EQ(body["inputData"]["imageData"], "data:image/png;base64,AAAA");
    EXPECT_EQ(body["inputData"]["imageName"], "line-3.png");

    request.imageName.clear();
    EXPECT_EQ(toSubmitJson(request, context)["inputData"]["imageName"],
              "line-preview.png");
}

TEST_F(HttpRecognitionServiceTest, SubmitReplyNeedsSuccessAndTaskId) {
    const auto ok = submitResponseFromJson(
        json::parse(R"({"success": true, "taskId": "abc-123"})"));
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.taskId, "abc-123");

    const auto rejected = submitResponseFromJson(
        json::parse(R"({"success": false, "error": "quota exceeded"})"));
    EXPECT_FALSE(rejected.success);
    EXPECT_EQ(rejected.error, "quota exceeded");

    const auto noId = submitResponseFromJson(json::parse(R"({"success": true})"));
    EXPECT_FALSE(noId.success);
    EXPECT_EQ(noId.error, "Submission rejected");

    const auto wrongType = submitResponseFromJson(
        json::parse(R"({"success": "yes", "taskId": 5})"));
    EXPECT_FALSE(wrongType.success);

    EXPECT_FALSE(submitResponseFromJson(json::parse("[]")).success);
}

TEST_F(HttpRecognitionServiceTest, ShortTaskIdKeepsTheTail) {
    EXPECT_EQ(shortTaskId("3f2a9c1e-7b44-4d0e-9a51-0c8e2d7f6b13"), "2d7f6b13");
    EXPECT_EQ(shortTaskId("task-1"), "task-1");
    EXPECT_EQ(shortTaskId(""), "");
}

TEST_F(HttpRecognitionServiceTest, CheckBodyListsTaskIds) {
    const auto body = toCheckJson({"a", "b"});
    ASSERT_TRUE(body["taskIds"].is_array());
    EXPECT_EQ(body["taskIds"].size(), 2u);
    EXPECT_EQ(body["taskIds"][1], "b");
}

TEST_F(HttpRecognitionServiceTest, CheckReplyIsMappedToRemoteTasks) {
    const auto response = checkResponseFromJson(json::parse(R"({
        "success": true,
        "tasks": [
            {"taskId": "t1", "status": "done",
             "outputData": {"text": "Hello", "duration": 2.5},
             "triggerId": "run_1",
             "createdAt": "2024-05-01T12:00:00.250Z",
             "updatedAt": "2024-05-01T14:00:05+02:00"},
            {"taskId": "t2", "status": "failed", "errorMessage": "bad image"},
            {"taskId": "t3", "status": "processing", "updatedAt": "yesterday"},
            {"taskId": "t4", "status": "queued"},
            {"status": "done"},
            42
        ]
    })"));

    ASSERT_TRUE(response.success);
    ASSERT_EQ(response.tasks.size(), 4u);

    const auto& done = response.tasks[0];
    EXPECT_EQ(done.taskId, "t1");
    EXPECT_EQ(done.status, TaskStatus::Done);
    EXPECT_EQ(done.text, "Hello");
    EXPECT_EQ(done.duration, 2.5);
    EXPECT_EQ(done.triggerId, "run_1");
    ASSERT_TRUE(done.createdAt.has_value());
    EXPECT_EQ(utils::toIsoTimestamp(*done.createdAt), "2024-05-01T12:00:00.250Z");
    ASSERT_TRUE(done.updatedAt.has_value());
    EXPECT_EQ(utils::toIsoTimestamp(*done.updatedAt), "2024-05-01T12:00:05.000Z");

    EXPECT_EQ(response.tasks[1].status, TaskStatus::Failed);
    EXPECT_EQ(response.tasks[1].errorMessage, "bad image");
    EXPECT_FALSE(response.tasks[1].text.has_value());

    EXPECT_EQ(response.tasks[2].status, TaskStatus::Processing);
    EXPECT_FALSE(response.tasks[2].updatedAt.has_value());

    EXPECT_EQ(response.tasks[3].status, TaskStatus::Pending);
}

TEST_F(HttpRecognitionServiceTest, FailedCheckKeepsError) {
    const auto response = checkResponseFromJson(
        json::parse(R"({"success": false, "error": "db down"})"));
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error, "db down");
    EXPECT_TRUE(response.tasks.empty());

    EXPECT_FALSE(checkResponseFromJson(json::parse("null")).success);
}

TEST_F(HttpRecognitionServiceTest, BaseUrlIsRequiredAndNormalized) {
    EXPECT_THROW(HttpRecognitionService(HttpServiceOptions{}),
                 error::InvalidArgument);

    HttpServiceOptions options;
    options.baseUrl = "https://example.test/functions/v1//";
    HttpRecognitionService service(options);
    EXPECT_EQ(service.options().baseUrl, "https://example.test/functions/v1");
}
