#include "coco_tools/errors.hpp"
#include "coco_tools/resize_pool.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <atomic>
#include <filesystem>

namespace coco_tools {
namespace {

TEST(ResizePoolTest, RunsEveryJob) {
    ResizePool pool(4);
    std::atomic<int> sum{0};
    std::vector<ResizePool::Job> jobs;
    for (int i = 1; i <= 100; ++i) {
        jobs.emplace_back([&sum, i] { sum += i; });
    }
    pool.run(std::move(jobs));
    EXPECT_EQ(sum.load(), 5050);
    EXPECT_EQ(pool.completed(), 100u);
    EXPECT_EQ(pool.skipped(), 0u);
}

TEST(ResizePoolTest, ZeroWorkersUsesHardwareConcurrency) {
    ResizePool pool(0);
    EXPECT_GE(pool.workers(), 1);
}

TEST(ResizePoolTest, FailurePropagatesAfterJoin) {
    ResizePool pool(3);
    std::vector<ResizePool::Job> jobs;
    for (int i = 0; i < 20; ++i) {
        if (i == 5) {
            jobs.emplace_back([] { throw IOError("disk gone", {7}); });
        } else {
            jobs.emplace_back([] {});
        }
    }
    try {
        pool.run(std::move(jobs));
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.ids(), (std::vector<int64_t>{7}));
    }
    EXPECT_EQ(pool.completed() + pool.skipped(), 19u);
}

TEST(ResizePoolTest, SingleWorkerStopsAtFirstFailure) {
    ResizePool pool(1);
    std::vector<ResizePool::Job> jobs;
    jobs.emplace_back([] { throw DimensionMismatch("bad raster", {1}); });
    for (int i = 0; i < 4; ++i) jobs.emplace_back([] {});

    EXPECT_THROW(pool.run(std::move(jobs)), DimensionMismatch);
    EXPECT_EQ(pool.completed(), 0u);
    EXPECT_EQ(pool.skipped(), 4u);
}

TEST(ResizePoolTest, ResizesTasksToTheirTargets) {
    testing::TempDir dir;
    std::vector<ResizeTask> tasks;
    for (int i = 0; i < 4; ++i) {
        const std::string name = "img_" + std::to_string(i) + ".png";
        testing::writeTestImage(dir.file("src/" + name), 40, 20);
        ResizeTask task;
        task.image_id = i;
        task.source = dir.file("src/" + name);
        task.destination = dir.file("dst/" + name);
        task.encode_ext = ".png";
        task.expected_source = cv::Size(40, 20);
        task.target = cv::Size(20, 10);
        task.sx = 0.5;
        task.sy = 0.5;
        tasks.push_back(task);
    }

    ResizePool pool(2);
    pool.run(tasks, RetryPolicy{0, 0});

    for (const auto& task : tasks) {
        cv::Mat out = cv::imread(task.destination, cv::IMREAD_UNCHANGED);
        ASSERT_FALSE(out.empty()) << task.destination;
        EXPECT_EQ(out.cols, 20);
        EXPECT_EQ(out.rows, 10);
    }
}

} // namespace
} // namespace coco_tools
