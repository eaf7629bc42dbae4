#include "collision_engine/collision_analyzer.hpp"
#include "collision_engine/danger_scorer.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <cstdio>

using namespace collision_engine;

namespace {

// Far background at 0.1 with a near, flat obstacle filling the walking path.
cv::Mat obstacleScene() {
    cv::Mat depth(100, 100, CV_32FC1, cv::Scalar(0.1f));
    depth(cv::Rect(30, 45, 40, 40)).setTo(cv::Scalar(0.9f));
    return depth;
}

std::vector<LabeledObject> randomObjects(cv::RNG& rng, int count, int width, int height) {
    std::vector<LabeledObject> objects;
    for (int i = 0; i < count; ++i) {
        int x1 = rng.uniform(-width / 2, width + width / 2);
        int y1 = rng.uniform(-height / 2, height + height / 2);
        int x2 = x1 + rng.uniform(0, width);
        int y2 = y1 + rng.uniform(0, height);
        objects.emplace_back("obj_" + std::to_string(i), "thing",
                             BoundingBox(x1, y1, x2, y2), rng.uniform(0.0f, 1.0f));
    }
    return objects;
}

void expectIdentical(const AnalyzedObject& a, const AnalyzedObject& b) {
    EXPECT_EQ(a.object_id, b.object_id);
    EXPECT_EQ(a.max_depth, b.max_depth);
    EXPECT_EQ(a.median_depth, b.median_depth);
    EXPECT_EQ(a.depth_variance, b.depth_variance);
    EXPECT_EQ(a.depth_gradient, b.depth_gradient);
    EXPECT_EQ(a.center_x, b.center_x);
    EXPECT_EQ(a.center_y, b.center_y);
    EXPECT_EQ(a.direction, b.direction);
    EXPECT_EQ(a.angle_deg, b.angle_deg);
    EXPECT_EQ(a.danger_level, b.danger_level);
    EXPECT_EQ(a.confidence_score, b.confidence_score);
    EXPECT_EQ(a.reason_for_danger, b.reason_for_danger);
}

} // namespace

TEST(CollisionAnalyzerTest, NearObstacleInWalkingPathIsCritical) {
    cv::Mat depth = obstacleScene();
    std::vector<LabeledObject> objects = {
        LabeledObject("person_1", "person", BoundingBox(30, 45, 69, 84), 0.92f)
    };

    AnalysisResult result = CollisionAnalyzer().analyze(depth, objects);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.objects.size(), 1u);

    const AnalyzedObject& obj = result.objects[0];
    EXPECT_EQ(obj.object_id, "person_1");
    EXPECT_EQ(obj.label, "person");
    EXPECT_FLOAT_EQ(obj.detection_confidence, 0.92f);
    EXPECT_FLOAT_EQ(obj.max_depth, 0.9f);
    EXPECT_EQ(obj.danger_level, DangerLevel::CRITICAL_COLLISION);
    EXPECT_EQ(obj.direction, "center");
}

TEST(CollisionAnalyzerTest, UniformFrameFillingBoxScenario) {
    // A uniform 0.9 map with a frame-filling box. Without any depth contrast the
    // closeness and relative factors stay at their floor, so the score tops out
    // well below the critical threshold.
    cv::Mat depth(100, 100, CV_32FC1, cv::Scalar(0.9f));
    std::vector<LabeledObject> objects = {
        LabeledObject("wall", "wall", BoundingBox(0, 0, 99, 99), 0.8f)
    };

    AnalysisResult result = CollisionAnalyzer().analyze(depth, objects);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.objects.size(), 1u);
    EXPECT_FLOAT_EQ(result.objects[0].factors.closeness, 0.1f);
    EXPECT_FLOAT_EQ(result.objects[0].factors.relative, 0.1f);
    EXPECT_FLOAT_EQ(result.objects[0].factors.size, 1.0f);
    EXPECT_NEAR(result.objects[0].confidence_score, 0.358f, 1e-4);
    EXPECT_EQ(result.objects[0].danger_level, DangerLevel::MODERATE_WARNING);
}

TEST(CollisionAnalyzerTest, SmallCornerObjectOnFarSceneIsSafe) {
    cv::Mat depth(100, 100, CV_32FC1, cv::Scalar(0.1f));
    std::vector<LabeledObject> objects = {
        LabeledObject("cup", "cup", BoundingBox(0, 0, 9, 9), 0.6f)
    };

    AnalysisResult result = CollisionAnalyzer().analyze(depth, objects);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.objects.size(), 1u);
    EXPECT_EQ(result.objects[0].danger_level, DangerLevel::SAFE);
    EXPECT_EQ(result.objects[0].direction, "left top");
    EXPECT_LT(result.objects[0].confidence_score, 0.2f);
}

TEST(CollisionAnalyzerTest, ReasonFactorsSumToScore) {
    cv::Mat depth(100, 100, CV_32FC1, cv::Scalar(0.5f));
    depth.at<float>(0, 0) = 0.0f;
    depth.at<float>(99, 0) = 1.0f;
    depth(cv::Rect(45, 55, 10, 10)).setTo(cv::Scalar(0.2f));

    std::vector<LabeledObject> objects = {
        LabeledObject("box", "box", BoundingBox(45, 55, 54, 64), 0.7f)
    };

    AnalysisResult first = CollisionAnalyzer().analyze(depth, objects);
    ASSERT_TRUE(first.success);
    ASSERT_EQ(first.objects.size(), 1u);
    const AnalyzedObject& obj = first.objects[0];

    EXPECT_FLOAT_EQ(obj.max_depth, 0.2f);
    EXPECT_FLOAT_EQ(obj.median_depth, 0.2f);
    EXPECT_GT(obj.factors.position, 1.0f);

    double closeness, relative, position, gradient, size, uniformity, total;
    int parsed = std::sscanf(obj.reason_for_danger.c_str(),
                             "Closeness:%lf Relative:%lf Position:%lf Gradient:%lf "
                             "Size:%lf Uniformity:%lf Total:%lf",
                             &closeness, &relative, &position, &gradient,
                             &size, &uniformity, &total);
    ASSERT_EQ(parsed, 7);

    double weighted = 0.35 * closeness + 0.25 * relative + 0.20 * position
                    + 0.10 * gradient + 0.05 * size + 0.05 * uniformity;
    EXPECT_NEAR(weighted, obj.confidence_score, 1e-6);
    EXPECT_NEAR(total, obj.confidence_score, 1e-6);
    EXPECT_NEAR(obj.factors.weightedSum(), obj.confidence_score, 1e-6);
    EXPECT_EQ(obj.danger_level, DangerLevel::LOW_WARNING);

    AnalysisResult second = CollisionAnalyzer().analyze(depth, objects);
    ASSERT_EQ(second.objects.size(), 1u);
    expectIdentical(first.objects[0], second.objects[0]);
}

TEST(CollisionAnalyzerTest, NoObjectsIsEmptySuccess) {
    cv::Mat depth(10, 10, CV_32FC1, cv::Scalar(0.4f));
    AnalysisResult result = CollisionAnalyzer().analyze(depth, {});
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.error.empty());
    EXPECT_TRUE(result.objects.empty());
}

TEST(CollisionAnalyzerTest, EmptyDepthMapFails) {
    std::vector<LabeledObject> objects = {
        LabeledObject("a", "chair", BoundingBox(0, 0, 5, 5), 0.5f)
    };

    AnalysisResult result = CollisionAnalyzer().analyze(cv::Mat(), objects);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
    EXPECT_TRUE(result.objects.empty());

    EXPECT_FALSE(CollisionAnalyzer().analyze(cv::Mat(), {}).success);
    EXPECT_FALSE(CollisionAnalyzer().analyze(cv::Mat(5, 0, CV_32FC1), objects).success);
    EXPECT_FALSE(CollisionAnalyzer().analyze(cv::Mat(5, 5, CV_8UC1, cv::Scalar(3)), objects).success);
}

TEST(CollisionAnalyzerTest, BoxOutsideMapDoesNotAbortFrame) {
    cv::Mat depth = obstacleScene();
    std::vector<LabeledObject> objects = {
        LabeledObject("ghost", "person", BoundingBox(150, 150, 200, 200), 0.4f),
        LabeledObject("person_1", "person", BoundingBox(30, 45, 69, 84), 0.9f),
    };

    AnalysisResult result = CollisionAnalyzer().analyze(depth, objects);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.objects.size(), 2u);

    EXPECT_EQ(result.objects[0].object_id, "person_1");
    const AnalyzedObject& ghost = result.objects[1];
    EXPECT_EQ(ghost.object_id, "ghost");
    EXPECT_EQ(ghost.max_depth, 0.0f);
    EXPECT_EQ(ghost.median_depth, 0.0f);
    EXPECT_EQ(ghost.depth_variance, 0.0f);
    EXPECT_EQ(ghost.depth_gradient, 0.0f);
    EXPECT_TRUE(std::isfinite(ghost.confidence_score));
    EXPECT_EQ(ghost.danger_level, DangerLevel::SAFE);
}

TEST(CollisionAnalyzerTest, BoxStraddlingRightEdgeKeepsItsDepth) {
    cv::Mat depth(100, 100, CV_32FC1, cv::Scalar(0.1f));
    depth(cv::Rect(95, 40, 5, 20)).setTo(cv::Scalar(0.9f));

    std::vector<LabeledObject> objects = {
        LabeledObject("door", "door", BoundingBox(95, 40, 140, 59), 0.8f),
        LabeledObject("pole", "pole", BoundingBox(99, 40, 150, 59), 0.8f),
    };

    AnalysisResult result = CollisionAnalyzer().analyze(depth, objects);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.objects.size(), 2u);

    for (const auto& obj : result.objects) {
        EXPECT_FLOAT_EQ(obj.max_depth, 0.9f) << obj.object_id;
        EXPECT_FLOAT_EQ(obj.median_depth, 0.9f) << obj.object_id;
        EXPECT_FLOAT_EQ(obj.factors.closeness, 1.0f) << obj.object_id;
    }

    const AnalyzedObject& door = result.objects[0].object_id == "door" ? result.objects[0] : result.objects[1];
    EXPECT_NEAR(door.factors.size, 45.0f * 19.0f / 10000.0f * 5.0f, 1e-6);
}

TEST(CollisionAnalyzerTest, ScoresStayFiniteAndBounded) {
    cv::RNG rng(42);
    CollisionAnalyzer analyzer;

    for (int trial = 0; trial < 10; ++trial) {
        int rows = 1 + rng.uniform(0, 60);
        int cols = 1 + rng.uniform(0, 60);
        cv::Mat depth(rows, cols, CV_32FC1);
        rng.fill(depth, cv::RNG::UNIFORM, cv::Scalar(0.0), cv::Scalar(1.0));

        AnalysisResult result = analyzer.analyze(depth, randomObjects(rng, 20, cols, rows));
        ASSERT_TRUE(result.success);
        ASSERT_EQ(result.objects.size(), 20u);

        for (const auto& obj : result.objects) {
            EXPECT_TRUE(std::isfinite(obj.confidence_score));
            EXPECT_GE(obj.confidence_score, 0.0f);
            EXPECT_LE(obj.confidence_score, 1.3f);
            EXPECT_EQ(obj.danger_level, DangerScorer::classify(obj.confidence_score));
        }
        for (size_t i = 1; i < result.objects.size(); ++i) {
            EXPECT_GE(static_cast<int>(result.objects[i - 1].danger_level),
                      static_cast<int>(result.objects[i].danger_level));
        }
    }
}

TEST(CollisionAnalyzerTest, ParallelScoringMatchesSerial) {
    cv::RNG rng(7);
    cv::Mat depth(80, 120, CV_32FC1);
    rng.fill(depth, cv::RNG::UNIFORM, cv::Scalar(0.0), cv::Scalar(1.0));
    std::vector<LabeledObject> objects = randomObjects(rng, 64, 120, 80);

    AnalysisResult serial = CollisionAnalyzer().analyze(depth, objects);
    AnalysisResult parallel = CollisionAnalyzer(AnalyzerConfig(4, 1)).analyze(depth, objects);

    ASSERT_TRUE(serial.success);
    ASSERT_TRUE(parallel.success);
    ASSERT_EQ(serial.objects.size(), parallel.objects.size());
    for (size_t i = 0; i < serial.objects.size(); ++i) {
        expectIdentical(serial.objects[i], parallel.objects[i]);
    }
}

TEST(CollisionAnalyzerTest, MoreThreadsThanObjectsMatchesSerial) {
    cv::Mat depth = obstacleScene();
    std::vector<LabeledObject> objects = {
        LabeledObject("a", "person", BoundingBox(30, 45, 69, 84), 0.9f),
        LabeledObject("b", "chair", BoundingBox(0, 0, 9, 9), 0.5f),
        LabeledObject("c", "ghost", BoundingBox(150, 150, 200, 200), 0.3f),
    };

    AnalysisResult serial = CollisionAnalyzer().analyze(depth, objects);
    AnalysisResult parallel = CollisionAnalyzer(AnalyzerConfig(16, 1)).analyze(depth, objects);

    ASSERT_TRUE(parallel.success);
    ASSERT_EQ(serial.objects.size(), parallel.objects.size());
    for (size_t i = 0; i < serial.objects.size(); ++i) {
        expectIdentical(serial.objects[i], parallel.objects[i]);
    }
}
