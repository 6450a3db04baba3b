#include "ShapeCollector.hpp"
#include "ShapeGrouping.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

using namespace pix;

namespace {

ShapeCandidate candidate(std::size_t opIndex, const BBox &bbox,
                         std::optional<BBox> clip = std::nullopt,
                         ShapeKind kind = ShapeKind::Vector) {
  ShapeCandidate c;
  c.kind = kind;
  c.localBbox = bbox;
  c.bbox = bbox;
  c.clip = clip;
  c.opIndex = opIndex;
  return c;
}

// Partition as sets of op indices, independent of group order
std::set<std::set<std::size_t>> partition(const std::vector<ShapeGroup> &groups) {
  std::set<std::set<std::size_t>> result;
  for (const auto &group : groups) {
    std::set<std::size_t> members;
    for (const auto &member : group.members) {
      members.insert(member.opIndex);
    }
    result.insert(members);
  }
  return result;
}

PaintOp rectOp(double x, double y, double w, double h) {
  PaintOp op;
  op.kind = PaintKind::Fill;
  op.path = "M" + std::to_string(x) + " " + std::to_string(y) + "H" +
            std::to_string(x + w) + "V" + std::to_string(y + h) + "H" +
            std::to_string(x) + "Z";
  return op;
}

} // namespace

TEST(DisjointSetTest, MergeAndFind) {
  DisjointSet sets(5);
  EXPECT_TRUE(sets.merge(0, 1));
  EXPECT_TRUE(sets.merge(3, 4));
  EXPECT_FALSE(sets.merge(1, 0));
  EXPECT_TRUE(sets.merge(1, 4));

  EXPECT_EQ(sets.find(0), sets.find(3));
  EXPECT_NE(sets.find(0), sets.find(2));
  EXPECT_EQ(sets.size(), 5u);
}

TEST(ShapeGroupingTest, OverlappingPairAndDisjointShape) {
  std::vector<ShapeCandidate> candidates = {
      candidate(0, {100, 100, 180, 180}),
      candidate(1, {150, 130, 230, 210}),
      candidate(2, {500, 100, 550, 150}),
  };

  auto groups = groupShapes(candidates);
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].members.size(), 2u);
  EXPECT_EQ(groups[0].bbox, (BBox{100, 100, 230, 210}));
  EXPECT_EQ(groups[1].members.size(), 1u);
}

TEST(ShapeGroupingTest, PartitionIsPermutationInvariant) {
  std::vector<ShapeCandidate> candidates = {
      candidate(0, {100, 100, 180, 180}),
      candidate(1, {500, 100, 550, 150}),
      candidate(2, {150, 130, 230, 210}),
      candidate(3, {225, 205, 300, 300}), // chains onto 2
  };
  auto expected = partition(groupShapes(candidates));
  ASSERT_EQ(expected.size(), 2u);

  std::sort(candidates.begin(), candidates.end(),
            [](const ShapeCandidate &a, const ShapeCandidate &b) {
              return a.opIndex < b.opIndex;
            });
  do {
    EXPECT_EQ(partition(groupShapes(candidates)), expected);
  } while (std::next_permutation(
      candidates.begin(), candidates.end(),
      [](const ShapeCandidate &a, const ShapeCandidate &b) {
        return a.opIndex < b.opIndex;
      }));
}

TEST(ShapeGroupingTest, TransitiveMerge) {
  // 0 and 2 do not touch, 1 bridges them
  std::vector<ShapeCandidate> candidates = {
      candidate(0, {0, 0, 10, 10}),
      candidate(2, {20, 0, 30, 10}),
      candidate(1, {8, 0, 22, 10}),
  };
  auto groups = groupShapes(candidates);
  ASSERT_EQ(groups.size(), 1u);
  ASSERT_EQ(groups[0].members.size(), 3u);
  EXPECT_EQ(groups[0].members[0].opIndex, 0u);
  EXPECT_EQ(groups[0].members[1].opIndex, 1u);
  EXPECT_EQ(groups[0].members[2].opIndex, 2u);
}

TEST(ShapeGroupingTest, DifferentClipsStaySeparate) {
  BBox clipA{0, 0, 50, 50};
  BBox clipB{0, 0, 60, 60};
  std::vector<ShapeCandidate> candidates = {
      candidate(0, {0, 0, 40, 40}, clipA),
      candidate(1, {10, 10, 50, 50}, clipB),
      candidate(2, {20, 20, 45, 45}, clipA),
      candidate(3, {5, 5, 30, 30}),
  };
  auto groups = groupShapes(candidates);
  ASSERT_EQ(groups.size(), 3u);
  EXPECT_EQ(groups[0].members.size(), 2u);
  ASSERT_TRUE(groups[0].clip);
  EXPECT_EQ(*groups[0].clip, clipA);
  EXPECT_FALSE(groups[2].clip);
}

TEST(ShapeGroupingTest, RasterNeverMergesWithVector) {
  std::vector<ShapeCandidate> candidates = {
      candidate(0, {0, 0, 100, 100}, std::nullopt, ShapeKind::Raster),
      candidate(1, {0, 0, 100, 100}),
  };
  auto groups = groupShapes(candidates);
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].kind, ShapeKind::Raster);
  EXPECT_EQ(groups[1].kind, ShapeKind::Vector);
}

TEST(ShapeGroupingTest, GroupsInDiscoveryOrder) {
  std::vector<ShapeCandidate> candidates = {
      candidate(4, {300, 300, 400, 400}),
      candidate(1, {0, 0, 50, 50}),
      candidate(7, {40, 40, 60, 60}),
  };
  auto groups = groupShapes(candidates);
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].members.front().opIndex, 1u);
  EXPECT_EQ(groups[1].members.front().opIndex, 4u);
}

TEST(ShapeGroupingTest, MarginJoinsNearbyShapes) {
  std::vector<ShapeCandidate> candidates = {
      candidate(0, {0, 0, 30, 30}),
      candidate(1, {33, 0, 60, 30}),
  };
  EXPECT_EQ(groupShapes(candidates).size(), 2u);
  EXPECT_EQ(groupShapes(candidates, 5.0).size(), 1u);
}

TEST(ShapeGroupingTest, EmptyInput) { EXPECT_TRUE(groupShapes({}).empty()); }

TEST(ShapeFilterTest, SmallGroupsAreDropped) {
  std::vector<ShapeCandidate> candidates = {
      candidate(0, {50, 50, 60, 60}),    // 10 x 10
      candidate(1, {300, 300, 400, 400}), // 100 x 100
      candidate(2, {0, 500, 200, 501}),  // thin rule, wide
  };
  auto groups = filterGroups(groupShapes(candidates));
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].members.front().opIndex, 1u);
  EXPECT_EQ(groups[1].members.front().opIndex, 2u);
}

TEST(ShapeFilterTest, CustomThreshold) {
  std::vector<ShapeCandidate> candidates = {candidate(0, {0, 0, 10, 10})};
  EXPECT_EQ(filterGroups(groupShapes(candidates), 5.0).size(), 1u);
  EXPECT_TRUE(filterGroups(groupShapes(candidates), 20.0).empty());
}

class ShapeCollectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    drawing.pageWidth = 612;
    drawing.pageHeight = 792;
    context.pageWidth = 612;
    context.pageHeight = 792;
  }

  PageDrawing drawing;
  CollectorContext context;
};

TEST_F(ShapeCollectorTest, ResolvesAbsoluteBbox) {
  PaintOp op = rectOp(0, 0, 100, 50);
  op.transform = "matrix(1,0,0,-1,0,792)";
  drawing.ops.push_back(op);

  auto candidates = collectShapes(drawing, context);
  ASSERT_EQ(candidates.size(), 1u);
  EXPECT_EQ(candidates[0].kind, ShapeKind::Vector);
  EXPECT_EQ(candidates[0].bbox, (BBox{0, 742, 100, 792}));
  EXPECT_FALSE(candidates[0].clip);
}

TEST_F(ShapeCollectorTest, PageLevelClipIsNoClip) {
  PaintOp op = rectOp(10, 10, 100, 100);
  op.clipChain = {{"M0 0H612V792H0Z", ""}};
  drawing.ops.push_back(op);

  auto candidates = collectShapes(drawing, context);
  ASSERT_EQ(candidates.size(), 1u);
  EXPECT_FALSE(candidates[0].clip);
}

TEST_F(ShapeCollectorTest, NestedClipsIntersect) {
  PaintOp op = rectOp(0, 0, 612, 792);
  op.clipChain = {{"M0 0H612V792H0Z", ""},
                  {"M50 92H450V492H50Z", ""},
                  {"M150 192H350V392H150Z", ""}};
  drawing.ops.push_back(op);

  auto candidates = collectShapes(drawing, context);
  ASSERT_EQ(candidates.size(), 1u);
  ASSERT_TRUE(candidates[0].clip);
  EXPECT_EQ(*candidates[0].clip, (BBox{150, 192, 350, 392}));
}

TEST_F(ShapeCollectorTest, SkipsInvisibleAndDegenerateOps) {
  PaintOp disjointClips = rectOp(0, 0, 100, 100);
  disjointClips.clipChain = {{"M0 0H10V10H0Z", ""}, {"M50 50H60V60H50Z", ""}};
  drawing.ops.push_back(disjointClips);

  PaintOp outsideClip = rectOp(0, 0, 100, 100);
  outsideClip.clipChain = {{"M200 200H300V300H200Z", ""}};
  drawing.ops.push_back(outsideClip);

  PaintOp hairline;
  hairline.kind = PaintKind::Stroke;
  hairline.path = "M0 100L300 100";
  hairline.lineWidth = 0;
  drawing.ops.push_back(hairline);

  PaintOp noPath;
  noPath.path = "bogus";
  drawing.ops.push_back(noPath);

  EXPECT_TRUE(collectShapes(drawing, context).empty());
}

TEST_F(ShapeCollectorTest, StrokesIncludeTheirLineWidth) {
  PaintOp line;
  line.kind = PaintKind::Stroke;
  line.path = "M0 100L300 100";
  line.lineWidth = 4;
  line.transform = "matrix(2,0,0,2,10,20)";
  drawing.ops.push_back(line);

  PaintOp box = rectOp(50, 50, 100, 100);
  box.kind = PaintKind::Stroke;
  box.lineWidth = 10;
  drawing.ops.push_back(box);

  auto candidates = collectShapes(drawing, context);
  ASSERT_EQ(candidates.size(), 2u);
  EXPECT_EQ(candidates[0].localBbox, (BBox{-2, 98, 302, 102}));
  EXPECT_EQ(candidates[0].bbox, (BBox{6, 216, 614, 224}));
  EXPECT_EQ(candidates[1].bbox, (BBox{45, 45, 155, 155}));
}

TEST_F(ShapeCollectorTest, ImagesUseUnitSquare) {
  drawing.images.push_back(cv::Mat(20, 20, CV_8UC4, cv::Scalar(0, 0, 255, 255)));

  PaintOp image;
  image.kind = PaintKind::Image;
  image.transform = "matrix(200,0,0,-200,100,392)";
  image.imageIndex = 0;
  drawing.ops.push_back(image);

  PaintOp dangling = image;
  dangling.imageIndex = 3;
  drawing.ops.push_back(dangling);

  auto candidates = collectShapes(drawing, context);
  ASSERT_EQ(candidates.size(), 1u);
  EXPECT_EQ(candidates[0].kind, ShapeKind::Raster);
  EXPECT_EQ(candidates[0].localBbox, (BBox{0, 0, 1, 1}));
  EXPECT_EQ(candidates[0].bbox, (BBox{100, 192, 300, 392}));
  EXPECT_EQ(candidates[0].opIndex, 0u);
}
