#include "PaintOpRecorder.hpp"

#include <gtest/gtest.h>

#include <GfxState.h>

#include <memory>

using namespace pix;

class PaintOpRecorderTest : public ::testing::Test {
protected:
  // A top-down device page the size of US Letter
  void SetUp() override {
    pageBox = std::make_unique<PDFRectangle>(0, 0, 612, 792);
    state = std::make_unique<GfxState>(72, 72, pageBox.get(), 0, true);
    recorder.startPage(1, state.get(), nullptr);
  }

  void rect(double x, double y, double w, double h) {
    state->moveTo(x, y);
    state->lineTo(x + w, y);
    state->lineTo(x + w, y + h);
    state->lineTo(x, y + h);
    state->closePath();
  }

  std::unique_ptr<PDFRectangle> pageBox;
  std::unique_ptr<GfxState> state;
  PaintOpRecorder recorder;
};

TEST_F(PaintOpRecorderTest, RecordsPageSize) {
  PageDrawing drawing = recorder.takeDrawing();
  EXPECT_DOUBLE_EQ(drawing.pageWidth, 612);
  EXPECT_DOUBLE_EQ(drawing.pageHeight, 792);
  EXPECT_TRUE(drawing.ops.empty());
}

TEST_F(PaintOpRecorderTest, FillMapsToTopDownPage) {
  rect(100, 100, 80, 80);
  recorder.fill(state.get());
  state->clearPath();

  PageDrawing drawing = recorder.takeDrawing();
  ASSERT_EQ(drawing.ops.size(), 1u);
  const PaintOp &op = drawing.ops[0];
  EXPECT_EQ(op.kind, PaintKind::Fill);

  auto local = resolvePathBbox(op.path);
  ASSERT_TRUE(local);
  EXPECT_EQ(*local, (BBox{100, 100, 180, 180}));
  EXPECT_EQ(applyTransform(*local, op.transform), (BBox{100, 612, 180, 692}));
}

TEST_F(PaintOpRecorderTest, StrokeAndEvenOdd) {
  state->setLineWidth(3);
  state->moveTo(0, 0);
  state->lineTo(50, 50);
  recorder.stroke(state.get());
  state->clearPath();

  rect(0, 0, 10, 10);
  recorder.eoFill(state.get());
  state->clearPath();

  PageDrawing drawing = recorder.takeDrawing();
  ASSERT_EQ(drawing.ops.size(), 2u);
  EXPECT_EQ(drawing.ops[0].kind, PaintKind::Stroke);
  EXPECT_DOUBLE_EQ(drawing.ops[0].lineWidth, 3);
  EXPECT_DOUBLE_EQ(drawing.ops[0].color.a, 1);
  EXPECT_EQ(drawing.ops[1].kind, PaintKind::EoFill);
}

TEST_F(PaintOpRecorderTest, CurvesBecomeCubicCommands) {
  state->moveTo(0, 0);
  state->curveTo(10, 20, 30, 40, 50, 0);
  recorder.fill(state.get());
  state->clearPath();

  PageDrawing drawing = recorder.takeDrawing();
  ASSERT_EQ(drawing.ops.size(), 1u);
  auto commands = parsePathCommands(drawing.ops[0].path);
  ASSERT_EQ(commands.size(), 2u);
  EXPECT_EQ(commands[0].type, PathCommand::MOVE);
  ASSERT_EQ(commands[1].type, PathCommand::CUBIC);
  EXPECT_DOUBLE_EQ(commands[1].points[2].x, 50);
}

TEST_F(PaintOpRecorderTest, ClipChainFollowsSaveRestore) {
  recorder.saveState(state.get());
  rect(100, 400, 200, 150);
  recorder.clip(state.get());
  state->clearPath();

  rect(50, 350, 300, 250);
  recorder.fill(state.get());
  state->clearPath();
  recorder.restoreState(state.get());

  rect(0, 0, 10, 10);
  recorder.fill(state.get());
  state->clearPath();

  PageDrawing drawing = recorder.takeDrawing();
  ASSERT_EQ(drawing.ops.size(), 2u);
  ASSERT_EQ(drawing.ops[0].clipChain.size(), 1u);
  EXPECT_TRUE(drawing.ops[1].clipChain.empty());

  ClipBounds clip = resolveClipChain(drawing.ops[0].clipChain);
  ASSERT_EQ(clip.state, ClipBounds::REGION);
  EXPECT_EQ(clip.region, (BBox{100, 242, 300, 392}));
}

TEST_F(PaintOpRecorderTest, UnbalancedRestoreIsIgnored) {
  rect(0, 0, 10, 10);
  recorder.clip(state.get());
  state->clearPath();
  recorder.restoreState(state.get());

  rect(0, 0, 5, 5);
  recorder.fill(state.get());
  state->clearPath();

  PageDrawing drawing = recorder.takeDrawing();
  ASSERT_EQ(drawing.ops.size(), 1u);
  EXPECT_EQ(drawing.ops[0].clipChain.size(), 1u);
}

TEST_F(PaintOpRecorderTest, EmptyPathIsNotRecorded) {
  recorder.fill(state.get());
  recorder.clip(state.get());
  EXPECT_TRUE(recorder.takeDrawing().ops.empty());
}

TEST_F(PaintOpRecorderTest, DescribeTransformReadsCtm) {
  auto matrix = parseMatrixTransform(PaintOpRecorder::describeTransform(state.get()));
  ASSERT_TRUE(matrix);
  EXPECT_DOUBLE_EQ(matrix->a, 1);
  EXPECT_DOUBLE_EQ(matrix->d, -1);
  EXPECT_DOUBLE_EQ(matrix->f, 792);
}
