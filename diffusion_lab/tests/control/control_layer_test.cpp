/// @file control_layer_test.cpp
/// @brief Derived flags, image extraction and list maintenance of control
/// layers.

#include "control/control_layer.hpp"

#include <QSignalSpy>

#include <stdexcept>

#include "model/model_test_fixture.hpp"

namespace diffusionlab::test {
namespace {

using ControlLayerTest = ModelTestFixture;

// ── Support detection ──────────────────────────────────────────────────────

TEST_F(ControlLayerTest, MissingControlNet_ListsModelFiles) {
  ControlLayer* control = model_->Controls().Add();
  EXPECT_EQ(control->GetMode(), ControlMode::SCRIBBLE);
  EXPECT_FALSE(control->IsSupported());
  EXPECT_FALSE(control->CanGenerate());
  EXPECT_TRUE(control->GetErrorText().startsWith("The ControlNet model is not installed ["));
}

TEST_F(ControlLayerTest, InstalledControlNet_IsSupported) {
  client_->caps_.control_models_[{ControlMode::DEPTH, SDVersion::SD15}] = "depth.pth";
  ControlLayer* control = model_->Controls().Add();
  QSignalSpy    supported(control, &ControlLayer::IsSupportedChanged);

  control->SetMode(ControlMode::DEPTH);
  EXPECT_TRUE(control->IsSupported());
  EXPECT_TRUE(control->CanGenerate());
  EXPECT_TRUE(control->GetErrorText().isEmpty());
  EXPECT_EQ(supported.count(), 1);
}

TEST_F(ControlLayerTest, ImageMode_RequiresIpAdapter) {
  ControlLayer* control = model_->Controls().Add();
  control->SetMode(ControlMode::IMAGE);
  EXPECT_FALSE(control->IsSupported());
  EXPECT_EQ(control->GetErrorText(), QString("The server is missing the IP-Adapter model"));

  client_->caps_.ip_adapter_models_[SDVersion::SD15] = "ip-adapter_sd15.safetensors";
  connection_.Disconnect();
  connection_.Connect(client_);
  EXPECT_TRUE(control->IsSupported());
  // Image references condition a generation but never produce a control image
  EXPECT_FALSE(control->CanGenerate());
}

TEST_F(ControlLayerTest, StyleChange_ReevaluatesAgainstResolvedVersion) {
  client_->caps_.checkpoints_["xl.safetensors"] = SDVersion::SDXL;
  client_->caps_.control_models_[{ControlMode::POSE, SDVersion::SD15}] = "pose15.pth";
  ControlLayer* control = model_->Controls().Add();
  control->SetMode(ControlMode::POSE);
  ASSERT_TRUE(control->IsSupported());

  Style xl;
  xl.name_          = "XL";
  xl.sd_checkpoint_ = "xl.safetensors";
  model_->SetStyle(xl);
  EXPECT_FALSE(control->IsSupported());
}

TEST_F(ControlLayerTest, WithoutClient_Supported) {
  connection_.Disconnect();
  ControlLayer* control = model_->Controls().Add();
  EXPECT_TRUE(control->IsSupported());
  EXPECT_TRUE(control->CanGenerate());
}

TEST_F(ControlLayerTest, ShowEnd_FollowsSetting) {
  client_->caps_.control_models_[{ControlMode::SCRIBBLE, SDVersion::SD15}] = "scribble.pth";
  ControlLayer* control = model_->Controls().Add();
  QSignalSpy    spy(control, &ControlLayer::ShowEndChanged);
  EXPECT_FALSE(control->ShowEnd());

  settings_.SetShowControlEnd(true);
  EXPECT_TRUE(control->ShowEnd());
  EXPECT_EQ(spy.count(), 1);
}

TEST_F(ControlLayerTest, PoseVector_DependsOnLayerKind) {
  const layer_id_t vector = doc_.AddLayer("pose", Bounds(0, 0, 512, 512), LayerKind::VECTOR);
  ControlLayer*    control = model_->Controls().Add();
  control->SetMode(ControlMode::POSE);
  EXPECT_FALSE(control->IsPoseVector());

  control->SetLayerId(vector);
  EXPECT_TRUE(control->IsPoseVector());

  control->SetMode(ControlMode::DEPTH);
  EXPECT_FALSE(control->IsPoseVector());
}

TEST_F(ControlLayerTest, StrengthAndEndAreClamped) {
  ControlLayer* control = model_->Controls().Add();
  control->SetStrength(1.7);
  control->SetEnd(-0.2);
  EXPECT_DOUBLE_EQ(control->GetStrength(), 1.0);
  EXPECT_DOUBLE_EQ(control->GetEnd(), 0.0);
}

// ── Image extraction ───────────────────────────────────────────────────────

TEST_F(ControlLayerTest, GetImage_LineModeIsFlattened) {
  const layer_id_t layer =
      doc_.AddLayer("lines", Bounds(0, 0, 512, 512), LayerKind::PAINT, cv::Scalar(0, 0, 0, 0));
  doc_.active_          = layer;
  ControlLayer* control = model_->Controls().Add();
  control->SetStrength(0.8);

  Control result = control->GetImage(std::nullopt);
  EXPECT_EQ(result.mode_, ControlMode::SCRIBBLE);
  EXPECT_DOUBLE_EQ(result.strength_, 0.8);
  EXPECT_TRUE(result.image_.GetData().at<cv::Vec4b>(0, 0) == cv::Vec4b(255, 255, 255, 255));
}

TEST_F(ControlLayerTest, GetImage_ImageModeIgnoresRequestedBounds) {
  ControlLayer* control = model_->Controls().Add();
  control->SetMode(ControlMode::IMAGE);

  control->GetImage(Bounds(10, 10, 64, 64));
  ASSERT_FALSE(doc_.layer_image_requests_.empty());
  EXPECT_FALSE(doc_.layer_image_requests_.back().has_value());

  control->SetMode(ControlMode::DEPTH);
  control->GetImage(Bounds(10, 10, 64, 64));
  EXPECT_EQ(doc_.layer_image_requests_.back(), Bounds(10, 10, 64, 64));
}

TEST_F(ControlLayerTest, GetImage_MissingLayerThrows) {
  const layer_id_t layer = doc_.AddLayer("tmp", Bounds(0, 0, 64, 64));
  doc_.active_           = layer;
  ControlLayer* control  = model_->Controls().Add();
  doc_.layers_.pop_back();  // removed behind the list's back
  EXPECT_THROW(control->GetImage(std::nullopt), std::runtime_error);
}

// ── List maintenance ───────────────────────────────────────────────────────

TEST_F(ControlLayerTest, Add_UsesActiveLayerAndLastMode) {
  QSignalSpy    added(&model_->Controls(), &ControlLayerList::Added);
  ControlLayer* first = model_->Controls().Add();
  EXPECT_EQ(first->GetLayerId(), doc_.active_);
  first->SetMode(ControlMode::CANNY_EDGE);

  ControlLayer* second = model_->Controls().Add();
  EXPECT_EQ(second->GetMode(), ControlMode::CANNY_EDGE);
  EXPECT_EQ(added.count(), 2);
  EXPECT_EQ(model_->Controls().Size(), 2u);
}

TEST_F(ControlLayerTest, RemovedLayer_RemovesControl) {
  const layer_id_t layer = doc_.AddLayer("control", Bounds(0, 0, 64, 64));
  doc_.active_           = layer;
  model_->Controls().Add();
  QSignalSpy removed(&model_->Controls(), &ControlLayerList::Removed);

  doc_.RemoveLayer(layer);

  EXPECT_EQ(removed.count(), 1);
  EXPECT_EQ(model_->Controls().Size(), 0u);
}

// ── Active job ─────────────────────────────────────────────────────────────

TEST_F(ControlLayerTest, Generate_TracksJobUntilFinished) {
  ControlLayer* control = model_->Controls().Add();
  control->SetMode(ControlMode::DEPTH);
  control->Generate();
  EXPECT_TRUE(control->HasActiveJob());

  auto job = model_->Jobs().At(0);
  ASSERT_TRUE(WaitUntil([&] { return job->GetId().has_value(); }));
  Finish(*job->GetId(), MakeImages(1, {512, 512}));

  EXPECT_FALSE(control->HasActiveJob());
  EXPECT_NE(control->GetLayerId(), doc_.active_);
  EXPECT_EQ(doc_.Get(control->GetLayerId()).name_, "[Control] Depth");
}

TEST_F(ControlLayerTest, Generate_ClearsOnCancel) {
  ControlLayer* control = model_->Controls().Add();
  control->Generate();
  auto job = model_->Jobs().At(0);
  ASSERT_TRUE(WaitUntil([&] { return job->GetId().has_value(); }));

  Send(ClientEvent::ERROR, *job->GetId());
  EXPECT_FALSE(control->HasActiveJob());
}

TEST_F(ControlLayerTest, Generate_ClearsOnQueuedCancel) {
  client_->hold_        = true;
  ControlLayer* control = model_->Controls().Add();
  control->Generate();
  ASSERT_TRUE(control->HasActiveJob());
  auto job = model_->Jobs().At(0);

  model_->Cancel(false, true);
  EXPECT_FALSE(control->HasActiveJob());
  EXPECT_EQ(job->GetState(), JobState::CANCELLED);
  EXPECT_EQ(model_->Jobs().Size(), 0u);
}

TEST_F(ControlLayerTest, Generate_RejectedLeavesNoActiveJob) {
  doc_.color_mode_error_ = "Incompatible document: 16-bit integer";
  ControlLayer* control  = model_->Controls().Add();
  control->Generate();
  EXPECT_FALSE(control->HasActiveJob());
  EXPECT_EQ(model_->Jobs().Size(), 0u);
  EXPECT_EQ(model_->GetError(), "Incompatible document: 16-bit integer");
}

}  // namespace
}  // namespace diffusionlab::test
