/// @file model_dispatch_test.cpp
/// @brief Request selection, job registration and dispatch error handling of
/// Model.

#include <QSignalSpy>

#include <algorithm>

#include "model/model_test_fixture.hpp"

namespace diffusionlab::test {
namespace {

using ModelDispatchTest = ModelTestFixture;

auto FullMask(const Bounds& bounds) -> Mask {
  return Mask(bounds, cv::Mat(bounds.height_, bounds.width_, CV_8UC1, cv::Scalar(255)));
}

// ── Construction ───────────────────────────────────────────────────────────

TEST_F(ModelDispatchTest, PicksSupportedStyleAndDefaultUpscaler) {
  EXPECT_EQ(model_->GetStyle().name_, "Realistic");
  EXPECT_EQ(model_->Upscale().upscaler_, "4x_default.pth");
}

// ── Generate ───────────────────────────────────────────────────────────────

TEST_F(ModelDispatchTest, Generate_NoSelection_GeneratesWholeDocument) {
  auto job = GenerateJob("a lighthouse");
  ASSERT_NE(job, nullptr);

  ASSERT_EQ(client_->requests_.size(), 1u);
  const WorkRequest& work = client_->requests_[0];
  EXPECT_EQ(work.kind_, WorkKind::GENERATE);
  EXPECT_EQ(work.extent_, (Extent{512, 512}));
  EXPECT_EQ(work.style_.name_, "Realistic");

  EXPECT_EQ(job->GetId(), "job-1");
  EXPECT_EQ(job->GetKind(), JobKind::DIFFUSION);
  EXPECT_EQ(job->GetPrompt(), "a lighthouse");
  EXPECT_EQ(job->GetBounds(), Bounds(0, 0, 512, 512));
  EXPECT_TRUE(doc_.image_requests_.empty());
}

TEST_F(ModelDispatchTest, Generate_PartialStrength_Refines) {
  model_->SetStrength(0.5);
  ASSERT_NE(GenerateJob(), nullptr);
  EXPECT_EQ(client_->requests_[0].kind_, WorkKind::REFINE);
  EXPECT_DOUBLE_EQ(client_->requests_[0].strength_, 0.5);
  EXPECT_EQ(doc_.image_requests_.size(), 1u);
}

TEST_F(ModelDispatchTest, Generate_Selection_InpaintsAroundMask) {
  doc_.extent_ = {2048, 2048};
  doc_.selection_.mask_             = FullMask(Bounds(1000, 1000, 100, 100));
  doc_.selection_.selection_bounds_ = Bounds(1010, 1010, 20, 20);

  auto job = GenerateJob();
  ASSERT_NE(job, nullptr);

  const WorkRequest& work = client_->requests_[0];
  EXPECT_EQ(work.kind_, WorkKind::INPAINT);
  // Image around the mask, mask relative to it, job placed at the mask
  EXPECT_EQ(work.extent_, (Extent{512, 512}));
  ASSERT_TRUE(work.mask_.has_value());
  EXPECT_EQ(work.mask_->bounds_, Bounds(206, 206, 100, 100));
  EXPECT_EQ(job->GetBounds(), Bounds(1000, 1000, 100, 100));
  ASSERT_TRUE(work.conditioning_.area_.has_value());
  EXPECT_EQ(work.conditioning_.area_->GetExtent(), (Extent{64, 64}));
}

TEST_F(ModelDispatchTest, Generate_SelectionPartialStrength_RefinesRegion) {
  model_->SetStrength(0.6);
  doc_.selection_.mask_             = FullMask(Bounds(100, 100, 50, 50));
  doc_.selection_.selection_bounds_ = Bounds(100, 100, 50, 50);

  ASSERT_NE(GenerateJob(), nullptr);
  const WorkRequest& work = client_->requests_[0];
  EXPECT_EQ(work.kind_, WorkKind::REFINE_REGION);
  EXPECT_EQ(work.extent_, (Extent{50, 50}));
  EXPECT_FALSE(work.conditioning_.area_.has_value());
}

TEST_F(ModelDispatchTest, Generate_ExcludesPreviewAndNonImageControls) {
  const layer_id_t depth_layer = doc_.AddLayer("depth", Bounds(0, 0, 512, 512));
  doc_.active_                 = depth_layer;
  model_->Controls().Add()->SetMode(ControlMode::DEPTH);
  const layer_id_t ref_layer   = doc_.AddLayer("reference", Bounds(0, 0, 512, 512));
  doc_.active_                 = ref_layer;
  model_->Controls().Add()->SetMode(ControlMode::IMAGE);

  model_->SetStrength(0.7);
  ASSERT_NE(GenerateJob(), nullptr);

  ASSERT_EQ(doc_.image_requests_.size(), 1u);
  const auto& exclude = doc_.image_requests_[0];
  EXPECT_NE(std::find(exclude.begin(), exclude.end(), depth_layer), exclude.end());
  EXPECT_EQ(std::find(exclude.begin(), exclude.end(), ref_layer), exclude.end());
  EXPECT_EQ(client_->requests_[0].conditioning_.control_.size(), 2u);
}

TEST_F(ModelDispatchTest, Generate_ColorModeRejected_NoJob) {
  doc_.color_mode_error_ = "Incompatible document: 16-bit float";
  model_->Generate();
  Drain();
  EXPECT_EQ(model_->Jobs().Size(), 0u);
  EXPECT_TRUE(client_->requests_.empty());
  EXPECT_EQ(model_->GetError(), "Incompatible document: 16-bit float");
  EXPECT_TRUE(model_->HasError());
}

TEST_F(ModelDispatchTest, Generate_ClearsPreviousError) {
  model_->ReportError("old");
  QSignalSpy has_error(model_.get(), &Model::HasErrorChanged);
  ASSERT_NE(GenerateJob(), nullptr);
  EXPECT_FALSE(model_->HasError());
  ASSERT_EQ(has_error.count(), 1);
  EXPECT_FALSE(has_error.at(0).at(0).toBool());
}

TEST_F(ModelDispatchTest, Generate_NetworkErrorIsReported) {
  client_->fail_with_ = NetworkError("Server unavailable", "http://127.0.0.1:8188/prompt", 500);
  model_->Live().is_active_ = true;
  model_->Generate();

  ASSERT_TRUE(WaitUntil([this] { return model_->HasError(); }));
  EXPECT_EQ(model_->GetError(),
            "Server unavailable [url=http://127.0.0.1:8188/prompt, code=500]");
  EXPECT_EQ(model_->Jobs().Size(), 0u);
  EXPECT_FALSE(model_->Live().is_active_);
  EXPECT_EQ(model_->PendingTaskCount(), 0u);
}

TEST_F(ModelDispatchTest, Generate_SynchronousFailureIsReported) {
  client_->throw_on_enqueue_ = true;
  model_->Generate();
  EXPECT_EQ(model_->GetError(), "Connection refused [url=http://127.0.0.1:8188, code=503]");
  EXPECT_EQ(model_->PendingTaskCount(), 0u);
}

TEST_F(ModelDispatchTest, Generate_NotConnected_ReportsError) {
  connection_.Disconnect();
  model_->Generate();
  EXPECT_EQ(model_->GetError(), "Not connected to a server");
  EXPECT_EQ(model_->Jobs().Size(), 0u);
}

TEST_F(ModelDispatchTest, Generate_ResetsProgressWhenIdle) {
  auto first = GenerateJob();
  ASSERT_NE(first, nullptr);
  Send(ClientEvent::PROGRESS, *first->GetId(), 0.8);
  Finish(*first->GetId(), MakeImages(1));
  EXPECT_DOUBLE_EQ(model_->GetProgress(), 1.0);

  ASSERT_NE(GenerateJob(), nullptr);
  EXPECT_DOUBLE_EQ(model_->GetProgress(), 0.0);
}

TEST_F(ModelDispatchTest, Generate_LaterDispatchRegistersWhileEarlierPending) {
  client_->hold_ = true;
  model_->SetPrompt("first");
  model_->Generate();
  model_->SetPrompt("second");
  model_->Generate();
  model_->SetPrompt("third");
  model_->Generate();
  ASSERT_EQ(client_->held_.size(), 3u);

  // Only the newest submission gets its id, the older two stay unanswered
  client_->held_.back().set_value("job-late");
  client_->held_.pop_back();

  ASSERT_TRUE(WaitUntil([this] { return model_->Jobs().Find("job-late") != nullptr; }));
  auto job = model_->Jobs().Find("job-late");
  EXPECT_EQ(job->GetPrompt(), "third");
  EXPECT_EQ(model_->PendingTaskCount(), 2u);

  Send(ClientEvent::PROGRESS, "job-late", 0.4);
  EXPECT_EQ(job->GetState(), JobState::EXECUTING);
}

// ── Upscale, live, control ─────────────────────────────────────────────────

TEST_F(ModelDispatchTest, UpscaleImage_RegistersJobBeforeEnqueueReturns) {
  client_->hold_              = true;
  model_->Upscale().upscaler_ = "";
  model_->UpscaleImage();

  ASSERT_EQ(model_->Jobs().Size(), 1u);
  auto job = model_->Jobs().At(0);
  EXPECT_EQ(job->GetKind(), JobKind::UPSCALING);
  EXPECT_FALSE(job->GetId().has_value());
  EXPECT_EQ(job->GetBounds(), Bounds(0, 0, 1024, 1024));
  EXPECT_EQ(job->GetPrompt(), "[Upscale] 1024x1024");

  ASSERT_EQ(client_->requests_.size(), 1u);
  EXPECT_EQ(client_->requests_[0].kind_, WorkKind::UPSCALE_TILED);
  EXPECT_EQ(client_->requests_[0].upscaler_, "4x_default.pth");

  const auto id = client_->ResolveNext();
  ASSERT_TRUE(WaitUntil([&] { return job->GetId().has_value(); }));
  EXPECT_EQ(job->GetId(), id);
  // The document keeps its size until the result arrives
  EXPECT_EQ(doc_.extent_, (Extent{512, 512}));
}

TEST_F(ModelDispatchTest, UpscaleImage_WithoutDiffusionIsSimple) {
  model_->Upscale().use_diffusion_ = false;
  model_->Upscale().factor_        = 1.5;
  model_->UpscaleImage();
  ASSERT_EQ(client_->requests_.size(), 1u);
  EXPECT_EQ(client_->requests_[0].kind_, WorkKind::UPSCALE_SIMPLE);
  EXPECT_EQ(client_->requests_[0].extent_, (Extent{768, 768}));
}

TEST_F(ModelDispatchTest, GenerateLive_UsesLiveParams) {
  model_->SetPrompt("sunset");
  model_->Live().strength_ = 1.0;
  model_->Live().seed_     = 1234;
  model_->GenerateLive();

  ASSERT_EQ(model_->Jobs().Size(), 1u);
  EXPECT_EQ(model_->Jobs().At(0)->GetKind(), JobKind::LIVE_PREVIEW);
  EXPECT_EQ(model_->Jobs().At(0)->GetPrompt(), "sunset");
  ASSERT_EQ(client_->requests_.size(), 1u);
  EXPECT_EQ(client_->requests_[0].kind_, WorkKind::GENERATE);
  ASSERT_TRUE(client_->requests_[0].live_.has_value());
  EXPECT_EQ(client_->requests_[0].live_->seed_, 1234);

  model_->Live().strength_ = 0.3;
  model_->GenerateLive();
  ASSERT_EQ(client_->requests_.size(), 2u);
  EXPECT_EQ(client_->requests_[1].kind_, WorkKind::REFINE);
  EXPECT_DOUBLE_EQ(client_->requests_[1].strength_, 0.3);
}

TEST_F(ModelDispatchTest, GenerateControlLayer_CreatesControlJob) {
  ControlLayer* control = model_->Controls().Add();
  control->SetMode(ControlMode::LINE_ART);
  auto job = model_->GenerateControlLayer(*control);

  ASSERT_NE(job, nullptr);
  EXPECT_EQ(job->GetKind(), JobKind::CONTROL_LAYER);
  EXPECT_EQ(job->GetControl(), control);
  EXPECT_EQ(job->GetPrompt(), "[Control] Line Art");
  ASSERT_EQ(client_->requests_.size(), 1u);
  EXPECT_EQ(client_->requests_[0].kind_, WorkKind::CONTROL_IMAGE);
  EXPECT_EQ(client_->requests_[0].control_mode_, ControlMode::LINE_ART);
}

// ── Cancellation ───────────────────────────────────────────────────────────

TEST_F(ModelDispatchTest, Cancel_QueuedDropsPendingDispatch) {
  client_->hold_ = true;
  model_->Generate();
  model_->UpscaleImage();
  ASSERT_EQ(model_->PendingTaskCount(), 2u);
  EXPECT_EQ(model_->LastTask().name_, "upscale");

  model_->Cancel(false, true);
  EXPECT_EQ(client_->clears_, 1);
  EXPECT_EQ(model_->Jobs().Size(), 0u);
  EXPECT_TRUE(model_->LastTask().IsCancelled());

  client_->ResolveNext();
  client_->ResolveNext();
  ASSERT_TRUE(WaitUntil([this] { return model_->PendingTaskCount() == 0; }));
  // The cancelled generate dispatch must not register its job afterwards
  EXPECT_EQ(model_->Jobs().Size(), 0u);
  EXPECT_FALSE(model_->HasError());
}

TEST_F(ModelDispatchTest, Cancel_ActiveInterruptsOnlyWhenExecuting) {
  auto job = GenerateJob();
  ASSERT_NE(job, nullptr);

  model_->Cancel(true, false);
  EXPECT_EQ(client_->interrupts_, 0);

  Send(ClientEvent::PROGRESS, *job->GetId(), 0.1);
  model_->Cancel(true, false);
  EXPECT_EQ(client_->interrupts_, 1);
  EXPECT_EQ(model_->Jobs().Size(), 1u);
}

TEST_F(ModelDispatchTest, Cancel_QueuedKeepsExecutingAndFinished) {
  auto running  = GenerateJob("running");
  auto waiting  = GenerateJob("waiting");
  ASSERT_NE(waiting, nullptr);
  Send(ClientEvent::PROGRESS, *running->GetId(), 0.5);

  model_->Cancel(false, true);
  ASSERT_EQ(model_->Jobs().Size(), 1u);
  EXPECT_EQ(model_->Jobs().At(0), running);
}

TEST_F(ModelDispatchTest, Destroy_WithUnansweredSubmission) {
  client_->hold_ = true;
  model_->Generate();
  model_->UpscaleImage();
  ASSERT_EQ(model_->PendingTaskCount(), 2u);

  // Must return although the backend never answered
  model_.reset();
  EXPECT_EQ(client_->held_.size(), 2u);
}

// ── Workspace ──────────────────────────────────────────────────────────────

TEST_F(ModelDispatchTest, LeavingLiveWorkspaceDeactivatesLive) {
  QSignalSpy spy(model_.get(), &Model::WorkspaceChanged);
  model_->SetWorkspace(Workspace::LIVE);
  model_->Live().is_active_ = true;
  model_->SetWorkspace(Workspace::GENERATION);
  EXPECT_FALSE(model_->Live().is_active_);
  EXPECT_EQ(spy.count(), 2);
}

}  // namespace
}  // namespace diffusionlab::test
