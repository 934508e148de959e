//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include <QtGlobal>

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

#include "model/model.hpp"
#include "workflow/workflow.hpp"

namespace diffusionlab {
void Model::Generate() {
  if (!CheckColorMode()) {
    return;
  }

  const Extent               extent = doc_.GetExtent();
  SelectionMask              selection;
  Bounds                     image_bounds;
  std::optional<ResultImage> image;
  Conditioning               conditioning;

  const bool                 prepared = ReportErrors([&] {
    selection    = doc_.CreateMaskFromSelection(settings_.SelectionGrow() / 100.0,
                                                settings_.SelectionFeather() / 100.0,
                                                settings_.SelectionPadding() / 100.0);
    std::optional<Bounds> mask_bounds;
    if (selection.mask_) {
      mask_bounds = selection.mask_->bounds_;
    }
    image_bounds = workflow::ComputeBounds(extent, mask_bounds, strength_);
    if (selection.mask_ || strength_ < 1.0) {
      image = GetCurrentImage(image_bounds);
    }

    conditioning.prompt_          = prompt_;
    conditioning.negative_prompt_ = negative_prompt_;
    conditioning.control_         = CollectControls(image_bounds);
    if (selection.selection_bounds_ && strength_ == 1.0) {
      Bounds area        = Bounds::ApplyCrop(*selection.selection_bounds_, image_bounds);
      conditioning.area_ = Bounds::MinimumSize(area, 64, image_bounds.GetExtent());
    }
  });
  if (!prepared) {
    return;
  }

  ClearError();

  const std::string prompt = conditioning.prompt_;
  // Results are inserted at the mask position, the mask itself is sent relative to the image
  Bounds            job_bounds = image_bounds;
  std::optional<Mask> mask     = selection.mask_;
  if (mask) {
    job_bounds    = mask->bounds_;
    mask->bounds_ = Bounds(mask->bounds_.x_ - image_bounds.x_, mask->bounds_.y_ - image_bounds.y_,
                           mask->bounds_.GetExtent());
  }

  auto build = [this, style = style_, strength = strength_, extent = image_bounds.GetExtent(),
                conditioning = std::move(conditioning), image = std::move(image),
                mask = std::move(mask)](const Client&) mutable {
    if (!jobs_.AnyExecuting()) {
      SetProgress(0.0);
    }
    return workflow::CreateDiffusionWork(style, extent, std::move(conditioning), std::move(image),
                                         std::move(mask), strength);
  };
  auto on_enqueued = [this, prompt, job_bounds](const job_id_t& id, const TaskHandle& task) {
    auto job = jobs_.AddDiffusion(id, prompt, job_bounds);
    job->SetDispatchToken(task.token_);
  };
  Dispatch("generate", std::move(build), std::move(on_enqueued), nullptr);
}

void Model::UpscaleImage() {
  const Extent extent = doc_.GetExtent();
  ResultImage  image;
  if (!ReportErrors([&] { image = doc_.GetImage(Bounds(0, 0, extent), {}); })) {
    return;
  }

  UpscaleParams params = upscale_;
  auto          job    = jobs_.AddUpscale(Bounds(0, 0, params.TargetExtent(extent)));
  ClearError();

  auto build = [style = style_, image = std::move(image),
                params = std::move(params)](const Client& client) mutable {
    if (params.upscaler_.empty()) {
      params.upscaler_ = client.Capabilities().default_upscaler_;
    }
    if (params.use_diffusion_) {
      return workflow::UpscaleTiled(std::move(image), params.upscaler_, params.factor_, style,
                                    params.strength_);
    }
    return workflow::UpscaleSimple(std::move(image), params.upscaler_, params.factor_);
  };
  Dispatch(
      "upscale", std::move(build),
      [this, job](const job_id_t& id, const TaskHandle&) { jobs_.AssignId(*job, id); }, job);
}

void Model::GenerateLive() {
  const Extent               extent = doc_.GetExtent();
  const Bounds               bounds(0, 0, extent);
  std::optional<ResultImage> image;
  Conditioning               conditioning;

  const bool                 prepared = ReportErrors([&] {
    if (live_.strength_ < 1.0) {
      image = GetCurrentImage(bounds);
    }
    conditioning.prompt_          = prompt_;
    conditioning.negative_prompt_ = negative_prompt_;
    conditioning.control_         = CollectControls(bounds);
  });
  if (!prepared) {
    return;
  }

  auto job = jobs_.AddLive(prompt_, bounds);
  ClearError();

  auto build = [style = style_, live = live_, extent, image = std::move(image),
                conditioning = std::move(conditioning)](const Client&) mutable {
    if (image) {
      return workflow::Refine(style, std::move(*image), std::move(conditioning), live.strength_,
                              live);
    }
    return workflow::Generate(style, extent, std::move(conditioning), live);
  };
  Dispatch(
      "live", std::move(build),
      [this, job](const job_id_t& id, const TaskHandle&) { jobs_.AssignId(*job, id); }, job);
}

auto Model::GenerateControlLayer(ControlLayer& control) -> std::shared_ptr<Job> {
  if (!CheckColorMode()) {
    return nullptr;
  }

  ResultImage image;
  if (!ReportErrors([&] { image = doc_.GetImage(Bounds(0, 0, doc_.GetExtent()), {}); })) {
    return nullptr;
  }

  auto job = jobs_.AddControl(control, Bounds(0, 0, image.GetExtent()));
  ClearError();

  auto build = [image = std::move(image), mode = control.GetMode()](const Client&) mutable {
    return workflow::CreateControlImage(std::move(image), mode);
  };
  Dispatch(
      "control_layer", std::move(build),
      [this, job](const job_id_t& id, const TaskHandle&) { jobs_.AssignId(*job, id); }, job);
  return job;
}

void Model::Dispatch(std::string name, RequestBuilder build, EnqueuedHandler on_enqueued,
                     const std::shared_ptr<Job>& job) {
  TaskHandle task{++task_counter_, std::move(name), std::make_shared<CancellationToken>()};
  if (job) {
    job->SetDispatchToken(task.token_);
  }
  last_task_ = task;
  pending_tasks_.push_back(task);

  auto resume = [this, task, on_enqueued = std::move(on_enqueued)](std::future<job_id_t> result) {
    FinishTask(task);
    if (task.IsCancelled()) {
      qInfo("Dispatch %s#%llu was cancelled, dropping its result", task.name_.c_str(),
            static_cast<unsigned long long>(task.id_));
      return;
    }
    ReportErrors([&] { on_enqueued(result.get(), task); });
  };

  const bool submitted = ReportErrors([&] {
    Client& client = connection_.GetClient();
    auto    future = client.Enqueue(build(client));
    task_runner_.Await<job_id_t>(std::move(future), this, task.token_, std::move(resume));
  });
  if (!submitted) {
    FinishTask(task);
  }
}

void Model::FinishTask(const TaskHandle& task) {
  std::erase_if(pending_tasks_, [&task](const TaskHandle& t) { return t.id_ == task.id_; });
}

auto Model::ReportErrors(const std::function<void()>& fn) -> bool {
  try {
    fn();
    return true;
  } catch (const NetworkError& e) {
    qWarning("Network error: %s [url=%s, code=%d]", e.what(), e.GetUrl().c_str(), e.GetCode());
    ReportError(std::format("{} [url={}, code={}]", e.what(), e.GetUrl(), e.GetCode()));
  } catch (const std::exception& e) {
    qWarning("%s", e.what());
    ReportError(e.what());
  }
  return false;
}

auto Model::CheckColorMode() -> bool {
  if (auto message = doc_.CheckColorMode()) {
    ReportError(*message);
    return false;
  }
  return true;
}

auto Model::GetCurrentImage(const Bounds& bounds) const -> ResultImage {
  std::vector<layer_id_t> exclude;
  for (const ControlLayer* control : control_) {
    if (control->GetMode() != ControlMode::IMAGE && control->GetMode() != ControlMode::BLUR) {
      exclude.push_back(control->GetLayerId());
    }
  }
  if (!preview_.layer_.isNull()) {
    exclude.push_back(preview_.layer_);
  }
  return doc_.GetImage(bounds, exclude);
}

auto Model::CollectControls(const Bounds& bounds) const -> std::vector<Control> {
  std::vector<Control> controls;
  for (const ControlLayer* control : control_) {
    controls.push_back(control->GetImage(bounds));
  }
  return controls;
}
};  // namespace diffusionlab
