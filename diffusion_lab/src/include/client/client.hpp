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

#pragma once

#include <future>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "control/control_mode.hpp"
#include "image/image.hpp"
#include "style/style.hpp"
#include "type/type.hpp"
#include "workflow/work_request.hpp"

namespace diffusionlab {
enum class ClientEvent : int { PROGRESS, FINISHED, INTERRUPTED, ERROR };

/**
 * @brief Event reported by the backend for one job. Images and result are only set for
 * FINISHED, the error text only for ERROR.
 */
struct ClientMessage {
  ClientEvent                    event_    = ClientEvent::PROGRESS;
  job_id_t                       job_id_{};
  double                         progress_ = 0.0;
  std::optional<ImageCollection> images_{};
  std::optional<nlohmann::json>  result_{};
  std::string                    error_{};
};

/**
 * @brief Failure talking to the backend. Carries the request url and the status code.
 */
class NetworkError : public std::runtime_error {
 private:
  std::string url_;
  int         code_;

 public:
  NetworkError(const std::string& message, std::string url, int code)
      : std::runtime_error(message), url_(std::move(url)), code_(code) {}

  auto GetUrl() const -> const std::string& { return url_; }
  auto GetCode() const -> int { return code_; }
};

/**
 * @brief Models found on the server when the connection was established.
 */
struct ClientCapabilities {
  std::unordered_map<std::string, SDVersion>                  checkpoints_{};
  std::map<SDVersion, std::string>                            ip_adapter_models_{};
  std::map<std::pair<ControlMode, SDVersion>, std::string>    control_models_{};
  std::vector<std::string>                                    upscalers_{};
  std::string                                                 default_upscaler_{};

  auto IpAdapterModel(SDVersion version) const -> std::optional<std::string>;
  auto ControlModel(ControlMode mode, SDVersion version) const -> std::optional<std::string>;
};

/**
 * @brief Connection to a diffusion backend. Implementations own the transport and report job
 * events through Connection::MessageReceived on the control thread.
 */
class Client {
 public:
  virtual ~Client() = default;

  /**
   * @brief Submit a workflow. The future resolves to the backend id of the new job, or holds the
   * exception (typically NetworkError) that made the submission fail.
   */
  virtual auto Enqueue(WorkRequest work) -> std::future<job_id_t> = 0;
  virtual void Interrupt()                                        = 0;
  virtual void ClearQueue()                                       = 0;

  virtual auto Capabilities() const -> const ClientCapabilities&  = 0;
  virtual auto GetUrl() const -> std::string                      = 0;
};

/**
 * @brief Concrete SD version of a style. AUTO resolves through the version of the style's
 * checkpoint on the server, falling back to SD 1.5.
 */
auto ResolveSDVersion(const Style& style, const Client& client) -> SDVersion;

// Styles whose checkpoint is available on the server
auto FilterSupportedStyles(const StyleList& styles, const Client& client) -> std::vector<Style>;
};  // namespace diffusionlab
