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

#include <QObject>
#include <QString>

#include <memory>
#include <string>

#include "client/client.hpp"

namespace diffusionlab {
enum class ConnectionState : int { DISCONNECTED, CONNECTING, CONNECTED, ERROR };

/**
 * @brief Owns the active backend client. Client implementations hand their events to Deliver(),
 * which republishes them as MessageReceived on the connection's thread.
 */
class Connection final : public QObject {
  Q_OBJECT

 public:
  explicit Connection(QObject* parent = nullptr);

  void Connect(std::shared_ptr<Client> client);
  void Disconnect();
  void SetError(const std::string& message);

  auto GetState() const -> ConnectionState { return state_; }
  auto GetError() const -> const std::string& { return error_; }

  // Null unless the state is CONNECTED
  auto ClientIfConnected() const -> Client*;

  /**
   * @throws std::runtime_error when no client is connected
   */
  auto GetClient() const -> Client&;

  void Interrupt();
  void ClearQueue();

  /**
   * @brief Thread-safe. Queues the message for emission on the connection's thread.
   */
  void Deliver(ClientMessage message);

 signals:
  void StateChanged(diffusionlab::ConnectionState state);
  void MessageReceived(const diffusionlab::ClientMessage& message);

 private:
  void SetState(ConnectionState state);

  std::shared_ptr<Client> client_ = nullptr;
  ConnectionState         state_  = ConnectionState::DISCONNECTED;
  std::string             error_{};
};
};  // namespace diffusionlab

Q_DECLARE_METATYPE(diffusionlab::ClientMessage)
