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

#include "client/connection.hpp"

#include <QMetaObject>
#include <QtGlobal>

#include <stdexcept>
#include <utility>

namespace diffusionlab {
Connection::Connection(QObject* parent) : QObject(parent) {
  qRegisterMetaType<diffusionlab::ClientMessage>("diffusionlab::ClientMessage");
}

void Connection::Connect(std::shared_ptr<Client> client) {
  if (!client) {
    throw std::invalid_argument("[ERROR] Connection: Cannot connect a null client.");
  }
  client_ = std::move(client);
  error_.clear();
  qInfo("Connected to %s", client_->GetUrl().c_str());
  SetState(ConnectionState::CONNECTED);
}

void Connection::Disconnect() {
  client_.reset();
  SetState(ConnectionState::DISCONNECTED);
}

void Connection::SetError(const std::string& message) {
  error_ = message;
  client_.reset();
  qWarning("Connection error: %s", message.c_str());
  SetState(ConnectionState::ERROR);
}

auto Connection::ClientIfConnected() const -> Client* {
  return state_ == ConnectionState::CONNECTED ? client_.get() : nullptr;
}

auto Connection::GetClient() const -> Client& {
  Client* client = ClientIfConnected();
  if (client == nullptr) {
    throw std::runtime_error("Not connected to a server");
  }
  return *client;
}

void Connection::Interrupt() {
  if (Client* client = ClientIfConnected()) {
    client->Interrupt();
  }
}

void Connection::ClearQueue() {
  if (Client* client = ClientIfConnected()) {
    client->ClearQueue();
  }
}

void Connection::Deliver(ClientMessage message) {
  QMetaObject::invokeMethod(
      this, [this, message = std::move(message)]() { emit MessageReceived(message); },
      Qt::QueuedConnection);
}

void Connection::SetState(ConnectionState state) {
  if (state_ == state) {
    return;
  }
  state_ = state;
  emit StateChanged(state_);
}
};  // namespace diffusionlab
