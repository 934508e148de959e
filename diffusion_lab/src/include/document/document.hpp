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

#include <optional>
#include <string>
#include <vector>

#include "image/bounds.hpp"
#include "image/image.hpp"
#include "type/type.hpp"

namespace diffusionlab {
enum class LayerKind : int { PAINT, VECTOR, GROUP, OTHER };

struct SelectionMask {
  std::optional<Mask>   mask_{};
  // Bounds of the raw selection, before grow and padding
  std::optional<Bounds> selection_bounds_{};
};

/**
 * @brief Host document the generated images are placed into. Implemented by the host
 * application, the controller only talks to it through this interface.
 *
 * A null layer_id_t stands for "no layer", e.g. as insertion anchor it means on top.
 */
class Document : public QObject {
  Q_OBJECT

 public:
  using QObject::QObject;
  ~Document() override = default;

  virtual auto GetExtent() const -> Extent = 0;

  /**
   * @brief Composite of the visible layers inside bounds, excluding the given layers.
   */
  virtual auto GetImage(const Bounds& bounds, const std::vector<layer_id_t>& exclude) const
      -> ResultImage = 0;
  virtual auto GetLayerImage(const layer_id_t& layer, const std::optional<Bounds>& bounds) const
      -> ResultImage = 0;
  virtual auto GetLayerBounds(const layer_id_t& layer) const -> Bounds = 0;

  /**
   * @brief Mask of the current selection, grown, feathered and padded by the given percentages
   * of the selection size. Both members are empty without a selection.
   */
  virtual auto CreateMaskFromSelection(double grow, double feather, double padding) const
      -> SelectionMask = 0;

  virtual auto InsertLayer(const std::string& name, const ResultImage& image,
                           const Bounds& bounds, const layer_id_t& below) -> layer_id_t = 0;
  virtual auto InsertVectorLayer(const std::string& name, const std::string& svg,
                                 const layer_id_t& below) -> layer_id_t = 0;
  // Replaces the pixels of a layer and makes it visible again
  virtual void SetLayerContent(const layer_id_t& layer, const ResultImage& image,
                               const Bounds& bounds) = 0;
  virtual void HideLayer(const layer_id_t& layer) = 0;
  virtual void RemoveLayer(const layer_id_t& layer) = 0;
  virtual void SetLayerName(const layer_id_t& layer, const std::string& name) = 0;
  virtual auto GetLayerName(const layer_id_t& layer) const -> std::string = 0;
  virtual void SetLayerLocked(const layer_id_t& layer, bool locked) = 0;

  virtual auto HasLayer(const layer_id_t& layer) const -> bool = 0;
  virtual auto GetLayerKind(const layer_id_t& layer) const -> std::optional<LayerKind> = 0;
  virtual auto GetLayerIds() const -> std::vector<layer_id_t> = 0;
  virtual auto GetActiveLayer() const -> layer_id_t = 0;

  virtual void Resize(Extent extent) = 0;

  // Error text when the document is not 8-bit RGBA
  virtual auto CheckColorMode() const -> std::optional<std::string> = 0;

 signals:
  void LayersChanged();
};
};  // namespace diffusionlab
