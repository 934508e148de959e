/*
 * @file        diffusion_lab/src/include/type/type.hpp
 * @brief       collection of wrapper types
 * @author      Yurun Zi
 * @date        2026-02-11
 * @license     MIT
 *
 * @copyright   Copyright (c) 2026 Yurun Zi
 */

// Copyright (c) 2026 Yurun Zi
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include <QUuid>
#include <string>

namespace diffusionlab {

// Opaque id handed out by the backend when a work item is enqueued
#define job_id_t     std::string

// Host document layers are identified by their unique id
#define layer_id_t   QUuid

// Approximate memory footprint used for history pruning
#define memory_mb_t  double

// Stable diffusion model family a checkpoint or style belongs to
enum class SDVersion { SD15, SDXL, AUTO };

auto SDVersionName(SDVersion version) -> std::string;
auto SDVersionFromName(const std::string& name) -> SDVersion;
};  // namespace diffusionlab
