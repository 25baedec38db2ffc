//
// Copyright (C) 2024 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <gmock/gmock.h>

#include "cvdr/common/libs/utils/result.h"

namespace cvdr {

MATCHER(IsOk, "succeeds") {
  if (arg.ok()) {
    return true;
  }
  *result_listener << "which failed with \"" << arg.error().Message()
                   << "\"\n"
                   << arg.error().Trace();
  return false;
}

MATCHER(IsError, "fails") { return !arg.ok(); }

}  // namespace cvdr
