// Copyright 2024 The Armada Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

// From Google gutil
#ifndef ARMADA_DISALLOW_COPY_AND_ASSIGN
#define ARMADA_DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName &) = delete;            \
  void operator=(const TypeName &) = delete
#endif

#define ARMADA_UNUSED(x) (void)x

#if defined(__GNUC__)
#define ARMADA_PREDICT_FALSE(x) (__builtin_expect(x, 0))
#define ARMADA_PREDICT_TRUE(x) (__builtin_expect(!!(x), 1))
#define ARMADA_NORETURN __attribute__((noreturn))
#else
#define ARMADA_NORETURN
#define ARMADA_PREDICT_FALSE(x) x
#define ARMADA_PREDICT_TRUE(x) x
#endif

#if defined(__GNUC__)
#define ARMADA_MUST_USE_RESULT __attribute__((warn_unused_result))
#else
#define ARMADA_MUST_USE_RESULT
#endif

#define ARMADA_CONCAT_IMPL(x, y) x##y
#define ARMADA_CONCAT(x, y) ARMADA_CONCAT_IMPL(x, y)
#define ARMADA_UNIQUE_VARIABLE(base) ARMADA_CONCAT(base, __LINE__)
