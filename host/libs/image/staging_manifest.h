/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "common/libs/utils/result.h"

namespace bootdisk {

enum class ArtifactKind {
  kFile,
  kDirectory,
};

std::string ToString(ArtifactKind kind);

struct RequiredArtifact {
  std::string relative_path;
  ArtifactKind kind;

  bool operator==(const RequiredArtifact& other) const {
    return relative_path == other.relative_path && kind == other.kind;
  }
};

std::ostream& operator<<(std::ostream& out, const RequiredArtifact& artifact);

// Where a missing artifact is detected decides how it is reported.
class StagingManifest {
 public:
  StagingManifest() = default;
  explicit StagingManifest(std::vector<RequiredArtifact> artifacts)
      : artifacts_(std::move(artifacts)) {}

  // The Limine layout: boot/limine/ and kernel.bin.
  static StagingManifest Default();
  // Comma separated relative paths; a trailing '/' marks a directory.
  static Result<StagingManifest> Parse(const std::string& description);

  Result<void> Add(RequiredArtifact artifact);

  const std::vector<RequiredArtifact>& artifacts() const { return artifacts_; }

  // Every artifact exists with the right kind under `root`. Fails with the
  // list of all offending artifacts, not just the first.
  Result<void> Check(const std::string& root) const;

 private:
  std::vector<RequiredArtifact> artifacts_;
};

}  // namespace bootdisk
