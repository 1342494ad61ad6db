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

#include "host/libs/image/staging_manifest.h"

#include <sys/stat.h>

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

#include <android-base/strings.h>

namespace bootdisk {

std::string ToString(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::kFile:
      return "file";
    case ArtifactKind::kDirectory:
      return "directory";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& out, const RequiredArtifact& artifact) {
  return out << artifact.relative_path << " (" << ToString(artifact.kind)
             << ")";
}

StagingManifest StagingManifest::Default() {
  return StagingManifest({
      {"boot/limine", ArtifactKind::kDirectory},
      {"kernel.bin", ArtifactKind::kFile},
  });
}

Result<StagingManifest> StagingManifest::Parse(const std::string& description) {
  StagingManifest manifest;
  for (auto& entry : android::base::Split(description, ",")) {
    auto path = android::base::Trim(entry);
    if (path.empty()) {
      continue;
    }
    auto kind = ArtifactKind::kFile;
    if (android::base::EndsWith(path, "/")) {
      kind = ArtifactKind::kDirectory;
      while (!path.empty() && path.back() == '/') {
        path.pop_back();
      }
    }
    BD_EXPECT(manifest.Add(RequiredArtifact{path, kind}));
  }
  BD_EXPECTF(!manifest.artifacts_.empty(), "No artifacts in \"{}\"",
             description);
  return manifest;
}

Result<void> StagingManifest::Add(RequiredArtifact artifact) {
  const auto& path = artifact.relative_path;
  BD_EXPECT(!path.empty(), "Empty artifact path");
  BD_EXPECTF(path[0] != '/', "Artifact \"{}\" is not a relative path", path);
  for (const auto& component : android::base::Split(path, "/")) {
    BD_EXPECTF(component != ".." && component != "." && !component.empty(),
               "Artifact \"{}\" is not a normalized relative path", path);
  }
  auto same_path = [&path](const RequiredArtifact& other) {
    return other.relative_path == path;
  };
  BD_EXPECTF(std::none_of(artifacts_.begin(), artifacts_.end(), same_path),
             "Artifact \"{}\" is listed twice", path);
  artifacts_.push_back(std::move(artifact));
  return {};
}

Result<void> StagingManifest::Check(const std::string& root) const {
  std::vector<std::string> problems;
  for (const auto& artifact : artifacts_) {
    const auto path = root + "/" + artifact.relative_path;
    struct stat st {};
    if (stat(path.c_str(), &st) != 0) {
      problems.push_back(artifact.relative_path + " is missing");
      continue;
    }
    bool is_dir = S_ISDIR(st.st_mode);
    bool is_file = S_ISREG(st.st_mode);
    if (artifact.kind == ArtifactKind::kDirectory && !is_dir) {
      problems.push_back(artifact.relative_path + " is not a directory");
    } else if (artifact.kind == ArtifactKind::kFile && !is_file) {
      problems.push_back(artifact.relative_path + " is not a regular file");
    }
  }
  BD_EXPECTF(problems.empty(), "Required artifacts in \"{}\": {}", root,
             android::base::Join(problems, "; "));
  return {};
}

}  // namespace bootdisk
