/*
 * This file is part of InspectDoc.
 * Copyright (C) 2025 Luisma Peramato
 *
 * InspectDoc is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * InspectDoc is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with InspectDoc. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace inspectdoc {

// Turns a stored image reference into something ImageLoader can open.
class ImageUrlResolver {
public:
  virtual ~ImageUrlResolver() = default;
  virtual std::string Resolve(const std::string &keyOrUrl) const = 0;
};

// http(s) URLs pass through, "/uploads/x" becomes the relative path
// "uploads/x", other keys are joined to the public storage URL or, without
// one, to the local uploads directory.
class StorageImageUrlResolver : public ImageUrlResolver {
public:
  StorageImageUrlResolver(std::string publicUrl, std::string uploadsDir);
  std::string Resolve(const std::string &keyOrUrl) const override;

private:
  std::string publicUrl_;
  std::string uploadsDir_;
};

// Retrieves the body of a remote resource; throws FetchError on failure.
class ByteFetcher {
public:
  virtual ~ByteFetcher() = default;
  virtual std::string Fetch(const std::string &url) = 0;
};

class CurlByteFetcher : public ByteFetcher {
public:
  CurlByteFetcher(long timeoutSeconds, std::string userAgent);
  std::string Fetch(const std::string &url) override;

private:
  long timeoutSeconds_;
  std::string userAgent_;
};

// Loads image bytes from a resolved location. Remote sources are retried
// with exponential backoff (base * 2^attempt between attempts); local paths
// are read directly.
class ImageLoader {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  ImageLoader(ByteFetcher &fetcher, int maxAttempts, int backoffBaseMs,
              Sleeper sleeper = {});

  bool Load(const std::string &location, std::string &bytes,
            std::string &error);

  static bool IsRemote(const std::string &location);

private:
  ByteFetcher &fetcher_;
  int maxAttempts_;
  int backoffBaseMs_;
  Sleeper sleeper_;
};

} // namespace inspectdoc
