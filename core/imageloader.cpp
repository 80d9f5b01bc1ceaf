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
#include "imageloader.h"

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <thread>

#include <curl/curl.h>

#include "../pdf/pdf_font_metrics.h"
#include "errors.h"
#include "stringutils.h"

namespace inspectdoc {
namespace {
size_t WriteToString(void *contents, size_t size, size_t nmemb, void *userp) {
  std::string *s = static_cast<std::string *>(userp);
  size_t total = size * nmemb;
  s->append(static_cast<char *>(contents), total);
  return total;
}

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}
} // namespace

StorageImageUrlResolver::StorageImageUrlResolver(std::string publicUrl,
                                                 std::string uploadsDir)
    : publicUrl_(std::move(publicUrl)), uploadsDir_(std::move(uploadsDir)) {
  while (!publicUrl_.empty() && publicUrl_.back() == '/')
    publicUrl_.pop_back();
  if (uploadsDir_.empty())
    uploadsDir_ = "uploads";
}

std::string StorageImageUrlResolver::Resolve(const std::string &keyOrUrl) const {
  if (keyOrUrl.empty())
    return {};
  if (ImageLoader::IsRemote(keyOrUrl))
    return keyOrUrl;
  if (StringUtils::StartsWith(keyOrUrl, "/uploads/"))
    return keyOrUrl.substr(1);
  if (!publicUrl_.empty())
    return publicUrl_ + "/" + keyOrUrl;
  return uploadsDir_ + "/" + keyOrUrl;
}

CurlByteFetcher::CurlByteFetcher(long timeoutSeconds, std::string userAgent)
    : timeoutSeconds_(timeoutSeconds), userAgent_(std::move(userAgent)) {}

std::string CurlByteFetcher::Fetch(const std::string &url) {
  EnsureCurlInitialized();
  CURL *curl = curl_easy_init();
  if (!curl)
    throw FetchError("curl_easy_init failed");

  std::string body;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

  CURLcode res = curl_easy_perform(curl);
  long httpCode = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK)
    throw FetchError(std::string(curl_easy_strerror(res)));
  if (httpCode >= 400)
    throw FetchError("HTTP " + std::to_string(httpCode));
  return body;
}

ImageLoader::ImageLoader(ByteFetcher &fetcher, int maxAttempts,
                         int backoffBaseMs, Sleeper sleeper)
    : fetcher_(fetcher), maxAttempts_(std::max(1, maxAttempts)),
      backoffBaseMs_(std::max(0, backoffBaseMs)), sleeper_(std::move(sleeper)) {
  if (!sleeper_)
    sleeper_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
}

bool ImageLoader::IsRemote(const std::string &location) {
  return StringUtils::StartsWith(location, "http://") ||
         StringUtils::StartsWith(location, "https://");
}

bool ImageLoader::Load(const std::string &location, std::string &bytes,
                       std::string &error) {
  if (location.empty()) {
    error = "empty image reference";
    return false;
  }

  if (!IsRemote(location)) {
    std::error_code ec;
    if (!std::filesystem::exists(location, ec)) {
      error = "file not found: " + location;
      return false;
    }
    if (!pdf::ReadFileToString(location, bytes)) {
      error = "unable to read " + location;
      return false;
    }
    return true;
  }

  for (int attempt = 0; attempt < maxAttempts_; ++attempt) {
    try {
      bytes = fetcher_.Fetch(location);
      if (!bytes.empty())
        return true;
      error = "empty response";
    } catch (const FetchError &ex) {
      error = ex.what();
    }
    if (attempt < maxAttempts_ - 1)
      sleeper_(std::chrono::milliseconds(backoffBaseMs_ << attempt));
  }
  error = "failed after " + std::to_string(maxAttempts_) +
          " attempts: " + error;
  return false;
}

} // namespace inspectdoc
