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
#include "../core/errors.h"
#include "../core/imageloader.h"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace inspectdoc;

namespace {

// Fails a fixed number of times before returning a body.
class FlakyFetcher : public ByteFetcher {
public:
  explicit FlakyFetcher(int failures) : failures_(failures) {}
  std::string Fetch(const std::string &url) override {
    urls.push_back(url);
    if (static_cast<int>(urls.size()) <= failures_)
      throw FetchError("connection reset");
    return "image-bytes";
  }
  std::vector<std::string> urls;

private:
  int failures_;
};

} // namespace

int main() {
  // Two failures, success on the third attempt; backoff doubles.
  {
    FlakyFetcher fetcher(2);
    std::vector<long long> sleeps;
    ImageLoader loader(fetcher, 3, 500, [&](std::chrono::milliseconds d) {
      sleeps.push_back(d.count());
    });
    std::string bytes;
    std::string error;
    assert(loader.Load("https://cdn.example.com/a.jpg", bytes, error));
    assert(bytes == "image-bytes");
    assert(fetcher.urls.size() == 3);
    assert(sleeps.size() == 2);
    assert(sleeps[0] == 500);
    assert(sleeps[1] == 1000);
  }

  // Every attempt fails: no sleep after the last one.
  {
    FlakyFetcher fetcher(10);
    std::vector<long long> sleeps;
    ImageLoader loader(fetcher, 3, 500, [&](std::chrono::milliseconds d) {
      sleeps.push_back(d.count());
    });
    std::string bytes;
    std::string error;
    assert(!loader.Load("https://cdn.example.com/a.jpg", bytes, error));
    assert(fetcher.urls.size() == 3);
    assert(sleeps.size() == 2);
    assert(error.find("connection reset") != std::string::npos);
  }

  // Local paths are read without the fetcher.
  {
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "inspectdoc_loader_test.bin";
    {
      std::ofstream out(path, std::ios::binary);
      out << "local-bytes";
    }
    FlakyFetcher fetcher(0);
    ImageLoader loader(fetcher, 3, 500, [](std::chrono::milliseconds) {});
    std::string bytes;
    std::string error;
    assert(loader.Load(path.string(), bytes, error));
    assert(bytes == "local-bytes");
    assert(fetcher.urls.empty());
    std::filesystem::remove(path);

    assert(!loader.Load((path.string() + ".missing"), bytes, error));
    assert(!loader.Load("", bytes, error));
  }

  // Reference resolution.
  {
    StorageImageUrlResolver storage("https://storage.example.com/bucket/",
                                    "uploads");
    assert(storage.Resolve("http://x.org/a.png") == "http://x.org/a.png");
    assert(storage.Resolve("/uploads/a.png") == "uploads/a.png");
    assert(storage.Resolve("tenants/1/logo.png") ==
           "https://storage.example.com/bucket/tenants/1/logo.png");
    assert(storage.Resolve("").empty());

    StorageImageUrlResolver local("", "/srv/uploads");
    assert(local.Resolve("reports/7/p.jpg") == "/srv/uploads/reports/7/p.jpg");
  }
  return 0;
}
