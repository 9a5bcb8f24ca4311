#include "linkscan/site_index.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <future>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <libxml/parser.h>

#include "io.h"
#include "linkscan/errors.h"
#include "util/string_util.h"

namespace linkscan {

namespace {

namespace fs = std::filesystem;

constexpr size_t kNoFailure = std::numeric_limits<size_t>::max();

std::string canonical_root(const std::string& root) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(fs::path(root), ec);
  if (ec) {
    throw std::runtime_error("Failed to resolve site root: " + root + " (" + ec.message() + ")");
  }
  if (!fs::is_directory(resolved, ec)) {
    throw std::runtime_error("Site root is not a directory: " + root);
  }
  std::string out = resolved.lexically_normal().generic_string();
  while (out.size() > 1 && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

/// Output of one scan worker; failed_at is the discovery position of its failure.
struct WorkerOutput {
  std::vector<ParsedFile> records;
  size_t failed_at = kNoFailure;
  std::exception_ptr error;
};

std::vector<ParsedFile> scan_parallel(const std::vector<std::string>& paths,
                                      const SelectorConfig& config,
                                      size_t jobs) {
  std::atomic<size_t> next{0};
  std::atomic<bool> failed{false};
  auto worker = [&]() {
    WorkerOutput out;
    ScanSelectors selectors(config);
    while (!failed.load()) {
      size_t i = next.fetch_add(1);
      if (i >= paths.size()) break;
      try {
        out.records.push_back(scan_file(paths[i], selectors));
      } catch (const std::exception&) {
        out.failed_at = i;
        out.error = std::current_exception();
        failed.store(true);
        break;
      }
    }
    return out;
  };

  const size_t workers = std::min(jobs, paths.size());
  std::vector<std::future<WorkerOutput>> futures;
  futures.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    futures.push_back(std::async(std::launch::async, worker));
  }

  std::vector<WorkerOutput> outputs;
  outputs.reserve(workers);
  for (auto& future : futures) {
    outputs.push_back(future.get());
  }

  const WorkerOutput* first_failure = nullptr;
  for (const auto& out : outputs) {
    if (out.error && (!first_failure || out.failed_at < first_failure->failed_at)) {
      first_failure = &out;
    }
  }
  if (first_failure) {
    std::rethrow_exception(first_failure->error);
  }

  std::vector<ParsedFile> records;
  records.reserve(paths.size());
  for (auto& out : outputs) {
    std::move(out.records.begin(), out.records.end(), std::back_inserter(records));
  }
  return records;
}

}  // namespace

const ParsedFile* SiteIndex::find_page(const std::string& path) const {
  auto it = pages.find(path);
  return it == pages.end() ? nullptr : &it->second;
}

std::string SiteIndex::relative(const std::string& path) const {
  std::string rel = fs::path(path).lexically_relative(fs::path(root)).generic_string();
  return rel.empty() ? path : rel;
}

std::vector<std::string> discover_files(const std::string& root) {
  std::vector<std::string> out;
  std::error_code ec;
  fs::recursive_directory_iterator it(root, ec);
  if (ec) {
    throw std::runtime_error("Failed to read directory: " + root + " (" + ec.message() + ")");
  }
  fs::recursive_directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      throw std::runtime_error("Failed to walk directory: " + root + " (" + ec.message() + ")");
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) continue;
    out.push_back(it->path().lexically_normal().generic_string());
  }
  if (ec) {
    throw std::runtime_error("Failed to walk directory: " + root + " (" + ec.message() + ")");
  }
  std::sort(out.begin(), out.end());
  return out;
}

ParsedFile scan_file(const std::string& path, const ScanSelectors& selectors) {
  ParsedFile file;
  file.path = path;
  file.content = internal::read_file(path);
  file.document = parse_html_document(file.content);
  try {
    ScanResult scanned = scan_document(file.document, selectors);
    file.links = std::move(scanned.links);
    file.images = std::move(scanned.images);
    file.fragments = std::move(scanned.fragments);
    file.duplicate_fragments = std::move(scanned.duplicate_fragments);
  } catch (const ScanError& err) {
    throw IndexError(IndexFailure{path, err.detail()});
  }
  return file;
}

SiteIndex build_index(const std::string& root,
                      const IndexOptions& options,
                      const ScanSelectors& selectors) {
  SiteIndex index;
  index.root = canonical_root(root);

  std::vector<std::string> page_paths;
  for (auto& path : discover_files(index.root)) {
    if (util::ends_with_icase(path, options.extension)) {
      page_paths.push_back(path);
    }
    index.files.insert(std::move(path));
  }

  xmlInitParser();
  if (options.jobs <= 1 || page_paths.size() < 2) {
    for (const auto& path : page_paths) {
      ParsedFile record = scan_file(path, selectors);
      std::string key = record.path;
      index.pages.emplace(std::move(key), std::move(record));
    }
    return index;
  }

  for (auto& record : scan_parallel(page_paths, selectors.config(), options.jobs)) {
    std::string key = record.path;
    index.pages.emplace(std::move(key), std::move(record));
  }
  return index;
}

}  // namespace linkscan
